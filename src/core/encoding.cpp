#include <toolhost/core/encoding.hpp>

#include <array>
#include <cstdint>

namespace toolhost {

namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::array<int8_t, 256> MakeDecodeTable() {
    std::array<int8_t, 256> table{};
    for (auto& v : table) v = -1;
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int8_t>(i);
    }
    return table;
}

constexpr auto kDecodeTable = MakeDecodeTable();

constexpr char kReplacement[] = "\xEF\xBF\xBD";  // U+FFFD

// Length of the well-formed sequence starting at bytes[pos], or 0.
size_t Utf8SequenceLength(std::string_view bytes, size_t pos) {
    const auto b0 = static_cast<unsigned char>(bytes[pos]);
    if (b0 < 0x80) return 1;

    size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        len = 2;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        len = 3;
        if (b0 == 0xE0) lo = 0xA0;      // overlong
        if (b0 == 0xED) hi = 0x9F;      // surrogates
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        len = 4;
        if (b0 == 0xF0) lo = 0x90;      // overlong
        if (b0 == 0xF4) hi = 0x8F;      // > U+10FFFF
    } else {
        return 0;
    }

    if (pos + len > bytes.size()) return 0;
    const auto b1 = static_cast<unsigned char>(bytes[pos + 1]);
    if (b1 < lo || b1 > hi) return 0;
    for (size_t i = 2; i < len; ++i) {
        const auto b = static_cast<unsigned char>(bytes[pos + i]);
        if ((b & 0xC0) != 0x80) return 0;
    }
    return len;
}

} // anonymous namespace

std::string Base64Encode(std::string_view bytes) {
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        const uint32_t n = (static_cast<unsigned char>(bytes[i]) << 16) |
                           (static_cast<unsigned char>(bytes[i + 1]) << 8) |
                           static_cast<unsigned char>(bytes[i + 2]);
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += kAlphabet[n & 0x3F];
    }

    const size_t rem = bytes.size() - i;
    if (rem == 1) {
        const uint32_t n = static_cast<unsigned char>(bytes[i]) << 16;
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += "==";
    } else if (rem == 2) {
        const uint32_t n = (static_cast<unsigned char>(bytes[i]) << 16) |
                           (static_cast<unsigned char>(bytes[i + 1]) << 8);
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

Result<std::string, std::string> Base64Decode(std::string_view text) {
    using DecodeResult = Result<std::string, std::string>;
    if (text.size() % 4 != 0) {
        return DecodeResult::Err("base64 length is not a multiple of 4");
    }

    std::string out;
    out.reserve(text.size() / 4 * 3);
    for (size_t i = 0; i < text.size(); i += 4) {
        const bool last = i + 4 == text.size();
        size_t padding = 0;
        uint32_t n = 0;
        for (size_t j = 0; j < 4; ++j) {
            const char c = text[i + j];
            if (c == '=') {
                // Padding only in the final quantum, and only in its tail.
                if (!last || j < 2) {
                    return DecodeResult::Err("unexpected padding");
                }
                ++padding;
                n <<= 6;
                continue;
            }
            if (padding > 0) {
                return DecodeResult::Err("data after padding");
            }
            const auto v = kDecodeTable[static_cast<unsigned char>(c)];
            if (v < 0) {
                return DecodeResult::Err("invalid base64 character");
            }
            n = (n << 6) | static_cast<uint32_t>(v);
        }
        out += static_cast<char>((n >> 16) & 0xFF);
        if (padding < 2) out += static_cast<char>((n >> 8) & 0xFF);
        if (padding < 1) out += static_cast<char>(n & 0xFF);
    }
    return DecodeResult::Ok(std::move(out));
}

bool IsValidUtf8(std::string_view bytes) {
    size_t pos = 0;
    while (pos < bytes.size()) {
        const auto len = Utf8SequenceLength(bytes, pos);
        if (len == 0) return false;
        pos += len;
    }
    return true;
}

std::string SanitizeUtf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    size_t pos = 0;
    while (pos < bytes.size()) {
        const auto len = Utf8SequenceLength(bytes, pos);
        if (len == 0) {
            out += kReplacement;
            ++pos;
            continue;
        }
        out.append(bytes.substr(pos, len));
        pos += len;
    }
    return out;
}

} // namespace toolhost
