#include <catch2/catch_test_macros.hpp>

#include <toolhost/fs/binary_classifier.hpp>

#include "mocks/temp_dir.hpp"

#include <fstream>
#include <string>

using namespace toolhost;
using toolhost::testing::TempDir;

namespace {

void WriteRaw(const std::string& path, const std::string& bytes) {
    std::ofstream out(path, std::ios::binary);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

} // anonymous namespace

// ===========================================================================
// LooksBinary
// ===========================================================================

TEST_CASE("LooksBinary: text without null bytes", "[fs][binary]") {
    CHECK_FALSE(LooksBinary(""));
    CHECK_FALSE(LooksBinary("hello\nworld\n"));
    CHECK_FALSE(LooksBinary("\xFF\xFE not utf-8 but no nulls"));
}

TEST_CASE("LooksBinary: null byte inside the sample window", "[fs][binary]") {
    std::string bytes(20, 'a');
    bytes[10] = '\0';
    CHECK(LooksBinary(bytes));

    std::string edge(kBinarySampleSize, 'a');
    edge[kBinarySampleSize - 1] = '\0';
    CHECK(LooksBinary(edge));
}

TEST_CASE("LooksBinary: null byte past the sample window is ignored", "[fs][binary]") {
    std::string bytes(kBinarySampleSize + 10, 'a');
    bytes[kBinarySampleSize] = '\0';
    CHECK_FALSE(LooksBinary(bytes));
}

// ===========================================================================
// IsBinaryFile
// ===========================================================================

TEST_CASE("IsBinaryFile: classifies files on disk", "[fs][binary]") {
    TempDir dir;
    const auto text = dir.Join("a.txt");
    const auto bin = dir.Join("a.bin");
    const auto empty = dir.Join("empty");
    WriteRaw(text, "plain text\n");
    WriteRaw(bin, std::string("PK\x03\x04\x00\x00", 6));
    WriteRaw(empty, "");

    auto t = IsBinaryFile(text);
    REQUIRE(t.IsOk());
    CHECK_FALSE(t.Value());

    auto b = IsBinaryFile(bin);
    REQUIRE(b.IsOk());
    CHECK(b.Value());

    auto e = IsBinaryFile(empty);
    REQUIRE(e.IsOk());
    CHECK_FALSE(e.Value());
}

TEST_CASE("IsBinaryFile: missing file is an Io error", "[fs][binary]") {
    TempDir dir;
    auto r = IsBinaryFile(dir.Join("missing"));
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Io);
    CHECK(r.Error().message == "No such file or directory");
}

TEST_CASE("IsBinaryFile: a directory cannot be classified", "[fs][binary]") {
    TempDir dir;
    auto r = IsBinaryFile(dir.Path().string());
    REQUIRE(r.IsErr());
    CHECK(r.Error().message == "Is a directory");
}

// ===========================================================================
// EncodeBinaryPayload
// ===========================================================================

TEST_CASE("EncodeBinaryPayload: marker line then base64", "[fs][binary]") {
    CHECK(EncodeBinaryPayload(std::string("AB\0", 3)) ==
          "[Binary file encoded as base64]\nQUIA");
}
