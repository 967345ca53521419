#include <toolhost/fs/binary_classifier.hpp>

#include <toolhost/core/encoding.hpp>
#include "posix_file.hpp"

#include <vector>

namespace toolhost {

bool LooksBinary(std::string_view bytes) {
    return bytes.substr(0, kBinarySampleSize).find('\0') != std::string_view::npos;
}

Result<bool, Error> IsBinaryFile(const std::string& path) {
    auto file = posix_file::OpenForRead("IsBinaryFile", path);
    if (file.IsErr()) {
        return Result<bool, Error>::Err(std::move(file).Error());
    }

    std::vector<char> buffer(kBinarySampleSize);
    auto n = posix_file::ReadSome(file.Value(), "IsBinaryFile", path,
                                  buffer.data(), buffer.size());
    if (n.IsErr()) {
        return Result<bool, Error>::Err(std::move(n).Error());
    }
    return Result<bool, Error>::Ok(
        LooksBinary(std::string_view(buffer.data(), n.Value())));
}

std::string EncodeBinaryPayload(std::string_view bytes) {
    return std::string(kBinaryMarker) + Base64Encode(bytes);
}

} // namespace toolhost
