#include <toolhost/fs/file_ops.hpp>

#include <toolhost/core/encoding.hpp>
#include <toolhost/core/log.hpp>
#include "posix_file.hpp"

#include <cerrno>
#include <filesystem>
#include <system_error>

#include <unistd.h>

namespace toolhost {

namespace fs = std::filesystem;

namespace {

Error FromErrorCode(const std::string& operation, const std::string& path,
                    const std::error_code& ec) {
    return Error{operation, path, std::nullopt, ec.message(), ErrorCategory::Io};
}

} // anonymous namespace

Result<std::string, Error> ReadFileBytes(const std::string& path) {
    auto file = posix_file::OpenForRead("ReadFile", path);
    if (file.IsErr()) {
        return Result<std::string, Error>::Err(std::move(file).Error());
    }
    return posix_file::ReadAll(file.Value(), "ReadFile", path);
}

Result<void, Error> WriteFileBytes(const std::string& path, std::string_view content) {
    auto file = posix_file::OpenForWrite("WriteFile", path);
    if (file.IsErr()) {
        return Result<void, Error>::Err(std::move(file).Error());
    }
    return posix_file::WriteAll(file.Value(), "WriteFile", path, content);
}

Result<std::vector<DirectoryEntry>, Error> ListDirectory(const std::string& path) {
    using ListResult = Result<std::vector<DirectoryEntry>, Error>;

    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        return ListResult::Err(FromErrorCode("ListDirectory", path, ec));
    }

    std::vector<DirectoryEntry> entries;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            LogDebug("fs", "Listing of " + path + " stopped early: " + ec.message());
            break;
        }
        auto name = it->path().filename().string();
        if (!IsValidUtf8(name)) {
            continue;
        }
        std::error_code type_ec;
        const bool is_dir = fs::is_directory(it->path(), type_ec);
        if (type_ec) {
            LogDebug("fs", "Skipping " + name + ": " + type_ec.message());
            continue;
        }
        entries.push_back(DirectoryEntry{std::move(name), is_dir});
    }
    // increment() reports its error after the loop condition when it fails
    // on the final step.
    if (ec) {
        LogDebug("fs", "Listing of " + path + " stopped early: " + ec.message());
    }
    return ListResult::Ok(std::move(entries));
}

Result<void, Error> CreateDirectories(const std::string& path) {
    // Nothing to create; std::filesystem would report EINVAL.
    if (path.empty()) {
        return Result<void, Error>::Ok();
    }

    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        return Result<void, Error>::Err(FromErrorCode("CreateDirectory", path, ec));
    }
    // Some standard libraries report success when the leaf exists as a file.
    if (!fs::is_directory(path, ec)) {
        return Result<void, Error>::Err(Error::FromErrno("CreateDirectory", path, EEXIST));
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> RemoveFile(const std::string& path) {
    if (::unlink(path.c_str()) != 0) {
        return Result<void, Error>::Err(Error::FromErrno("RemoveFile", path, errno));
    }
    return Result<void, Error>::Ok();
}

} // namespace toolhost
