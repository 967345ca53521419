#pragma once

#include <toolhost/core/result.hpp>

#include <cerrno>
#include <cstddef>
#include <string>
#include <string_view>

#include <fcntl.h>
#include <unistd.h>

namespace toolhost::posix_file {

// Owning file descriptor, closed on destruction.
class FileDescriptor {
public:
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.fd_) {
        other.fd_ = -1;
    }
    FileDescriptor& operator=(FileDescriptor&&) = delete;

    [[nodiscard]] int Get() const noexcept { return fd_; }

private:
    int fd_;
};

inline Result<FileDescriptor, Error> Open(const std::string& operation,
                                          const std::string& path,
                                          int flags) {
    int fd;
    do {
        fd = ::open(path.c_str(), flags | O_CLOEXEC, 0666);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        return Result<FileDescriptor, Error>::Err(
            Error::FromErrno(operation, path, errno));
    }
    return Result<FileDescriptor, Error>::Ok(FileDescriptor(fd));
}

inline Result<FileDescriptor, Error> OpenForRead(const std::string& operation,
                                                 const std::string& path) {
    return Open(operation, path, O_RDONLY);
}

// Create or truncate.
inline Result<FileDescriptor, Error> OpenForWrite(const std::string& operation,
                                                  const std::string& path) {
    return Open(operation, path, O_WRONLY | O_CREAT | O_TRUNC);
}

// Read until `len` bytes are in `buf` or EOF. Returns the count read.
inline Result<std::size_t, Error> ReadSome(const FileDescriptor& file,
                                           const std::string& operation,
                                           const std::string& path,
                                           char* buf, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        const auto n = ::read(file.Get(), buf + total, len - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result<std::size_t, Error>::Err(
                Error::FromErrno(operation, path, errno));
        }
        if (n == 0) break;
        total += static_cast<std::size_t>(n);
    }
    return Result<std::size_t, Error>::Ok(total);
}

inline Result<std::string, Error> ReadAll(const FileDescriptor& file,
                                          const std::string& operation,
                                          const std::string& path) {
    constexpr std::size_t kChunk = 64 * 1024;
    std::string data;
    char chunk[kChunk];
    while (true) {
        auto n = ReadSome(file, operation, path, chunk, kChunk);
        if (n.IsErr()) {
            return Result<std::string, Error>::Err(std::move(n).Error());
        }
        data.append(chunk, n.Value());
        if (n.Value() < kChunk) break;
    }
    return Result<std::string, Error>::Ok(std::move(data));
}

inline Result<void, Error> WriteAll(const FileDescriptor& file,
                                    const std::string& operation,
                                    const std::string& path,
                                    std::string_view data) {
    std::size_t written = 0;
    while (written < data.size()) {
        const auto n = ::write(file.Get(), data.data() + written,
                               data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result<void, Error>::Err(
                Error::FromErrno(operation, path, errno));
        }
        written += static_cast<std::size_t>(n);
    }
    return Result<void, Error>::Ok();
}

} // namespace toolhost::posix_file
