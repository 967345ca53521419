#pragma once

#include <filesystem>
#include <random>
#include <string>

namespace toolhost {
namespace testing {

// Fresh directory under the system temp dir, removed with its contents on
// destruction.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        const auto base = std::filesystem::temp_directory_path();
        do {
            path_ = base / ("toolhost-test-" + std::to_string(rd()));
        } while (std::filesystem::exists(path_));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& Path() const noexcept { return path_; }

    // Absolute path of `name` inside the directory, as a string.
    [[nodiscard]] std::string Join(const std::string& name) const {
        return (path_ / name).string();
    }

private:
    std::filesystem::path path_;
};

} // namespace testing
} // namespace toolhost
