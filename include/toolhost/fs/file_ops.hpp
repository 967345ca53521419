#pragma once

#include <toolhost/core/result.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace toolhost {

// ---------------------------------------------------------------------------
// Direct host filesystem operations. No path confinement: whatever the OS
// permits for this process is permitted here. Every failure carries the OS
// error text in Error::message.
// ---------------------------------------------------------------------------

struct DirectoryEntry {
    std::string name;
    bool is_directory = false;
};

/// Read the whole file as raw bytes.
Result<std::string, Error> ReadFileBytes(const std::string& path);

/// Create or truncate `path` and write `content` to it.
Result<void, Error> WriteFileBytes(const std::string& path, std::string_view content);

/// Immediate children of `path`, in directory order. Best-effort: entries
/// whose name is not valid UTF-8, or whose type cannot be determined, are
/// left out rather than failing the listing.
Result<std::vector<DirectoryEntry>, Error> ListDirectory(const std::string& path);

/// mkdir -p. Succeeds if `path` already is a directory.
Result<void, Error> CreateDirectories(const std::string& path);

/// Remove a single non-directory entry.
Result<void, Error> RemoveFile(const std::string& path);

} // namespace toolhost
