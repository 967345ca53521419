#include <toolhost/tools/fs_tools.hpp>

#include <toolhost/core/encoding.hpp>
#include <toolhost/core/log.hpp>
#include <toolhost/fs/binary_classifier.hpp>
#include <toolhost/fs/file_ops.hpp>

#include "tool_utils.hpp"

#include <string>

namespace toolhost {

using namespace tool_utils;

namespace {

// ---------------------------------------------------------------------------
// Tool handlers
// ---------------------------------------------------------------------------

// read_file
ToolOutcome HandleReadFile(const nlohmann::json& params) {
    const auto path = params["path"].get<std::string>();

    auto binary = IsBinaryFile(path);
    if (binary.IsErr()) {
        return FsFailure("check file type", path, binary.Error());
    }

    if (binary.Value()) {
        auto bytes = ReadFileBytes(path);
        if (bytes.IsErr()) {
            return FsFailure("read binary file", path, bytes.Error());
        }
        LogDebug("tools", "read_file " + path + ": binary, " +
                              std::to_string(bytes.Value().size()) + " bytes");
        return TextOutcome(EncodeBinaryPayload(bytes.Value()));
    }

    auto text = ReadFileBytes(path);
    if (text.IsErr()) {
        return FsFailure("read file", path, text.Error());
    }
    if (!IsValidUtf8(text.Value())) {
        return ToolOutcome::Err(ToolError::Internal(
            "read file", "stream did not contain valid UTF-8",
            {{"operation", "read file"}, {"path", path}}));
    }
    return TextOutcome(std::move(text).Value());
}

// write_file
ToolOutcome HandleWriteFile(const nlohmann::json& params) {
    const auto path = params["path"].get<std::string>();
    const auto content = params["content"].get<std::string>();

    auto result = WriteFileBytes(path, content);
    if (result.IsErr()) {
        return FsFailure("write file", path, result.Error());
    }
    return TextOutcome("Successfully wrote to " + path);
}

// list_directory
ToolOutcome HandleListDirectory(const nlohmann::json& params) {
    const auto path = params["path"].get<std::string>();

    auto entries = ListDirectory(path);
    if (entries.IsErr()) {
        return FsFailure("list directory", path, entries.Error());
    }

    std::string out;
    for (const auto& entry : entries.Value()) {
        if (!out.empty()) out += '\n';
        out += entry.name;
        out += entry.is_directory ? " (directory)" : " (file)";
    }
    return TextOutcome(std::move(out));
}

// create_directory
ToolOutcome HandleCreateDirectory(const nlohmann::json& params) {
    const auto path = params["path"].get<std::string>();

    auto result = CreateDirectories(path);
    if (result.IsErr()) {
        return FsFailure("create directory", path, result.Error());
    }
    return TextOutcome("Successfully created directory: " + path);
}

// delete_file
ToolOutcome HandleDeleteFile(const nlohmann::json& params) {
    const auto path = params["path"].get<std::string>();

    auto result = RemoveFile(path);
    if (result.IsErr()) {
        return FsFailure("delete file", path, result.Error());
    }
    return TextOutcome("Successfully deleted file: " + path);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

ToolGroup MakeFilesystemTools() {
    ToolGroup group("filesystem");

    group.Add(
        "read_file",
        "Read a file from the filesystem. Text files are returned as-is; "
        "binary files are returned base64-encoded after a marker line.",
        MakeSchema({{"path", StringProp("Path to the file to read")}},
                   {"path"}),
        HandleReadFile);

    group.Add(
        "write_file",
        "Write text content to a file, creating it or replacing its contents.",
        MakeSchema(
            {{"path", StringProp("Path to the file to write")},
             {"content", StringProp("Content to write")}},
            {"path", "content"}),
        HandleWriteFile);

    group.Add(
        "list_directory",
        "List the entries of a directory, one 'name (directory|file)' per line.",
        MakeSchema({{"path", StringProp("Path to the directory to list")}},
                   {"path"}),
        HandleListDirectory);

    group.Add(
        "create_directory",
        "Create a directory, including missing parents.",
        MakeSchema({{"path", StringProp("Path of the directory to create")}},
                   {"path"}),
        HandleCreateDirectory);

    group.Add(
        "delete_file",
        "Delete a single file. Directories are not removed.",
        MakeSchema({{"path", StringProp("Path to the file to delete")}},
                   {"path"}),
        HandleDeleteFile);

    return group;
}

} // namespace toolhost
