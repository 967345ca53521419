#pragma once

#include <toolhost/mcp/tool_registry.hpp>

namespace toolhost {

// ---------------------------------------------------------------------------
// Group "filesystem": read_file, write_file, list_directory,
// create_directory, delete_file.
//
// Paths are passed to the OS as given (relative paths resolve against the
// process working directory). Failures are Internal errors whose detail is
// {"operation": <verb>, "path": <path>}.
// ---------------------------------------------------------------------------
ToolGroup MakeFilesystemTools();

} // namespace toolhost
