#pragma once

#include <toolhost/mcp/tool_registry.hpp>

namespace toolhost {

// Group "echo": echo(message) returns message unchanged.
ToolGroup MakeEchoTools();

} // namespace toolhost
