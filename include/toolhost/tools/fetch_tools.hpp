#pragma once

#include <toolhost/http/i_http_client.hpp>
#include <toolhost/mcp/tool_registry.hpp>

namespace toolhost {

// Group "fetch": fetch(url, method?, headers?, body?, content_type?).
// The handlers keep a reference to `http`, which must outlive the group
// and every registry built from it.
ToolGroup MakeFetchTools(IHttpClient& http);

} // namespace toolhost
