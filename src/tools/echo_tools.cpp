#include <toolhost/tools/echo_tools.hpp>

#include "tool_utils.hpp"

namespace toolhost {

using namespace tool_utils;

ToolGroup MakeEchoTools() {
    ToolGroup group("echo");
    group.Add(
        "echo",
        "Echo the given message back unchanged.",
        MakeSchema({{"message", StringProp("Text to echo back")}},
                   {"message"}),
        [](const nlohmann::json& params) {
            return TextOutcome(params["message"].get<std::string>());
        });
    return group;
}

} // namespace toolhost
