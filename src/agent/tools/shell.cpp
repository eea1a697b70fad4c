#include "agent/tools/shell.hpp"

namespace replbox::agent::tools {

ExecuteBashTool::ExecuteBashTool(session::SandboxService& service, std::string caller_id)
    : service_(service)
    , caller_id_(std::move(caller_id)) {}

std::string ExecuteBashTool::ParametersJson() const {
    return R"({"type":"object","properties":{"command":{"type":"string"},"timeout":{"type":"number"}},"required":["command"]})";
}

sandbox::ExecutionResult ExecuteBashTool::Run(const ToolParams& params,
                                              std::optional<std::chrono::milliseconds> timeout) {
    return service_.ExecuteShell(caller_id_, params.at("command"), timeout);
}

}  // namespace replbox::agent::tools
