#include "agent/tools/python.hpp"

namespace replbox::agent::tools {

ExecutePythonTool::ExecutePythonTool(session::SandboxService& service, std::string caller_id)
    : service_(service)
    , caller_id_(std::move(caller_id)) {}

std::string ExecutePythonTool::ParametersJson() const {
    return R"({"type":"object","properties":{"code":{"type":"string"},"timeout":{"type":"number"}},"required":["code"]})";
}

sandbox::ExecutionResult ExecutePythonTool::Run(const ToolParams& params,
                                                std::optional<std::chrono::milliseconds> timeout) {
    return service_.ExecuteCode(caller_id_, params.at("code"), timeout);
}

}  // namespace replbox::agent::tools
