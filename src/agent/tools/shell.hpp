#pragma once

#include <string>

#include "agent/tools/tool.hpp"
#include "session/sandbox_service.hpp"

namespace replbox::agent::tools {

class ExecuteBashTool : public Tool {
public:
    ExecuteBashTool(session::SandboxService& service, std::string caller_id);

    std::string Name() const override { return "execute_bash"; }
    std::string Description() const override {
        return "Run a shell command in your sandbox. Each call starts a fresh shell; "
               "files written to the working directory persist.";
    }
    std::string ParametersJson() const override;
    sandbox::ExecutionResult Run(const ToolParams& params,
                                 std::optional<std::chrono::milliseconds> timeout) override;

private:
    session::SandboxService& service_;
    std::string caller_id_;
};

}  // namespace replbox::agent::tools
