#pragma once

#include <string>

#include "agent/tools/tool.hpp"
#include "session/sandbox_service.hpp"

namespace replbox::agent::tools {

// Persistent Python for one caller: names defined in one call are visible
// in the next.
class ExecutePythonTool : public Tool {
public:
    ExecutePythonTool(session::SandboxService& service, std::string caller_id);

    std::string Name() const override { return "execute_python"; }
    std::string Description() const override {
        return "Run Python code in a persistent interpreter. Variables and imports "
               "stay defined between calls; numpy is available as np and pandas as pd.";
    }
    std::string ParametersJson() const override;
    sandbox::ExecutionResult Run(const ToolParams& params,
                                 std::optional<std::chrono::milliseconds> timeout) override;

private:
    session::SandboxService& service_;
    std::string caller_id_;
};

}  // namespace replbox::agent::tools
