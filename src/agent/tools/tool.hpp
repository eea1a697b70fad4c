#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>

#include "sandbox/execution_result.hpp"

namespace replbox::agent::tools {

using ToolParams = std::unordered_map<std::string, std::string>;

struct ToolDefinition {
    std::string name;
    std::string description;
    std::string parameters_json;
};

// A tool runs against one sandbox and hands back the raw result. Parameter
// checks, the timeout parameter and the text shown to the model are the
// registry's job.
class Tool {
public:
    virtual ~Tool() = default;
    virtual std::string Name() const = 0;
    virtual std::string Description() const = 0;
    // JSON schema; its "required" list is enforced before Run is called.
    virtual std::string ParametersJson() const = 0;
    virtual sandbox::ExecutionResult Run(const ToolParams& params,
                                         std::optional<std::chrono::milliseconds> timeout) = 0;
};

}  // namespace replbox::agent::tools
