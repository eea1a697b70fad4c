#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "agent/tools/tool.hpp"
#include "sandbox/execution_result.hpp"

namespace replbox::agent::tools {

// Longest timeout a caller may ask for through the "timeout" parameter.
constexpr double kMaxTimeoutSeconds = 24 * 60 * 60;

// stdout, then "\n[stderr]: ..." when stderr is non-empty. Timeouts and
// failures become "Error: <message>".
std::string FormatToolOutput(const sandbox::ExecutionResult& result);

// Optional "timeout" parameter in seconds. Absent, unparsable, non-positive,
// non-finite or over kMaxTimeoutSeconds all give nullopt.
std::optional<std::chrono::milliseconds> ParseTimeoutParam(const ToolParams& params);

class ToolRegistry {
public:
    void Register(std::unique_ptr<Tool> tool);
    Tool* Find(const std::string& name) const;
    std::vector<std::string> List() const;
    std::vector<ToolDefinition> GetDefinitions() const;

    // Validates required parameters, runs the tool and formats its result.
    // Always returns text for the model; nothing is thrown.
    std::string Execute(const std::string& name, const ToolParams& params);

private:
    struct Entry {
        std::unique_ptr<Tool> tool;
        std::vector<std::string> required;
    };

    std::map<std::string, Entry> tools_;
};

}  // namespace replbox::agent::tools
