#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "sandbox/execution_result.hpp"
#include "sandbox/platform.hpp"

namespace replbox::sandbox {

struct CommandOptions {
    // The command string is appended as the last argument.
    std::vector<std::string> command = {"bash", "-c"};
    std::chrono::milliseconds default_timeout{std::chrono::seconds(120)};
};

// One-shot commands in a fresh process each time; nothing carries over
// between calls.
class CommandRunner {
public:
    CommandRunner(Environment& environment, CommandOptions options);

    ExecutionResult Run(const std::string& command,
                        std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

private:
    Environment& environment_;
    CommandOptions options_;
};

}  // namespace replbox::sandbox
