#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "sandbox/command_runner.hpp"
#include "sandbox/execution_result.hpp"
#include "sandbox/interpreter_session.hpp"
#include "sandbox/platform.hpp"

namespace replbox::sandbox {

// Everything one caller owns: its environment, the persistent interpreter
// in it, and the one-shot command path.
class Sandbox {
public:
    Sandbox(std::string caller_id,
            std::unique_ptr<Environment> environment,
            InterpreterOptions interpreter,
            CommandOptions shell);
    ~Sandbox();

    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    const std::string& CallerId() const { return caller_id_; }
    std::string ObjectId() const { return environment_->Id(); }

    ExecutionResult ExecuteCode(const std::string& code,
                                std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    ExecutionResult ExecuteShell(const std::string& command,
                                 std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    void Terminate();
    bool IsTerminated() const { return terminated_.load(); }
    // The environment went away underneath us (lifetime elapsed).
    bool Expired() const;

    InterpreterSession& Interpreter() { return interpreter_; }
    Environment& Env() { return *environment_; }

private:
    std::string caller_id_;
    std::unique_ptr<Environment> environment_;
    InterpreterSession interpreter_;
    CommandRunner commands_;
    std::atomic<bool> terminated_{false};
};

}  // namespace replbox::sandbox
