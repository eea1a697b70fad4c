#include "sandbox/sandbox.hpp"

#include "utils/logging.hpp"

namespace replbox::sandbox {

Sandbox::Sandbox(std::string caller_id,
                 std::unique_ptr<Environment> environment,
                 InterpreterOptions interpreter,
                 CommandOptions shell)
    : caller_id_(std::move(caller_id))
    , environment_(std::move(environment))
    , interpreter_(*environment_, std::move(interpreter), caller_id_)
    , commands_(*environment_, std::move(shell)) {}

Sandbox::~Sandbox() {
    Terminate();
}

ExecutionResult Sandbox::ExecuteCode(const std::string& code,
                                     std::optional<std::chrono::milliseconds> timeout) {
    if (terminated_) {
        return ExecutionResult::Failure(FailureKind::kTerminated, "sandbox is terminated");
    }
    return interpreter_.Execute(code, timeout);
}

ExecutionResult Sandbox::ExecuteShell(const std::string& command,
                                      std::optional<std::chrono::milliseconds> timeout) {
    if (terminated_) {
        return ExecutionResult::Failure(FailureKind::kTerminated, "sandbox is terminated");
    }
    return commands_.Run(command, timeout);
}

void Sandbox::Terminate() {
    if (terminated_.exchange(true)) {
        return;
    }
    interpreter_.Terminate();
    utils::BestEffort("sandbox", "terminate environment " + environment_->Id(), [this]() {
        environment_->Terminate();
    });
    utils::Log(utils::LogLevel::kInfo, "sandbox", "terminated",
               {{"caller", caller_id_}, {"env", environment_->Id()}});
}

bool Sandbox::Expired() const {
    return environment_->IsTerminated();
}

}  // namespace replbox::sandbox
