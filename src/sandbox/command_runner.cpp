#include "sandbox/command_runner.hpp"

#include <future>

#include "utils/logging.hpp"

namespace replbox::sandbox {
namespace {

constexpr std::chrono::seconds kKillGrace(2);

struct Capture {
    std::string text;
    std::string error;
};

std::future<Capture> CaptureAsync(LineReader& reader) {
    return std::async(std::launch::async, [&reader]() {
        Capture capture{};
        try {
            capture.text = reader.ReadAll();
        } catch (const std::exception& ex) {
            capture.error = ex.what();
        }
        return capture;
    });
}

}  // namespace

CommandRunner::CommandRunner(Environment& environment, CommandOptions options)
    : environment_(environment)
    , options_(std::move(options)) {}

ExecutionResult CommandRunner::Run(const std::string& command,
                                   std::optional<std::chrono::milliseconds> timeout) const {
    const auto limit = timeout.value_or(options_.default_timeout);
    auto argv = options_.command;
    argv.push_back(command);

    std::unique_ptr<ProcessHandle> process;
    try {
        // The platform bound is a backstop; the wait below normally fires first.
        process = environment_.SpawnProcess(argv, limit + kKillGrace);
    } catch (const ProvisioningError& ex) {
        utils::Log(utils::LogLevel::kError, "exec", "spawn failed",
                   {{"env", environment_.Id()}, {"error", ex.what()}});
        return ExecutionResult::Failure(FailureKind::kProvisioning, ex.what());
    }

    utils::BestEffort("exec", "close stdin", [&]() { process->CloseStdin(); });
    auto stdout_reader = MakeLineReader(process->StdoutHandle());
    auto stderr_reader = MakeLineReader(process->StderrHandle());
    auto stdout_future = CaptureAsync(*stdout_reader);
    auto stderr_future = CaptureAsync(*stderr_reader);

    const auto exit_code = process->Wait(limit);
    if (!exit_code.has_value()) {
        process->Kill();
        stdout_future.wait();
        stderr_future.wait();
        utils::Log(utils::LogLevel::kInfo, "exec", "command timed out",
                   {{"env", environment_.Id()}, {"timeout", utils::FormatDuration(limit)}});
        return ExecutionResult::Timeout(limit);
    }

    // Background jobs may still hold the pipes open after the shell exits.
    const auto drain_deadline = std::chrono::steady_clock::now() + kKillGrace;
    if (stdout_future.wait_until(drain_deadline) != std::future_status::ready ||
        stderr_future.wait_until(drain_deadline) != std::future_status::ready) {
        utils::Log(utils::LogLevel::kDebug, "exec", "killing leftover background processes",
                   {{"env", environment_.Id()}});
        process->Kill();
    }
    auto out = stdout_future.get();
    auto err = stderr_future.get();
    if (!out.error.empty() || !err.error.empty()) {
        const auto message = !out.error.empty() ? out.error : err.error;
        utils::Log(utils::LogLevel::kWarn, "exec", "stream read failed",
                   {{"env", environment_.Id()}, {"error", message}});
        return ExecutionResult::Failure(FailureKind::kTransport, message);
    }

    utils::Log(utils::LogLevel::kDebug, "exec", "exit code " + std::to_string(*exit_code),
               {{"env", environment_.Id()}});
    return ExecutionResult::Success(*exit_code == 0, std::move(out.text), std::move(err.text), exit_code);
}

}  // namespace replbox::sandbox
