#include "sandbox/interpreter_session.hpp"

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace replbox::sandbox {

using utils::LogLevel;

struct InterpreterSession::Resident {
    std::unique_ptr<ProcessHandle> process;
    std::unique_ptr<LineWriter> stdin_writer;
    std::unique_ptr<LinePump> stdout_pump;
    std::unique_ptr<LinePump> stderr_pump;

    ~Resident() {
        // The pumps only return once the process is gone and its pipes close.
        if (process) {
            utils::BestEffort("session", "kill resident", [this]() { process->Kill(); });
        }
        stderr_pump.reset();
        stdout_pump.reset();
    }
};

const char* ToString(SessionState state) {
    switch (state) {
        case SessionState::kAbsent: return "absent";
        case SessionState::kStarting: return "starting";
        case SessionState::kReady: return "ready";
        case SessionState::kFailed: return "failed";
        case SessionState::kTerminated: return "terminated";
    }
    return "absent";
}

InterpreterSession::InterpreterSession(Environment& environment, InterpreterOptions options, std::string label)
    : environment_(environment)
    , options_(std::move(options))
    , label_(label.empty() ? environment.Id() : std::move(label)) {}

InterpreterSession::~InterpreterSession() {
    Terminate();
}

std::optional<int> InterpreterSession::ResidentProcessId() const {
    const auto pid = resident_pid_.load();
    if (pid < 0) {
        return std::nullopt;
    }
    return pid;
}

void InterpreterSession::Start(std::optional<std::chrono::milliseconds> timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::kTerminated) {
        throw std::logic_error("interpreter session is terminated");
    }
    try {
        EnsureStartedLocked(timeout.value_or(options_.default_timeout));
    } catch (const TimeoutError&) {
        throw;
    } catch (const std::exception&) {
        state_ = SessionState::kFailed;
        StopResidentLocked(std::chrono::milliseconds(0));
        throw;
    }
}

ExecutionResult InterpreterSession::Execute(const std::string& code,
                                            std::optional<std::chrono::milliseconds> timeout) {
    const auto limit = timeout.value_or(options_.default_timeout);
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::kTerminated) {
        return ExecutionResult::Failure(FailureKind::kTerminated, "interpreter session is terminated");
    }

    std::string last_error;
    for (int attempt = 0; attempt < 2; ++attempt) {
        try {
            EnsureStartedLocked(limit);
            auto response = CommunicateLocked(ControlRequest::Code(code), limit);
            state_ = SessionState::kReady;
            return ExecutionResult::Success(
                response.ok,
                std::move(response.stdout_text),
                std::move(response.stderr_text));
        } catch (const TimeoutError&) {
            utils::Log(LogLevel::kInfo, "session", "call timed out",
                       {{"session", label_}, {"timeout", utils::FormatDuration(limit)}});
            if (options_.restart_on_timeout) {
                StopResidentLocked(std::chrono::milliseconds(0));
                state_ = SessionState::kAbsent;
            }
            return ExecutionResult::Timeout(limit);
        } catch (const ProvisioningError& ex) {
            state_ = SessionState::kFailed;
            utils::Log(LogLevel::kError, "session", "resident could not be started",
                       {{"session", label_}, {"error", ex.what()}});
            return ExecutionResult::Failure(FailureKind::kProvisioning, ex.what());
        } catch (const std::exception& ex) {
            last_error = ex.what();
            state_ = SessionState::kFailed;
            utils::Log(LogLevel::kWarn, "session", "transport failure",
                       {{"session", label_}, {"attempt", std::to_string(attempt)}, {"error", last_error}});
            StopResidentLocked(options_.terminate_grace);
            if (attempt == 0) {
                ++restart_count_;
                utils::Log(LogLevel::kInfo, "session", "restarting resident", {{"session", label_}});
            }
        }
    }
    return ExecutionResult::Failure(
        FailureKind::kTransport,
        last_error.empty() ? std::string("interpreter session failed") : last_error);
}

void InterpreterSession::Terminate() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::kTerminated) {
        return;
    }
    StopResidentLocked(options_.terminate_grace);
    state_ = SessionState::kTerminated;
    utils::Log(LogLevel::kDebug, "session", "terminated", {{"session", label_}});
}

void InterpreterSession::EnsureStartedLocked(std::chrono::milliseconds timeout) {
    if (resident_) {
        return;
    }
    StartLocked(timeout);
}

void InterpreterSession::StartLocked(std::chrono::milliseconds timeout) {
    state_ = SessionState::kStarting;
    auto argv = options_.command;
    argv.push_back("-c");
    argv.push_back(ResidentLoopScript());

    auto resident = std::make_unique<Resident>();
    resident->process = environment_.SpawnProcess(argv, std::chrono::milliseconds(0));
    resident->stdin_writer = MakeLineWriter(resident->process->StdinHandle());
    resident->stdout_pump = std::make_unique<LinePump>(MakeLineReader(resident->process->StdoutHandle()));
    resident->stderr_pump = std::make_unique<LinePump>(
        MakeLineReader(resident->process->StderrHandle()),
        [label = label_](const std::string& line) {
            utils::Log(LogLevel::kDebug, "resident", utils::Trim(line), {{"session", label}});
        });
    resident_pid_ = resident->process->Id();
    resident_ = std::move(resident);
    utils::Log(LogLevel::kInfo, "session", "resident started",
               {{"session", label_}, {"pid", std::to_string(resident_pid_.load())}});

    if (!options_.init_code.empty()) {
        const auto response = CommunicateLocked(ControlRequest::Code(options_.init_code), timeout);
        if (!response.ok) {
            utils::Log(LogLevel::kWarn, "session", "init snippet raised",
                       {{"session", label_}, {"stderr", utils::Trim(response.stderr_text)}});
        } else if (!response.stderr_text.empty()) {
            utils::Log(LogLevel::kDebug, "session", "init snippet stderr",
                       {{"session", label_}, {"stderr", utils::Trim(response.stderr_text)}});
        }
    }
    state_ = SessionState::kReady;
}

ControlResponse InterpreterSession::CommunicateLocked(ControlRequest request,
                                                      std::chrono::milliseconds timeout) {
    if (!resident_) {
        throw StreamError("interpreter session is not started");
    }
    const auto id = next_request_id_++;
    request.id = id;
    resident_->stdin_writer->WriteAndFlush(EncodeRequest(request));

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto event = resident_->stdout_pump->Next(deadline);
        if (!event.has_value()) {
            throw TimeoutError("no response within " + utils::FormatDuration(timeout));
        }
        if (event->kind == LinePump::Event::Kind::kClosed) {
            throw StreamError("interpreter session terminated unexpectedly");
        }
        if (event->kind == LinePump::Event::Kind::kError) {
            throw StreamError(event->text);
        }
        if (utils::Trim(event->text).empty()) {
            continue;
        }
        auto response = DecodeResponse(event->text);
        if (response.id.has_value() && *response.id != id) {
            // Late answer to a request that already timed out.
            utils::Log(LogLevel::kDebug, "session", "discarding stale response",
                       {{"session", label_}, {"id", std::to_string(*response.id)},
                        {"expected", std::to_string(id)}});
            continue;
        }
        return response;
    }
}

void InterpreterSession::StopResidentLocked(std::chrono::milliseconds grace) {
    if (!resident_) {
        return;
    }
    auto resident = std::move(resident_);
    resident_pid_ = -1;

    if (grace.count() > 0) {
        const auto deadline = std::chrono::steady_clock::now() + grace;
        const auto id = next_request_id_++;
        utils::BestEffort("session", "graceful stop", [&]() {
            resident->stdin_writer->WriteAndFlush(EncodeRequest(ControlRequest::Terminate(id)));
            while (true) {
                auto event = resident->stdout_pump->Next(deadline);
                if (!event.has_value() || event->kind != LinePump::Event::Kind::kLine) {
                    break;
                }
                if (utils::Trim(event->text).empty()) {
                    continue;
                }
                const auto response = DecodeResponse(event->text);
                if (!response.id.has_value() || *response.id == id) {
                    break;
                }
            }
        });
        utils::BestEffort("session", "close resident stdin", [&]() { resident->process->CloseStdin(); });
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() > 0 && !resident->process->Wait(remaining).has_value()) {
            utils::Log(LogLevel::kDebug, "session", "resident still running after grace period",
                       {{"session", label_}});
        }
    }
    utils::Log(LogLevel::kDebug, "session", "resident stopped", {{"session", label_}});
    resident.reset();
}

}  // namespace replbox::sandbox
