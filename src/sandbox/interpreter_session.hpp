#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "sandbox/control_protocol.hpp"
#include "sandbox/execution_result.hpp"
#include "sandbox/platform.hpp"

namespace replbox::sandbox {

class TimeoutError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class SessionState {
    kAbsent,
    kStarting,
    kReady,
    kFailed,
    kTerminated
};

const char* ToString(SessionState state);

struct InterpreterOptions {
    // Must accept "-c <program>" after these arguments.
    std::vector<std::string> command = {"python3", "-u"};
    std::string init_code;
    std::chrono::milliseconds default_timeout{std::chrono::seconds(120)};
    std::chrono::milliseconds terminate_grace{std::chrono::seconds(5)};
    bool restart_on_timeout = false;
};

// One long-lived interpreter process inside an environment. Calls are
// serialized; names bound by one call stay visible to the next until the
// process is restarted.
class InterpreterSession {
public:
    InterpreterSession(Environment& environment, InterpreterOptions options, std::string label = {});
    ~InterpreterSession();

    InterpreterSession(const InterpreterSession&) = delete;
    InterpreterSession& operator=(const InterpreterSession&) = delete;

    // Spawns and initializes the resident process unless one is running.
    // Throws ProvisioningError, StreamError, ProtocolError or TimeoutError.
    void Start(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // A transport failure restarts the resident once and retries the same
    // code; timeouts and errors raised by the code are returned as they are.
    ExecutionResult Execute(const std::string& code,
                            std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Graceful stop with a short grace period, then force close. Absorbing.
    void Terminate();

    SessionState State() const { return state_.load(); }
    int RestartCount() const { return restart_count_.load(); }
    std::optional<int> ResidentProcessId() const;

private:
    struct Resident;

    void EnsureStartedLocked(std::chrono::milliseconds timeout);
    void StartLocked(std::chrono::milliseconds timeout);
    ControlResponse CommunicateLocked(ControlRequest request, std::chrono::milliseconds timeout);
    void StopResidentLocked(std::chrono::milliseconds grace);

    Environment& environment_;
    InterpreterOptions options_;
    std::string label_;
    std::mutex mutex_;
    std::unique_ptr<Resident> resident_;
    std::uint64_t next_request_id_ = 1;
    std::atomic<SessionState> state_{SessionState::kAbsent};
    std::atomic<int> restart_count_{0};
    std::atomic<int> resident_pid_{-1};
};

}  // namespace replbox::sandbox
