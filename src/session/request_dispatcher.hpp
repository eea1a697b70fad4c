#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "sandbox/execution_result.hpp"
#include "session/sandbox_service.hpp"

namespace replbox::session {

// Longest "timeoutMs" a request may carry.
constexpr double kMaxRequestTimeoutMs = 24.0 * 60 * 60 * 1000;

nlohmann::json BuildResultJson(const sandbox::ExecutionResult& result);
nlohmann::json BuildRequestFailure(const std::string& message);

// Positive finite "timeoutMs" up to kMaxRequestTimeoutMs; anything else is
// ignored and the configured default applies.
std::optional<std::chrono::milliseconds> ReadTimeout(const nlohmann::json& request);

// Runs one request object against the service and returns the response
// record (without the echoed id). Never throws.
nlohmann::json HandleRequest(SandboxService& service, const nlohmann::json& request);

// Serve-mode dispatch. Requests from one caller run one at a time in the
// order they were submitted; different callers run in parallel. Each caller
// has a lane with its own worker thread, which exits once the lane is empty
// and is joined on a later Submit or on Drain.
class RequestDispatcher {
public:
    using Emit = std::function<void(const nlohmann::json&)>;

    RequestDispatcher(SandboxService& service, Emit emit);
    ~RequestDispatcher();

    RequestDispatcher(const RequestDispatcher&) = delete;
    RequestDispatcher& operator=(const RequestDispatcher&) = delete;

    // One request line. Malformed lines and requests without a string
    // caller are answered immediately on the calling thread.
    void Submit(const std::string& line);

    // Waits for every queued request to be answered and joins all workers.
    void Drain();

    // Callers that still have a lane (busy, or finished but not reaped).
    std::size_t ActiveCallers() const;
    std::size_t Submitted() const;

private:
    struct Lane {
        std::deque<nlohmann::json> pending;
        std::thread worker;
        bool running = false;
    };

    void RunLane(Lane* lane);
    void Respond(const nlohmann::json& request, nlohmann::json response);

    SandboxService& service_;
    Emit emit_;
    mutable std::mutex mutex_;
    std::condition_variable idle_;
    std::unordered_map<std::string, std::unique_ptr<Lane>> lanes_;
    std::size_t submitted_ = 0;
};

}  // namespace replbox::session
