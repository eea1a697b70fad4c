#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "utils/common.hpp"

namespace replbox::sandbox {

enum class ResultKind {
    kCompleted,
    kTimeout,
    kFailure
};

enum class FailureKind {
    kNone,
    kTransport,
    kProvisioning,
    kTerminated
};

inline const char* ToString(ResultKind kind) {
    switch (kind) {
        case ResultKind::kCompleted: return "completed";
        case ResultKind::kTimeout: return "timeout";
        case ResultKind::kFailure: return "failure";
    }
    return "failure";
}

inline const char* ToString(FailureKind kind) {
    switch (kind) {
        case FailureKind::kNone: return "none";
        case FailureKind::kTransport: return "transport";
        case FailureKind::kProvisioning: return "provisioning";
        case FailureKind::kTerminated: return "terminated";
    }
    return "none";
}

// Outcome of one call. For kCompleted, success=false means the code raised
// or the command exited non-zero; output and error are still filled.
struct ExecutionResult {
    ResultKind kind = ResultKind::kFailure;
    bool success = false;
    std::string output;
    std::string error;
    std::optional<int> exit_code;
    FailureKind failure = FailureKind::kNone;
    std::string message;

    bool Completed() const { return kind == ResultKind::kCompleted; }
    bool TimedOut() const { return kind == ResultKind::kTimeout; }
    bool Failed() const { return kind == ResultKind::kFailure; }

    static ExecutionResult Success(bool ok, std::string output, std::string error,
                                   std::optional<int> exit_code = std::nullopt) {
        ExecutionResult result{};
        result.kind = ResultKind::kCompleted;
        result.success = ok;
        result.output = std::move(output);
        result.error = std::move(error);
        result.exit_code = exit_code;
        return result;
    }

    static ExecutionResult Timeout(std::chrono::milliseconds timeout) {
        ExecutionResult result{};
        result.kind = ResultKind::kTimeout;
        result.message = "Timeout after " + utils::FormatDuration(timeout);
        return result;
    }

    static ExecutionResult Failure(FailureKind failure, std::string message) {
        ExecutionResult result{};
        result.kind = ResultKind::kFailure;
        result.failure = failure;
        result.message = std::move(message);
        return result;
    }
};

}  // namespace replbox::sandbox
