#include "session/request_dispatcher.hpp"

#include <cmath>
#include <vector>

#include "utils/logging.hpp"

namespace replbox::session {

using utils::LogLevel;

namespace {

// Optional string field; a present field of another type is an error.
std::optional<std::string> ReadString(const nlohmann::json& request, const char* key, std::string& error) {
    auto it = request.find(key);
    if (it == request.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        error = std::string(key) + " must be a string";
        return std::nullopt;
    }
    return it->get<std::string>();
}

nlohmann::json HandleChecked(SandboxService& service, const nlohmann::json& request) {
    std::string error;
    const auto op = ReadString(request, "op", error);
    const auto caller = ReadString(request, "caller", error);
    if (!error.empty()) {
        return BuildRequestFailure(error);
    }
    if (!caller || caller->empty()) {
        return BuildRequestFailure("missing caller");
    }
    if (!op) {
        return BuildRequestFailure("missing op");
    }

    if (*op == "execute_code" || *op == "execute_shell") {
        const bool code = *op == "execute_code";
        const char* field = code ? "code" : "command";
        const auto text = ReadString(request, field, error);
        if (!error.empty()) {
            return BuildRequestFailure(error);
        }
        if (!text) {
            return BuildRequestFailure(std::string("missing ") + field);
        }
        return BuildResultJson(code
            ? service.ExecuteCode(*caller, *text, ReadTimeout(request))
            : service.ExecuteShell(*caller, *text, ReadTimeout(request)));
    }
    if (*op == "release") {
        service.ReleaseSession(*caller);
        return {{"kind", "completed"}, {"success", true}};
    }
    return BuildRequestFailure("unknown op '" + *op + "'");
}

}  // namespace

nlohmann::json BuildResultJson(const sandbox::ExecutionResult& result) {
    nlohmann::json json = {
        {"kind", sandbox::ToString(result.kind)},
        {"success", result.success}
    };
    if (result.Completed()) {
        json["stdout"] = result.output;
        json["stderr"] = result.error;
        json["exitCode"] = result.exit_code.has_value() ? nlohmann::json(*result.exit_code) : nlohmann::json(nullptr);
    } else {
        json["message"] = result.message;
    }
    if (result.Failed()) {
        json["failure"] = sandbox::ToString(result.failure);
    }
    return json;
}

nlohmann::json BuildRequestFailure(const std::string& message) {
    return {{"kind", "failure"}, {"success", false}, {"failure", "request"}, {"message", message}};
}

std::optional<std::chrono::milliseconds> ReadTimeout(const nlohmann::json& request) {
    auto it = request.find("timeoutMs");
    if (it == request.end() || !it->is_number()) {
        return std::nullopt;
    }
    const auto value = it->get<double>();
    if (!std::isfinite(value) || value <= 0 || value > kMaxRequestTimeoutMs) {
        utils::Log(LogLevel::kWarn, "serve", "ignoring timeoutMs", {{"value", it->dump()}});
        return std::nullopt;
    }
    return std::chrono::milliseconds(static_cast<long long>(value));
}

nlohmann::json HandleRequest(SandboxService& service, const nlohmann::json& request) {
    if (!request.is_object()) {
        return BuildRequestFailure("malformed request");
    }
    try {
        return HandleChecked(service, request);
    } catch (const nlohmann::json::exception& ex) {
        return BuildRequestFailure(ex.what());
    } catch (const std::exception& ex) {
        utils::Log(LogLevel::kError, "serve", "request failed", {{"error", ex.what()}});
        return {{"kind", "failure"}, {"success", false}, {"failure", "transport"}, {"message", ex.what()}};
    }
}

RequestDispatcher::RequestDispatcher(SandboxService& service, Emit emit)
    : service_(service)
    , emit_(std::move(emit)) {}

RequestDispatcher::~RequestDispatcher() {
    Drain();
}

void RequestDispatcher::Respond(const nlohmann::json& request, nlohmann::json response) {
    if (request.is_object() && request.contains("id")) {
        response["id"] = request["id"];
    }
    emit_(response);
}

void RequestDispatcher::Submit(const std::string& line) {
    auto request = nlohmann::json::parse(line, nullptr, false);
    if (request.is_discarded() || !request.is_object()) {
        Respond(request, BuildRequestFailure("malformed request"));
        return;
    }
    auto caller = request.find("caller");
    if (caller == request.end() || !caller->is_string() || caller->get<std::string>().empty()) {
        Respond(request, BuildRequestFailure(
            caller == request.end() || caller->is_null() ? "missing caller" : "caller must be a non-empty string"));
        return;
    }
    const auto caller_id = caller->get<std::string>();

    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++submitted_;
        // Idle lanes of other callers are reaped here so the set of threads
        // tracks the callers with work in flight.
        for (auto it = lanes_.begin(); it != lanes_.end();) {
            if (it->first != caller_id && !it->second->running) {
                finished.push_back(std::move(it->second->worker));
                it = lanes_.erase(it);
            } else {
                ++it;
            }
        }

        auto& lane = lanes_[caller_id];
        if (!lane) {
            lane = std::make_unique<Lane>();
        }
        lane->pending.push_back(std::move(request));
        if (!lane->running) {
            if (lane->worker.joinable()) {
                finished.push_back(std::move(lane->worker));
            }
            lane->running = true;
            lane->worker = std::thread(&RequestDispatcher::RunLane, this, lane.get());
        }
    }
    for (auto& worker : finished) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void RequestDispatcher::RunLane(Lane* lane) {
    while (true) {
        nlohmann::json request;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (lane->pending.empty()) {
                lane->running = false;
                idle_.notify_all();
                return;
            }
            request = std::move(lane->pending.front());
            lane->pending.pop_front();
        }
        Respond(request, HandleRequest(service_, request));
    }
}

void RequestDispatcher::Drain() {
    std::unordered_map<std::string, std::unique_ptr<Lane>> lanes;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_.wait(lock, [this]() {
            for (const auto& [_, lane] : lanes_) {
                if (lane->running) {
                    return false;
                }
            }
            return true;
        });
        lanes.swap(lanes_);
    }
    for (auto& [_, lane] : lanes) {
        if (lane->worker.joinable()) {
            lane->worker.join();
        }
    }
}

std::size_t RequestDispatcher::ActiveCallers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lanes_.size();
}

std::size_t RequestDispatcher::Submitted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return submitted_;
}

}  // namespace replbox::session
