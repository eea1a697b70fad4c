#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>

namespace replbox::utils {
namespace {

std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

LogConfig& MutableConfig() {
    static LogConfig config{};
    return config;
}

}  // namespace

void SetLogConfig(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(LogMutex());
    MutableConfig() = config;
}

LogConfig GetLogConfig() {
    std::lock_guard<std::mutex> lock(LogMutex());
    return MutableConfig();
}

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void Log(const LogMessage& message) {
    std::ostringstream line;
    line << "[" << message.tag << "] " << message.message;
    // Sorted so that lines for the same event always read the same way.
    const std::map<std::string, std::string> ordered(message.fields.begin(), message.fields.end());
    for (const auto& [key, value] : ordered) {
        line << " " << key << "=" << value;
    }
    std::lock_guard<std::mutex> lock(LogMutex());
    if (static_cast<int>(message.level) < static_cast<int>(MutableConfig().min_level)) {
        return;
    }
    if (message.level == LogLevel::kWarn || message.level == LogLevel::kError) {
        std::cerr << ToString(message.level) << " ";
    }
    std::cerr << line.str() << std::endl;
}

void Log(LogLevel level, const std::string& tag, const std::string& message, const LogFields& fields) {
    Log(LogMessage{level, tag, message, fields});
}

bool BestEffort(const std::string& tag, const std::string& action, const std::function<void()>& fn) {
    try {
        fn();
        return true;
    } catch (const std::exception& ex) {
        Log(LogLevel::kWarn, tag, action + " failed", {{"error", ex.what()}});
    }
    return false;
}

}  // namespace replbox::utils
