#pragma once

#include <functional>
#include <string>
#include <unordered_map>

namespace replbox::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

using LogFields = std::unordered_map<std::string, std::string>;

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    LogFields fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();
LogLevel ParseLogLevel(const std::string& value, LogLevel fallback);

// Writes "[tag] message key=value ..." to stderr when level passes the filter.
void Log(const LogMessage& message);
void Log(LogLevel level, const std::string& tag, const std::string& message, const LogFields& fields = {});

// Runs fn; a thrown exception is logged at warn level and not rethrown.
// Returns false when fn threw.
bool BestEffort(const std::string& tag, const std::string& action, const std::function<void()>& fn);

}  // namespace replbox::utils
