#pragma once

#include <string>
#include <utility>
#include <vector>

namespace snipguard::utils {

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

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback);

using LogFields = std::vector<std::pair<std::string, std::string>>;

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

// Lines go to stderr as "[tag] message key=value ..."; stdout belongs to the protocol.
void Log(const LogMessage& message);
void Log(LogLevel level, const std::string& tag, const std::string& message, LogFields fields = {});

}  // namespace snipguard::utils
