#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>

namespace snipguard::utils {
namespace {

std::mutex g_log_mutex;
LogConfig g_log_config;

bool NeedsQuoting(const std::string& value) {
    return value.empty() || std::any_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c) || c == '"';
    });
}

}  // namespace

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

void SetLogConfig(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_config = config;
}

void Log(const LogMessage& message) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (message.level < g_log_config.min_level) {
        return;
    }
    std::cerr << "[" << message.tag << "] ";
    if (message.level != LogLevel::kInfo) {
        std::cerr << ToString(message.level) << " ";
    }
    std::cerr << message.message;
    for (const auto& [key, value] : message.fields) {
        std::cerr << " " << key << "=";
        if (NeedsQuoting(value)) {
            std::cerr << "\"" << value << "\"";
        } else {
            std::cerr << value;
        }
    }
    std::cerr << std::endl;
}

void Log(LogLevel level, const std::string& tag, const std::string& message, LogFields fields) {
    Log(LogMessage{level, tag, message, std::move(fields)});
}

}  // namespace snipguard::utils
