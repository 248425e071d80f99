#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace snipguard::bus {

enum class Phase {
    kInitializing,
    kValidating,
    kSettingUp,
    kPreparingEnvironment,
    kLoadingContext,
    kExecuting,
    kProcessingResults,
    kCompleted,
    kFailed
};

const char* ToString(Phase phase);
std::optional<int> DefaultPercentage(Phase phase);
bool IsTerminal(Phase phase);

struct ProgressEvent {
    Phase phase = Phase::kInitializing;
    std::optional<int> percentage;
    std::string message;
    std::chrono::system_clock::time_point emitted_at = std::chrono::system_clock::now();
};

struct StatusEvent {
    std::string status;
    std::string message;
    nlohmann::json details;
    std::chrono::system_clock::time_point emitted_at = std::chrono::system_clock::now();
};

}  // namespace snipguard::bus
