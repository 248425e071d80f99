#include "bus/event_emitter.hpp"

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace snipguard::bus {

const char* ToString(Phase phase) {
    switch (phase) {
        case Phase::kInitializing: return "initializing";
        case Phase::kValidating: return "validating";
        case Phase::kSettingUp: return "setting_up";
        case Phase::kPreparingEnvironment: return "preparing_environment";
        case Phase::kLoadingContext: return "loading_context";
        case Phase::kExecuting: return "executing";
        case Phase::kProcessingResults: return "processing_results";
        case Phase::kCompleted: return "completed";
        case Phase::kFailed: return "failed";
    }
    return "unknown";
}

std::optional<int> DefaultPercentage(Phase phase) {
    switch (phase) {
        case Phase::kInitializing: return 0;
        case Phase::kValidating: return 10;
        case Phase::kSettingUp: return 20;
        case Phase::kPreparingEnvironment: return 30;
        case Phase::kLoadingContext: return 40;
        case Phase::kExecuting: return 50;
        case Phase::kProcessingResults: return 90;
        case Phase::kCompleted: return 100;
        case Phase::kFailed: return std::nullopt;
    }
    return std::nullopt;
}

bool IsTerminal(Phase phase) {
    return phase == Phase::kCompleted || phase == Phase::kFailed;
}

void EventEmitter::SubscribeProgress(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_subscribers_.push_back(std::move(callback));
}

void EventEmitter::SubscribeStatus(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_subscribers_.push_back(std::move(callback));
}

void EventEmitter::Progress(Phase phase, std::string message) {
    Progress(phase, DefaultPercentage(phase), std::move(message));
}

void EventEmitter::Progress(Phase phase, std::optional<int> percentage, std::string message) {
    ProgressEvent event{phase, percentage, std::move(message)};
    std::vector<ProgressCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_) {
            utils::Log(utils::LogLevel::kWarn, "events", "progress after terminal phase dropped",
                       {{"phase", ToString(phase)}});
            return;
        }
        finished_ = IsTerminal(phase);
        history_.push_back(event);
        callbacks = progress_subscribers_;
    }
    for (const auto& cb : callbacks) {
        if (cb) {
            cb(event);
        }
    }
}

void EventEmitter::Status(std::string status, std::string message, nlohmann::json details) {
    StatusEvent event{std::move(status), std::move(message), std::move(details)};
    std::vector<StatusCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_history_.push_back(event);
        callbacks = status_subscribers_;
    }
    for (const auto& cb : callbacks) {
        if (cb) {
            cb(event);
        }
    }
}

std::vector<ProgressEvent> EventEmitter::History() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

std::vector<StatusEvent> EventEmitter::StatusHistory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_history_;
}

bool EventEmitter::Finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

nlohmann::json ToJson(const ProgressEvent& event) {
    nlohmann::json json;
    json["step"] = ToString(event.phase);
    json["percentage"] = event.percentage ? nlohmann::json(*event.percentage) : nlohmann::json(nullptr);
    json["message"] = event.message;
    json["timestamp"] = utils::EpochSeconds(event.emitted_at);
    return json;
}

nlohmann::json ToJson(const StatusEvent& event) {
    nlohmann::json json;
    json["status"] = event.status;
    json["message"] = event.message;
    json["details"] = event.details;
    json["timestamp"] = utils::EpochSeconds(event.emitted_at);
    return json;
}

std::string FormatProgressLine(const ProgressEvent& event) {
    return "PROGRESS:" + ToJson(event).dump();
}

std::string FormatStatusLine(const StatusEvent& event) {
    return "STATUS:" + ToJson(event).dump();
}

void AttachLineWriter(EventEmitter& emitter, std::ostream& out) {
    emitter.SubscribeProgress([&out](const ProgressEvent& event) {
        out << FormatProgressLine(event) << std::endl;
    });
    emitter.SubscribeStatus([&out](const StatusEvent& event) {
        out << FormatStatusLine(event) << std::endl;
    });
}

}  // namespace snipguard::bus
