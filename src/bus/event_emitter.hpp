#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "bus/events.hpp"

namespace snipguard::bus {

// Ordered, append-only event stream for one request. Subscribers run synchronously
// on the emitting thread, in subscription order.
class EventEmitter {
public:
    using ProgressCallback = std::function<void(const ProgressEvent&)>;
    using StatusCallback = std::function<void(const StatusEvent&)>;

    void SubscribeProgress(ProgressCallback callback);
    void SubscribeStatus(StatusCallback callback);

    void Progress(Phase phase, std::string message);
    void Progress(Phase phase, std::optional<int> percentage, std::string message);
    void Status(std::string status, std::string message, nlohmann::json details = nullptr);

    std::vector<ProgressEvent> History() const;
    std::vector<StatusEvent> StatusHistory() const;
    bool Finished() const;

private:
    mutable std::mutex mutex_;
    std::vector<ProgressEvent> history_;
    std::vector<StatusEvent> status_history_;
    std::vector<ProgressCallback> progress_subscribers_;
    std::vector<StatusCallback> status_subscribers_;
    bool finished_ = false;
};

nlohmann::json ToJson(const ProgressEvent& event);
nlohmann::json ToJson(const StatusEvent& event);
std::string FormatProgressLine(const ProgressEvent& event);
std::string FormatStatusLine(const StatusEvent& event);

// Writes every event as a PROGRESS:/STATUS: line, flushed.
void AttachLineWriter(EventEmitter& emitter, std::ostream& out);

}  // namespace snipguard::bus
