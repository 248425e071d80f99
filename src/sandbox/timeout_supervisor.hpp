#pragma once

#include <time.h>

#include <chrono>
#include <cstdint>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

namespace snipguard::sandbox {

enum class ExpiryReason {
    kWallClock,
    kCpuTime
};

struct CpuBudget {
    clockid_t clock = CLOCK_THREAD_CPUTIME_ID;
    std::chrono::milliseconds budget{0};
};

// Deadline watchdog. The worker thread lives as long as the supervisor, so arming
// never spawns anything. Once expired, the handler is re-delivered every poll
// interval until Disarm(). Each Arm() starts a new generation; a handler that
// runs late can tell whether its generation is still the armed one.
class TimeoutSupervisor {
public:
    using ExpiryHandler = std::function<void(ExpiryReason, std::uint64_t generation)>;

    explicit TimeoutSupervisor(std::chrono::milliseconds poll_interval = std::chrono::milliseconds(50));
    ~TimeoutSupervisor();

    TimeoutSupervisor(const TimeoutSupervisor&) = delete;
    TimeoutSupervisor& operator=(const TimeoutSupervisor&) = delete;

    std::uint64_t Arm(std::chrono::milliseconds wall_budget,
                      ExpiryHandler handler,
                      std::optional<CpuBudget> cpu = std::nullopt);
    // Does not wait for a handler that is already running.
    void Disarm();

    bool StillArmed(std::uint64_t generation) const;
    std::optional<ExpiryReason> Reason() const;

private:
    void RunLoop();
    std::optional<ExpiryReason> CheckLocked() const;

    const std::chrono::milliseconds poll_interval_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_ = true;
    bool armed_ = false;
    std::uint64_t generation_ = 0;
    std::chrono::steady_clock::time_point deadline_{};
    std::optional<CpuBudget> cpu_;
    struct timespec cpu_start_{};
    ExpiryHandler handler_;
    std::optional<ExpiryReason> reason_;
    std::thread worker_;
};

class ScopedDeadline {
public:
    ScopedDeadline(TimeoutSupervisor& supervisor,
                   std::chrono::milliseconds wall_budget,
                   TimeoutSupervisor::ExpiryHandler handler,
                   std::optional<CpuBudget> cpu = std::nullopt)
        : supervisor_(supervisor) {
        supervisor_.Arm(wall_budget, std::move(handler), cpu);
    }
    ~ScopedDeadline() { supervisor_.Disarm(); }

    ScopedDeadline(const ScopedDeadline&) = delete;
    ScopedDeadline& operator=(const ScopedDeadline&) = delete;

private:
    TimeoutSupervisor& supervisor_;
};

}  // namespace snipguard::sandbox
