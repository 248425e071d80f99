#include "sandbox/timeout_supervisor.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>

#include "sandbox/types.hpp"
#include "utils/logging.hpp"

namespace snipguard::sandbox {
namespace {

std::chrono::milliseconds CpuElapsed(clockid_t clock, const struct timespec& start) {
    struct timespec now{};
    if (::clock_gettime(clock, &now) != 0) {
        return std::chrono::milliseconds(0);
    }
    const auto seconds = static_cast<std::int64_t>(now.tv_sec - start.tv_sec);
    const auto nanos = static_cast<std::int64_t>(now.tv_nsec - start.tv_nsec);
    return std::chrono::milliseconds(seconds * 1000 + nanos / 1000000);
}

}  // namespace

TimeoutSupervisor::TimeoutSupervisor(std::chrono::milliseconds poll_interval)
    : poll_interval_(poll_interval) {
    worker_ = std::thread([this]() { RunLoop(); });
}

TimeoutSupervisor::~TimeoutSupervisor() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        armed_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::uint64_t TimeoutSupervisor::Arm(std::chrono::milliseconds wall_budget,
                                     ExpiryHandler handler,
                                     std::optional<CpuBudget> cpu) {
    struct timespec cpu_start{};
    if (cpu && ::clock_gettime(cpu->clock, &cpu_start) != 0) {
        throw SandboxError(std::string("clock_gettime failed: ") + std::strerror(errno));
    }
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        armed_ = true;
        generation = ++generation_;
        deadline_ = std::chrono::steady_clock::now() + wall_budget;
        cpu_ = cpu;
        cpu_start_ = cpu_start;
        handler_ = std::move(handler);
        reason_.reset();
    }
    cv_.notify_all();
    return generation;
}

void TimeoutSupervisor::Disarm() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        armed_ = false;
    }
    cv_.notify_all();
}

bool TimeoutSupervisor::StillArmed(std::uint64_t generation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return armed_ && generation_ == generation;
}

std::optional<ExpiryReason> TimeoutSupervisor::Reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

std::optional<ExpiryReason> TimeoutSupervisor::CheckLocked() const {
    if (reason_) {
        return reason_;
    }
    if (std::chrono::steady_clock::now() >= deadline_) {
        return ExpiryReason::kWallClock;
    }
    if (cpu_ && CpuElapsed(cpu_->clock, cpu_start_) >= cpu_->budget) {
        return ExpiryReason::kCpuTime;
    }
    return std::nullopt;
}

void TimeoutSupervisor::RunLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (!armed_) {
            cv_.wait(lock, [this]() { return !running_ || armed_; });
            continue;
        }
        cv_.wait_for(lock, poll_interval_);
        if (!running_ || !armed_) {
            continue;
        }
        const auto reason = CheckLocked();
        if (!reason) {
            continue;
        }
        if (!reason_) {
            reason_ = reason;
            utils::Log(utils::LogLevel::kDebug, "timeout", "deadline expired",
                       {{"reason", *reason == ExpiryReason::kCpuTime ? "cpu" : "wall"}});
        }
        auto handler = handler_;
        const auto generation = generation_;
        lock.unlock();
        if (handler) {
            handler(*reason, generation);
        }
        lock.lock();
    }
}

}  // namespace snipguard::sandbox
