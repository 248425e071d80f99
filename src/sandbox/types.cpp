#include "sandbox/types.hpp"

#include <type_traits>

namespace snipguard::sandbox {

const char* ToString(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::kMemory: return "memory";
        case ResourceKind::kCpu: return "cpu";
        case ResourceKind::kProcesses: return "processes";
        case ResourceKind::kFileSize: return "file_size";
    }
    return "unknown";
}

std::optional<ResourceKind> ParseResourceKind(const std::string& value) {
    if (value == "memory") {
        return ResourceKind::kMemory;
    }
    if (value == "cpu") {
        return ResourceKind::kCpu;
    }
    if (value == "processes") {
        return ResourceKind::kProcesses;
    }
    if (value == "file_size") {
        return ResourceKind::kFileSize;
    }
    return std::nullopt;
}

const char* OutcomeName(const ExecutionOutcome& outcome) {
    return std::visit([](const auto& value) -> const char* {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, Success>) {
            return "success";
        } else if constexpr (std::is_same_v<T, ValidationRejected>) {
            return "validation_rejected";
        } else if constexpr (std::is_same_v<T, RuntimeError>) {
            return "runtime_error";
        } else if constexpr (std::is_same_v<T, TimedOut>) {
            return "timed_out";
        } else if constexpr (std::is_same_v<T, ResourceExceeded>) {
            return "resource_exceeded";
        } else {
            return "internal_error";
        }
    }, outcome);
}

std::optional<std::int64_t> OutcomeElapsedMs(const ExecutionOutcome& outcome) {
    return std::visit([](const auto& value) -> std::optional<std::int64_t> {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, ValidationRejected>) {
            return std::nullopt;
        } else {
            return value.elapsed_ms;
        }
    }, outcome);
}

}  // namespace snipguard::sandbox
