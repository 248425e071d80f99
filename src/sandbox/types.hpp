#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

#include "nlohmann/json.hpp"

namespace snipguard::sandbox {

class SandboxError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class CapabilityError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

struct ExecutionLimits {
    std::uint64_t max_memory_bytes = 64ull * 1024 * 1024;
    std::uint32_t max_cpu_seconds = 15;
    std::uint32_t max_wall_seconds = 10;
    std::uint32_t max_processes = 1;
    std::uint64_t max_file_bytes = 0;
};

struct ExecutionRequest {
    std::string snippet;
    std::map<std::string, nlohmann::json> context_variables;
    std::optional<nlohmann::json> context_data;
    ExecutionLimits limits;

    bool HasContext() const {
        return !context_variables.empty() || context_data.has_value();
    }
};

enum class ResourceKind {
    kMemory,
    kCpu,
    kProcesses,
    kFileSize
};

const char* ToString(ResourceKind kind);
std::optional<ResourceKind> ParseResourceKind(const std::string& value);

struct Success {
    std::string output;
    std::string error_output;
    nlohmann::json return_value;
    std::int64_t elapsed_ms = 0;
};

struct ValidationRejected {
    std::string reason;
};

struct RuntimeError {
    std::string message;
    std::string partial_output;
    std::int64_t elapsed_ms = 0;
};

struct TimedOut {
    std::int64_t elapsed_ms = 0;
};

struct ResourceExceeded {
    ResourceKind kind = ResourceKind::kMemory;
    std::int64_t elapsed_ms = 0;
};

struct InternalError {
    std::string message;
    std::optional<std::int64_t> elapsed_ms;
};

using ExecutionOutcome = std::variant<
    Success,
    ValidationRejected,
    RuntimeError,
    TimedOut,
    ResourceExceeded,
    InternalError>;

const char* OutcomeName(const ExecutionOutcome& outcome);
std::optional<std::int64_t> OutcomeElapsedMs(const ExecutionOutcome& outcome);

}  // namespace snipguard::sandbox
