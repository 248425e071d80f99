#include "engine/result_assembler.hpp"

#include <type_traits>

#include "utils/common.hpp"

namespace snipguard::engine {

ResultAssembler::ResultAssembler(sandbox::ExecutionLimits limits)
    : limits_(limits) {}

std::string ResultAssembler::ErrorMessage(const sandbox::ExecutionOutcome& outcome) const {
    return std::visit([this](const auto& value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, sandbox::Success>) {
            return {};
        } else if constexpr (std::is_same_v<T, sandbox::ValidationRejected>) {
            return "Security validation failed: " + value.reason;
        } else if constexpr (std::is_same_v<T, sandbox::RuntimeError>) {
            return "Execution error: " + value.message;
        } else if constexpr (std::is_same_v<T, sandbox::TimedOut>) {
            return "Code execution timed out (" + std::to_string(limits_.max_wall_seconds) + " seconds)";
        } else if constexpr (std::is_same_v<T, sandbox::ResourceExceeded>) {
            switch (value.kind) {
                case sandbox::ResourceKind::kMemory:
                    return "Code execution exceeded memory limit (" +
                           std::to_string(limits_.max_memory_bytes / (1024 * 1024)) + "MB)";
                case sandbox::ResourceKind::kCpu:
                    return "Code execution exceeded CPU time limit (" +
                           std::to_string(limits_.max_cpu_seconds) + " seconds)";
                case sandbox::ResourceKind::kProcesses:
                    return "Code execution exceeded process limit (" +
                           std::to_string(limits_.max_processes) + ")";
                case sandbox::ResourceKind::kFileSize:
                    return "Code execution exceeded file size limit (" +
                           std::to_string(limits_.max_file_bytes) + " bytes)";
            }
            return "Code execution exceeded a resource limit";
        } else {
            return "Sandbox error: " + value.message;
        }
    }, outcome);
}

nlohmann::json ResultAssembler::ToResponse(const sandbox::ExecutionOutcome& outcome,
                                           std::int64_t fallback_elapsed_ms,
                                           std::chrono::system_clock::time_point now) const {
    const auto elapsed = sandbox::OutcomeElapsedMs(outcome).value_or(fallback_elapsed_ms);
    nlohmann::json response;
    if (const auto* success = std::get_if<sandbox::Success>(&outcome)) {
        auto output = success->output;
        if (!success->error_output.empty()) {
            output += "\nSTDERR: " + success->error_output;
        }
        response["success"] = true;
        response["output"] = output;
        response["result"] = success->return_value;
    } else {
        response["success"] = false;
        response["error"] = ErrorMessage(outcome);
        if (const auto* failure = std::get_if<sandbox::RuntimeError>(&outcome)) {
            response["output"] = failure->partial_output;
        }
    }
    response["execution_time"] = elapsed;
    response["timestamp"] = utils::IsoTimestamp(now);
    return response;
}

nlohmann::json ResultAssembler::ErrorResponse(const std::string& error,
                                              std::int64_t elapsed_ms,
                                              std::chrono::system_clock::time_point now) {
    nlohmann::json response;
    response["success"] = false;
    response["error"] = error;
    response["execution_time"] = elapsed_ms;
    response["timestamp"] = utils::IsoTimestamp(now);
    return response;
}

}  // namespace snipguard::engine
