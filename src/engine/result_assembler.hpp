#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "nlohmann/json.hpp"
#include "sandbox/types.hpp"

namespace snipguard::engine {

class ResultAssembler {
public:
    explicit ResultAssembler(sandbox::ExecutionLimits limits);

    // Human-readable failure text; empty for Success.
    std::string ErrorMessage(const sandbox::ExecutionOutcome& outcome) const;

    // The single terminal response. `fallback_elapsed_ms` is used when the outcome
    // carries no elapsed time of its own.
    nlohmann::json ToResponse(const sandbox::ExecutionOutcome& outcome,
                              std::int64_t fallback_elapsed_ms,
                              std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    static nlohmann::json ErrorResponse(const std::string& error,
                                        std::int64_t elapsed_ms = 0,
                                        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

private:
    sandbox::ExecutionLimits limits_;
};

}  // namespace snipguard::engine
