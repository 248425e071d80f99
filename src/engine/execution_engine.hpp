#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "bus/event_emitter.hpp"
#include "config/config_schema.hpp"
#include "engine/result_assembler.hpp"
#include "sandbox/executor.hpp"
#include "sandbox/sandbox_profile.hpp"
#include "sandbox/static_validator.hpp"
#include "sandbox/structural_analyzer.hpp"

namespace snipguard::engine {

// Orchestrates one request: validate, build capabilities, run, normalize.
class ExecutionEngine {
public:
    explicit ExecutionEngine(config::Config config);
    ExecutionEngine(config::Config config, std::unique_ptr<sandbox::Executor> executor);

    // Limits always come from the deployment profile, never from the caller.
    sandbox::ExecutionRequest MakeRequest(std::string snippet,
                                          std::map<std::string, nlohmann::json> variables = {},
                                          std::optional<nlohmann::json> data = std::nullopt) const;

    sandbox::ExecutionOutcome Execute(const sandbox::ExecutionRequest& request, bus::EventEmitter& events);
    // Execute() plus the terminal response shape.
    nlohmann::json ExecuteToResponse(const sandbox::ExecutionRequest& request, bus::EventEmitter& events);

    const sandbox::SandboxProfile& Profile() const { return profile_; }
    const char* Strategy() const { return executor_->Name(); }

private:
    sandbox::ExecutionOutcome ExecuteUnchecked(const sandbox::ExecutionRequest& request,
                                               bus::EventEmitter& events);
    void Finish(const sandbox::ExecutionOutcome& outcome, bus::EventEmitter& events) const;

    const config::Config config_;
    const sandbox::SandboxProfile profile_;
    const sandbox::StaticValidator validator_;
    const std::optional<sandbox::StructuralAnalyzer> analyzer_;
    const ResultAssembler assembler_;
    std::unique_ptr<sandbox::Executor> executor_;
};

std::unique_ptr<sandbox::Executor> MakeExecutor(const sandbox::SandboxProfile& profile);

}  // namespace snipguard::engine
