#include "engine/execution_engine.hpp"

#include <chrono>
#include <vector>

#include "sandbox/capability_allowlist.hpp"
#include "sandbox/in_process_executor.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace snipguard::engine {
namespace {

std::optional<sandbox::StructuralAnalyzer> MakeAnalyzer(const sandbox::SandboxProfile& profile) {
    if (!profile.structural_analysis) {
        return std::nullopt;
    }
    return sandbox::StructuralAnalyzer(sandbox::CapabilityAllowlist::BuildNamespace(profile.namespaces));
}

std::vector<std::string> ContextNames(const sandbox::ExecutionRequest& request) {
    std::vector<std::string> names;
    names.reserve(request.context_variables.size());
    for (const auto& [name, _] : request.context_variables) {
        names.push_back(name);
    }
    return names;
}

}  // namespace

std::unique_ptr<sandbox::Executor> MakeExecutor(const sandbox::SandboxProfile& profile) {
    if (profile.strategy == config::IsolationStrategy::kInProcess) {
        return std::make_unique<sandbox::InProcessExecutor>(sandbox::LimitMode::kScoped);
    }
    return std::make_unique<sandbox::SandboxExecutor>(profile);
}

ExecutionEngine::ExecutionEngine(config::Config config)
    : ExecutionEngine(config, MakeExecutor(sandbox::MakeProfile(config.sandbox))) {}

ExecutionEngine::ExecutionEngine(config::Config config, std::unique_ptr<sandbox::Executor> executor)
    : config_(std::move(config))
    , profile_(sandbox::MakeProfile(config_.sandbox))
    , validator_(profile_.denylist_policy)
    , analyzer_(MakeAnalyzer(profile_))
    , assembler_(profile_.limits)
    , executor_(std::move(executor)) {}

sandbox::ExecutionRequest ExecutionEngine::MakeRequest(std::string snippet,
                                                       std::map<std::string, nlohmann::json> variables,
                                                       std::optional<nlohmann::json> data) const {
    sandbox::ExecutionRequest request;
    request.snippet = std::move(snippet);
    request.context_variables = std::move(variables);
    request.context_data = std::move(data);
    request.limits = profile_.limits;
    return request;
}

sandbox::ExecutionOutcome ExecutionEngine::Execute(const sandbox::ExecutionRequest& request,
                                                   bus::EventEmitter& events) {
    const auto start = std::chrono::steady_clock::now();
    utils::Log(utils::LogLevel::kInfo, "engine", "start",
               {{"strategy", executor_->Name()}, {"size", std::to_string(request.snippet.size())}});
    sandbox::ExecutionOutcome outcome;
    try {
        outcome = ExecuteUnchecked(request, events);
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "engine", "internal failure", {{"error", ex.what()}});
        outcome = sandbox::InternalError{ex.what(), utils::ElapsedMs(start)};
    }
    Finish(outcome, events);
    utils::Log(utils::LogLevel::kInfo, "engine", "end",
               {{"outcome", sandbox::OutcomeName(outcome)},
                {"elapsed_ms", std::to_string(utils::ElapsedMs(start))}});
    return outcome;
}

nlohmann::json ExecutionEngine::ExecuteToResponse(const sandbox::ExecutionRequest& request,
                                                  bus::EventEmitter& events) {
    const auto start = std::chrono::steady_clock::now();
    const auto outcome = Execute(request, events);
    return assembler_.ToResponse(outcome, utils::ElapsedMs(start));
}

sandbox::ExecutionOutcome ExecutionEngine::ExecuteUnchecked(const sandbox::ExecutionRequest& request,
                                                            bus::EventEmitter& events) {
    events.Progress(bus::Phase::kInitializing, "Starting code execution");
    events.Progress(bus::Phase::kValidating, "Validating code security");
    auto verdict = validator_.Validate(request.snippet);
    if (verdict.ok && analyzer_) {
        verdict = analyzer_->Analyze(request.snippet, ContextNames(request));
    }
    if (!verdict.ok) {
        utils::Log(utils::LogLevel::kInfo, "engine", "rejected",
                   {{"pattern", verdict.pattern}, {"policy", config::ToString(validator_.Policy())}});
        return sandbox::ValidationRejected{verdict.reason};
    }

    events.Progress(bus::Phase::kSettingUp, "Setting up security restrictions");
    const auto capabilities = sandbox::CapabilityAllowlist::BuildNamespace(profile_.namespaces);
    auto outcome = executor_->Run(request, capabilities, events);
    events.Progress(bus::Phase::kProcessingResults, "Processing execution results");
    return outcome;
}

void ExecutionEngine::Finish(const sandbox::ExecutionOutcome& outcome, bus::EventEmitter& events) const {
    if (const auto* success = std::get_if<sandbox::Success>(&outcome)) {
        events.Progress(bus::Phase::kCompleted, "Code execution completed successfully");
        events.Status("completed", "Execution finished successfully",
                      {{"execution_time", success->elapsed_ms}});
        return;
    }
    const auto error = assembler_.ErrorMessage(outcome);
    events.Progress(bus::Phase::kFailed, error);
    nlohmann::json details = {{"outcome", sandbox::OutcomeName(outcome)}};
    if (const auto elapsed = sandbox::OutcomeElapsedMs(outcome)) {
        details["execution_time"] = *elapsed;
    }
    events.Status("failed", error, details);
}

}  // namespace snipguard::engine
