#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "sandbox/sandbox_profile.hpp"
#include "sandbox/types.hpp"

namespace snipguard::sandbox {

// What the runner child receives on stdin.
struct RunnerInput {
    ExecutionRequest request;
    std::vector<std::string> namespaces;
};

nlohmann::json EncodeRunnerInput(const ExecutionRequest& request, const SandboxProfile& profile);
// Throws SandboxError on a malformed document.
RunnerInput DecodeRunnerInput(const nlohmann::json& json);

nlohmann::json EncodeOutcome(const ExecutionOutcome& outcome);
// Throws SandboxError on a malformed document.
ExecutionOutcome DecodeOutcome(const nlohmann::json& json);

}  // namespace snipguard::sandbox
