#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/types.hpp"

namespace snipguard::sandbox {

struct SandboxProfile {
    ExecutionLimits limits;
    std::vector<std::string> namespaces;
    config::IsolationStrategy strategy = config::IsolationStrategy::kIsolated;
    config::DenylistPolicy denylist_policy = config::DenylistPolicy::kStandard;
    bool structural_analysis = true;
    std::chrono::seconds grace{5};
    std::filesystem::path temp_root;
    std::filesystem::path runner_path;
};

SandboxProfile MakeProfile(const config::SandboxConfig& config);

// Path of the running executable; the runner child is spawned from it by default.
std::filesystem::path CurrentExecutable();

}  // namespace snipguard::sandbox
