#pragma once

#include <optional>
#include <string>

namespace snipguard::config {

enum class IsolationStrategy {
    kInProcess,
    kIsolated
};

enum class DenylistPolicy {
    kStandard,
    kStrict
};

const char* ToString(IsolationStrategy strategy);
const char* ToString(DenylistPolicy policy);
std::optional<IsolationStrategy> ParseIsolationStrategy(const std::string& value);
std::optional<DenylistPolicy> ParseDenylistPolicy(const std::string& value);

struct SandboxConfig {
    IsolationStrategy strategy = IsolationStrategy::kIsolated;
    long long max_memory_mb = 64;
    int max_cpu_seconds = 15;
    int max_wall_seconds = 10;
    int max_processes = 1;
    long long max_file_bytes = 0;
    int grace_seconds = 5;
    DenylistPolicy denylist_policy = DenylistPolicy::kStandard;
    bool structural_analysis = true;
    std::string runner_path;
    std::string temp_root;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    SandboxConfig sandbox;
    LoggingConfig logging;
};

}  // namespace snipguard::config
