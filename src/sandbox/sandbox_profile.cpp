#include "sandbox/sandbox_profile.hpp"

#include <system_error>

#include "sandbox/capability_allowlist.hpp"
#include "utils/logging.hpp"

namespace snipguard::sandbox {

SandboxProfile MakeProfile(const config::SandboxConfig& config) {
    SandboxProfile profile;
    profile.limits.max_memory_bytes = static_cast<std::uint64_t>(config.max_memory_mb) * 1024 * 1024;
    profile.limits.max_cpu_seconds = static_cast<std::uint32_t>(config.max_cpu_seconds);
    profile.limits.max_wall_seconds = static_cast<std::uint32_t>(config.max_wall_seconds);
    profile.limits.max_processes = static_cast<std::uint32_t>(config.max_processes);
    profile.limits.max_file_bytes = static_cast<std::uint64_t>(config.max_file_bytes);
    profile.namespaces = CapabilityAllowlist::DefaultNamespaces();
    profile.strategy = config.strategy;
    profile.denylist_policy = config.denylist_policy;
    profile.structural_analysis = config.structural_analysis;
    profile.grace = std::chrono::seconds(config.grace_seconds);
    profile.temp_root = config.temp_root;
    profile.runner_path = config.runner_path.empty() ? CurrentExecutable()
                                                     : std::filesystem::path(config.runner_path);
    return profile;
}

std::filesystem::path CurrentExecutable() {
    std::error_code ec;
    auto path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        utils::Log(utils::LogLevel::kWarn, "sandbox", "cannot resolve /proc/self/exe",
                   {{"error", ec.message()}});
        return {};
    }
    return path;
}

}  // namespace snipguard::sandbox
