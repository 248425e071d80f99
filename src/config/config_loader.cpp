#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <string>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace snipguard::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

bool ParseBool(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

long long ParseLong(const std::string& value, long long fallback) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoll(value, &consumed);
        return consumed == value.size() ? parsed : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

void WarnIgnored(const std::string& key, const std::string& value) {
    utils::Log(utils::LogLevel::kWarn, "config", "ignoring invalid value",
               {{"key", key}, {"value", value}});
}

// 2^50 bytes; larger ceilings exceed any address space and overflow the byte arithmetic.
constexpr long long kMaxMemoryMb = 1ll << 30;

// Ceilings must stay positive and representable; anything else keeps the current value.
template <typename T>
void ApplyPositive(T& target, long long value, const std::string& key,
                   long long max = static_cast<long long>(std::numeric_limits<T>::max())) {
    if (value <= 0 || value > max) {
        WarnIgnored(key, std::to_string(value));
        return;
    }
    target = static_cast<T>(value);
}

template <typename T>
void ApplyNonNegative(T& target, long long value, const std::string& key) {
    if (value < 0 || value > static_cast<long long>(std::numeric_limits<T>::max())) {
        WarnIgnored(key, std::to_string(value));
        return;
    }
    target = static_cast<T>(value);
}

void ApplySandboxFromJson(SandboxConfig& sandbox, const nlohmann::json& data) {
    if (data.contains("strategy") && data["strategy"].is_string()) {
        const auto raw = data["strategy"].get<std::string>();
        if (auto strategy = ParseIsolationStrategy(raw)) {
            sandbox.strategy = *strategy;
        } else {
            WarnIgnored("sandbox.strategy", raw);
        }
    }
    if (data.contains("maxMemoryMb") && data["maxMemoryMb"].is_number_integer()) {
        ApplyPositive(sandbox.max_memory_mb, data["maxMemoryMb"].get<long long>(), "sandbox.maxMemoryMb", kMaxMemoryMb);
    }
    if (data.contains("maxCpuSeconds") && data["maxCpuSeconds"].is_number_integer()) {
        ApplyPositive(sandbox.max_cpu_seconds, data["maxCpuSeconds"].get<long long>(), "sandbox.maxCpuSeconds");
    }
    if (data.contains("maxWallSeconds") && data["maxWallSeconds"].is_number_integer()) {
        ApplyPositive(sandbox.max_wall_seconds, data["maxWallSeconds"].get<long long>(), "sandbox.maxWallSeconds");
    }
    if (data.contains("maxProcesses") && data["maxProcesses"].is_number_integer()) {
        ApplyPositive(sandbox.max_processes, data["maxProcesses"].get<long long>(), "sandbox.maxProcesses");
    }
    if (data.contains("maxFileBytes") && data["maxFileBytes"].is_number_integer()) {
        ApplyNonNegative(sandbox.max_file_bytes, data["maxFileBytes"].get<long long>(), "sandbox.maxFileBytes");
    }
    if (data.contains("graceSeconds") && data["graceSeconds"].is_number_integer()) {
        ApplyPositive(sandbox.grace_seconds, data["graceSeconds"].get<long long>(), "sandbox.graceSeconds");
    }
    if (data.contains("denylistPolicy") && data["denylistPolicy"].is_string()) {
        const auto raw = data["denylistPolicy"].get<std::string>();
        if (auto policy = ParseDenylistPolicy(raw)) {
            sandbox.denylist_policy = *policy;
        } else {
            WarnIgnored("sandbox.denylistPolicy", raw);
        }
    }
    if (data.contains("structuralAnalysis") && data["structuralAnalysis"].is_boolean()) {
        sandbox.structural_analysis = data["structuralAnalysis"].get<bool>();
    }
    if (data.contains("runnerPath") && data["runnerPath"].is_string()) {
        sandbox.runner_path = data["runnerPath"].get<std::string>();
    }
    if (data.contains("tempRoot") && data["tempRoot"].is_string()) {
        sandbox.temp_root = data["tempRoot"].get<std::string>();
    }
}

}  // namespace

const char* ToString(IsolationStrategy strategy) {
    switch (strategy) {
        case IsolationStrategy::kInProcess: return "in_process";
        case IsolationStrategy::kIsolated: return "isolated";
    }
    return "unknown";
}

const char* ToString(DenylistPolicy policy) {
    switch (policy) {
        case DenylistPolicy::kStandard: return "standard";
        case DenylistPolicy::kStrict: return "strict";
    }
    return "unknown";
}

std::optional<IsolationStrategy> ParseIsolationStrategy(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    if (lowered == "in_process" || lowered == "in-process" || lowered == "inprocess") {
        return IsolationStrategy::kInProcess;
    }
    if (lowered == "isolated" || lowered == "process") {
        return IsolationStrategy::kIsolated;
    }
    return std::nullopt;
}

std::optional<DenylistPolicy> ParseDenylistPolicy(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    if (lowered == "standard") {
        return DenylistPolicy::kStandard;
    }
    if (lowered == "strict") {
        return DenylistPolicy::kStrict;
    }
    return std::nullopt;
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }
    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        ApplySandboxFromJson(config.sandbox, data["sandbox"]);
    }
    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            config.logging.level = logging["level"].get<std::string>();
        }
    }
}

void ApplyConfigFromEnv(Config& config) {
    auto& sandbox = config.sandbox;

    const auto strategy = GetEnvFallback("SNIPGUARD_SANDBOX__STRATEGY", "SNIPGUARD_SANDBOX_STRATEGY");
    if (!strategy.empty()) {
        if (auto parsed = ParseIsolationStrategy(strategy)) {
            sandbox.strategy = *parsed;
        } else {
            WarnIgnored("SNIPGUARD_SANDBOX__STRATEGY", strategy);
        }
    }

    const auto memory = GetEnvFallback("SNIPGUARD_SANDBOX__MAX_MEMORY_MB", "SNIPGUARD_SANDBOX_MAX_MEMORY_MB");
    if (!memory.empty()) {
        ApplyPositive(sandbox.max_memory_mb, ParseLong(memory, -1), "SNIPGUARD_SANDBOX__MAX_MEMORY_MB", kMaxMemoryMb);
    }

    const auto cpu = GetEnvFallback("SNIPGUARD_SANDBOX__MAX_CPU_SECONDS", "SNIPGUARD_SANDBOX_MAX_CPU_SECONDS");
    if (!cpu.empty()) {
        ApplyPositive(sandbox.max_cpu_seconds, ParseLong(cpu, -1), "SNIPGUARD_SANDBOX__MAX_CPU_SECONDS");
    }

    const auto wall = GetEnvFallback("SNIPGUARD_SANDBOX__MAX_WALL_SECONDS", "SNIPGUARD_SANDBOX_MAX_WALL_SECONDS");
    if (!wall.empty()) {
        ApplyPositive(sandbox.max_wall_seconds, ParseLong(wall, -1), "SNIPGUARD_SANDBOX__MAX_WALL_SECONDS");
    }

    const auto processes = GetEnvFallback("SNIPGUARD_SANDBOX__MAX_PROCESSES", "SNIPGUARD_SANDBOX_MAX_PROCESSES");
    if (!processes.empty()) {
        ApplyPositive(sandbox.max_processes, ParseLong(processes, -1), "SNIPGUARD_SANDBOX__MAX_PROCESSES");
    }

    const auto file_bytes = GetEnvFallback("SNIPGUARD_SANDBOX__MAX_FILE_BYTES", "SNIPGUARD_SANDBOX_MAX_FILE_BYTES");
    if (!file_bytes.empty()) {
        ApplyNonNegative(sandbox.max_file_bytes, ParseLong(file_bytes, -1), "SNIPGUARD_SANDBOX__MAX_FILE_BYTES");
    }

    const auto grace = GetEnvFallback("SNIPGUARD_SANDBOX__GRACE_SECONDS", "SNIPGUARD_SANDBOX_GRACE_SECONDS");
    if (!grace.empty()) {
        ApplyPositive(sandbox.grace_seconds, ParseLong(grace, -1), "SNIPGUARD_SANDBOX__GRACE_SECONDS");
    }

    const auto policy = GetEnvFallback("SNIPGUARD_SANDBOX__DENYLIST_POLICY", "SNIPGUARD_SANDBOX_DENYLIST_POLICY");
    if (!policy.empty()) {
        if (auto parsed = ParseDenylistPolicy(policy)) {
            sandbox.denylist_policy = *parsed;
        } else {
            WarnIgnored("SNIPGUARD_SANDBOX__DENYLIST_POLICY", policy);
        }
    }

    const auto structural = GetEnvFallback(
        "SNIPGUARD_SANDBOX__STRUCTURAL_ANALYSIS",
        "SNIPGUARD_SANDBOX_STRUCTURAL_ANALYSIS");
    if (!structural.empty()) {
        sandbox.structural_analysis = ParseBool(structural);
    }

    const auto runner = GetEnvFallback("SNIPGUARD_SANDBOX__RUNNER_PATH", "SNIPGUARD_SANDBOX_RUNNER_PATH");
    if (!runner.empty()) {
        sandbox.runner_path = runner;
    }

    const auto temp_root = GetEnvFallback("SNIPGUARD_SANDBOX__TEMP_ROOT", "SNIPGUARD_SANDBOX_TEMP_ROOT");
    if (!temp_root.empty()) {
        sandbox.temp_root = temp_root;
    }

    const auto log_level = GetEnvFallback("SNIPGUARD_LOGGING__LEVEL", "SNIPGUARD_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

std::filesystem::path DefaultConfigPath() {
    const auto explicit_path = GetEnv("SNIPGUARD_CONFIG");
    if (!explicit_path.empty()) {
        return std::filesystem::path(explicit_path);
    }
    return GetHomePath() / ".snipguard" / "config.json";
}

Config LoadConfig(const std::filesystem::path& path) {
    Config config{};

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        try {
            std::ifstream input(path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::Log(utils::LogLevel::kWarn, "config", "keeping defaults, config file unreadable",
                       {{"path", path.string()}, {"error", ex.what()}});
        }
    }

    ApplyConfigFromEnv(config);
    return config;
}

Config LoadConfig() {
    return LoadConfig(DefaultConfigPath());
}

}  // namespace snipguard::config
