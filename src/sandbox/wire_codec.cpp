#include "sandbox/wire_codec.hpp"

#include <type_traits>

namespace snipguard::sandbox {
namespace {

template <typename T>
T Required(const nlohmann::json& json, const char* key) {
    if (!json.is_object() || !json.contains(key)) {
        throw SandboxError(std::string("runner message missing field: ") + key);
    }
    try {
        return json.at(key).get<T>();
    } catch (const nlohmann::json::exception& ex) {
        throw SandboxError(std::string("runner message field ") + key + ": " + ex.what());
    }
}

}  // namespace

nlohmann::json EncodeRunnerInput(const ExecutionRequest& request, const SandboxProfile& profile) {
    nlohmann::json limits;
    limits["maxMemoryBytes"] = request.limits.max_memory_bytes;
    limits["maxCpuSeconds"] = request.limits.max_cpu_seconds;
    limits["maxWallSeconds"] = request.limits.max_wall_seconds;
    limits["maxProcesses"] = request.limits.max_processes;
    limits["maxFileBytes"] = request.limits.max_file_bytes;

    nlohmann::json variables = nlohmann::json::object();
    for (const auto& [name, value] : request.context_variables) {
        variables[name] = value;
    }

    nlohmann::json json;
    json["snippet"] = request.snippet;
    json["variables"] = std::move(variables);
    if (request.context_data) {
        json["data"] = *request.context_data;
    }
    json["limits"] = std::move(limits);
    json["namespaces"] = profile.namespaces;
    return json;
}

RunnerInput DecodeRunnerInput(const nlohmann::json& json) {
    RunnerInput input;
    input.request.snippet = Required<std::string>(json, "snippet");
    const auto variables = Required<nlohmann::json>(json, "variables");
    if (!variables.is_object()) {
        throw SandboxError("runner message field variables: expected an object");
    }
    for (const auto& [name, value] : variables.items()) {
        input.request.context_variables.emplace(name, value);
    }
    if (json.contains("data")) {
        input.request.context_data = json.at("data");
    }
    const auto limits = Required<nlohmann::json>(json, "limits");
    input.request.limits.max_memory_bytes = Required<std::uint64_t>(limits, "maxMemoryBytes");
    input.request.limits.max_cpu_seconds = Required<std::uint32_t>(limits, "maxCpuSeconds");
    input.request.limits.max_wall_seconds = Required<std::uint32_t>(limits, "maxWallSeconds");
    input.request.limits.max_processes = Required<std::uint32_t>(limits, "maxProcesses");
    input.request.limits.max_file_bytes = Required<std::uint64_t>(limits, "maxFileBytes");
    input.namespaces = Required<std::vector<std::string>>(json, "namespaces");
    return input;
}

nlohmann::json EncodeOutcome(const ExecutionOutcome& outcome) {
    nlohmann::json json;
    json["kind"] = OutcomeName(outcome);
    std::visit([&json](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, Success>) {
            json["stdout"] = value.output;
            json["stderr"] = value.error_output;
            json["returnValue"] = value.return_value;
            json["elapsedMs"] = value.elapsed_ms;
        } else if constexpr (std::is_same_v<T, ValidationRejected>) {
            json["reason"] = value.reason;
        } else if constexpr (std::is_same_v<T, RuntimeError>) {
            json["message"] = value.message;
            json["partialStdout"] = value.partial_output;
            json["elapsedMs"] = value.elapsed_ms;
        } else if constexpr (std::is_same_v<T, TimedOut>) {
            json["elapsedMs"] = value.elapsed_ms;
        } else if constexpr (std::is_same_v<T, ResourceExceeded>) {
            json["resource"] = ToString(value.kind);
            json["elapsedMs"] = value.elapsed_ms;
        } else {
            json["message"] = value.message;
            if (value.elapsed_ms) {
                json["elapsedMs"] = *value.elapsed_ms;
            }
        }
    }, outcome);
    return json;
}

ExecutionOutcome DecodeOutcome(const nlohmann::json& json) {
    const auto kind = Required<std::string>(json, "kind");
    if (kind == "success") {
        return Success{Required<std::string>(json, "stdout"),
                       Required<std::string>(json, "stderr"),
                       json.value("returnValue", nlohmann::json()),
                       Required<std::int64_t>(json, "elapsedMs")};
    }
    if (kind == "validation_rejected") {
        return ValidationRejected{Required<std::string>(json, "reason")};
    }
    if (kind == "runtime_error") {
        return RuntimeError{Required<std::string>(json, "message"),
                            Required<std::string>(json, "partialStdout"),
                            Required<std::int64_t>(json, "elapsedMs")};
    }
    if (kind == "timed_out") {
        return TimedOut{Required<std::int64_t>(json, "elapsedMs")};
    }
    if (kind == "resource_exceeded") {
        const auto resource = ParseResourceKind(Required<std::string>(json, "resource"));
        if (!resource) {
            throw SandboxError("runner message has an unknown resource kind");
        }
        return ResourceExceeded{*resource, Required<std::int64_t>(json, "elapsedMs")};
    }
    if (kind == "internal_error") {
        InternalError error{Required<std::string>(json, "message"), std::nullopt};
        if (json.contains("elapsedMs")) {
            error.elapsed_ms = Required<std::int64_t>(json, "elapsedMs");
        }
        return error;
    }
    throw SandboxError("runner message has an unknown outcome kind: " + kind);
}

}  // namespace snipguard::sandbox
