#include "tools/code_execution_tool.hpp"

#include <regex>

#include "sandbox/capability_allowlist.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace snipguard::tools {
namespace {

bool IsVariableName(const std::string& name) {
    static const std::regex kIdentifier("[A-Za-z][A-Za-z0-9_]*");
    return std::regex_match(name, kIdentifier);
}

}  // namespace

CodeExecutionTool::CodeExecutionTool(engine::ExecutionEngine& engine)
    : engine_(engine) {}

std::string CodeExecutionTool::Description() const {
    const auto& limits = engine_.Profile().limits;
    return "Execute a Python snippet in a restricted sandbox. The value of a single expression, "
           "or of a variable named `result`, is returned along with printed output. Available "
           "modules: " + utils::Join(sandbox::CapabilityAllowlist::DefaultNamespaces(), ", ") +
           ". Limits: " + std::to_string(limits.max_wall_seconds) + "s wall time, " +
           std::to_string(limits.max_memory_bytes / (1024 * 1024)) + "MB memory.";
}

std::string CodeExecutionTool::ParametersJson() const {
    return R"({"type":"object","properties":{"code":{"type":"string","description":"Python code to execute"},)"
           R"("context_data":{"type":"object","description":"Values made available to the code",)"
           R"("properties":{"variables":{"type":"object","description":"Bound as global names"},)"
           R"("data":{"description":"Bound as the global name `data`"}}}},"required":["code"]})";
}

sandbox::ExecutionRequest CodeExecutionTool::ParseRequest(const nlohmann::json& params) const {
    if (!params.is_object()) {
        throw InputError("Request must be a JSON object");
    }
    if (!params.contains("code")) {
        throw InputError("Missing required parameter: code");
    }
    if (!params.at("code").is_string()) {
        throw InputError("Parameter 'code' must be a string");
    }

    std::map<std::string, nlohmann::json> variables;
    std::optional<nlohmann::json> data;
    if (params.contains("context_data") && !params.at("context_data").is_null()) {
        const auto& context = params.at("context_data");
        if (!context.is_object()) {
            throw InputError("Parameter 'context_data' must be an object");
        }
        if (context.contains("variables") && !context.at("variables").is_null()) {
            const auto& values = context.at("variables");
            if (!values.is_object()) {
                throw InputError("Parameter 'context_data.variables' must be an object");
            }
            for (const auto& [name, value] : values.items()) {
                if (!IsVariableName(name)) {
                    throw InputError("Invalid variable name: '" + name + "'");
                }
                variables.emplace(name, value);
            }
        }
        if (context.contains("data")) {
            data = context.at("data");
        }
    }
    return engine_.MakeRequest(params.at("code").get<std::string>(), std::move(variables), std::move(data));
}

nlohmann::json CodeExecutionTool::Execute(const nlohmann::json& params, bus::EventEmitter& events) {
    const auto request = ParseRequest(params);
    utils::Log(utils::LogLevel::kInfo, "tool", "start",
               {{"name", Name()}, {"variables", std::to_string(request.context_variables.size())}});
    auto response = engine_.ExecuteToResponse(request, events);
    utils::Log(utils::LogLevel::kInfo, "tool", "end",
               {{"name", Name()}, {"success", response.value("success", false) ? "true" : "false"}});
    return response;
}

}  // namespace snipguard::tools
