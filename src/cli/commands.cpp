#include <exception>
#include <iostream>
#include <iterator>
#include <string>

#include "bus/event_emitter.hpp"
#include "config/config_loader.hpp"
#include "engine/execution_engine.hpp"
#include "engine/result_assembler.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/runner.hpp"
#include "tools/code_execution_tool.hpp"
#include "utils/logging.hpp"

namespace {

constexpr int kExitInputError = 2;

std::string Dump(const nlohmann::json& json) {
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void ConfigureLogging(const snipguard::config::Config& config) {
    snipguard::utils::LogConfig log_config;
    log_config.min_level = snipguard::utils::ParseLogLevel(config.logging.level, snipguard::utils::LogLevel::kInfo);
    snipguard::utils::SetLogConfig(log_config);
}

int RunRequest() {
    const std::string input((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    if (input.find_first_not_of(" \t\r\n") == std::string::npos) {
        std::cout << Dump(snipguard::engine::ResultAssembler::ErrorResponse("No input data provided")) << std::endl;
        return kExitInputError;
    }
    nlohmann::json params;
    try {
        params = nlohmann::json::parse(input);
    } catch (const nlohmann::json::parse_error& ex) {
        snipguard::utils::Log(snipguard::utils::LogLevel::kWarn, "cli", "invalid json", {{"error", ex.what()}});
        std::cout << Dump(snipguard::engine::ResultAssembler::ErrorResponse("Invalid JSON input")) << std::endl;
        return kExitInputError;
    }

    const auto config = snipguard::config::LoadConfig();
    ConfigureLogging(config);
    snipguard::engine::ExecutionEngine engine(config);
    snipguard::tools::CodeExecutionTool tool(engine);

    snipguard::bus::EventEmitter events;
    snipguard::bus::AttachLineWriter(events, std::cout);
    try {
        std::cout << Dump(tool.Execute(params, events)) << std::endl;
    } catch (const snipguard::tools::InputError& ex) {
        std::cout << Dump(snipguard::engine::ResultAssembler::ErrorResponse(ex.what())) << std::endl;
        return kExitInputError;
    }
    return 0;
}

int RunSchema() {
    const auto config = snipguard::config::LoadConfig();
    snipguard::engine::ExecutionEngine engine(config);
    snipguard::tools::CodeExecutionTool tool(engine);
    nlohmann::json schema;
    schema["name"] = tool.Name();
    schema["description"] = tool.Description();
    schema["parameters"] = nlohmann::json::parse(tool.ParametersJson());
    std::cout << schema.dump(2) << std::endl;
    return 0;
}

int RunRunner() {
    const auto config = snipguard::config::LoadConfig();
    ConfigureLogging(config);
    return snipguard::sandbox::RunChild(std::cin, std::cout);
}

}  // namespace

int main(int argc, char** argv) {
    const std::string command = argc >= 2 ? argv[1] : "run";
    try {
        if (command == "run") {
            return RunRequest();
        }
        if (command == "runner") {
            return RunRunner();
        }
        if (command == "schema") {
            return RunSchema();
        }
    } catch (const std::exception& ex) {
        snipguard::utils::Log(snipguard::utils::LogLevel::kError, "cli", "fatal", {{"error", ex.what()}});
        std::cout << Dump(snipguard::engine::ResultAssembler::ErrorResponse(
            std::string("Unexpected error: ") + ex.what())) << std::endl;
        return 1;
    }
    std::cout << "Usage: snipguard [run] | snipguard schema | snipguard runner" << std::endl;
    return 1;
}
