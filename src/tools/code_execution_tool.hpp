#pragma once

#include <string>

#include "engine/execution_engine.hpp"
#include "tools/tool.hpp"

namespace snipguard::tools {

class CodeExecutionTool : public Tool {
public:
    explicit CodeExecutionTool(engine::ExecutionEngine& engine);

    std::string Name() const override { return "code_execution"; }
    std::string Description() const override;
    std::string ParametersJson() const override;
    // Throws InputError for malformed parameters; everything else is a response.
    nlohmann::json Execute(const nlohmann::json& params, bus::EventEmitter& events) override;

    sandbox::ExecutionRequest ParseRequest(const nlohmann::json& params) const;

private:
    engine::ExecutionEngine& engine_;
};

}  // namespace snipguard::tools
