#include <gtest/gtest.h>

#include "bus/event_emitter.hpp"
#include "tools/code_execution_tool.hpp"

using namespace snipguard;
using namespace snipguard::tools;

namespace {

class EchoExecutor : public sandbox::Executor {
public:
    const char* Name() const override { return "echo"; }

    sandbox::ExecutionOutcome Run(const sandbox::ExecutionRequest& request,
                                  const sandbox::CapabilitySet&,
                                  bus::EventEmitter&) override {
        nlohmann::json names = nlohmann::json::array();
        for (const auto& [name, _] : request.context_variables) {
            names.push_back(name);
        }
        return sandbox::Success{"ran\n", "", names, 5};
    }
};

}  // namespace

class CodeExecutionToolTest : public ::testing::Test {
protected:
    CodeExecutionToolTest()
        : engine_(config::Config{}, std::make_unique<EchoExecutor>())
        , tool_(engine_) {}

    std::string InputErrorOf(const nlohmann::json& params) {
        try {
            tool_.ParseRequest(params);
        } catch (const InputError& ex) {
            return ex.what();
        }
        return {};
    }

    engine::ExecutionEngine engine_;
    CodeExecutionTool tool_;
    bus::EventEmitter events_;
};

TEST_F(CodeExecutionToolTest, SchemaIsValidJson) {
    const auto schema = nlohmann::json::parse(tool_.ParametersJson());
    EXPECT_EQ("object", schema["type"]);
    EXPECT_EQ(nlohmann::json::array({"code"}), schema["required"]);
    EXPECT_TRUE(schema["properties"].contains("context_data"));
    EXPECT_EQ("code_execution", tool_.Name());
    EXPECT_NE(std::string::npos, tool_.Description().find("math"));
}

TEST_F(CodeExecutionToolTest, MalformedParametersAreInputErrors) {
    EXPECT_EQ("Request must be a JSON object", InputErrorOf(nlohmann::json::array()));
    EXPECT_EQ("Missing required parameter: code", InputErrorOf({{"context_data", nullptr}}));
    EXPECT_EQ("Parameter 'code' must be a string", InputErrorOf({{"code", 42}}));
    EXPECT_EQ("Parameter 'context_data' must be an object",
              InputErrorOf({{"code", "1"}, {"context_data", "x"}}));
    EXPECT_EQ("Parameter 'context_data.variables' must be an object",
              InputErrorOf({{"code", "1"}, {"context_data", {{"variables", {1, 2}}}}}));
    EXPECT_EQ("Invalid variable name: '_hidden'",
              InputErrorOf({{"code", "1"}, {"context_data", {{"variables", {{"_hidden", 1}}}}}}));
    EXPECT_EQ("Invalid variable name: '9lives'",
              InputErrorOf({{"code", "1"}, {"context_data", {{"variables", {{"9lives", 1}}}}}}));
}

TEST_F(CodeExecutionToolTest, ContextDataIsParsed) {
    const auto request = tool_.ParseRequest(nlohmann::json::parse(
        R"({"code": "a + b", "context_data": {"variables": {"a": 3, "b": [1]}, "data": {"k": "v"}}})"));
    EXPECT_EQ("a + b", request.snippet);
    EXPECT_EQ(3, request.context_variables.at("a"));
    EXPECT_EQ(nlohmann::json::array({1}), request.context_variables.at("b"));
    ASSERT_TRUE(request.context_data.has_value());
    EXPECT_EQ("v", (*request.context_data)["k"]);
    EXPECT_EQ(engine_.Profile().limits.max_memory_bytes, request.limits.max_memory_bytes);
}

TEST_F(CodeExecutionToolTest, NullContextIsAbsent) {
    const auto request = tool_.ParseRequest({{"code", "1"}, {"context_data", {{"variables", nullptr}}}});
    EXPECT_TRUE(request.context_variables.empty());
    EXPECT_FALSE(request.context_data.has_value());
    EXPECT_FALSE(tool_.ParseRequest({{"code", "1"}, {"context_data", nullptr}}).HasContext());
}

TEST_F(CodeExecutionToolTest, ExecuteReturnsResponse) {
    const auto response = tool_.Execute(
        {{"code", "x + y"}, {"context_data", {{"variables", {{"x", 1}, {"y", 2}}}}}}, events_);
    EXPECT_TRUE(response["success"].get<bool>());
    EXPECT_EQ("ran\n", response["output"]);
    EXPECT_EQ(nlohmann::json::array({"x", "y"}), response["result"]);
    EXPECT_EQ(5, response["execution_time"]);
    EXPECT_TRUE(response["timestamp"].is_string());
    EXPECT_TRUE(events_.Finished());
}

TEST_F(CodeExecutionToolTest, RejectedCodeIsAResponseNotAnError) {
    const auto response = tool_.Execute({{"code", "open('/etc/passwd')"}}, events_);
    EXPECT_FALSE(response["success"].get<bool>());
    EXPECT_EQ("Security validation failed: Code contains potentially dangerous operation: open(",
              response["error"]);
}
