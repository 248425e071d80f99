#include <gtest/gtest.h>

#include "bus/event_emitter.hpp"
#include "sandbox/capability_allowlist.hpp"
#include "sandbox/in_process_executor.hpp"

using namespace snipguard;
using namespace snipguard::sandbox;

class InProcessExecutorTest : public ::testing::Test {
protected:
    ExecutionOutcome Run(const std::string& snippet,
                         std::map<std::string, nlohmann::json> variables = {},
                         std::optional<nlohmann::json> data = std::nullopt) {
        ExecutionRequest request;
        request.snippet = snippet;
        request.context_variables = std::move(variables);
        request.context_data = std::move(data);
        request.limits = limits_;
        return executor_.Run(request, capabilities_, events_);
    }

    ExecutionLimits limits_;
    CapabilitySet capabilities_ = CapabilityAllowlist::BuildNamespace();
    bus::EventEmitter events_;
    InProcessExecutor executor_;
};

TEST_F(InProcessExecutorTest, ExpressionYieldsItsValue) {
    const auto outcome = Run("2 + 2");
    ASSERT_TRUE(std::holds_alternative<Success>(outcome)) << OutcomeName(outcome);
    const auto& success = std::get<Success>(outcome);
    EXPECT_EQ(4, success.return_value);
    EXPECT_EQ("", success.output);
}

TEST_F(InProcessExecutorTest, StatementsYieldResultBinding) {
    const auto outcome = Run("print('hi')\nresult = [1, 'two', None, True, {'k': 1.5}]");
    ASSERT_TRUE(std::holds_alternative<Success>(outcome)) << OutcomeName(outcome);
    const auto& success = std::get<Success>(outcome);
    EXPECT_EQ("hi\n", success.output);
    EXPECT_EQ(nlohmann::json::parse(R"([1, "two", null, true, {"k": 1.5}])"), success.return_value);
}

TEST_F(InProcessExecutorTest, StatementsWithoutResultYieldNull) {
    const auto outcome = Run("x = 5");
    ASSERT_TRUE(std::holds_alternative<Success>(outcome));
    EXPECT_TRUE(std::get<Success>(outcome).return_value.is_null());
}

TEST_F(InProcessExecutorTest, ContextVariablesAndDataAreBound) {
    const auto outcome = Run("a + b", {{"a", 3}, {"b", 4}});
    ASSERT_TRUE(std::holds_alternative<Success>(outcome));
    EXPECT_EQ(7, std::get<Success>(outcome).return_value);

    const auto with_data = Run("sum(data['values'])", {}, nlohmann::json{{"values", {1, 2, 3}}});
    ASSERT_TRUE(std::holds_alternative<Success>(with_data));
    EXPECT_EQ(6, std::get<Success>(with_data).return_value);
}

TEST_F(InProcessExecutorTest, AllowedModulesImportAndClassesWork) {
    const auto outcome = Run(
        "import math\n"
        "class Box:\n"
        "    def __init__(self, v):\n"
        "        self.v = v\n"
        "result = math.floor(Box(2.5).v)");
    ASSERT_TRUE(std::holds_alternative<Success>(outcome)) << OutcomeName(outcome);
    EXPECT_EQ(2, std::get<Success>(outcome).return_value);
}

TEST_F(InProcessExecutorTest, ExceptionKeepsPartialOutput) {
    const auto outcome = Run("print('before')\n1 / 0");
    ASSERT_TRUE(std::holds_alternative<RuntimeError>(outcome)) << OutcomeName(outcome);
    const auto& failure = std::get<RuntimeError>(outcome);
    EXPECT_EQ("division by zero", failure.message);
    EXPECT_EQ("before\n", failure.partial_output);
}

TEST_F(InProcessExecutorTest, ImportGateRefusesUnknownModules) {
    const auto outcome = Run("import os");
    ASSERT_TRUE(std::holds_alternative<RuntimeError>(outcome));
    EXPECT_EQ(0u, std::get<RuntimeError>(outcome).message.rfind(
        "Module 'os' is not available in this environment. Available: [base64, bisect,", 0));
}

TEST_F(InProcessExecutorTest, RestrictedBuiltinsHideOpen) {
    const auto outcome = Run("open('/etc/passwd')");
    ASSERT_TRUE(std::holds_alternative<RuntimeError>(outcome));
    EXPECT_EQ("name 'open' is not defined", std::get<RuntimeError>(outcome).message);
}

TEST_F(InProcessExecutorTest, SyntaxErrorIsRuntimeError) {
    const auto outcome = Run("def (");
    ASSERT_TRUE(std::holds_alternative<RuntimeError>(outcome));
}

TEST_F(InProcessExecutorTest, WallDeadlineYieldsTimedOut) {
    limits_.max_wall_seconds = 1;
    const auto outcome = Run("while True:\n    pass");
    ASSERT_TRUE(std::holds_alternative<TimedOut>(outcome)) << OutcomeName(outcome);
    const auto elapsed = std::get<TimedOut>(outcome).elapsed_ms;
    EXPECT_GE(elapsed, 1000);
    EXPECT_LT(elapsed, 1000 + 5000);

    const auto after = Run("2 + 2");
    EXPECT_TRUE(std::holds_alternative<Success>(after)) << OutcomeName(after);
}

TEST_F(InProcessExecutorTest, CpuBudgetYieldsResourceExceeded) {
    limits_.max_cpu_seconds = 1;
    limits_.max_wall_seconds = 20;
    const auto outcome = Run("total = 0\nwhile True:\n    total += 1");
    ASSERT_TRUE(std::holds_alternative<ResourceExceeded>(outcome)) << OutcomeName(outcome);
    EXPECT_EQ(ResourceKind::kCpu, std::get<ResourceExceeded>(outcome).kind);
}

TEST_F(InProcessExecutorTest, OversizedAllocationYieldsMemoryExceeded) {
    limits_.max_memory_bytes = 64ull * 1024 * 1024;
    const auto outcome = Run("x = [0] * 10**9");
    ASSERT_TRUE(std::holds_alternative<ResourceExceeded>(outcome)) << OutcomeName(outcome);
    EXPECT_EQ(ResourceKind::kMemory, std::get<ResourceExceeded>(outcome).kind);
}

TEST_F(InProcessExecutorTest, IdenticalSubmissionsAgree) {
    const auto first = Run("result = sorted([3, 1, 2])");
    const auto second = Run("result = sorted([3, 1, 2])");
    ASSERT_TRUE(std::holds_alternative<Success>(first));
    ASSERT_TRUE(std::holds_alternative<Success>(second));
    EXPECT_EQ(std::get<Success>(first).return_value, std::get<Success>(second).return_value);
    EXPECT_EQ(std::get<Success>(first).output, std::get<Success>(second).output);
}

TEST_F(InProcessExecutorTest, EmitsPhasesUpToExecuting) {
    Run("a", {{"a", 1}});
    std::vector<bus::Phase> phases;
    for (const auto& event : events_.History()) {
        phases.push_back(event.phase);
    }
    EXPECT_EQ((std::vector<bus::Phase>{bus::Phase::kPreparingEnvironment, bus::Phase::kLoadingContext,
                                       bus::Phase::kExecuting}),
              phases);
}

TEST_F(InProcessExecutorTest, NamespaceRebindingDoesNotLeakIntoLaterRuns) {
    const auto tamper = Run("math.pi = 3\nrandom.seed(7)\nresult = math.pi");
    ASSERT_TRUE(std::holds_alternative<Success>(tamper)) << OutcomeName(tamper);
    EXPECT_EQ(3, std::get<Success>(tamper).return_value);

    const auto after = Run("import math\nresult = math.pi");
    ASSERT_TRUE(std::holds_alternative<Success>(after)) << OutcomeName(after);
    EXPECT_DOUBLE_EQ(3.141592653589793, std::get<Success>(after).return_value.get<double>());
}

TEST_F(InProcessExecutorTest, NamespacesExposeOnlyApprovedMembers) {
    const auto chain = Run("f = operator.attrgetter('real')\nresult = f(1)");
    ASSERT_TRUE(std::holds_alternative<RuntimeError>(chain)) << OutcomeName(chain);
    EXPECT_EQ("module 'operator' has no attribute 'attrgetter'", std::get<RuntimeError>(chain).message);

    const auto formatter = Run("from string import Formatter");
    EXPECT_TRUE(std::holds_alternative<RuntimeError>(formatter)) << OutcomeName(formatter);

    const auto allowed = Run("from operator import itemgetter\nresult = itemgetter(1)([5, 6])");
    ASSERT_TRUE(std::holds_alternative<Success>(allowed)) << OutcomeName(allowed);
    EXPECT_EQ(6, std::get<Success>(allowed).return_value);
}
