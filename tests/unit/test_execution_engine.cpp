#include <gtest/gtest.h>

#include <algorithm>

#include "bus/event_emitter.hpp"
#include "engine/execution_engine.hpp"

using namespace snipguard;
using namespace snipguard::engine;

namespace {

class ScriptedExecutor : public sandbox::Executor {
public:
    explicit ScriptedExecutor(sandbox::ExecutionOutcome outcome, bool fail = false)
        : outcome_(std::move(outcome))
        , fail_(fail) {}

    const char* Name() const override { return "scripted"; }

    sandbox::ExecutionOutcome Run(const sandbox::ExecutionRequest& request,
                                  const sandbox::CapabilitySet&,
                                  bus::EventEmitter& events) override {
        ++calls;
        last_request = request;
        events.Progress(bus::Phase::kExecuting, "Executing code");
        if (fail_) {
            throw sandbox::SandboxError("runner vanished");
        }
        return outcome_;
    }

    int calls = 0;
    sandbox::ExecutionRequest last_request;

private:
    sandbox::ExecutionOutcome outcome_;
    bool fail_;
};

std::vector<bus::Phase> Phases(const bus::EventEmitter& events) {
    std::vector<bus::Phase> phases;
    for (const auto& event : events.History()) {
        phases.push_back(event.phase);
    }
    return phases;
}

bool Contains(const std::vector<bus::Phase>& phases, bus::Phase phase) {
    return std::find(phases.begin(), phases.end(), phase) != phases.end();
}

}  // namespace

class ExecutionEngineTest : public ::testing::Test {
protected:
    ExecutionEngine MakeEngine(sandbox::ExecutionOutcome outcome, bool fail = false) {
        auto executor = std::make_unique<ScriptedExecutor>(std::move(outcome), fail);
        executor_ = executor.get();
        return ExecutionEngine(config_, std::move(executor));
    }

    config::Config config_;
    ScriptedExecutor* executor_ = nullptr;
    bus::EventEmitter events_;
};

TEST_F(ExecutionEngineTest, RequestLimitsComeFromProfile) {
    config_.sandbox.max_memory_mb = 128;
    config_.sandbox.max_wall_seconds = 3;
    auto engine = MakeEngine(sandbox::Success{});
    const auto request = engine.MakeRequest("2 + 2", {{"a", 1}});
    EXPECT_EQ(128ull * 1024 * 1024, request.limits.max_memory_bytes);
    EXPECT_EQ(3u, request.limits.max_wall_seconds);
    EXPECT_EQ(1, request.context_variables.at("a"));
    EXPECT_STREQ("scripted", engine.Strategy());
}

TEST_F(ExecutionEngineTest, DenylistRejectionNeverReachesExecutor) {
    auto engine = MakeEngine(sandbox::Success{});
    const auto outcome = engine.Execute(engine.MakeRequest("import os\nos.listdir('.')"), events_);

    ASSERT_TRUE(std::holds_alternative<sandbox::ValidationRejected>(outcome));
    EXPECT_EQ("Code contains potentially dangerous operation: import os",
              std::get<sandbox::ValidationRejected>(outcome).reason);
    EXPECT_EQ(0, executor_->calls);

    const auto phases = Phases(events_);
    EXPECT_FALSE(Contains(phases, bus::Phase::kExecuting));
    ASSERT_FALSE(phases.empty());
    EXPECT_EQ(bus::Phase::kFailed, phases.back());
}

TEST_F(ExecutionEngineTest, StructuralRejectionNeverReachesExecutor) {
    auto engine = MakeEngine(sandbox::Success{});
    const auto response = engine.ExecuteToResponse(engine.MakeRequest("x = ().__base__"), events_);

    EXPECT_FALSE(response["success"].get<bool>());
    EXPECT_EQ("Security validation failed: Access to attribute '__base__' is not allowed",
              response["error"]);
    EXPECT_EQ(0, executor_->calls);
}

TEST_F(ExecutionEngineTest, StructuralAnalysisCanBeDisabled) {
    config_.sandbox.structural_analysis = false;
    auto engine = MakeEngine(sandbox::Success{});
    engine.Execute(engine.MakeRequest("x = ().__base__"), events_);
    EXPECT_EQ(1, executor_->calls);
}

TEST_F(ExecutionEngineTest, ContextNamesPassStructuralAnalysis) {
    auto engine = MakeEngine(sandbox::Success{"", "", 7, 3});
    const auto outcome = engine.Execute(engine.MakeRequest("a + b", {{"a", 3}, {"b", 4}}), events_);
    ASSERT_TRUE(std::holds_alternative<sandbox::Success>(outcome)) << sandbox::OutcomeName(outcome);
    EXPECT_EQ(1, executor_->calls);
    EXPECT_EQ(2u, executor_->last_request.context_variables.size());
}

TEST_F(ExecutionEngineTest, SuccessEmitsOrderedPhasesAndCompletedStatus) {
    auto engine = MakeEngine(sandbox::Success{"", "", 4, 12});
    const auto response = engine.ExecuteToResponse(engine.MakeRequest("2 + 2"), events_);

    EXPECT_TRUE(response["success"].get<bool>());
    EXPECT_EQ(4, response["result"]);
    EXPECT_EQ("", response["output"]);
    EXPECT_EQ(12, response["execution_time"]);

    const std::vector<bus::Phase> expected = {
        bus::Phase::kInitializing, bus::Phase::kValidating, bus::Phase::kSettingUp,
        bus::Phase::kExecuting, bus::Phase::kProcessingResults, bus::Phase::kCompleted,
    };
    EXPECT_EQ(expected, Phases(events_));

    const auto statuses = events_.StatusHistory();
    ASSERT_EQ(1u, statuses.size());
    EXPECT_EQ("completed", statuses[0].status);
    EXPECT_EQ(12, statuses[0].details["execution_time"]);
    EXPECT_TRUE(events_.Finished());
}

TEST_F(ExecutionEngineTest, ExecutorFailureBecomesSandboxError) {
    auto engine = MakeEngine(sandbox::Success{}, true);
    const auto response = engine.ExecuteToResponse(engine.MakeRequest("2 + 2"), events_);

    EXPECT_FALSE(response["success"].get<bool>());
    EXPECT_EQ("Sandbox error: runner vanished", response["error"]);
    EXPECT_FALSE(response.contains("output"));

    const auto statuses = events_.StatusHistory();
    ASSERT_EQ(1u, statuses.size());
    EXPECT_EQ("failed", statuses[0].status);
    EXPECT_EQ("internal_error", statuses[0].details["outcome"]);
}

TEST_F(ExecutionEngineTest, TimeoutResponseNamesWallLimit) {
    config_.sandbox.max_wall_seconds = 2;
    auto engine = MakeEngine(sandbox::TimedOut{2004});
    const auto response = engine.ExecuteToResponse(engine.MakeRequest("while True:\n    pass"), events_);

    EXPECT_EQ("Code execution timed out (2 seconds)", response["error"]);
    EXPECT_EQ(2004, response["execution_time"]);
}

TEST_F(ExecutionEngineTest, InProcessStrategyRunsEndToEnd) {
    config_.sandbox.strategy = config::IsolationStrategy::kInProcess;
    ExecutionEngine engine(config_);
    EXPECT_STREQ("in_process", engine.Strategy());

    const auto response = engine.ExecuteToResponse(engine.MakeRequest("2 + 2"), events_);
    EXPECT_TRUE(response["success"].get<bool>());
    EXPECT_EQ(4, response["result"]);
    EXPECT_EQ("", response["output"]);
    EXPECT_TRUE(Contains(Phases(events_), bus::Phase::kExecuting));
}

TEST_F(ExecutionEngineTest, IsolatedStrategyRunsEndToEnd) {
    config_.sandbox.runner_path = SNIPGUARD_RUNNER_PATH;
    ExecutionEngine engine(config_);
    EXPECT_STREQ("isolated", engine.Strategy());

    const auto response = engine.ExecuteToResponse(
        engine.MakeRequest("print('x')\nresult = a * 2", {{"a", 21}}), events_);
    EXPECT_TRUE(response["success"].get<bool>()) << response.dump();
    EXPECT_EQ(42, response["result"]);
    EXPECT_EQ("x\n", response["output"]);
}

TEST_F(ExecutionEngineTest, DefaultLimitsReportBusyLoopAsTimeout) {
    config_.sandbox.runner_path = SNIPGUARD_RUNNER_PATH;
    ExecutionEngine engine(config_);
    const auto outcome = engine.Execute(engine.MakeRequest("while True:\n    pass"), events_);
    ASSERT_TRUE(std::holds_alternative<sandbox::TimedOut>(outcome)) << sandbox::OutcomeName(outcome);
    EXPECT_GE(std::get<sandbox::TimedOut>(outcome).elapsed_ms, 10000);

    const auto response = engine.ExecuteToResponse(engine.MakeRequest("while True:\n    pass"), events_);
    EXPECT_FALSE(response["success"].get<bool>());
    EXPECT_EQ("Code execution timed out (10 seconds)", response["error"]);
    EXPECT_GE(response["execution_time"].get<std::int64_t>(), 10000);
}
