#include <gtest/gtest.h>

#include "sandbox/wire_codec.hpp"

using namespace snipguard::sandbox;

TEST(WireCodecTest, RunnerInputCarriesRequestAndLimits) {
    ExecutionRequest request;
    request.snippet = "a + b";
    request.context_variables["a"] = 3;
    request.context_variables["b"] = 4;
    request.context_data = nlohmann::json{{"rows", {1, 2, 3}}};
    request.limits.max_wall_seconds = 7;
    request.limits.max_memory_bytes = 32ull * 1024 * 1024;

    SandboxProfile profile;
    profile.namespaces = {"math", "json"};

    const auto decoded = DecodeRunnerInput(EncodeRunnerInput(request, profile));
    EXPECT_EQ("a + b", decoded.request.snippet);
    EXPECT_EQ(3, decoded.request.context_variables.at("a"));
    ASSERT_TRUE(decoded.request.context_data.has_value());
    EXPECT_EQ(3u, decoded.request.context_data->at("rows").size());
    EXPECT_EQ(7u, decoded.request.limits.max_wall_seconds);
    EXPECT_EQ(32ull * 1024 * 1024, decoded.request.limits.max_memory_bytes);
    EXPECT_EQ((std::vector<std::string>{"math", "json"}), decoded.namespaces);
}

TEST(WireCodecTest, RunnerInputWithoutDataStaysWithoutContext) {
    ExecutionRequest request;
    request.snippet = "1";
    const auto decoded = DecodeRunnerInput(EncodeRunnerInput(request, SandboxProfile{}));
    EXPECT_FALSE(decoded.request.HasContext());
}

TEST(WireCodecTest, MalformedRunnerInputThrows) {
    EXPECT_THROW(DecodeRunnerInput(nlohmann::json::object()), SandboxError);
    EXPECT_THROW(DecodeRunnerInput(nlohmann::json{{"snippet", 5}}), SandboxError);
}

TEST(WireCodecTest, OutcomeKeepsAlternativeAndFields) {
    const auto success = DecodeOutcome(EncodeOutcome(Success{"hi\n", "", 4, 12}));
    ASSERT_TRUE(std::holds_alternative<Success>(success));
    EXPECT_EQ("hi\n", std::get<Success>(success).output);
    EXPECT_EQ(4, std::get<Success>(success).return_value);

    const auto failure = DecodeOutcome(EncodeOutcome(RuntimeError{"division by zero", "partial", 3}));
    ASSERT_TRUE(std::holds_alternative<RuntimeError>(failure));
    EXPECT_EQ("partial", std::get<RuntimeError>(failure).partial_output);

    const auto exceeded = DecodeOutcome(EncodeOutcome(ResourceExceeded{ResourceKind::kFileSize, 9}));
    ASSERT_TRUE(std::holds_alternative<ResourceExceeded>(exceeded));
    EXPECT_EQ(ResourceKind::kFileSize, std::get<ResourceExceeded>(exceeded).kind);

    const auto internal = DecodeOutcome(EncodeOutcome(InternalError{"boom", std::nullopt}));
    ASSERT_TRUE(std::holds_alternative<InternalError>(internal));
    EXPECT_FALSE(std::get<InternalError>(internal).elapsed_ms.has_value());
}

TEST(WireCodecTest, UnknownOutcomeKindThrows) {
    EXPECT_THROW(DecodeOutcome(nlohmann::json{{"kind", "exploded"}}), SandboxError);
    EXPECT_THROW(DecodeOutcome(nlohmann::json{{"kind", "resource_exceeded"}, {"resource", "disk"}, {"elapsedMs", 1}}),
                 SandboxError);
}
