#include <gtest/gtest.h>
#include "message.h"

using namespace forge;

class MessageTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(MessageTest, TurnRequestSerialization) {
    AgentTurnRequest request;
    request.role = "Writer";
    request.role_prompt = "You're the Writer.";
    request.transcript = "User wants: add\n\n[Planner]\n1. \"add\" two numbers";
    request.provider = "anthropic";

    std::string serialized = MessageHandler::serialize_turn_request(request);
    AgentTurnRequest deserialized = MessageHandler::deserialize_turn_request(serialized);

    EXPECT_EQ(deserialized.role, request.role);
    EXPECT_EQ(deserialized.role_prompt, request.role_prompt);
    EXPECT_EQ(deserialized.transcript, request.transcript);
    EXPECT_EQ(deserialized.provider, "anthropic");
}

TEST_F(MessageTest, TurnRequestOmitsEmptyProvider) {
    AgentTurnRequest request;
    request.role = "Planner";
    request.role_prompt = "plan";
    request.transcript = "User wants: x";

    nlohmann::json j;
    request.to_json(j);

    EXPECT_FALSE(j.contains("provider"));
}

TEST_F(MessageTest, TurnResponseToleratesMissingOptionalFields) {
    AgentTurnResponse response = MessageHandler::deserialize_turn_response(R"({"success": true, "text": "SAFE"})");

    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.text, "SAFE");
    EXPECT_TRUE(response.error_message.empty());
    EXPECT_TRUE(response.provider.empty());
}

TEST_F(MessageTest, FailedTurnResponseCarriesError) {
    AgentTurnResponse response;
    response.success = false;
    response.error_message = "HTTP error: 429";
    response.provider = "openai";

    AgentTurnResponse deserialized =
        MessageHandler::deserialize_turn_response(MessageHandler::serialize_turn_response(response));

    EXPECT_FALSE(deserialized.success);
    EXPECT_EQ(deserialized.error_message, "HTTP error: 429");
    EXPECT_EQ(deserialized.provider, "openai");
}

TEST_F(MessageTest, InvalidJsonHandling) {
    EXPECT_THROW(MessageHandler::deserialize_turn_request("invalid json"), std::runtime_error);
    EXPECT_THROW(MessageHandler::deserialize_turn_request(R"({"role": "Writer"})"), std::runtime_error);
    EXPECT_THROW(MessageHandler::deserialize_turn_response(R"({"text": "no success flag"})"), std::runtime_error);
}

TEST_F(MessageTest, RunOutcomeExitCodes) {
    EXPECT_EQ(RunOutcome::delivered("https://x/pull/1").exit_code(), EXIT_DELIVERED);
    EXPECT_EQ(RunOutcome::aborted("no", ErrorKind::POLICY_ABORT).exit_code(), EXIT_ABORTED);
    EXPECT_EQ(RunOutcome::no_artifact().exit_code(), EXIT_NO_ARTIFACT);
    EXPECT_EQ(RunOutcome::delivery_failed("HTTP error: 401").exit_code(), EXIT_DELIVERY_FAILED);
}

TEST_F(MessageTest, RunOutcomeDescriptions) {
    EXPECT_EQ(RunOutcome::delivered("https://x/pull/1").to_string(), "Delivered(https://x/pull/1)");
    EXPECT_EQ(RunOutcome::aborted("execution failed: timeout", ErrorKind::CONTAINMENT_ERROR).to_string(),
              "Aborted(execution failed: timeout) [ContainmentError]");
    EXPECT_EQ(RunOutcome::no_artifact().to_string(), "NoArtifact");
    EXPECT_EQ(RunOutcome::delivery_failed("commit_file: 409").to_string(),
              "DeliveryFailed(commit_file: 409) [CollaboratorError]");
    EXPECT_TRUE(RunOutcome::delivered("r").is_delivered());
    EXPECT_FALSE(RunOutcome::no_artifact().is_delivered());
}

TEST_F(MessageTest, ExecutionResultDescription) {
    ExecutionResult result;
    result.succeeded = false;
    result.exit_code = 137;
    result.failure_reason = "timeout";
    result.stdout_stderr_combined = "partial";

    std::string text = result.to_string();

    EXPECT_NE(text.find("Succeeded: false"), std::string::npos);
    EXPECT_NE(text.find("Failure: timeout"), std::string::npos);
    EXPECT_NE(text.find("Output:\npartial"), std::string::npos);
    EXPECT_TRUE(result.has_output());
}
