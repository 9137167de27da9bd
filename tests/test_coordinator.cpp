#include <gtest/gtest.h>
#include "coordinator.h"
#include "test_doubles.h"
#include <filesystem>
#include <memory>

namespace forge {

class CoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings.agents.retry_backoff_ms = 0;
        settings.hosting.repository = "octo/demo";
        task = Task{"Write an add function", "dev@example.com"};
    }

    void TearDown() override {
        coordinator.reset();
    }

    // Builds the coordinator from the current settings and scripted doubles
    Coordinator& build() {
        auto agent = std::make_unique<TestAgentClient>();
        auto runtime = std::make_unique<TestContainerRuntime>();
        auto hosting = std::make_unique<TestHostingClient>();
        auto mail = std::make_unique<TestMailClient>();

        agent_ptr = agent.get();
        runtime_ptr = runtime.get();
        hosting_ptr = hosting.get();
        mail_ptr = mail.get();

        coordinator = std::make_unique<Coordinator>(settings, std::move(agent), std::move(runtime),
                                                    std::move(hosting), std::move(mail));
        return *coordinator;
    }

    void script_happy_path() {
        agent_ptr->script(RoleTag::PLANNER, {"1. Define add\n2. Return the sum"});
        agent_ptr->script(RoleTag::WRITER, {"def add(a,b):\n  return a+b"});
        agent_ptr->script(RoleTag::SANITIZER, {"SAFE"});
        agent_ptr->script(RoleTag::REVIEWER, {"APPROVED"});
        agent_ptr->script(RoleTag::NOTIFIER, {"Your add function is ready."});
    }

    PipelineSettings settings;
    Task task;
    std::unique_ptr<Coordinator> coordinator;
    TestAgentClient* agent_ptr = nullptr;
    TestContainerRuntime* runtime_ptr = nullptr;
    TestHostingClient* hosting_ptr = nullptr;
    TestMailClient* mail_ptr = nullptr;
};

TEST_F(CoordinatorTest, DeliversWhenSandboxOutputIsSafe) {
    build();
    script_happy_path();

    RunOutcome outcome = coordinator->run(task);

    EXPECT_EQ(outcome.kind, RunOutcome::Kind::DELIVERED);
    EXPECT_EQ(outcome.reference, "https://github.com/octo/demo/pull/7");
    EXPECT_EQ(outcome.exit_code(), EXIT_DELIVERED);

    EXPECT_EQ(agent_ptr->calls.size(), 5u);
    EXPECT_EQ(runtime_ptr->run_requests.size(), 1u);
    EXPECT_EQ(hosting_ptr->branch_calls.size(), 1u);
    ASSERT_EQ(hosting_ptr->commit_calls.size(), 1u);
    EXPECT_EQ(hosting_ptr->change_request_calls.size(), 1u);
    EXPECT_EQ(hosting_ptr->commit_calls[0].content, "def add(a,b):\n  return a+b");
    EXPECT_EQ(hosting_ptr->commit_calls[0].path, "generated_code.py");

    ASSERT_EQ(mail_ptr->messages.size(), 1u);
    EXPECT_EQ(mail_ptr->messages[0].recipient, "dev@example.com");
    EXPECT_NE(mail_ptr->messages[0].body.find("Task complete! PR: https://github.com/octo/demo/pull/7"),
              std::string::npos);
    EXPECT_NE(mail_ptr->messages[0].body.find("Your add function is ready."), std::string::npos);
}

TEST_F(CoordinatorTest, AbortsWhenSafetyMarkerMissing) {
    build();
    script_happy_path();
    runtime_ptr->mock_result = ContainerRunResult{"3\n", false, 0};

    RunOutcome outcome = coordinator->run(task);

    EXPECT_EQ(outcome.kind, RunOutcome::Kind::ABORTED);
    ASSERT_TRUE(outcome.error_kind.has_value());
    EXPECT_EQ(*outcome.error_kind, ErrorKind::POLICY_ABORT);
    EXPECT_EQ(outcome.exit_code(), EXIT_ABORTED);
    EXPECT_EQ(hosting_ptr->total_calls(), 0u);
    EXPECT_TRUE(mail_ptr->messages.empty());
}

TEST_F(CoordinatorTest, NoArtifactWhenWriterProducesNoFunction) {
    build();
    script_happy_path();
    agent_ptr->script(RoleTag::WRITER, {"I would add the two numbers together."});

    RunOutcome outcome = coordinator->run(task);

    EXPECT_EQ(outcome.kind, RunOutcome::Kind::NO_ARTIFACT);
    EXPECT_EQ(outcome.exit_code(), EXIT_NO_ARTIFACT);
    EXPECT_EQ(agent_ptr->calls.size(), static_cast<size_t>(settings.max_turns()));
    EXPECT_TRUE(runtime_ptr->run_requests.empty());
    EXPECT_EQ(hosting_ptr->total_calls(), 0u);
    EXPECT_TRUE(mail_ptr->messages.empty());
}

TEST_F(CoordinatorTest, FunctionInNonWriterTurnIsIgnored) {
    build();
    script_happy_path();
    agent_ptr->script(RoleTag::WRITER, {"Working on it."});
    agent_ptr->script(RoleTag::REVIEWER, {"Try this instead:\ndef add(a, b):\n    return a + b"});

    RunOutcome outcome = coordinator->run(task);

    EXPECT_EQ(outcome.kind, RunOutcome::Kind::NO_ARTIFACT);
    EXPECT_TRUE(runtime_ptr->run_requests.empty());
}

TEST_F(CoordinatorTest, DeliveryFailedWhenPublishFails) {
    build();
    script_happy_path();
    hosting_ptr->mock_change_request_result = HostingResult{false, "", "HTTP error: 422"};

    RunOutcome outcome = coordinator->run(task);

    EXPECT_EQ(outcome.kind, RunOutcome::Kind::DELIVERY_FAILED);
    EXPECT_EQ(outcome.exit_code(), EXIT_DELIVERY_FAILED);
    EXPECT_NE(outcome.reason.find("HTTP error: 422"), std::string::npos);
    EXPECT_TRUE(mail_ptr->messages.empty());
}

TEST_F(CoordinatorTest, FailureNoticeSentOnlyWhenConfigured) {
    settings.mail.notify_on_failure = true;
    build();
    script_happy_path();
    hosting_ptr->mock_branch_result = HostingResult{false, "", "Bad credentials"};

    RunOutcome outcome = coordinator->run(task);

    EXPECT_EQ(outcome.kind, RunOutcome::Kind::DELIVERY_FAILED);
    ASSERT_EQ(mail_ptr->messages.size(), 1u);
    EXPECT_EQ(mail_ptr->messages[0].body.find("Task complete!"), std::string::npos);
    EXPECT_NE(mail_ptr->messages[0].body.find("Bad credentials"), std::string::npos);
}

TEST_F(CoordinatorTest, TimeoutAbortsAsContainmentError) {
    build();
    script_happy_path();
    runtime_ptr->mock_result = ContainerRunResult{"SAFE\n", true, 137};

    RunOutcome outcome = coordinator->run(task);

    EXPECT_EQ(outcome.kind, RunOutcome::Kind::ABORTED);
    ASSERT_TRUE(outcome.error_kind.has_value());
    EXPECT_EQ(*outcome.error_kind, ErrorKind::CONTAINMENT_ERROR);
    EXPECT_NE(outcome.reason.find("timeout"), std::string::npos);
    EXPECT_EQ(runtime_ptr->removed_containers.size(), 1u);
    EXPECT_EQ(hosting_ptr->total_calls(), 0u);
}

TEST_F(CoordinatorTest, RuntimeFailureAbortsAsContainmentError) {
    build();
    script_happy_path();
    runtime_ptr->throw_on_run = true;

    RunOutcome outcome = coordinator->run(task);

    EXPECT_EQ(outcome.kind, RunOutcome::Kind::ABORTED);
    EXPECT_EQ(*outcome.error_kind, ErrorKind::CONTAINMENT_ERROR);
    EXPECT_NE(outcome.reason.find("setup_error"), std::string::npos);
}

TEST_F(CoordinatorTest, RolesFollowCycleOrderAcrossCycles) {
    settings.agents.cycles = 2;
    build();
    script_happy_path();

    coordinator->run(task);

    ASSERT_EQ(agent_ptr->calls.size(), 10u);
    for (size_t i = 0; i < agent_ptr->calls.size(); ++i) {
        EXPECT_EQ(agent_ptr->calls[i].role_prompt, role_prompt(kRoleCycle[i % 5])) << "turn " << i;
    }

    const Transcript& transcript = coordinator->get_transcript();
    ASSERT_EQ(transcript.size(), 10u);
    EXPECT_EQ(transcript.at(0).role, RoleTag::PLANNER);
    EXPECT_EQ(transcript.at(6).role, RoleTag::WRITER);
    EXPECT_EQ(transcript.at(9).role, RoleTag::NOTIFIER);
}

TEST_F(CoordinatorTest, EachTurnSeesFullTranscriptSoFar) {
    build();
    script_happy_path();

    coordinator->run(task);

    ASSERT_EQ(agent_ptr->calls.size(), 5u);
    EXPECT_EQ(agent_ptr->calls[0].transcript, "User wants: Write an add function");
    EXPECT_EQ(agent_ptr->calls[1].transcript,
              "User wants: Write an add function\n\n[Planner]\n1. Define add\n2. Return the sum");
    EXPECT_NE(agent_ptr->calls[2].transcript.find("[Writer]\ndef add(a,b):"), std::string::npos);
}

TEST_F(CoordinatorTest, MostRecentWriterTurnIsExtracted) {
    settings.agents.cycles = 2;
    build();
    script_happy_path();
    agent_ptr->script(RoleTag::WRITER, {"def first():\n    pass", "def second():\n    return 2"});

    RunOutcome outcome = coordinator->run(task);

    EXPECT_EQ(outcome.kind, RunOutcome::Kind::DELIVERED);
    ASSERT_EQ(hosting_ptr->commit_calls.size(), 1u);
    EXPECT_EQ(hosting_ptr->commit_calls[0].content, "def second():\n    return 2");
}

TEST_F(CoordinatorTest, EmptyReplyIsAppendedAndCycleContinues) {
    build();
    script_happy_path();
    agent_ptr->script(RoleTag::PLANNER, {""});

    RunOutcome outcome = coordinator->run(task);

    EXPECT_EQ(outcome.kind, RunOutcome::Kind::DELIVERED);
    ASSERT_EQ(coordinator->get_transcript().size(), 5u);
    EXPECT_EQ(coordinator->get_transcript().at(0).text, "");
    EXPECT_EQ(agent_ptr->calls.size(), 5u);
}

TEST_F(CoordinatorTest, FailedTurnBecomesEmptyTurn) {
    build();
    script_happy_path();
    agent_ptr->failing_calls = {0};

    RunOutcome outcome = coordinator->run(task);

    EXPECT_EQ(outcome.kind, RunOutcome::Kind::DELIVERED);
    EXPECT_EQ(coordinator->get_transcript().at(0).text, "");
    EXPECT_EQ(agent_ptr->calls.size(), 5u);
}

TEST_F(CoordinatorTest, AllTurnsFailingAbortsAsCollaboratorError) {
    build();
    agent_ptr->throw_always = true;

    RunOutcome outcome = coordinator->run(task);

    EXPECT_EQ(outcome.kind, RunOutcome::Kind::ABORTED);
    ASSERT_TRUE(outcome.error_kind.has_value());
    EXPECT_EQ(*outcome.error_kind, ErrorKind::COLLABORATOR_ERROR);
    EXPECT_EQ(agent_ptr->calls.size(), 5u);
    EXPECT_TRUE(runtime_ptr->run_requests.empty());
}

TEST_F(CoordinatorTest, RetriesFailedTurnsUpToMaxAttempts) {
    settings.agents.max_attempts = 3;
    build();
    script_happy_path();
    agent_ptr->failing_calls = {0, 1};

    RunOutcome outcome = coordinator->run(task);

    EXPECT_EQ(outcome.kind, RunOutcome::Kind::DELIVERED);
    EXPECT_EQ(agent_ptr->calls.size(), 7u);
    EXPECT_EQ(coordinator->get_transcript().at(0).text, "1. Define add\n2. Return the sum");
}

TEST_F(CoordinatorTest, SanitizerVerdictBlocksExecutionWhenRequired) {
    settings.gate.require_sanitizer_verdict = true;
    build();
    script_happy_path();
    agent_ptr->script(RoleTag::SANITIZER, {"UNSAFE: the code calls os.system"});

    RunOutcome outcome = coordinator->run(task);

    EXPECT_EQ(outcome.kind, RunOutcome::Kind::ABORTED);
    EXPECT_EQ(*outcome.error_kind, ErrorKind::POLICY_ABORT);
    EXPECT_TRUE(runtime_ptr->run_requests.empty());
    EXPECT_EQ(hosting_ptr->total_calls(), 0u);
}

TEST_F(CoordinatorTest, SanitizerVerdictIgnoredByDefault) {
    build();
    script_happy_path();
    agent_ptr->script(RoleTag::SANITIZER, {"Looks risky to me."});

    RunOutcome outcome = coordinator->run(task);

    EXPECT_EQ(outcome.kind, RunOutcome::Kind::DELIVERED);
}

TEST_F(CoordinatorTest, RunsUseDistinctResourceNames) {
    build();
    script_happy_path();

    coordinator->run(task);
    std::string first_id = coordinator->get_run_id();
    coordinator->run(task);
    std::string second_id = coordinator->get_run_id();

    EXPECT_NE(first_id, second_id);
    ASSERT_EQ(runtime_ptr->run_requests.size(), 2u);
    EXPECT_NE(runtime_ptr->run_requests[0].container_name, runtime_ptr->run_requests[1].container_name);
    EXPECT_NE(runtime_ptr->run_requests[0].host_directory, runtime_ptr->run_requests[1].host_directory);
    ASSERT_EQ(hosting_ptr->branch_calls.size(), 2u);
    EXPECT_NE(hosting_ptr->branch_calls[0].first, hosting_ptr->branch_calls[1].first);
    EXPECT_EQ(hosting_ptr->branch_calls[0].first.rfind("auto/feature-agent-", 0), 0u);
}

TEST_F(CoordinatorTest, TranscriptStartsFreshForEachRun) {
    build();
    script_happy_path();

    coordinator->run(task);
    coordinator->run(Task{"Second task", "dev@example.com"});

    EXPECT_EQ(coordinator->get_transcript().size(), 5u);
    EXPECT_EQ(coordinator->get_transcript().get_task_description(), "Second task");
}

TEST_F(CoordinatorTest, NotificationFailureDoesNotChangeOutcome) {
    build();
    script_happy_path();
    mail_ptr->throw_on_send = true;

    RunOutcome outcome = coordinator->run(task);

    EXPECT_EQ(outcome.kind, RunOutcome::Kind::DELIVERED);
    EXPECT_EQ(mail_ptr->messages.size(), 1u);
}

TEST_F(CoordinatorTest, ExtractArtifactPrefersFencedCode) {
    Transcript transcript("task");
    transcript.append(RoleTag::WRITER, "Here you go:\n```python\ndef add(a, b):\n    return a + b\n```\nEnjoy.");
    transcript.append(RoleTag::SANITIZER, "SAFE");

    auto artifact = Coordinator::extract_artifact(transcript);

    ASSERT_TRUE(artifact.has_value());
    EXPECT_EQ(artifact->source_text, "def add(a, b):\n    return a + b");
    EXPECT_EQ(artifact->extracted_at_turn, 0);
}

TEST_F(CoordinatorTest, RejectsMissingCollaborators) {
    EXPECT_THROW(Coordinator(settings, nullptr, std::make_unique<TestContainerRuntime>(),
                             std::make_unique<TestHostingClient>(), std::make_unique<TestMailClient>()),
                 std::invalid_argument);
}

} // namespace forge
