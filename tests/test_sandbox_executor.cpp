#include <gtest/gtest.h>
#include "sandbox/sandbox_executor.h"
#include "test_doubles.h"
#include "utils.h"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace forge {

class SandboxExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        run_id = "test-" + Utils::generate_run_id();
        workspace = SandboxExecutor::workspace_path(run_id);

        // Capture what the container would see while it runs
        runtime.on_run = [this](const ContainerRunRequest& request) {
            std::filesystem::path source = std::filesystem::path(request.host_directory) / request.source_file_name;
            file_existed_during_run = std::filesystem::exists(source);
            std::ifstream file(source);
            std::stringstream buffer;
            buffer << file.rdbuf();
            source_seen = buffer.str();
            directory_entries = 0;
            for (const auto& entry : std::filesystem::directory_iterator(request.host_directory)) {
                (void)entry;
                ++directory_entries;
            }
        };
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(workspace, ec);
    }

    SandboxSettings settings;
    TestContainerRuntime runtime;
    std::string run_id;
    std::filesystem::path workspace;
    bool file_existed_during_run = false;
    std::string source_seen;
    int directory_entries = 0;
};

TEST_F(SandboxExecutorTest, SuccessfulRunCapturesOutput) {
    runtime.mock_result = ContainerRunResult{"SAFE\nresult: 3\n", false, 0};
    SandboxExecutor executor(settings, runtime);

    ExecutionResult result = executor.execute("def add(a, b):\n    return a + b\nprint('SAFE')", run_id);

    EXPECT_TRUE(result.succeeded);
    EXPECT_FALSE(result.failure_reason.has_value());
    EXPECT_EQ(result.stdout_stderr_combined, "SAFE\nresult: 3\n");
    EXPECT_EQ(result.exit_code, 0);
}

TEST_F(SandboxExecutorTest, WorkspaceHoldsOnlyTheSourceFile) {
    SandboxExecutor executor(settings, runtime);
    const std::string source = "def main():\n    print('hi')\n";

    executor.execute(source, run_id);

    EXPECT_TRUE(file_existed_during_run);
    EXPECT_EQ(source_seen, source);
    EXPECT_EQ(directory_entries, 1);
}

TEST_F(SandboxExecutorTest, RequestCarriesContainmentLimits) {
    settings.memory_limit_mb = 64;
    settings.timeout_seconds = 5;
    settings.pids_limit = 16;
    settings.image = "python:3.12-slim";
    SandboxExecutor executor(settings, runtime);

    executor.execute("def f():\n    pass", run_id);

    ASSERT_EQ(runtime.run_requests.size(), 1u);
    const ContainerRunRequest& request = runtime.run_requests[0];
    EXPECT_EQ(request.container_name, SandboxExecutor::container_name(run_id));
    EXPECT_EQ(request.host_directory, workspace.string());
    EXPECT_EQ(request.source_file_name, "script.py");
    EXPECT_EQ(request.image, "python:3.12-slim");
    EXPECT_EQ(request.interpreter, "python");
    EXPECT_EQ(request.limits.memory_limit_mb, 64);
    EXPECT_EQ(request.limits.timeout_seconds, 5);
    EXPECT_EQ(request.limits.pids_limit, 16);
    EXPECT_TRUE(request.limits.network_disabled);
}

TEST_F(SandboxExecutorTest, TeardownAfterSuccess) {
    SandboxExecutor executor(settings, runtime);

    executor.execute("def f():\n    pass", run_id);

    EXPECT_FALSE(std::filesystem::exists(workspace));
    ASSERT_EQ(runtime.removed_containers.size(), 1u);
    EXPECT_EQ(runtime.removed_containers[0], SandboxExecutor::container_name(run_id));
}

TEST_F(SandboxExecutorTest, TimeoutReportedAndTornDown) {
    runtime.mock_result = ContainerRunResult{"partial output", true, 137};
    SandboxExecutor executor(settings, runtime);

    ExecutionResult result = executor.execute("def spin():\n    while True: pass\nspin()", run_id);

    EXPECT_FALSE(result.succeeded);
    ASSERT_TRUE(result.failure_reason.has_value());
    EXPECT_EQ(*result.failure_reason, "timeout");
    EXPECT_EQ(result.stdout_stderr_combined, "partial output");
    EXPECT_FALSE(std::filesystem::exists(workspace));
    EXPECT_EQ(runtime.removed_containers.size(), 1u);
}

TEST_F(SandboxExecutorTest, RuntimeExceptionBecomesSetupError) {
    runtime.throw_on_run = true;
    SandboxExecutor executor(settings, runtime);

    ExecutionResult result = executor.execute("def f():\n    pass", run_id);

    EXPECT_FALSE(result.succeeded);
    ASSERT_TRUE(result.failure_reason.has_value());
    EXPECT_EQ(result.failure_reason->rfind("setup_error:", 0), 0u);
    EXPECT_NE(result.failure_reason->find("Docker daemon"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(workspace));
    EXPECT_EQ(runtime.removed_containers.size(), 1u);
}

TEST_F(SandboxExecutorTest, NonZeroExitIsFailure) {
    runtime.mock_result = ContainerRunResult{"Traceback (most recent call last):\nNameError\n", false, 1};
    SandboxExecutor executor(settings, runtime);

    ExecutionResult result = executor.execute("def f():\n    undefined_name", run_id);

    EXPECT_FALSE(result.succeeded);
    EXPECT_EQ(result.failure_reason.value_or(""), "exit_code: 1");
    EXPECT_EQ(result.exit_code, 1);
}

TEST_F(SandboxExecutorTest, RemoveFailureDoesNotEscape) {
    runtime.throw_on_remove = true;
    SandboxExecutor executor(settings, runtime);

    ExecutionResult result;
    EXPECT_NO_THROW(result = executor.execute("def f():\n    pass", run_id));
    EXPECT_TRUE(result.succeeded);
    EXPECT_FALSE(std::filesystem::exists(workspace));
}

TEST_F(SandboxExecutorTest, EmptyInputRejectedWithoutRuntime) {
    SandboxExecutor executor(settings, runtime);

    EXPECT_THROW(executor.execute("", run_id), std::invalid_argument);
    EXPECT_THROW(executor.execute("  \n\t", run_id), std::invalid_argument);
    EXPECT_TRUE(runtime.run_requests.empty());
    EXPECT_TRUE(runtime.removed_containers.empty());
}

TEST_F(SandboxExecutorTest, ExistingWorkspaceIsSetupError) {
    std::filesystem::create_directory(workspace);
    SandboxExecutor executor(settings, runtime);

    ExecutionResult result = executor.execute("def f():\n    pass", run_id);

    EXPECT_FALSE(result.succeeded);
    EXPECT_EQ(result.failure_reason->rfind("setup_error:", 0), 0u);
    EXPECT_TRUE(runtime.run_requests.empty());
}

TEST_F(SandboxExecutorTest, GeneratesRunIdWhenNoneGiven) {
    SandboxExecutor executor(settings, runtime);

    executor.execute("def f():\n    pass");
    executor.execute("def f():\n    pass");

    ASSERT_EQ(runtime.run_requests.size(), 2u);
    EXPECT_NE(runtime.run_requests[0].container_name, runtime.run_requests[1].container_name);
    EXPECT_FALSE(std::filesystem::exists(runtime.run_requests[0].host_directory));
}

} // namespace forge
