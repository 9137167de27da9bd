#include "sandbox/sandbox_executor.h"
#include "utils.h"
#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace forge {

namespace {

// Temporary directory containing only the source file; removed on destruction
class ScopedWorkspace {
public:
    explicit ScopedWorkspace(const std::filesystem::path& directory)
        : directory_(directory) {
        if (!std::filesystem::create_directory(directory_)) {
            throw std::runtime_error("workspace " + directory_.string() + " already exists");
        }
    }

    ~ScopedWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(directory_, ec);
        if (ec) {
            std::cerr << "[SANDBOX] Failed to remove " << directory_ << ": " << ec.message() << std::endl;
        }
    }

    ScopedWorkspace(const ScopedWorkspace&) = delete;
    ScopedWorkspace& operator=(const ScopedWorkspace&) = delete;

    void write_file(const std::string& file_name, const std::string& content) {
        const auto file_path = directory_ / file_name;
        std::ofstream file(file_path);
        if (!file.is_open()) {
            throw std::runtime_error("could not write " + file_path.string());
        }
        file << content;
        file.close();
        if (file.fail()) {
            throw std::runtime_error("failed writing " + file_path.string());
        }
    }

private:
    std::filesystem::path directory_;
};

// Force-removes the named container when the run leaves scope
class ContainerGuard {
public:
    ContainerGuard(IContainerRuntime& runtime, const std::string& name)
        : runtime_(runtime), name_(name) {
    }

    ~ContainerGuard() {
        try {
            runtime_.remove(name_);
        } catch (const std::exception& e) {
            std::cerr << "[SANDBOX] Failed to remove container " << name_ << ": " << e.what() << std::endl;
        }
    }

    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;

private:
    IContainerRuntime& runtime_;
    std::string name_;
};

} // namespace

SandboxExecutor::SandboxExecutor(const SandboxSettings& settings, IContainerRuntime& runtime)
    : settings_(settings), runtime_(runtime) {
}

std::filesystem::path SandboxExecutor::workspace_path(const std::string& run_id) {
    return std::filesystem::temp_directory_path() / ("forge-" + run_id);
}

std::string SandboxExecutor::container_name(const std::string& run_id) {
    return "forge-" + run_id;
}

ExecutionResult SandboxExecutor::execute(const std::string& source_text, const std::string& run_id) {
    if (Utils::trim(source_text).empty()) {
        throw std::invalid_argument("sandbox input must not be empty");
    }

    const std::string id = run_id.empty() ? Utils::generate_run_id() : run_id;

    ExecutionResult result;
    const auto start_time = std::chrono::steady_clock::now();

    try {
        ScopedWorkspace workspace(workspace_path(id));
        workspace.write_file(settings_.source_file_name, source_text);

        ContainerRunRequest request;
        request.container_name = container_name(id);
        request.host_directory = workspace_path(id).string();
        request.source_file_name = settings_.source_file_name;
        request.image = settings_.image;
        request.interpreter = settings_.interpreter;
        request.limits.memory_limit_mb = settings_.memory_limit_mb;
        request.limits.timeout_seconds = settings_.timeout_seconds;
        request.limits.pids_limit = settings_.pids_limit;
        request.limits.network_disabled = settings_.network_disabled;
        request.max_output_bytes = settings_.max_output_bytes;

        // Declared after the workspace so the container goes first
        ContainerGuard guard(runtime_, request.container_name);

        ContainerRunResult run = runtime_.run_isolated(request);
        result.stdout_stderr_combined = run.output;
        result.exit_code = run.exit_code;

        if (run.timed_out) {
            result.succeeded = false;
            result.failure_reason = "timeout";
        } else if (run.exit_code != 0) {
            result.succeeded = false;
            result.failure_reason = "exit_code: " + std::to_string(run.exit_code);
        } else {
            result.succeeded = true;
        }

    } catch (const std::exception& e) {
        result.succeeded = false;
        result.failure_reason = "setup_error: " + std::string(e.what());
    }

    result.execution_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    std::cout << "[SANDBOX] " << (result.succeeded ? "Finished" : "Failed")
              << " in " << result.execution_duration.count() << "ms";
    if (result.failure_reason) {
        std::cout << " (" << *result.failure_reason << ")";
    }
    std::cout << std::endl;
    if (result.has_output()) {
        std::cout << result.stdout_stderr_combined << std::endl;
    }

    return result;
}

} // namespace forge
