#pragma once

#include "message.h"
#include "pipeline_config.h"
#include "interfaces/container_runtime_interface.h"
#include <filesystem>
#include <string>

namespace forge {

/**
 * @brief Runs exactly one untrusted source artifact under containment
 *
 * Every call gets its own temporary directory holding only the source file,
 * mounted read-only into a fresh container. Both the container and the
 * directory are gone by the time execute() returns, on every exit path.
 */
class SandboxExecutor {
public:
    SandboxExecutor(const SandboxSettings& settings, IContainerRuntime& runtime);

    /**
     * @brief Execute source_text and capture its combined output
     * @param source_text Artifact to run; must not be blank
     * @param run_id Names the temp directory and container; generated if empty
     * @return Result with failure_reason "timeout", "exit_code: N" or "setup_error: ..."
     * @throws std::invalid_argument if source_text is blank
     */
    ExecutionResult execute(const std::string& source_text, const std::string& run_id = "");

    static std::filesystem::path workspace_path(const std::string& run_id);
    static std::string container_name(const std::string& run_id);

    const SandboxSettings& get_settings() const { return settings_; }

private:
    SandboxSettings settings_;
    IContainerRuntime& runtime_;
};

} // namespace forge
