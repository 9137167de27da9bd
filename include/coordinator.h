#pragma once

#include "message.h"
#include "pipeline_config.h"
#include "transcript.h"
#include "review_gate.h"
#include "sandbox/sandbox_executor.h"
#include "delivery/delivery_pipeline.h"
#include "interfaces/agent_client_interface.h"
#include "interfaces/container_runtime_interface.h"
#include "interfaces/hosting_client_interface.h"
#include "interfaces/mail_client_interface.h"
#include <memory>
#include <optional>
#include <string>

namespace forge {

/**
 * @brief Drives one task from agent turns to delivered code
 *
 * A run is strictly sequential: MAX_TURNS agent turns in fixed role order,
 * one artifact extraction, at most one sandbox execution, one gate decision
 * and at most one publish/notify pair. run() never throws; every failure
 * becomes a RunOutcome.
 */
class Coordinator {
public:
    // Collaborators are injected so tests can substitute deterministic doubles
    Coordinator(const PipelineSettings& settings,
                std::unique_ptr<IAgentClient> agent_client,
                std::unique_ptr<IContainerRuntime> container_runtime,
                std::unique_ptr<IHostingClient> hosting_client,
                std::unique_ptr<IMailClient> mail_client);

    ~Coordinator() = default;

    RunOutcome run(const Task& task);

    // Most recent Writer turn whose text is code, scanning newest first
    static std::optional<CandidateArtifact> extract_artifact(const Transcript& transcript);

    AgentVerdicts collect_verdicts(const Transcript& transcript) const;

    // State of the most recent run, for reporting
    const Transcript& get_transcript() const { return transcript_; }
    const std::string& get_run_id() const { return run_id_; }
    const std::optional<ExecutionResult>& get_execution_result() const { return execution_result_; }

    const PipelineSettings& get_settings() const { return settings_; }

private:
    PipelineSettings settings_;

    std::unique_ptr<IAgentClient> agent_client_;
    std::unique_ptr<IContainerRuntime> container_runtime_;
    std::unique_ptr<IHostingClient> hosting_client_;
    std::unique_ptr<IMailClient> mail_client_;

    SandboxExecutor executor_;
    ReviewGate gate_;
    DeliveryPipeline delivery_;

    Transcript transcript_;
    std::string run_id_;
    std::optional<ExecutionResult> execution_result_;

    // Runs every agent turn; returns how many of them failed outright
    int run_agent_turns();

    // One turn with retry; ok is false if every attempt threw
    std::string request_turn(RoleTag role, bool& ok);

    RunOutcome run_pipeline(const Task& task);
};

} // namespace forge
