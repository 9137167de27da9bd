#include "coordinator.h"
#include "code_detector.h"
#include "utils.h"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace forge {

namespace {

template <typename T>
T& require(const std::unique_ptr<T>& collaborator, const char* name) {
    if (!collaborator) {
        throw std::invalid_argument(std::string("Coordinator requires a ") + name);
    }
    return *collaborator;
}

} // namespace

Coordinator::Coordinator(const PipelineSettings& settings,
                         std::unique_ptr<IAgentClient> agent_client,
                         std::unique_ptr<IContainerRuntime> container_runtime,
                         std::unique_ptr<IHostingClient> hosting_client,
                         std::unique_ptr<IMailClient> mail_client)
    : settings_(settings),
      agent_client_(std::move(agent_client)),
      container_runtime_(std::move(container_runtime)),
      hosting_client_(std::move(hosting_client)),
      mail_client_(std::move(mail_client)),
      executor_(settings_.sandbox, require(container_runtime_, "container runtime")),
      gate_(settings_.gate),
      delivery_(settings_.hosting, settings_.mail,
                require(hosting_client_, "hosting client"),
                require(mail_client_, "mail client")) {
    require(agent_client_, "agent client");
}

std::optional<CandidateArtifact> Coordinator::extract_artifact(const Transcript& transcript) {
    for (size_t i = transcript.size(); i > 0; --i) {
        const Turn& turn = transcript.at(i - 1);
        if (turn.role != RoleTag::WRITER) {
            continue;
        }

        auto code = CodeDetector::extract_code(turn.text);
        if (code) {
            CandidateArtifact artifact;
            artifact.source_text = *code;
            artifact.extracted_at_turn = static_cast<int>(i - 1);
            return artifact;
        }
    }
    return std::nullopt;
}

AgentVerdicts Coordinator::collect_verdicts(const Transcript& transcript) const {
    auto sanitizer = transcript.find_latest(RoleTag::SANITIZER);
    auto reviewer = transcript.find_latest(RoleTag::REVIEWER);

    return gate_.parse_verdicts(sanitizer ? transcript.at(*sanitizer).text : std::string(), sanitizer.has_value(),
                                reviewer ? transcript.at(*reviewer).text : std::string(), reviewer.has_value());
}

std::string Coordinator::request_turn(RoleTag role, bool& ok) {
    const std::string prompt = role_prompt(role);
    const std::string rendered = transcript_.render();
    const int attempts = std::max(1, settings_.agents.max_attempts);

    for (int attempt = 0; attempt < attempts; ++attempt) {
        try {
            std::string text = agent_client_->send(prompt, rendered);
            ok = true;
            return text;
        } catch (const std::exception& e) {
            std::cerr << "[AGENT] " << role_name(role) << " turn failed (attempt "
                      << attempt + 1 << "/" << attempts << "): " << e.what() << std::endl;
        }

        if (attempt + 1 < attempts && settings_.agents.retry_backoff_ms > 0) {
            auto delay = std::chrono::milliseconds(settings_.agents.retry_backoff_ms) * (1LL << attempt);
            std::this_thread::sleep_for(delay);
        }
    }

    ok = false;
    return "";
}

int Coordinator::run_agent_turns() {
    const int max_turns = settings_.max_turns();
    int failed_turns = 0;

    for (int i = 0; i < max_turns; ++i) {
        RoleTag role = role_for_turn(static_cast<size_t>(i));

        bool ok = false;
        std::string text = request_turn(role, ok);
        if (!ok) {
            ++failed_turns;
        }

        // An empty or failed turn is still recorded and the cycle continues
        transcript_.append(role, text);
        std::cout << "[" << role_name(role) << "] " << (text.empty() ? "(no reply)" : text) << std::endl;
    }

    return failed_turns;
}

RunOutcome Coordinator::run_pipeline(const Task& task) {
    std::cout << "🎯 Task: " << task.description << " (run " << run_id_ << ")" << std::endl;

    const int failed_turns = run_agent_turns();
    if (failed_turns == settings_.max_turns()) {
        return RunOutcome::aborted("all " + std::to_string(failed_turns) + " agent turns failed",
                                   ErrorKind::COLLABORATOR_ERROR);
    }

    auto artifact = extract_artifact(transcript_);
    if (!artifact) {
        std::cout << "⚠️ No code generated." << std::endl;
        return RunOutcome::no_artifact();
    }
    std::cout << "Extracted artifact from turn " << artifact->extracted_at_turn << std::endl;

    AgentVerdicts verdicts = collect_verdicts(transcript_);
    if (settings_.gate.require_sanitizer_verdict && !verdicts.sanitizer_safe) {
        return RunOutcome::aborted("Sanitizer did not mark the code '" + settings_.gate.sanitizer_marker +
                                   "'; artifact not executed", ErrorKind::POLICY_ABORT);
    }

    std::cout << "🧪 Running sandbox..." << std::endl;
    ExecutionResult result = executor_.execute(artifact->source_text, run_id_);
    execution_result_ = result;

    GateDecision decision = gate_.decide(result, verdicts);
    std::cout << "[GATE] " << (decision.proceed() ? "PROCEED" : "ABORT") << ": " << decision.reason << std::endl;
    if (!decision.proceed()) {
        return RunOutcome::aborted(decision.reason,
                                   result.succeeded ? ErrorKind::POLICY_ABORT : ErrorKind::CONTAINMENT_ERROR);
    }

    std::string summary;
    if (auto notifier = transcript_.find_latest(RoleTag::NOTIFIER)) {
        summary = transcript_.at(*notifier).text;
    }

    DeliveryOutcome delivery = delivery_.deliver(*artifact, task, run_id_, summary);
    if (!delivery.published_reference) {
        return RunOutcome::delivery_failed(delivery.error_message.empty() ? "publish failed" : delivery.error_message);
    }

    if (!delivery.notified) {
        std::cerr << "Notification to " << task.requester_contact << " was not delivered" << std::endl;
    }

    return RunOutcome::delivered(*delivery.published_reference);
}

RunOutcome Coordinator::run(const Task& task) {
    transcript_ = Transcript(task.description);
    execution_result_.reset();

    try {
        run_id_ = Utils::generate_run_id();
        return run_pipeline(task);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return RunOutcome::aborted(std::string("unexpected error: ") + e.what(), ErrorKind::COLLABORATOR_ERROR);
    }
}

} // namespace forge
