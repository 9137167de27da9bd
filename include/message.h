#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>

namespace forge {

/**
 * @brief A natural-language task and the address to notify when it is done
 */
struct Task {
    std::string description;
    std::string requester_contact;
};

/**
 * @brief Source text chosen for sandboxed execution
 */
struct CandidateArtifact {
    std::string source_text;
    int extracted_at_turn = -1;   // Index of the Writer turn it came from
};

/**
 * @brief Outcome of running one artifact inside the sandbox
 */
struct ExecutionResult {
    std::string stdout_stderr_combined;
    bool succeeded = false;
    std::optional<std::string> failure_reason;
    int exit_code = -1;
    std::chrono::milliseconds execution_duration{0};

    bool has_output() const { return !stdout_stderr_combined.empty(); }
    std::string to_string() const;
};

enum class GateOutcome {
    PROCEED,
    ABORT
};

struct GateDecision {
    GateOutcome outcome = GateOutcome::ABORT;
    std::string reason;

    bool proceed() const { return outcome == GateOutcome::PROCEED; }
    bool operator==(const GateDecision& other) const {
        return outcome == other.outcome && reason == other.reason;
    }
    bool operator!=(const GateDecision& other) const { return !(*this == other); }
};

/**
 * @brief Structured verdicts parsed from the Sanitizer and Reviewer turns
 */
struct AgentVerdicts {
    bool sanitizer_present = false;
    bool sanitizer_safe = false;
    bool reviewer_present = false;
    bool reviewer_approved = false;
};

struct DeliveryOutcome {
    std::optional<std::string> published_reference;
    bool notified = false;
    std::string error_message;   // Why publishing failed, if it did
};

enum class ErrorKind {
    COLLABORATOR_ERROR,   // An external call failed (network, auth, quota)
    CONTAINMENT_ERROR,    // Sandbox setup or execution failed or timed out
    EXTRACTION_MISS,      // No code-shaped artifact in the transcript
    POLICY_ABORT          // Gate rejected a successfully produced artifact
};

std::string to_string(ErrorKind kind);

/**
 * @brief Terminal result of one pipeline run
 */
struct RunOutcome {
    enum class Kind {
        DELIVERED,
        ABORTED,
        NO_ARTIFACT,
        DELIVERY_FAILED
    };

    Kind kind = Kind::ABORTED;
    std::string reference;             // Set for DELIVERED
    std::string reason;                // Set for ABORTED and DELIVERY_FAILED
    std::optional<ErrorKind> error_kind;

    static RunOutcome delivered(const std::string& reference);
    static RunOutcome aborted(const std::string& reason, ErrorKind error_kind);
    static RunOutcome no_artifact();
    static RunOutcome delivery_failed(const std::string& reason);

    bool is_delivered() const { return kind == Kind::DELIVERED; }
    int exit_code() const;
    std::string get_kind_name() const;
    std::string to_string() const;
};

// Process exit codes, one per outcome
constexpr int EXIT_DELIVERED = 0;
constexpr int EXIT_USAGE_ERROR = 1;
constexpr int EXIT_ABORTED = 2;
constexpr int EXIT_NO_ARTIFACT = 3;
constexpr int EXIT_DELIVERY_FAILED = 4;

/**
 * @brief Request sent from the coordinator to the LLM adapter service
 */
struct AgentTurnRequest {
    std::string role;          // Role name, e.g. "Writer"
    std::string role_prompt;   // System instruction for that role
    std::string transcript;    // Rendered transcript so far
    std::string provider;      // Optional provider override

    void to_json(nlohmann::json& j) const;
    void from_json(const nlohmann::json& j);
};

struct AgentTurnResponse {
    bool success = false;
    std::string text;
    std::string error_message;
    std::string provider;

    void to_json(nlohmann::json& j) const;
    void from_json(const nlohmann::json& j);
};

class MessageHandler {
public:
    static std::string serialize_turn_request(const AgentTurnRequest& request);
    static AgentTurnRequest deserialize_turn_request(const std::string& json_str);

    static std::string serialize_turn_response(const AgentTurnResponse& response);
    static AgentTurnResponse deserialize_turn_response(const std::string& json_str);
};

} // namespace forge
