#include "message.h"
#include <stdexcept>
#include <sstream>

namespace forge {

std::string ExecutionResult::to_string() const {
    std::ostringstream oss;
    oss << "Succeeded: " << (succeeded ? "true" : "false") << "\n"
        << "Exit Code: " << exit_code << "\n"
        << "Duration: " << execution_duration.count() << "ms\n";

    if (failure_reason) {
        oss << "Failure: " << *failure_reason << "\n";
    }

    if (!stdout_stderr_combined.empty()) {
        oss << "Output:\n" << stdout_stderr_combined << "\n";
    }

    return oss.str();
}

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::COLLABORATOR_ERROR: return "CollaboratorError";
        case ErrorKind::CONTAINMENT_ERROR: return "ContainmentError";
        case ErrorKind::EXTRACTION_MISS: return "ExtractionMiss";
        case ErrorKind::POLICY_ABORT: return "PolicyAbort";
    }
    return "Unknown";
}

RunOutcome RunOutcome::delivered(const std::string& reference) {
    RunOutcome outcome;
    outcome.kind = Kind::DELIVERED;
    outcome.reference = reference;
    return outcome;
}

RunOutcome RunOutcome::aborted(const std::string& reason, ErrorKind error_kind) {
    RunOutcome outcome;
    outcome.kind = Kind::ABORTED;
    outcome.reason = reason;
    outcome.error_kind = error_kind;
    return outcome;
}

RunOutcome RunOutcome::no_artifact() {
    RunOutcome outcome;
    outcome.kind = Kind::NO_ARTIFACT;
    outcome.reason = "no code-shaped Writer turn in transcript";
    outcome.error_kind = ErrorKind::EXTRACTION_MISS;
    return outcome;
}

RunOutcome RunOutcome::delivery_failed(const std::string& reason) {
    RunOutcome outcome;
    outcome.kind = Kind::DELIVERY_FAILED;
    outcome.reason = reason;
    outcome.error_kind = ErrorKind::COLLABORATOR_ERROR;
    return outcome;
}

int RunOutcome::exit_code() const {
    switch (kind) {
        case Kind::DELIVERED: return EXIT_DELIVERED;
        case Kind::ABORTED: return EXIT_ABORTED;
        case Kind::NO_ARTIFACT: return EXIT_NO_ARTIFACT;
        case Kind::DELIVERY_FAILED: return EXIT_DELIVERY_FAILED;
    }
    return EXIT_ABORTED;
}

std::string RunOutcome::get_kind_name() const {
    switch (kind) {
        case Kind::DELIVERED: return "Delivered";
        case Kind::ABORTED: return "Aborted";
        case Kind::NO_ARTIFACT: return "NoArtifact";
        case Kind::DELIVERY_FAILED: return "DeliveryFailed";
    }
    return "Unknown";
}

std::string RunOutcome::to_string() const {
    std::string result = get_kind_name();
    if (kind == Kind::DELIVERED) {
        result += "(" + reference + ")";
    } else if (kind == Kind::ABORTED || kind == Kind::DELIVERY_FAILED) {
        result += "(" + reason + ")";
    }
    if (error_kind && kind != Kind::NO_ARTIFACT) {
        result += " [" + forge::to_string(*error_kind) + "]";
    }
    return result;
}

// AgentTurnRequest implementations
void AgentTurnRequest::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"role", role},
        {"role_prompt", role_prompt},
        {"transcript", transcript}
    };

    if (!provider.empty()) {
        j["provider"] = provider;
    }
}

void AgentTurnRequest::from_json(const nlohmann::json& j) {
    j.at("role").get_to(role);
    j.at("role_prompt").get_to(role_prompt);
    j.at("transcript").get_to(transcript);
    if (j.contains("provider") && j["provider"].is_string()) {
        j.at("provider").get_to(provider);
    }
}

// AgentTurnResponse implementations
void AgentTurnResponse::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"success", success},
        {"text", text},
        {"error_message", error_message},
        {"provider", provider}
    };
}

void AgentTurnResponse::from_json(const nlohmann::json& j) {
    j.at("success").get_to(success);
    if (j.contains("text") && j["text"].is_string()) {
        j.at("text").get_to(text);
    }
    if (j.contains("error_message") && j["error_message"].is_string()) {
        j.at("error_message").get_to(error_message);
    }
    if (j.contains("provider") && j["provider"].is_string()) {
        j.at("provider").get_to(provider);
    }
}

// MessageHandler implementations
std::string MessageHandler::serialize_turn_request(const AgentTurnRequest& request) {
    nlohmann::json j;
    request.to_json(j);
    return j.dump();
}

AgentTurnRequest MessageHandler::deserialize_turn_request(const std::string& json_str) {
    try {
        nlohmann::json j = nlohmann::json::parse(json_str);
        AgentTurnRequest request;
        request.from_json(j);
        return request;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to deserialize agent turn request: " + std::string(e.what()));
    }
}

std::string MessageHandler::serialize_turn_response(const AgentTurnResponse& response) {
    nlohmann::json j;
    response.to_json(j);
    return j.dump();
}

AgentTurnResponse MessageHandler::deserialize_turn_response(const std::string& json_str) {
    try {
        nlohmann::json j = nlohmann::json::parse(json_str);
        AgentTurnResponse response;
        response.from_json(j);
        return response;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to deserialize agent turn response: " + std::string(e.what()));
    }
}

} // namespace forge
