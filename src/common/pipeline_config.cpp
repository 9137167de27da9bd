#include "pipeline_config.h"
#include "agent_roles.h"
#include "utils.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <fstream>
#include <iostream>
#include <vector>

namespace forge {

namespace {

enum class FieldType { STRING, INTEGER, SIZE, BOOLEAN };

struct FieldSpec {
    const char* section;
    const char* key;
    FieldType type;
};

// Every field the configuration file may carry. Secrets are never listed.
const std::vector<FieldSpec>& get_field_specs() {
    static const std::vector<FieldSpec> specs = {
        {"agents", "cycles", FieldType::INTEGER},
        {"agents", "max_attempts", FieldType::INTEGER},
        {"agents", "retry_backoff_ms", FieldType::INTEGER},
        {"agents", "provider", FieldType::STRING},
        {"sandbox", "runtime", FieldType::STRING},
        {"sandbox", "image", FieldType::STRING},
        {"sandbox", "interpreter", FieldType::STRING},
        {"sandbox", "source_file_name", FieldType::STRING},
        {"sandbox", "memory_limit_mb", FieldType::INTEGER},
        {"sandbox", "timeout_seconds", FieldType::INTEGER},
        {"sandbox", "pids_limit", FieldType::INTEGER},
        {"sandbox", "max_output_bytes", FieldType::SIZE},
        {"sandbox", "network_disabled", FieldType::BOOLEAN},
        {"gate", "safety_marker", FieldType::STRING},
        {"gate", "require_sanitizer_verdict", FieldType::BOOLEAN},
        {"gate", "sanitizer_marker", FieldType::STRING},
        {"gate", "reviewer_marker", FieldType::STRING},
        {"hosting", "api_base", FieldType::STRING},
        {"hosting", "repository", FieldType::STRING},
        {"hosting", "base_branch", FieldType::STRING},
        {"hosting", "branch_prefix", FieldType::STRING},
        {"hosting", "file_path", FieldType::STRING},
        {"hosting", "commit_message", FieldType::STRING},
        {"hosting", "pr_title", FieldType::STRING},
        {"hosting", "pr_body", FieldType::STRING},
        {"mail", "smtp_port", FieldType::INTEGER},
        {"mail", "subject", FieldType::STRING},
        {"mail", "notify_on_failure", FieldType::BOOLEAN},
        {"network", "llm_adapter_url", FieldType::STRING},
        {"network", "receive_timeout_ms", FieldType::INTEGER}
    };
    return specs;
}

const char* type_name(FieldType type) {
    switch (type) {
        case FieldType::STRING: return "string";
        case FieldType::INTEGER: return "integer";
        case FieldType::SIZE: return "non-negative integer";
        case FieldType::BOOLEAN: return "boolean";
    }
    return "value";
}

bool has_type(const nlohmann::json& value, FieldType type) {
    switch (type) {
        case FieldType::STRING: return value.is_string();
        case FieldType::INTEGER:
        case FieldType::SIZE: return value.is_number_integer();
        case FieldType::BOOLEAN: return value.is_boolean();
    }
    return false;
}

// Integer fields must fit their C++ type before get<T>() narrows them
bool fits_target(const nlohmann::json& value, FieldType type) {
    if (type == FieldType::INTEGER) {
        if (value.is_number_unsigned()) {
            return value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max());
        }
        int64_t number = value.get<int64_t>();
        return number >= std::numeric_limits<int>::min() && number <= std::numeric_limits<int>::max();
    }
    if (type == FieldType::SIZE) {
        if (value.is_number_unsigned()) {
            return value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<size_t>::max());
        }
        return value.get<int64_t>() >= 0;
    }
    return true;
}

template <typename T>
void read_field(const nlohmann::json& section, const char* key, T& target) {
    if (section.contains(key)) {
        target = section[key].get<T>();
    }
}

} // namespace

bool PipelineSettings::validate(std::string& error_message) const {
    if (agents.cycles < 1 || agents.cycles > 20) {
        error_message = "agents.cycles must be between 1 and 20, got " + std::to_string(agents.cycles);
        return false;
    }

    if (agents.max_attempts < 1 || agents.max_attempts > 10) {
        error_message = "agents.max_attempts must be between 1 and 10, got " + std::to_string(agents.max_attempts);
        return false;
    }

    if (agents.retry_backoff_ms < 0) {
        error_message = "agents.retry_backoff_ms must not be negative";
        return false;
    }

    if (sandbox.runtime.empty() || sandbox.image.empty() || sandbox.interpreter.empty()) {
        error_message = "sandbox.runtime, sandbox.image and sandbox.interpreter must not be empty";
        return false;
    }

    if (sandbox.source_file_name.empty() || sandbox.source_file_name.find('/') != std::string::npos) {
        error_message = "sandbox.source_file_name must be a plain file name, got '" + sandbox.source_file_name + "'";
        return false;
    }

    if (sandbox.memory_limit_mb < 4) {
        error_message = "sandbox.memory_limit_mb must be at least 4, got " + std::to_string(sandbox.memory_limit_mb);
        return false;
    }

    if (sandbox.timeout_seconds < 1 || sandbox.timeout_seconds > 3600) {
        error_message = "sandbox.timeout_seconds must be between 1 and 3600, got " + std::to_string(sandbox.timeout_seconds);
        return false;
    }

    if (sandbox.pids_limit < 1) {
        error_message = "sandbox.pids_limit must be positive";
        return false;
    }

    if (sandbox.max_output_bytes == 0) {
        error_message = "sandbox.max_output_bytes must be positive";
        return false;
    }

    if (gate.safety_marker.empty()) {
        error_message = "gate.safety_marker must not be empty";
        return false;
    }

    if (gate.require_sanitizer_verdict && gate.sanitizer_marker.empty()) {
        error_message = "gate.sanitizer_marker must not be empty when gate.require_sanitizer_verdict is set";
        return false;
    }

    size_t slash = hosting.repository.find('/');
    if (slash == std::string::npos || slash == 0 || slash == hosting.repository.size() - 1 ||
        hosting.repository.find('/', slash + 1) != std::string::npos) {
        error_message = "hosting.repository must have the form 'owner/name', got '" + hosting.repository + "'";
        return false;
    }

    if (hosting.base_branch.empty() || hosting.branch_prefix.empty() || hosting.file_path.empty()) {
        error_message = "hosting.base_branch, hosting.branch_prefix and hosting.file_path must not be empty";
        return false;
    }

    if (hosting.file_path.find("..") != std::string::npos || hosting.file_path.front() == '/') {
        error_message = "hosting.file_path '" + hosting.file_path + "' must be a relative path inside the repository";
        return false;
    }

    if (mail.smtp_port < 1 || mail.smtp_port > 65535) {
        error_message = "mail.smtp_port must be between 1 and 65535, got " + std::to_string(mail.smtp_port);
        return false;
    }

    if (network.llm_adapter_url.empty()) {
        error_message = "network.llm_adapter_url must not be empty";
        return false;
    }

    if (network.receive_timeout_ms < 1000) {
        error_message = "network.receive_timeout_ms must be at least 1000";
        return false;
    }

    return true;
}

int PipelineSettings::max_turns() const {
    return static_cast<int>(kRoleCycleLength) * agents.cycles;
}

std::unique_ptr<PipelineSettings> PipelineConfig::load_or_create(std::string& error_message,
                                                                 const std::string& config_path) {
    std::string config_file = config_path.empty() ? get_config_file_path() : config_path;

    if (!std::filesystem::exists(config_file)) {
        std::cout << "Creating default pipeline configuration at " << config_file << std::endl;

        if (!Utils::create_directories(config_file)) {
            error_message = "Could not create directory for " + config_file;
            return nullptr;
        }

        PipelineSettings default_settings;
        if (!save(default_settings, config_file, error_message)) {
            return nullptr;
        }
    }

    auto settings = parse_config(config_file, error_message);
    if (!settings) {
        error_message = config_file + ": " + error_message;
        return nullptr;
    }

    apply_environment(*settings);
    return settings;
}

bool PipelineConfig::save(const PipelineSettings& settings, const std::string& file_path, std::string& error_message) {
    if (!settings.validate(error_message)) {
        return false;
    }

    try {
        nlohmann::json json = settings_to_json(settings);

        std::ofstream file(file_path);
        if (!file.is_open()) {
            error_message = "Could not open " + file_path + " for writing";
            return false;
        }

        file << json.dump(2) << std::endl;
        file.close();

        if (file.fail()) {
            error_message = "Failed to write to " + file_path;
            return false;
        }

        return true;

    } catch (const std::exception& e) {
        error_message = "JSON serialization error: " + std::string(e.what());
        return false;
    }
}

void PipelineConfig::apply_environment(PipelineSettings& settings) {
    settings.hosting.token = Utils::get_env("GITHUB_TOKEN");
    settings.mail.smtp_host = Utils::get_env("SMTP_HOST");
    settings.mail.username = Utils::get_env("SMTP_USER");
    settings.mail.password = Utils::get_env("SMTP_PASS");
}

std::string PipelineConfig::get_forge_directory() {
    return Utils::get_current_working_directory() + "/.forge";
}

std::string PipelineConfig::get_config_file_path() {
    return get_forge_directory() + "/pipeline.json";
}

std::unique_ptr<PipelineSettings> PipelineConfig::parse_config(const std::string& file_path, std::string& error_message) {
    try {
        std::ifstream file(file_path);
        if (!file.is_open()) {
            error_message = "Could not open file: " + file_path;
            return nullptr;
        }

        nlohmann::json json;
        file >> json;

        if (!validate_json_schema(json, error_message)) {
            return nullptr;
        }

        auto settings = json_to_settings(json);

        std::string validation_error;
        if (!settings->validate(validation_error)) {
            error_message = "Configuration validation failed: " + validation_error;
            return nullptr;
        }

        return settings;

    } catch (const nlohmann::json::parse_error& e) {
        error_message = "JSON parse error at byte " + std::to_string(e.byte) + ": " + e.what();
        return nullptr;
    } catch (const std::exception& e) {
        error_message = "Unexpected error: " + std::string(e.what());
        return nullptr;
    }
}

bool PipelineConfig::validate_json_schema(const nlohmann::json& json, std::string& error_message) {
    if (!json.is_object()) {
        error_message = "Top level must be a JSON object";
        return false;
    }

    if (!json.contains("version") || !json["version"].is_string()) {
        error_message = "Missing or invalid 'version' field (must be string)";
        return false;
    }

    for (const char* section : {"agents", "sandbox", "gate", "hosting", "mail", "network"}) {
        if (json.contains(section) && !json[section].is_object()) {
            error_message = "Invalid '" + std::string(section) + "' field (must be object)";
            return false;
        }
    }

    for (const auto& field : get_field_specs()) {
        if (!json.contains(field.section)) {
            continue;
        }
        const auto& section = json[field.section];
        if (!section.contains(field.key)) {
            continue;
        }
        const auto& value = section[field.key];
        if (!has_type(value, field.type)) {
            error_message = "Invalid '" + std::string(field.section) + "." + field.key +
                            "' field (must be " + type_name(field.type) + ")";
            return false;
        }
        if (!fits_target(value, field.type)) {
            error_message = "Invalid '" + std::string(field.section) + "." + field.key +
                            "' field (" + value.dump() + " is out of range)";
            return false;
        }
    }

    return true;
}

nlohmann::json PipelineConfig::settings_to_json(const PipelineSettings& settings) {
    nlohmann::json json;
    json["version"] = "1.0";

    json["agents"] = {
        {"cycles", settings.agents.cycles},
        {"max_attempts", settings.agents.max_attempts},
        {"retry_backoff_ms", settings.agents.retry_backoff_ms},
        {"provider", settings.agents.provider}
    };

    json["sandbox"] = {
        {"runtime", settings.sandbox.runtime},
        {"image", settings.sandbox.image},
        {"interpreter", settings.sandbox.interpreter},
        {"source_file_name", settings.sandbox.source_file_name},
        {"memory_limit_mb", settings.sandbox.memory_limit_mb},
        {"timeout_seconds", settings.sandbox.timeout_seconds},
        {"pids_limit", settings.sandbox.pids_limit},
        {"max_output_bytes", settings.sandbox.max_output_bytes},
        {"network_disabled", settings.sandbox.network_disabled}
    };

    json["gate"] = {
        {"safety_marker", settings.gate.safety_marker},
        {"require_sanitizer_verdict", settings.gate.require_sanitizer_verdict},
        {"sanitizer_marker", settings.gate.sanitizer_marker},
        {"reviewer_marker", settings.gate.reviewer_marker}
    };

    json["hosting"] = {
        {"api_base", settings.hosting.api_base},
        {"repository", settings.hosting.repository},
        {"base_branch", settings.hosting.base_branch},
        {"branch_prefix", settings.hosting.branch_prefix},
        {"file_path", settings.hosting.file_path},
        {"commit_message", settings.hosting.commit_message},
        {"pr_title", settings.hosting.pr_title},
        {"pr_body", settings.hosting.pr_body}
    };

    json["mail"] = {
        {"smtp_port", settings.mail.smtp_port},
        {"subject", settings.mail.subject},
        {"notify_on_failure", settings.mail.notify_on_failure}
    };

    json["network"] = {
        {"llm_adapter_url", settings.network.llm_adapter_url},
        {"receive_timeout_ms", settings.network.receive_timeout_ms}
    };

    return json;
}

std::unique_ptr<PipelineSettings> PipelineConfig::json_to_settings(const nlohmann::json& json) {
    auto settings = std::make_unique<PipelineSettings>();
    const nlohmann::json empty = nlohmann::json::object();

    const auto& agents = json.contains("agents") ? json["agents"] : empty;
    read_field(agents, "cycles", settings->agents.cycles);
    read_field(agents, "max_attempts", settings->agents.max_attempts);
    read_field(agents, "retry_backoff_ms", settings->agents.retry_backoff_ms);
    read_field(agents, "provider", settings->agents.provider);

    const auto& sandbox = json.contains("sandbox") ? json["sandbox"] : empty;
    read_field(sandbox, "runtime", settings->sandbox.runtime);
    read_field(sandbox, "image", settings->sandbox.image);
    read_field(sandbox, "interpreter", settings->sandbox.interpreter);
    read_field(sandbox, "source_file_name", settings->sandbox.source_file_name);
    read_field(sandbox, "memory_limit_mb", settings->sandbox.memory_limit_mb);
    read_field(sandbox, "timeout_seconds", settings->sandbox.timeout_seconds);
    read_field(sandbox, "pids_limit", settings->sandbox.pids_limit);
    read_field(sandbox, "max_output_bytes", settings->sandbox.max_output_bytes);
    read_field(sandbox, "network_disabled", settings->sandbox.network_disabled);

    const auto& gate = json.contains("gate") ? json["gate"] : empty;
    read_field(gate, "safety_marker", settings->gate.safety_marker);
    read_field(gate, "require_sanitizer_verdict", settings->gate.require_sanitizer_verdict);
    read_field(gate, "sanitizer_marker", settings->gate.sanitizer_marker);
    read_field(gate, "reviewer_marker", settings->gate.reviewer_marker);

    const auto& hosting = json.contains("hosting") ? json["hosting"] : empty;
    read_field(hosting, "api_base", settings->hosting.api_base);
    read_field(hosting, "repository", settings->hosting.repository);
    read_field(hosting, "base_branch", settings->hosting.base_branch);
    read_field(hosting, "branch_prefix", settings->hosting.branch_prefix);
    read_field(hosting, "file_path", settings->hosting.file_path);
    read_field(hosting, "commit_message", settings->hosting.commit_message);
    read_field(hosting, "pr_title", settings->hosting.pr_title);
    read_field(hosting, "pr_body", settings->hosting.pr_body);

    const auto& mail = json.contains("mail") ? json["mail"] : empty;
    read_field(mail, "smtp_port", settings->mail.smtp_port);
    read_field(mail, "subject", settings->mail.subject);
    read_field(mail, "notify_on_failure", settings->mail.notify_on_failure);

    const auto& network = json.contains("network") ? json["network"] : empty;
    read_field(network, "llm_adapter_url", settings->network.llm_adapter_url);
    read_field(network, "receive_timeout_ms", settings->network.receive_timeout_ms);

    return settings;
}

} // namespace forge
