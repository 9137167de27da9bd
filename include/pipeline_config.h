#pragma once

#include "config.h"
#include <cstddef>
#include <string>
#include <memory>
#include <nlohmann/json.hpp>

namespace forge {

struct AgentSettings {
    int cycles = 1;                 // Full passes through the five roles
    int max_attempts = 1;           // Per agent turn; 1 means no retry
    int retry_backoff_ms = 500;     // Doubled after every failed attempt
    std::string provider;           // Empty lets the adapter auto-detect
};

struct SandboxSettings {
    std::string runtime = "docker";
    std::string image = "python:3.10";
    std::string interpreter = "python";
    std::string source_file_name = "script.py";
    int memory_limit_mb = 128;
    int timeout_seconds = 30;
    int pids_limit = 64;
    size_t max_output_bytes = 1024 * 1024;
    bool network_disabled = true;
};

struct GateSettings {
    std::string safety_marker = "SAFE";
    bool require_sanitizer_verdict = false;
    std::string sanitizer_marker = "SAFE";
    std::string reviewer_marker = "APPROVED";
};

struct HostingSettings {
    std::string api_base = APIConfig::GITHUB_BASE_URL;
    std::string repository = "yourusername/yourrepo";
    std::string base_branch = "main";
    std::string branch_prefix = "auto/feature-agent";
    std::string file_path = "generated_code.py";
    std::string commit_message = "Add AI-generated feature";
    std::string pr_title = "AI Agent: New Code Contribution";
    std::string pr_body = "This PR was created by the multi-agent AI system.";
    std::string token;              // GITHUB_TOKEN, never persisted
};

struct MailSettings {
    std::string smtp_host;          // SMTP_HOST
    int smtp_port = 465;
    std::string username;           // SMTP_USER, also the sender
    std::string password;           // SMTP_PASS, never persisted
    std::string subject = "Your AI Task is Done";
    bool notify_on_failure = false;
};

struct AdapterSettings {
    std::string llm_adapter_url = NetworkConfig::get_llm_adapter_url();
    int receive_timeout_ms = NetworkConfig::RECEIVE_TIMEOUT_MS;
};

struct PipelineSettings {
    AgentSettings agents;
    SandboxSettings sandbox;
    GateSettings gate;
    HostingSettings hosting;
    MailSettings mail;
    AdapterSettings network;

    // Validation
    bool validate(std::string& error_message) const;

    // Agent turns per run: cycle length times number of cycles
    int max_turns() const;
};

class PipelineConfig {
public:
    // Loads .forge/pipeline.json (or config_path), creating a default file if missing.
    // Returns nullptr and fills error_message on failure.
    static std::unique_ptr<PipelineSettings> load_or_create(std::string& error_message,
                                                            const std::string& config_path = "");

    // Save settings, without secrets, to the given path
    static bool save(const PipelineSettings& settings, const std::string& file_path, std::string& error_message);

    // Fill secrets (token, SMTP credentials) from the environment
    static void apply_environment(PipelineSettings& settings);

    static std::string get_forge_directory();
    static std::string get_config_file_path();

    static std::unique_ptr<PipelineSettings> parse_config(const std::string& file_path, std::string& error_message);
    static bool validate_json_schema(const nlohmann::json& json, std::string& error_message);
    static nlohmann::json settings_to_json(const PipelineSettings& settings);
    static std::unique_ptr<PipelineSettings> json_to_settings(const nlohmann::json& json);
};

} // namespace forge
