#pragma once

#include <string>
#include <vector>
#include <memory>
#include <nlohmann/json.hpp>

namespace forge {

// Abstract base class for LLM providers
class LLMProvider {
public:
    virtual ~LLMProvider() = default;

    // Provider identification
    virtual std::string get_name() const = 0;
    virtual std::string get_api_url() const = 0;
    virtual std::string get_default_model() const = 0;

    // Request building: system carries the role prompt, user carries the transcript
    virtual nlohmann::json build_request_payload(
        const std::string& system_prompt,
        const std::string& user_prompt,
        const std::string& model
    ) const = 0;

    // Header configuration
    virtual std::vector<std::string> get_headers(const std::string& api_key) const = 0;

    // Response parsing: the completion text, throws std::runtime_error on malformed replies
    virtual std::string parse_completion(const std::string& response) const = 0;

    // Environment variable for API key
    virtual std::string get_api_key_env_var() const = 0;
};

// Factory for creating providers
class ProviderFactory {
public:
    static std::unique_ptr<LLMProvider> create_provider(const std::string& provider_name);

    // First provider whose API key is set, in the order of get_supported_providers()
    static std::string detect_available_provider();
    static std::vector<std::string> get_supported_providers();

    // Accepts friendly aliases such as "chatgpt" and "claude"
    static std::string normalize_provider_name(const std::string& provider_name);
};

} // namespace forge
