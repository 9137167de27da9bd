#include "providers/anthropic_provider.h"
#include "config.h"
#include <stdexcept>

namespace forge {

std::string AnthropicProvider::get_name() const {
    return "anthropic";
}

std::string AnthropicProvider::get_api_url() const {
    return APIConfig::ANTHROPIC_BASE_URL;
}

std::string AnthropicProvider::get_default_model() const {
    return APIConfig::ANTHROPIC_DEFAULT_MODEL;
}

nlohmann::json AnthropicProvider::build_request_payload(
    const std::string& system_prompt,
    const std::string& user_prompt,
    const std::string& model
) const {
    return nlohmann::json{
        {"model", model},
        {"max_tokens", 2000},
        {"temperature", 0.1},
        {"system", system_prompt},
        {"messages", {
            {{"role", "user"}, {"content", {{{"type", "text"}, {"text", user_prompt}}}}}
        }}
    };
}

std::vector<std::string> AnthropicProvider::get_headers(const std::string& api_key) const {
    return {
        "Content-Type: application/json",
        "anthropic-version: 2023-06-01",
        "x-api-key: " + api_key
    };
}

std::string AnthropicProvider::parse_completion(const std::string& response) const {
    try {
        nlohmann::json json_response = nlohmann::json::parse(response);

        if (!json_response.contains("content") || !json_response["content"].is_array()) {
            throw std::runtime_error("Invalid Anthropic API response format");
        }

        // Concatenate every text block; other block types carry no reply text
        std::string text;
        for (const auto& block : json_response["content"]) {
            if (block.value("type", "") == "text") {
                text += block.at("text").get<std::string>();
            }
        }
        return text;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to parse Anthropic response: " + std::string(e.what()));
    }
}

std::string AnthropicProvider::get_api_key_env_var() const {
    return "ANTHROPIC_API_KEY";
}

} // namespace forge
