#include "providers/openai_provider.h"
#include "config.h"
#include <stdexcept>

namespace forge {

std::string OpenAIProvider::get_name() const {
    return "openai";
}

std::string OpenAIProvider::get_api_url() const {
    return APIConfig::OPENAI_BASE_URL;
}

std::string OpenAIProvider::get_default_model() const {
    return APIConfig::OPENAI_DEFAULT_MODEL;
}

nlohmann::json OpenAIProvider::build_request_payload(
    const std::string& system_prompt,
    const std::string& user_prompt,
    const std::string& model
) const {
    return nlohmann::json{
        {"model", model},
        {"messages", {
            {{"role", "system"}, {"content", system_prompt}},
            {{"role", "user"}, {"content", user_prompt}}
        }},
        {"max_tokens", 2000},
        {"temperature", 0.1}
    };
}

std::vector<std::string> OpenAIProvider::get_headers(const std::string& api_key) const {
    return {
        "Content-Type: application/json",
        "Authorization: Bearer " + api_key
    };
}

std::string OpenAIProvider::parse_completion(const std::string& response) const {
    try {
        nlohmann::json json_response = nlohmann::json::parse(response);

        if (json_response.contains("choices") && json_response["choices"].is_array() &&
            !json_response["choices"].empty()) {

            const auto& content = json_response["choices"][0]["message"]["content"];
            // A null content is a valid, empty reply
            return content.is_string() ? content.get<std::string>() : std::string();
        } else {
            throw std::runtime_error("Invalid OpenAI API response format");
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to parse OpenAI response: " + std::string(e.what()));
    }
}

std::string OpenAIProvider::get_api_key_env_var() const {
    return "OPENAI_API_KEY";
}

} // namespace forge
