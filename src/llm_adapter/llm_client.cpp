#include "llm_client.h"
#include "utils.h"
#include <iostream>
#include <stdexcept>

namespace forge {

LLMClient::LLMClient() {
    // Auto-detect provider
    std::string provider_name = ProviderFactory::detect_available_provider();
    std::string api_key = get_api_key_for_provider(provider_name);
    initialize_provider(provider_name, api_key, "");
}

LLMClient::LLMClient(const std::string& provider_name, const std::string& api_key,
                     const std::string& model) {
    std::string actual_api_key = api_key.empty() ? get_api_key_for_provider(provider_name) : api_key;
    initialize_provider(provider_name, actual_api_key, model);
}

void LLMClient::initialize_provider(const std::string& provider_name, const std::string& api_key,
                                   const std::string& model) {
    provider_ = ProviderFactory::create_provider(provider_name);
    api_key_ = api_key;
    model_ = model.empty() ? provider_->get_default_model() : model;
}

std::string LLMClient::get_api_key_for_provider(const std::string& provider_name) const {
    std::unique_ptr<LLMProvider> temp_provider = ProviderFactory::create_provider(provider_name);
    std::string env_var = temp_provider->get_api_key_env_var();

    std::string api_key = Utils::get_env(env_var.c_str());
    if (api_key.empty()) {
        throw std::runtime_error("API key not found for provider " + provider_name +
                                ". Please set " + env_var + " environment variable.");
    }

    return api_key;
}

std::string LLMClient::complete(const std::string& system_prompt, const std::string& user_prompt) const {
    nlohmann::json payload = provider_->build_request_payload(system_prompt, user_prompt, model_);

    std::vector<std::string> headers = provider_->get_headers(api_key_);
    std::string url = provider_->get_api_url();

    std::cout << "[LLM-DEBUG] Request to " << url << " (" << model_ << ", "
              << user_prompt.length() << " chars of transcript)" << std::endl;

    HttpResponse response = http_client_.post(url, payload.dump(), headers);

    std::cout << "[LLM-DEBUG] HTTP Response - Success: " << response.success
              << ", Status: " << response.status_code << std::endl;

    if (!response.success) {
        throw std::runtime_error("HTTP request failed: " + response.error_message +
                                " (Status: " + std::to_string(response.status_code) + ")");
    }

    std::string text = provider_->parse_completion(response.data);
    std::cout << "[LLM-DEBUG] Completion: " << text.length() << " chars" << std::endl;
    return text;
}

std::string LLMClient::get_current_provider() const {
    return provider_->get_name();
}

std::string LLMClient::get_current_model() const {
    return model_;
}

void LLMClient::set_provider(const std::string& provider_name, const std::string& model) {
    std::string api_key = get_api_key_for_provider(provider_name);
    initialize_provider(provider_name, api_key, model);
}

} // namespace forge
