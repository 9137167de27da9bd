#include "llm_provider.h"
#include "providers/openai_provider.h"
#include "providers/anthropic_provider.h"
#include "utils.h"
#include <stdexcept>

namespace forge {

std::unique_ptr<LLMProvider> ProviderFactory::create_provider(const std::string& provider_name) {
    std::string name = normalize_provider_name(provider_name);
    if (name == "openai") {
        return std::make_unique<OpenAIProvider>();
    } else if (name == "anthropic") {
        return std::make_unique<AnthropicProvider>();
    } else {
        throw std::runtime_error("Unsupported LLM provider: " + provider_name);
    }
}

std::string ProviderFactory::detect_available_provider() {
    std::string searched;
    for (const auto& name : get_supported_providers()) {
        auto provider = create_provider(name);
        std::string env_var = provider->get_api_key_env_var();
        if (!Utils::get_env(env_var.c_str()).empty()) {
            return name;
        }
        searched += (searched.empty() ? "" : ", ") + env_var;
    }

    throw std::runtime_error("No supported LLM provider API key found. Please set one of: " + searched);
}

std::vector<std::string> ProviderFactory::get_supported_providers() {
    return {"openai", "anthropic"};
}

std::string ProviderFactory::normalize_provider_name(const std::string& provider_name) {
    if (provider_name == "chatgpt" || provider_name == "gpt") {
        return "openai";
    }
    if (provider_name == "claude") {
        return "anthropic";
    }
    return provider_name;
}

} // namespace forge
