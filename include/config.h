#pragma once

#include <string>

namespace forge {

// Network configuration
struct NetworkConfig {
    static constexpr const char* LLM_ADAPTER_HOST = "127.0.0.1";
    static constexpr int LLM_ADAPTER_PORT = 5555;
    static constexpr int RECEIVE_TIMEOUT_MS = 120000;

    static std::string get_llm_adapter_url() {
        return std::string("tcp://") + LLM_ADAPTER_HOST + ":" + std::to_string(LLM_ADAPTER_PORT);
    }
};

// API configuration
struct APIConfig {
    // OpenAI API
    static constexpr const char* OPENAI_BASE_URL = "https://api.openai.com/v1/chat/completions";
    static constexpr const char* OPENAI_DEFAULT_MODEL = "gpt-4";

    // Anthropic API
    static constexpr const char* ANTHROPIC_BASE_URL = "https://api.anthropic.com/v1/messages";
    static constexpr const char* ANTHROPIC_DEFAULT_MODEL = "claude-3-haiku-20240307";

    // GitHub REST API
    static constexpr const char* GITHUB_BASE_URL = "https://api.github.com";
    static constexpr const char* GITHUB_API_VERSION = "2022-11-28";

    static constexpr const char* USER_AGENT = "forge/1.0";
};

} // namespace forge
