#pragma once

#include "llm_provider.h"
#include "http_client.h"
#include <string>
#include <memory>

namespace forge {

/**
 * @brief Adapter-side client that turns one agent turn into one completion call
 */
class LLMClient {
public:
    // Constructor with auto-detection
    LLMClient();

    // Constructor with specific provider
    LLMClient(const std::string& provider_name, const std::string& api_key = "",
              const std::string& model = "");

    // System prompt plus user text in, completion text out; throws on HTTP or parse failure
    std::string complete(const std::string& system_prompt, const std::string& user_prompt) const;

    // Information methods
    std::string get_current_provider() const;
    std::string get_current_model() const;

    // Provider management
    void set_provider(const std::string& provider_name, const std::string& model = "");

private:
    std::unique_ptr<LLMProvider> provider_;
    std::string api_key_;
    std::string model_;
    HttpClient http_client_;

    void initialize_provider(const std::string& provider_name, const std::string& api_key,
                            const std::string& model);
    std::string get_api_key_for_provider(const std::string& provider_name) const;
};

} // namespace forge
