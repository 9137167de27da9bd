#include "llm_client.h"
#include "message.h"
#include "config.h"
#include <nng/nng.h>
#include <nng/protocol/reqrep0/rep.h>
#include <iostream>
#include <map>
#include <memory>
#include <string>

using namespace forge;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--url=URL] [--provider=NAME]\n"
              << "  --url=URL        Address to listen on (default " << NetworkConfig::get_llm_adapter_url() << ")\n"
              << "  --provider=NAME  openai or anthropic (default: first with an API key set)" << std::endl;
}

// One client per provider, created on first use
LLMClient& client_for(const std::string& provider,
                      LLMClient& default_client,
                      std::map<std::string, std::unique_ptr<LLMClient>>& overrides) {
    if (provider.empty() || ProviderFactory::normalize_provider_name(provider) == default_client.get_current_provider()) {
        return default_client;
    }

    std::string name = ProviderFactory::normalize_provider_name(provider);
    auto it = overrides.find(name);
    if (it == overrides.end()) {
        it = overrides.emplace(name, std::make_unique<LLMClient>(name)).first;
    }
    return *it->second;
}

AgentTurnResponse handle_request(const std::string& request_data,
                                 LLMClient& default_client,
                                 std::map<std::string, std::unique_ptr<LLMClient>>& overrides) {
    AgentTurnResponse response;
    try {
        AgentTurnRequest request = MessageHandler::deserialize_turn_request(request_data);
        std::cout << "Received " << request.role << " turn ("
                  << request.transcript.length() << " chars of transcript)";
        if (!request.provider.empty()) {
            std::cout << ", Provider: " << request.provider;
        }
        std::cout << std::endl;

        LLMClient& client = client_for(request.provider, default_client, overrides);
        response.provider = client.get_current_provider();
        response.text = client.complete(request.role_prompt, request.transcript);
        response.success = true;

    } catch (const std::exception& e) {
        std::cerr << "Error processing request: " << e.what() << std::endl;
        response.success = false;
        response.error_message = e.what();
    }
    return response;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string url = NetworkConfig::get_llm_adapter_url();
    std::string provider;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--url=", 0) == 0) {
            url = arg.substr(6);
        } else if (arg.rfind("--provider=", 0) == 0) {
            provider = arg.substr(11);
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    nng_socket sock;
    int rv;

    try {
        std::unique_ptr<LLMClient> llm_client = provider.empty()
            ? std::make_unique<LLMClient>()
            : std::make_unique<LLMClient>(ProviderFactory::normalize_provider_name(provider));
        std::map<std::string, std::unique_ptr<LLMClient>> overrides;

        std::cout << "Using " << llm_client->get_current_provider()
                  << " with model " << llm_client->get_current_model() << std::endl;

        if ((rv = nng_rep0_open(&sock)) != 0) {
            std::cerr << "nng_rep0_open: " << nng_strerror(rv) << std::endl;
            return 1;
        }

        if ((rv = nng_listen(sock, url.c_str(), nullptr, 0)) != 0) {
            std::cerr << "nng_listen: " << nng_strerror(rv) << std::endl;
            nng_close(sock);
            return 1;
        }

        std::cout << "LLM Adapter listening on " << url << std::endl;

        // Main service loop
        while (true) {
            char* buf = nullptr;
            size_t sz = 0;

            if ((rv = nng_recv(sock, &buf, &sz, NNG_FLAG_ALLOC)) != 0) {
                std::cerr << "nng_recv: " << nng_strerror(rv) << std::endl;
                continue;
            }

            std::string request_data(buf, sz);
            nng_free(buf, sz);

            AgentTurnResponse response = handle_request(request_data, *llm_client, overrides);
            std::string reply = MessageHandler::serialize_turn_response(response);

            if ((rv = nng_send(sock, const_cast<char*>(reply.c_str()), reply.length(), 0)) != 0) {
                std::cerr << "nng_send: " << nng_strerror(rv) << std::endl;
            } else {
                std::cout << "Sent " << (response.success ? "reply" : "error") << " ("
                          << response.text.length() << " chars)" << std::endl;
            }
        }

        nng_close(sock);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
