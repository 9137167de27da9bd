#include "network/nng_agent_client.h"
#include "message.h"
#include "agent_roles.h"
#include <nng/protocol/reqrep0/req.h>
#include <stdexcept>

namespace forge {

std::string NNGAgentClient::role_for_prompt(const std::string& prompt) {
    for (RoleTag role : kRoleCycle) {
        if (role_prompt(role) == prompt) {
            return role_name(role);
        }
    }
    return "Agent";
}

NNGAgentClient::NNGAgentClient(const std::string& url, int receive_timeout_ms,
                               const std::string& provider_override)
    : socket_(NNG_SOCKET_INITIALIZER), url_(url), provider_(provider_override) {
    initialize_socket(receive_timeout_ms);
}

NNGAgentClient::~NNGAgentClient() {
    cleanup_socket();
}

void NNGAgentClient::initialize_socket(int receive_timeout_ms) {
    int rv;

    if ((rv = nng_req0_open(&socket_)) != 0) {
        throw std::runtime_error("Failed to open agent socket: " + std::string(nng_strerror(rv)));
    }
    open_ = true;

    // One request per turn: req0 would otherwise resend after 60 s and the adapter
    // would answer the same turn twice
    const struct {
        const char* name;
        nng_duration value;
    } options[] = {
        {NNG_OPT_RECVTIMEO, receive_timeout_ms},
        {NNG_OPT_SENDTIMEO, receive_timeout_ms},
        {NNG_OPT_REQ_RESENDTIME, NNG_DURATION_INFINITE}
    };

    for (const auto& option : options) {
        if ((rv = nng_socket_set_ms(socket_, option.name, option.value)) != 0) {
            cleanup_socket();
            throw std::runtime_error("Failed to set " + std::string(option.name) + " on agent socket: " +
                                     std::string(nng_strerror(rv)));
        }
    }

    // Non-blocking dial: the adapter may come up after us, nng keeps retrying
    if ((rv = nng_dial(socket_, url_.c_str(), nullptr, NNG_FLAG_NONBLOCK)) != 0) {
        cleanup_socket();
        throw std::runtime_error("Failed to connect to LLM adapter at " + url_ + ": " +
                                 std::string(nng_strerror(rv)));
    }
}

nng_duration NNGAgentClient::get_option_ms(const char* option) const {
    nng_duration value = 0;
    int rv = nng_socket_get_ms(socket_, option, &value);
    if (rv != 0) {
        throw std::runtime_error("Failed to read " + std::string(option) + ": " + std::string(nng_strerror(rv)));
    }
    return value;
}

void NNGAgentClient::cleanup_socket() {
    if (open_) {
        nng_close(socket_);
        open_ = false;
    }
}

std::string NNGAgentClient::send(const std::string& role_prompt, const std::string& transcript) {
    int rv;

    AgentTurnRequest request;
    request.role = role_for_prompt(role_prompt);
    request.role_prompt = role_prompt;
    request.transcript = transcript;
    request.provider = provider_;

    std::string request_str = MessageHandler::serialize_turn_request(request);

    if ((rv = nng_send(socket_, const_cast<char*>(request_str.c_str()), request_str.length(), 0)) != 0) {
        throw std::runtime_error("Failed to send to LLM adapter: " + std::string(nng_strerror(rv)));
    }

    char* buf = nullptr;
    size_t sz = 0;
    if ((rv = nng_recv(socket_, &buf, &sz, NNG_FLAG_ALLOC)) != 0) {
        throw std::runtime_error("Failed to receive from LLM adapter: " + std::string(nng_strerror(rv)));
    }

    std::string response_str(buf, sz);
    nng_free(buf, sz);

    AgentTurnResponse response = MessageHandler::deserialize_turn_response(response_str);
    if (!response.success) {
        throw std::runtime_error("LLM adapter error: " + response.error_message);
    }

    return response.text;
}

} // namespace forge
