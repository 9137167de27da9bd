#pragma once

#include "interfaces/agent_client_interface.h"
#include <nng/nng.h>
#include <nng/protocol/reqrep0/req.h>
#include <string>

namespace forge {

/**
 * @brief NNG-based implementation of the agent-turn interface
 *
 * Sends each turn as an AgentTurnRequest over a req socket to the LLM
 * adapter service and waits for the matching AgentTurnResponse. Requests
 * are never resent, so each turn costs exactly one completion call.
 */
class NNGAgentClient : public IAgentClient {
public:
    /**
     * @param url Adapter address, e.g. tcp://127.0.0.1:5555
     * @param receive_timeout_ms Longest wait for one reply
     * @param provider_override Optional provider to use instead of auto-detection
     * @throws std::runtime_error if the socket cannot be opened
     */
    NNGAgentClient(const std::string& url, int receive_timeout_ms,
                   const std::string& provider_override = "");

    ~NNGAgentClient() override;

    NNGAgentClient(const NNGAgentClient&) = delete;
    NNGAgentClient& operator=(const NNGAgentClient&) = delete;

    std::string send(const std::string& role_prompt, const std::string& transcript) override;

    /**
     * @brief Role name sent to the adapter for logging
     *
     * Matched against the built-in role prompts; any other prompt is labelled "Agent".
     */
    static std::string role_for_prompt(const std::string& prompt);

    // Current value of a millisecond socket option, e.g. NNG_OPT_REQ_RESENDTIME
    nng_duration get_option_ms(const char* option) const;

private:
    nng_socket socket_;
    bool open_ = false;
    std::string url_;
    std::string provider_;

    void initialize_socket(int receive_timeout_ms);
    void cleanup_socket();
};

} // namespace forge
