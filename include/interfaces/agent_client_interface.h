#pragma once

#include <string>

namespace forge {

/**
 * @brief Interface for one agent turn against the completion backend
 *
 * The Coordinator treats the reply as free text and assumes nothing about
 * its structure from one call to the next.
 */
class IAgentClient {
public:
    virtual ~IAgentClient() = default;

    /**
     * @brief Ask the backend for the next contribution to the transcript
     * @param role_prompt System instruction for the current role
     * @param transcript Rendered transcript so far
     * @return The agent's reply, possibly empty
     * @throws std::runtime_error on communication or backend failure
     */
    virtual std::string send(const std::string& role_prompt, const std::string& transcript) = 0;
};

} // namespace forge
