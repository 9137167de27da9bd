#pragma once

#include <string>

namespace forge {

class IMailClient {
public:
    virtual ~IMailClient() = default;

    // Returns false if the message could not be handed to the mail server
    virtual bool send_message(const std::string& subject,
                              const std::string& body,
                              const std::string& recipient) = 0;
};

} // namespace forge
