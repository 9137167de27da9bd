#pragma once

#include "interfaces/mail_client_interface.h"
#include "pipeline_config.h"
#include <ctime>
#include <string>

namespace forge {

/**
 * @brief Mail client sending over SMTPS with libcurl
 *
 * Host and credentials come from MailSettings (SMTP_HOST, SMTP_USER,
 * SMTP_PASS). The authenticated user is also the sender.
 */
class SmtpMailClient : public IMailClient {
public:
    explicit SmtpMailClient(const MailSettings& settings);
    ~SmtpMailClient() override = default;

    bool send_message(const std::string& subject,
                      const std::string& body,
                      const std::string& recipient) override;

    // RFC 5322 message text with From, To, Subject and Date headers
    static std::string build_message(const std::string& from,
                                     const std::string& to,
                                     const std::string& subject,
                                     const std::string& body,
                                     std::time_t date);

    std::string get_server_url() const;

    // Header values must stay on one line, or they could inject further headers
    static bool is_header_safe(const std::string& value);

private:
    MailSettings settings_;

    struct UploadState {
        const std::string* data;
        size_t offset;
    };

    static size_t ReadCallback(char* buffer, size_t size, size_t nitems, void* userdata);
};

} // namespace forge
