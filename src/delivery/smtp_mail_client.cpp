#include "delivery/smtp_mail_client.h"
#include <curl/curl.h>
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace forge {

SmtpMailClient::SmtpMailClient(const MailSettings& settings)
    : settings_(settings) {
}

std::string SmtpMailClient::get_server_url() const {
    return "smtps://" + settings_.smtp_host + ":" + std::to_string(settings_.smtp_port);
}

std::string SmtpMailClient::build_message(const std::string& from,
                                          const std::string& to,
                                          const std::string& subject,
                                          const std::string& body,
                                          std::time_t date) {
    std::ostringstream oss;
    std::tm tm_utc{};
    gmtime_r(&date, &tm_utc);

    oss << "Date: " << std::put_time(&tm_utc, "%a, %d %b %Y %H:%M:%S +0000") << "\r\n"
        << "From: " << from << "\r\n"
        << "To: " << to << "\r\n"
        << "Subject: " << subject << "\r\n"
        << "MIME-Version: 1.0\r\n"
        << "Content-Type: text/plain; charset=utf-8\r\n"
        << "\r\n";

    // SMTP wants CRLF line endings in the body as well
    std::istringstream lines(body);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        oss << line << "\r\n";
    }

    return oss.str();
}

bool SmtpMailClient::is_header_safe(const std::string& value) {
    return value.find_first_of("\r\n") == std::string::npos;
}

size_t SmtpMailClient::ReadCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* state = static_cast<UploadState*>(userdata);
    size_t room = size * nitems;
    size_t remaining = state->data->size() - state->offset;
    size_t count = std::min(room, remaining);
    if (count > 0) {
        std::memcpy(buffer, state->data->data() + state->offset, count);
        state->offset += count;
    }
    return count;
}

bool SmtpMailClient::send_message(const std::string& subject,
                                  const std::string& body,
                                  const std::string& recipient) {
    if (settings_.smtp_host.empty() || settings_.username.empty() || settings_.password.empty()) {
        std::cerr << "[MAIL] SMTP_HOST, SMTP_USER and SMTP_PASS must be set to send mail" << std::endl;
        return false;
    }

    if (recipient.empty()) {
        std::cerr << "[MAIL] No recipient address" << std::endl;
        return false;
    }

    if (!is_header_safe(recipient) || !is_header_safe(subject)) {
        std::cerr << "[MAIL] Refusing to send: line break in recipient or subject" << std::endl;
        return false;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        std::cerr << "[MAIL] Failed to initialize CURL" << std::endl;
        return false;
    }

    const std::string message = build_message(settings_.username, recipient, subject, body, std::time(nullptr));
    UploadState state{&message, 0};

    const std::string server = get_server_url();
    const std::string mail_from = "<" + settings_.username + ">";
    const std::string mail_to = "<" + recipient + ">";

    curl_easy_setopt(curl, CURLOPT_URL, server.c_str());
    curl_easy_setopt(curl, CURLOPT_USERNAME, settings_.username.c_str());
    curl_easy_setopt(curl, CURLOPT_PASSWORD, settings_.password.c_str());
    curl_easy_setopt(curl, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
    curl_easy_setopt(curl, CURLOPT_MAIL_FROM, mail_from.c_str());

    struct curl_slist* recipients = curl_slist_append(nullptr, mail_to.c_str());
    curl_easy_setopt(curl, CURLOPT_MAIL_RCPT, recipients);

    curl_easy_setopt(curl, CURLOPT_READFUNCTION, ReadCallback);
    curl_easy_setopt(curl, CURLOPT_READDATA, &state);
    curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 60L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);

    curl_slist_free_all(recipients);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        std::cerr << "[MAIL] Failed to send to " << recipient << ": " << curl_easy_strerror(res) << std::endl;
        return false;
    }

    std::cout << "[MAIL] Sent '" << subject << "' to " << recipient << std::endl;
    return true;
}

} // namespace forge
