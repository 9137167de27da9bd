#pragma once

#include <string>
#include <vector>

namespace forge {

struct HttpResponse {
    std::string data;
    long status_code = 0;
    bool success = false;
    std::string error_message;
};

/**
 * @brief Thin libcurl wrapper shared by the LLM providers and the GitHub client
 *
 * A non-2xx status is a failed response, not an exception.
 */
class HttpClient {
public:
    explicit HttpClient(long timeout_seconds = 120);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse get(const std::string& url, const std::vector<std::string>& headers) const;

    HttpResponse post(
        const std::string& url,
        const std::string& payload,
        const std::vector<std::string>& headers
    ) const;

    HttpResponse put(
        const std::string& url,
        const std::string& payload,
        const std::vector<std::string>& headers
    ) const;

private:
    void* curl_; // CURL handle
    long timeout_seconds_;

    HttpResponse perform(
        const std::string& method,
        const std::string& url,
        const std::string* payload,
        const std::vector<std::string>& headers
    ) const;

    static size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* response);
};

} // namespace forge
