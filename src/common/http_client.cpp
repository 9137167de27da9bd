#include "http_client.h"
#include <curl/curl.h>
#include <stdexcept>

namespace forge {

HttpClient::HttpClient(long timeout_seconds)
    : curl_(nullptr), timeout_seconds_(timeout_seconds) {
    curl_ = curl_easy_init();
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

HttpClient::~HttpClient() {
    if (curl_) {
        curl_easy_cleanup(static_cast<CURL*>(curl_));
    }
}

size_t HttpClient::WriteCallback(void* contents, size_t size, size_t nmemb, std::string* response) {
    size_t total_size = size * nmemb;
    response->append(static_cast<char*>(contents), total_size);
    return total_size;
}

HttpResponse HttpClient::get(const std::string& url, const std::vector<std::string>& headers) const {
    return perform("GET", url, nullptr, headers);
}

HttpResponse HttpClient::post(
    const std::string& url,
    const std::string& payload,
    const std::vector<std::string>& headers
) const {
    return perform("POST", url, &payload, headers);
}

HttpResponse HttpClient::put(
    const std::string& url,
    const std::string& payload,
    const std::vector<std::string>& headers
) const {
    return perform("PUT", url, &payload, headers);
}

HttpResponse HttpClient::perform(
    const std::string& method,
    const std::string& url,
    const std::string* payload,
    const std::vector<std::string>& headers
) const {
    HttpResponse response;

    CURL* curl = static_cast<CURL*>(curl_);

    // Reset curl for new request
    curl_easy_reset(curl);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (payload) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload->length()));
        if (method != "POST") {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
        }
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& header : headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.data);

    CURLcode res = curl_easy_perform(curl);

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    if (res != CURLE_OK) {
        response.error_message = curl_easy_strerror(res);
        response.success = false;
    } else if (response.status_code >= 200 && response.status_code < 300) {
        response.success = true;
    } else {
        response.success = false;
        response.error_message = "HTTP error: " + std::to_string(response.status_code);
    }

    return response;
}

} // namespace forge
