#pragma once

#include "interfaces/hosting_client_interface.h"
#include "http_client.h"
#include "pipeline_config.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace forge {

/**
 * @brief Source-hosting client for the GitHub REST API
 *
 * Authenticates with the token from HostingSettings (GITHUB_TOKEN). Failures
 * come back as HostingResult with success=false; nothing here throws past
 * the call.
 */
class GitHubClient : public IHostingClient {
public:
    explicit GitHubClient(const HostingSettings& settings);
    ~GitHubClient() override = default;

    HostingResult create_branch(const std::string& branch, const std::string& base_branch) override;

    HostingResult commit_file(const std::string& branch,
                              const std::string& path,
                              const std::string& content,
                              const std::string& message) override;

    HostingResult open_change_request(const std::string& branch,
                                      const std::string& base_branch,
                                      const std::string& title,
                                      const std::string& body) override;

    // Request building and response parsing, exposed for tests
    std::string repository_url(const std::string& suffix) const;
    std::vector<std::string> get_headers() const;
    static nlohmann::json build_ref_payload(const std::string& branch, const std::string& sha);
    static nlohmann::json build_contents_payload(const std::string& branch,
                                                 const std::string& content,
                                                 const std::string& message);
    static nlohmann::json build_pull_payload(const std::string& branch,
                                             const std::string& base_branch,
                                             const std::string& title,
                                             const std::string& body);
    static std::string describe_failure(const HttpResponse& response);

private:
    HostingSettings settings_;
    HttpClient http_client_;

    bool has_token(HostingResult& result) const;
};

} // namespace forge
