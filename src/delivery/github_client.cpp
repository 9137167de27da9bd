#include "delivery/github_client.h"
#include "config.h"
#include "utils.h"
#include <iostream>

namespace forge {

GitHubClient::GitHubClient(const HostingSettings& settings)
    : settings_(settings), http_client_(60) {
}

std::string GitHubClient::repository_url(const std::string& suffix) const {
    std::string base = settings_.api_base;
    if (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/repos/" + settings_.repository + suffix;
}

std::vector<std::string> GitHubClient::get_headers() const {
    return {
        "Accept: application/vnd.github+json",
        "Authorization: Bearer " + settings_.token,
        "X-GitHub-Api-Version: " + std::string(APIConfig::GITHUB_API_VERSION),
        "User-Agent: " + std::string(APIConfig::USER_AGENT),
        "Content-Type: application/json"
    };
}

nlohmann::json GitHubClient::build_ref_payload(const std::string& branch, const std::string& sha) {
    return nlohmann::json{
        {"ref", "refs/heads/" + branch},
        {"sha", sha}
    };
}

nlohmann::json GitHubClient::build_contents_payload(const std::string& branch,
                                                    const std::string& content,
                                                    const std::string& message) {
    return nlohmann::json{
        {"message", message},
        {"content", Utils::base64_encode(content)},
        {"branch", branch}
    };
}

nlohmann::json GitHubClient::build_pull_payload(const std::string& branch,
                                                const std::string& base_branch,
                                                const std::string& title,
                                                const std::string& body) {
    return nlohmann::json{
        {"title", title},
        {"head", branch},
        {"base", base_branch},
        {"body", body}
    };
}

std::string GitHubClient::describe_failure(const HttpResponse& response) {
    std::string description = response.error_message.empty()
        ? "HTTP error: " + std::to_string(response.status_code)
        : response.error_message;

    // GitHub puts a human-readable explanation in "message"
    auto body = nlohmann::json::parse(response.data, nullptr, false);
    if (!body.is_discarded() && body.is_object() && body.contains("message") && body["message"].is_string()) {
        description += " (" + body["message"].get<std::string>() + ")";
    }
    return description;
}

bool GitHubClient::has_token(HostingResult& result) const {
    if (settings_.token.empty()) {
        result.success = false;
        result.error_message = "GITHUB_TOKEN environment variable not set";
        return false;
    }
    return true;
}

HostingResult GitHubClient::create_branch(const std::string& branch, const std::string& base_branch) {
    HostingResult result;
    if (!has_token(result)) {
        return result;
    }

    try {
        HttpResponse base_ref = http_client_.get(repository_url("/git/ref/heads/" + base_branch), get_headers());
        if (!base_ref.success) {
            result.error_message = "Failed to look up " + base_branch + ": " + describe_failure(base_ref);
            return result;
        }

        std::string sha = nlohmann::json::parse(base_ref.data).at("object").at("sha").get<std::string>();

        HttpResponse created = http_client_.post(repository_url("/git/refs"),
                                                 build_ref_payload(branch, sha).dump(),
                                                 get_headers());
        if (!created.success) {
            result.error_message = "Failed to create branch " + branch + ": " + describe_failure(created);
            return result;
        }

        std::cout << "[DELIVERY] Created branch " << branch << " from " << base_branch << std::endl;
        result.success = true;
        result.reference = sha;

    } catch (const std::exception& e) {
        result.success = false;
        result.error_message = "Unexpected response creating branch " + branch + ": " + e.what();
    }

    return result;
}

HostingResult GitHubClient::commit_file(const std::string& branch,
                                        const std::string& path,
                                        const std::string& content,
                                        const std::string& message) {
    HostingResult result;
    if (!has_token(result)) {
        return result;
    }

    try {
        HttpResponse committed = http_client_.put(repository_url("/contents/" + path),
                                                  build_contents_payload(branch, content, message).dump(),
                                                  get_headers());
        if (!committed.success) {
            result.error_message = "Failed to commit " + path + ": " + describe_failure(committed);
            return result;
        }

        auto body = nlohmann::json::parse(committed.data);
        std::cout << "[DELIVERY] Committed " << path << " to " << branch << std::endl;
        result.success = true;
        result.reference = body.at("commit").at("sha").get<std::string>();

    } catch (const std::exception& e) {
        result.success = false;
        result.error_message = "Unexpected response committing " + path + ": " + e.what();
    }

    return result;
}

HostingResult GitHubClient::open_change_request(const std::string& branch,
                                                const std::string& base_branch,
                                                const std::string& title,
                                                const std::string& body) {
    HostingResult result;
    if (!has_token(result)) {
        return result;
    }

    try {
        HttpResponse opened = http_client_.post(repository_url("/pulls"),
                                                build_pull_payload(branch, base_branch, title, body).dump(),
                                                get_headers());
        if (!opened.success) {
            result.error_message = "Failed to open pull request: " + describe_failure(opened);
            return result;
        }

        result.reference = nlohmann::json::parse(opened.data).at("html_url").get<std::string>();
        result.success = true;
        std::cout << "[DELIVERY] Opened pull request " << result.reference << std::endl;

    } catch (const std::exception& e) {
        result.success = false;
        result.error_message = "Unexpected response opening pull request: " + std::string(e.what());
    }

    return result;
}

} // namespace forge
