#pragma once

#include <string>

namespace forge {

struct HostingResult {
    bool success = false;
    std::string reference;       // URL or SHA of what was created
    std::string error_message;
};

/**
 * @brief Interface for the source-hosting service
 *
 * Each step may fail independently of the others.
 */
class IHostingClient {
public:
    virtual ~IHostingClient() = default;

    virtual HostingResult create_branch(const std::string& branch, const std::string& base_branch) = 0;

    virtual HostingResult commit_file(const std::string& branch,
                                      const std::string& path,
                                      const std::string& content,
                                      const std::string& message) = 0;

    /**
     * @brief Open a change request from branch into base_branch
     * @return On success, reference holds the change request URL
     */
    virtual HostingResult open_change_request(const std::string& branch,
                                              const std::string& base_branch,
                                              const std::string& title,
                                              const std::string& body) = 0;
};

} // namespace forge
