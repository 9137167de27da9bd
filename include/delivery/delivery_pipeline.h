#pragma once

#include "message.h"
#include "pipeline_config.h"
#include "interfaces/hosting_client_interface.h"
#include "interfaces/mail_client_interface.h"
#include <optional>
#include <string>

namespace forge {

/**
 * @brief Irreversible external actions taken after the gate says PROCEED
 *
 * publish() creates a run-specific branch, commits the artifact and opens a
 * change request. Any failed step makes the whole publish fail; no later
 * step runs after a failure. notify() is best effort and never throws.
 */
class DeliveryPipeline {
public:
    DeliveryPipeline(const HostingSettings& hosting,
                     const MailSettings& mail,
                     IHostingClient& hosting_client,
                     IMailClient& mail_client);

    // Returns the change request reference, or nullopt on any failure
    std::optional<std::string> publish(const CandidateArtifact& artifact,
                                       const std::string& commit_message,
                                       const std::string& run_id);

    // Success message when reference is present, failure message otherwise
    bool notify(const std::optional<std::string>& reference,
                const std::string& requester_contact,
                const std::string& summary = "");

    /**
     * @brief Publish, then notify according to the mail settings
     *
     * The requester is always told about a published reference. A failed
     * publish is only reported when notify_on_failure is set.
     */
    DeliveryOutcome deliver(const CandidateArtifact& artifact,
                            const Task& task,
                            const std::string& run_id,
                            const std::string& summary = "");

    std::string branch_name(const std::string& run_id) const;

    static std::string success_body(const std::string& reference, const std::string& summary);
    static std::string failure_body(const std::string& error_message);

    const std::string& get_last_error() const { return last_error_; }

private:
    HostingSettings hosting_;
    MailSettings mail_;
    IHostingClient& hosting_client_;
    IMailClient& mail_client_;
    std::string last_error_;

    template <typename Step>
    bool run_step(const char* step_name, Step step, HostingResult& result);
};

} // namespace forge
