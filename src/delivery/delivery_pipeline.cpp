#include "delivery/delivery_pipeline.h"
#include "utils.h"
#include <iostream>

namespace forge {

DeliveryPipeline::DeliveryPipeline(const HostingSettings& hosting,
                                   const MailSettings& mail,
                                   IHostingClient& hosting_client,
                                   IMailClient& mail_client)
    : hosting_(hosting), mail_(mail), hosting_client_(hosting_client), mail_client_(mail_client) {
}

std::string DeliveryPipeline::branch_name(const std::string& run_id) const {
    return hosting_.branch_prefix + "-" + run_id;
}

std::string DeliveryPipeline::success_body(const std::string& reference, const std::string& summary) {
    std::string body = "Task complete! PR: " + reference;
    std::string trimmed = Utils::trim(summary);
    if (!trimmed.empty()) {
        body += "\n\n" + trimmed;
    }
    return body;
}

std::string DeliveryPipeline::failure_body(const std::string& error_message) {
    return "Your task could not be delivered: publishing the generated code failed.\n\n"
           "Reason: " + error_message;
}

template <typename Step>
bool DeliveryPipeline::run_step(const char* step_name, Step step, HostingResult& result) {
    try {
        result = step();
    } catch (const std::exception& e) {
        result.success = false;
        result.error_message = e.what();
    }

    if (!result.success) {
        last_error_ = std::string(step_name) + ": " + result.error_message;
        std::cerr << "[DELIVERY] " << last_error_ << std::endl;
        return false;
    }
    return true;
}

std::optional<std::string> DeliveryPipeline::publish(const CandidateArtifact& artifact,
                                                     const std::string& commit_message,
                                                     const std::string& run_id) {
    last_error_.clear();
    const std::string branch = branch_name(run_id);
    HostingResult result;

    if (!run_step("create_branch", [&] {
            return hosting_client_.create_branch(branch, hosting_.base_branch);
        }, result)) {
        return std::nullopt;
    }

    if (!run_step("commit_file", [&] {
            return hosting_client_.commit_file(branch, hosting_.file_path, artifact.source_text, commit_message);
        }, result)) {
        return std::nullopt;
    }

    if (!run_step("open_change_request", [&] {
            return hosting_client_.open_change_request(branch, hosting_.base_branch,
                                                       hosting_.pr_title, hosting_.pr_body);
        }, result)) {
        return std::nullopt;
    }

    if (result.reference.empty()) {
        last_error_ = "open_change_request: no reference returned";
        std::cerr << "[DELIVERY] " << last_error_ << std::endl;
        return std::nullopt;
    }

    return result.reference;
}

bool DeliveryPipeline::notify(const std::optional<std::string>& reference,
                              const std::string& requester_contact,
                              const std::string& summary) {
    const std::string subject = reference ? mail_.subject : mail_.subject + " (delivery failed)";
    const std::string body = reference ? success_body(*reference, summary)
                                       : failure_body(last_error_.empty() ? "unknown error" : last_error_);

    try {
        if (mail_client_.send_message(subject, body, requester_contact)) {
            return true;
        }
        std::cerr << "[DELIVERY] Notification to " << requester_contact << " was not sent" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[DELIVERY] Notification to " << requester_contact << " failed: " << e.what() << std::endl;
    }
    return false;
}

DeliveryOutcome DeliveryPipeline::deliver(const CandidateArtifact& artifact,
                                          const Task& task,
                                          const std::string& run_id,
                                          const std::string& summary) {
    DeliveryOutcome outcome;
    outcome.published_reference = publish(artifact, hosting_.commit_message, run_id);

    if (outcome.published_reference) {
        outcome.notified = notify(outcome.published_reference, task.requester_contact, summary);
    } else {
        outcome.error_message = last_error_;
        if (mail_.notify_on_failure) {
            outcome.notified = notify(std::nullopt, task.requester_contact);
        }
    }

    return outcome;
}

} // namespace forge
