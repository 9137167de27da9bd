#include "cli_options.h"
#include "llm_provider.h"
#include "utils.h"
#include <algorithm>
#include <sstream>

namespace forge {

namespace {

bool take_value(const std::string& arg, const std::string& prefix, std::string& target, std::string& error_message) {
    target = arg.substr(prefix.length());
    if (target.empty()) {
        error_message = "Missing value for " + prefix.substr(0, prefix.length() - 1);
        return false;
    }
    return true;
}

} // namespace

bool CommandLine::parse(int argc, const char* const argv[], CliOptions& options, std::string& error_message) {
    std::string description;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg.rfind("--config=", 0) == 0) {
            if (!take_value(arg, "--config=", options.config_path, error_message)) {
                return false;
            }
        } else if (arg.rfind("--contact=", 0) == 0) {
            if (!take_value(arg, "--contact=", options.task.requester_contact, error_message)) {
                return false;
            }
        } else if (arg.rfind("--provider=", 0) == 0) {
            if (!take_value(arg, "--provider=", options.provider, error_message)) {
                return false;
            }
            options.provider = ProviderFactory::normalize_provider_name(options.provider);
            auto supported = ProviderFactory::get_supported_providers();
            if (std::find(supported.begin(), supported.end(), options.provider) == supported.end()) {
                error_message = "Invalid provider '" + options.provider + "'";
                return false;
            }
        } else if (arg.rfind("--", 0) == 0) {
            error_message = "Unknown option: " + arg;
            return false;
        } else {
            // This is part of the task description
            if (!description.empty()) description += " ";
            description += arg;
        }
    }

    options.task.description = Utils::trim(description);
    return true;
}

bool CommandLine::prompt_for_missing(CliOptions& options, InputHandler& input) {
    if (options.task.description.empty()) {
        options.task.description = Utils::trim(
            input.get_line("📝 Enter your task (e.g., 'Write a memoized factorial function'): "));
        input.add_history(options.task.description);
    }

    if (options.task.requester_contact.empty()) {
        options.task.requester_contact = Utils::trim(
            input.get_line("📧 Enter your email address to receive notification: "));
        input.add_history(options.task.requester_contact);
    }

    return !options.task.description.empty() && !options.task.requester_contact.empty();
}

std::string CommandLine::usage(const std::string& program_name) {
    std::ostringstream oss;
    oss << "Usage: " << program_name << " [OPTIONS] [TASK...]\n\n"
        << "Options:\n"
        << "  --config=PATH        Pipeline configuration (default .forge/pipeline.json)\n"
        << "  --contact=ADDRESS    Email address to notify when the task is delivered\n"
        << "  --provider=PROVIDER  LLM provider for agent turns (openai|anthropic)\n"
        << "  --help               Show this help message\n\n"
        << "Missing task or contact is prompted for interactively.\n\n"
        << "Exit status:\n"
        << "  " << EXIT_DELIVERED << "  Delivered\n"
        << "  " << EXIT_USAGE_ERROR << "  Usage or configuration error\n"
        << "  " << EXIT_ABORTED << "  Aborted\n"
        << "  " << EXIT_NO_ARTIFACT << "  No code artifact produced\n"
        << "  " << EXIT_DELIVERY_FAILED << "  Delivery failed\n\n"
        << "Environment:\n"
        << "  OPENAI_API_KEY, ANTHROPIC_API_KEY  read by forge_llm_adapter\n"
        << "  GITHUB_TOKEN                       pull request creation\n"
        << "  SMTP_HOST, SMTP_USER, SMTP_PASS    notification email\n";
    return oss.str();
}

} // namespace forge
