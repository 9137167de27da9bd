#include "cli_options.h"
#include "coordinator.h"
#include "pipeline_config.h"
#include "delivery/github_client.h"
#include "delivery/smtp_mail_client.h"
#include "network/nng_agent_client.h"
#include "sandbox/docker_runtime.h"
#include <iostream>
#include <memory>
#include <string>

using namespace forge;

int main(int argc, char* argv[]) {
    try {
        CliOptions options;
        std::string error_message;

        if (!CommandLine::parse(argc, argv, options, error_message)) {
            std::cerr << "Error: " << error_message << std::endl;
            std::cerr << CommandLine::usage(argv[0]);
            return EXIT_USAGE_ERROR;
        }

        if (options.show_help) {
            std::cout << CommandLine::usage(argv[0]);
            return EXIT_DELIVERED;
        }

        auto settings = PipelineConfig::load_or_create(error_message, options.config_path);
        if (!settings) {
            std::cerr << "Error: " << error_message << std::endl;
            return EXIT_USAGE_ERROR;
        }

        if (!options.provider.empty()) {
            settings->agents.provider = options.provider;
        }

        if (options.task.description.empty() || options.task.requester_contact.empty()) {
            auto input = create_input_handler();
            if (!CommandLine::prompt_for_missing(options, *input)) {
                std::cerr << "Error: a task description and a contact address are required" << std::endl;
                return EXIT_USAGE_ERROR;
            }
        }

        Coordinator coordinator(
            *settings,
            std::make_unique<NNGAgentClient>(settings->network.llm_adapter_url,
                                             settings->network.receive_timeout_ms,
                                             settings->agents.provider),
            std::make_unique<DockerRuntime>(settings->sandbox.runtime),
            std::make_unique<GitHubClient>(settings->hosting),
            std::make_unique<SmtpMailClient>(settings->mail));

        RunOutcome outcome = coordinator.run(options.task);

        if (outcome.is_delivered()) {
            std::cout << "✅ " << outcome.to_string() << std::endl;
        } else {
            std::cerr << "❌ " << outcome.to_string() << std::endl;
        }

        return outcome.exit_code();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_USAGE_ERROR;
    }
}
