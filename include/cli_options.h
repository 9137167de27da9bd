#pragma once

#include "input_handler.h"
#include "message.h"
#include <string>

namespace forge {

struct CliOptions {
    std::string config_path;
    std::string provider;
    Task task;
    bool show_help = false;
};

class CommandLine {
public:
    /**
     * @brief Parse `forge [--config=PATH] [--contact=ADDRESS] [--provider=NAME] [TASK...]`
     *
     * Free arguments are joined with spaces into the task description.
     * @return false with error_message set on an unknown option or empty value
     */
    static bool parse(int argc, const char* const argv[], CliOptions& options, std::string& error_message);

    // Prompt for whatever the command line left out; false if the user gave nothing
    static bool prompt_for_missing(CliOptions& options, InputHandler& input);

    static std::string usage(const std::string& program_name);
};

} // namespace forge
