#include "readline_input_handler.h"
#include "utils.h"
#include <cstdio>
#include <cstdlib>
#include <readline/readline.h>
#include <readline/history.h>

namespace forge {

ReadlineInputHandler::ReadlineInputHandler(const std::string& history_file)
    : history_file_(history_file) {
    Utils::create_directories(history_file_);

    // Plain text prompts, no filename completion
    rl_bind_key('\t', rl_insert);

    load_history();
}

ReadlineInputHandler::~ReadlineInputHandler() {
    save_history();
}

std::string ReadlineInputHandler::get_line(const std::string& prompt) {
    char* line = readline(prompt.c_str());

    if (line == nullptr) {
        // EOF (Ctrl+D)
        return "";
    }

    std::string result(line);
    free(line);

    return result;
}

void ReadlineInputHandler::add_history(const std::string& line) {
    if (!line.empty()) {
        ::add_history(line.c_str());
    }
}

void ReadlineInputHandler::save_history() {
    write_history(history_file_.c_str());
}

void ReadlineInputHandler::load_history() {
    read_history(history_file_.c_str());

    // Limit history size
    stifle_history(200);
}

} // namespace forge
