#pragma once

#include "input_handler.h"
#include <string>

namespace forge {

/**
 * @brief GNU readline input with line editing and persistent history
 */
class ReadlineInputHandler : public InputHandler {
public:
    explicit ReadlineInputHandler(const std::string& history_file);
    ~ReadlineInputHandler() override;

    std::string get_line(const std::string& prompt) override;
    void add_history(const std::string& line) override;
    void save_history() override;
    void load_history() override;

private:
    std::string history_file_;
};

} // namespace forge
