#pragma once

#include <string>
#include <memory>

namespace forge {

/**
 * @brief Abstract interface for reading user input
 *
 * The interactive prompt uses readline; tests substitute scripted input.
 */
class InputHandler {
public:
    virtual ~InputHandler() = default;

    /**
     * @brief Get a line of input from the user
     * @param prompt The prompt to display to the user
     * @return The user's input, or empty string on EOF
     */
    virtual std::string get_line(const std::string& prompt) = 0;

    virtual void add_history(const std::string& line) = 0;
    virtual void save_history() = 0;
    virtual void load_history() = 0;
};

// Readline-backed handler with history kept under .forge/
std::unique_ptr<InputHandler> create_input_handler();

} // namespace forge
