#pragma once

#include <optional>
#include <string>
#include <vector>

namespace forge {

/**
 * @brief Decides whether agent text is source code and pulls the code out of it
 *
 * A text counts as code when at least one of its lines opens a function
 * definition: optional indentation, an optional "async", then "def name(".
 */
class CodeDetector {
public:
    static bool is_code(const std::string& text);

    // True if this single line opens a function definition
    static bool is_function_definition(const std::string& line);

    // Bodies of all ``` fenced blocks, in order of appearance
    static std::vector<std::string> fenced_blocks(const std::string& text);

    // Body of the first fenced block that is code, else the whole text if it is code
    static std::optional<std::string> extract_code(const std::string& text);
};

} // namespace forge
