#include "code_detector.h"
#include <regex>
#include <sstream>

namespace forge {

namespace {

const std::regex& function_definition_regex() {
    static const std::regex pattern(R"(^\s*(async\s+)?def\s+[A-Za-z_]\w*\s*\()");
    return pattern;
}

bool is_fence(const std::string& line) {
    size_t start = line.find_first_not_of(" \t");
    return start != std::string::npos && line.compare(start, 3, "```") == 0;
}

} // namespace

bool CodeDetector::is_function_definition(const std::string& line) {
    return std::regex_search(line, function_definition_regex());
}

bool CodeDetector::is_code(const std::string& text) {
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (is_function_definition(line)) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> CodeDetector::fenced_blocks(const std::string& text) {
    std::vector<std::string> blocks;
    std::istringstream stream(text);
    std::string line;
    std::string current;
    bool inside = false;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (is_fence(line)) {
            if (inside) {
                blocks.push_back(current);
                current.clear();
            }
            inside = !inside;
            continue;
        }

        if (inside) {
            if (!current.empty()) {
                current += '\n';
            }
            current += line;
        }
    }

    // An unterminated fence still yields its body
    if (inside && !current.empty()) {
        blocks.push_back(current);
    }

    return blocks;
}

std::optional<std::string> CodeDetector::extract_code(const std::string& text) {
    auto blocks = fenced_blocks(text);
    for (const auto& block : blocks) {
        if (is_code(block)) {
            return block;
        }
    }

    if (is_code(text)) {
        return text;
    }

    return std::nullopt;
}

} // namespace forge
