#pragma once

#include <string>

namespace forge {

class Utils {
public:
    static std::string get_current_working_directory();
    static bool file_exists(const std::string& path);
    static bool create_directories(const std::string& file_path);

    static std::string get_env(const char* name);
    static std::string trim(const std::string& text);
    static std::string regex_escape(const std::string& str);
    static std::string base64_encode(const std::string& data);

    // Unique per-run identifier, e.g. "20261018T034512Z-5f3a9c1e"
    static std::string generate_run_id();
};

} // namespace forge
