#include "utils.h"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>

namespace forge {

std::string Utils::get_current_working_directory() {
    return std::filesystem::current_path().string();
}

bool Utils::file_exists(const std::string& path) {
    return std::filesystem::exists(path);
}

bool Utils::create_directories(const std::string& file_path) {
    try {
        std::filesystem::path fs_path(file_path);
        std::filesystem::path parent_path = fs_path.parent_path();

        if (parent_path.empty()) {
            return true; // No parent directory needed
        }

        if (std::filesystem::exists(parent_path)) {
            return true;
        }

        return std::filesystem::create_directories(parent_path);
    } catch (const std::filesystem::filesystem_error&) {
        return false;
    }
}

std::string Utils::get_env(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string Utils::trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

std::string Utils::regex_escape(const std::string& str) {
    std::string result;
    result.reserve(str.length() * 2);

    for (char c : str) {
        switch (c) {
            case '[': case ']': case '{': case '}': case '(': case ')':
            case '*': case '+': case '?': case '.': case ',': case '\\':
            case '^': case '$': case '|': case '#': case '-':
                result += '\\';
                result += c;
                break;
            default:
                result += c;
                break;
        }
    }
    return result;
}

std::string Utils::base64_encode(const std::string& data) {
    static const char* alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string encoded;
    encoded.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < data.size()) {
        unsigned int chunk = (static_cast<unsigned char>(data[i]) << 16) |
                             (static_cast<unsigned char>(data[i + 1]) << 8) |
                             static_cast<unsigned char>(data[i + 2]);
        encoded += alphabet[(chunk >> 18) & 0x3F];
        encoded += alphabet[(chunk >> 12) & 0x3F];
        encoded += alphabet[(chunk >> 6) & 0x3F];
        encoded += alphabet[chunk & 0x3F];
        i += 3;
    }

    size_t remaining = data.size() - i;
    if (remaining == 1) {
        unsigned int chunk = static_cast<unsigned char>(data[i]) << 16;
        encoded += alphabet[(chunk >> 18) & 0x3F];
        encoded += alphabet[(chunk >> 12) & 0x3F];
        encoded += "==";
    } else if (remaining == 2) {
        unsigned int chunk = (static_cast<unsigned char>(data[i]) << 16) |
                             (static_cast<unsigned char>(data[i + 1]) << 8);
        encoded += alphabet[(chunk >> 18) & 0x3F];
        encoded += alphabet[(chunk >> 12) & 0x3F];
        encoded += alphabet[(chunk >> 6) & 0x3F];
        encoded += '=';
    }

    return encoded;
}

std::string Utils::generate_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::random_device device;
    std::mt19937 generator(device());
    std::uniform_int_distribution<unsigned int> distribution(0, 0xFFFFFFFF);

    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time_t), "%Y%m%dT%H%M%SZ");
    ss << '-' << std::hex << std::setfill('0') << std::setw(8) << distribution(generator);
    return ss.str();
}

} // namespace forge
