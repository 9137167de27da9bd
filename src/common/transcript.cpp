#include "transcript.h"
#include <sstream>

namespace forge {

Transcript::Transcript(const std::string& task_description)
    : task_description_(task_description) {
}

void Transcript::append(RoleTag role, const std::string& text) {
    turns_.push_back(Turn{role, text});
}

std::optional<size_t> Transcript::find_latest(RoleTag role) const {
    for (size_t i = turns_.size(); i > 0; --i) {
        if (turns_[i - 1].role == role) {
            return i - 1;
        }
    }
    return std::nullopt;
}

std::string Transcript::render() const {
    std::ostringstream oss;
    oss << "User wants: " << task_description_;

    for (const auto& turn : turns_) {
        oss << "\n\n[" << role_name(turn.role) << "]\n" << turn.text;
    }

    return oss.str();
}

} // namespace forge
