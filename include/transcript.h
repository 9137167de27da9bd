#pragma once

#include "agent_roles.h"
#include <optional>
#include <string>
#include <vector>

namespace forge {

// One role's contribution to the shared transcript
struct Turn {
    RoleTag role;
    std::string text;
};

/**
 * @brief Append-only record of the agent turns of one run
 *
 * The transcript is seeded with the task description and only ever grows.
 * Turns are never edited or removed.
 */
class Transcript {
public:
    Transcript() = default;
    explicit Transcript(const std::string& task_description);

    void append(RoleTag role, const std::string& text);

    const std::vector<Turn>& get_turns() const { return turns_; }
    const Turn& at(size_t index) const { return turns_.at(index); }
    size_t size() const { return turns_.size(); }
    bool empty() const { return turns_.empty(); }
    const std::string& get_task_description() const { return task_description_; }

    // Index of the most recent turn with the given role
    std::optional<size_t> find_latest(RoleTag role) const;

    // Text form sent to the agent-turn collaborator
    std::string render() const;

private:
    std::string task_description_;
    std::vector<Turn> turns_;
};

} // namespace forge
