#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace forge {

/**
 * @brief The fixed set of agent roles, in cycle order
 */
enum class RoleTag {
    PLANNER,
    WRITER,
    SANITIZER,
    REVIEWER,
    NOTIFIER
};

constexpr std::array<RoleTag, 5> kRoleCycle = {
    RoleTag::PLANNER,
    RoleTag::WRITER,
    RoleTag::SANITIZER,
    RoleTag::REVIEWER,
    RoleTag::NOTIFIER
};

constexpr size_t kRoleCycleLength = kRoleCycle.size();

// Role of turn i is kRoleCycle[i mod 5]
RoleTag role_for_turn(size_t turn_index);

std::string role_name(RoleTag role);
std::optional<RoleTag> role_from_name(const std::string& name);

// System instruction sent along with the transcript for each role
std::string role_prompt(RoleTag role);

} // namespace forge
