#include "agent_roles.h"

namespace forge {

RoleTag role_for_turn(size_t turn_index) {
    return kRoleCycle[turn_index % kRoleCycleLength];
}

std::string role_name(RoleTag role) {
    switch (role) {
        case RoleTag::PLANNER: return "Planner";
        case RoleTag::WRITER: return "Writer";
        case RoleTag::SANITIZER: return "Sanitizer";
        case RoleTag::REVIEWER: return "Reviewer";
        case RoleTag::NOTIFIER: return "Notifier";
    }
    return "Unknown";
}

std::optional<RoleTag> role_from_name(const std::string& name) {
    for (RoleTag role : kRoleCycle) {
        if (role_name(role) == name) {
            return role;
        }
    }
    return std::nullopt;
}

std::string role_prompt(RoleTag role) {
    const std::string team =
        "You are part of an AI team collaborating to complete coding tasks. "
        "The conversation so far is given below; add only your own contribution.\n\n";

    switch (role) {
        case RoleTag::PLANNER:
            return team +
                "You're the Planner. Based on the user's request, break down the task into steps.\n"
                "Respond in a concise, numbered list of actions.";
        case RoleTag::WRITER:
            return team +
                "You're the Writer. Based on the plan, write correct and clean Python code.\n"
                "Do not include any explanation.";
        case RoleTag::SANITIZER:
            return team +
                "You're the Sanitizer. Check the Python code for syntax errors or dangerous operations.\n"
                "If safe, say 'SAFE'. If not, explain the issue.";
        case RoleTag::REVIEWER:
            return team +
                "You're the Reviewer. Review the generated code for quality and correctness.\n"
                "If it's okay, say 'APPROVED'. Otherwise, list improvements.";
        case RoleTag::NOTIFIER:
            return team +
                "You're the Notifier. Format a short summary message to email the user about task "
                "completion. The pull request link will be added for you.";
    }
    return team;
}

} // namespace forge
