#include "review_gate.h"
#include "utils.h"
#include <regex>

namespace forge {

ReviewGate::ReviewGate(const GateSettings& settings)
    : settings_(settings) {
}

bool ReviewGate::text_affirms(const std::string& text, const std::string& marker) {
    if (marker.empty()) {
        return false;
    }

    const std::string escaped = Utils::regex_escape(marker);

    // \b only works next to word characters, so bound the marker explicitly
    const std::regex standalone("(^|[^A-Za-z0-9_])" + escaped + "($|[^A-Za-z0-9_])");
    if (!std::regex_search(text, standalone)) {
        return false;
    }

    // Negating word, then spaces, tabs or hyphens on the same line: "NOT SAFE", "isn't SAFE", "not-SAFE"
    const std::string negation = "([Nn]ot|NOT|[Nn]ever|NEVER|[Ii]sn'?t|ISN'?T|[Nn]o|NO)";
    const std::regex negated("(^|[^A-Za-z0-9_'])" + negation + "[ \\t-]+" + escaped + "($|[^A-Za-z0-9_])");
    const std::regex prefixed("(UN|[Uu]n)-?" + escaped + "($|[^A-Za-z0-9_])");
    if (std::regex_search(text, negated) || std::regex_search(text, prefixed)) {
        return false;
    }

    return true;
}

GateDecision ReviewGate::decide(const ExecutionResult& result) const {
    GateDecision decision;
    decision.outcome = GateOutcome::ABORT;

    if (!result.succeeded) {
        decision.reason = "execution failed: " + result.failure_reason.value_or("unknown failure");
        return decision;
    }

    if (!text_affirms(result.stdout_stderr_combined, settings_.safety_marker)) {
        bool mentioned = result.stdout_stderr_combined.find(settings_.safety_marker) != std::string::npos;
        decision.reason = mentioned
            ? "safety marker '" + settings_.safety_marker + "' contradicted in output"
            : "safety marker '" + settings_.safety_marker + "' absent from output";
        return decision;
    }

    decision.outcome = GateOutcome::PROCEED;
    decision.reason = "execution succeeded and output affirms '" + settings_.safety_marker + "'";
    return decision;
}

GateDecision ReviewGate::decide(const ExecutionResult& result, const AgentVerdicts& verdicts) const {
    GateDecision decision = decide(result);
    if (!decision.proceed() || !settings_.require_sanitizer_verdict) {
        return decision;
    }

    if (!verdicts.sanitizer_present) {
        return GateDecision{GateOutcome::ABORT, "no Sanitizer verdict in transcript"};
    }
    if (!verdicts.sanitizer_safe) {
        return GateDecision{GateOutcome::ABORT, "Sanitizer did not mark the code '" + settings_.sanitizer_marker + "'"};
    }

    decision.reason += "; Sanitizer verdict '" + settings_.sanitizer_marker + "'";
    return decision;
}

AgentVerdicts ReviewGate::parse_verdicts(const std::string& sanitizer_text, bool sanitizer_present,
                                         const std::string& reviewer_text, bool reviewer_present) const {
    AgentVerdicts verdicts;
    verdicts.sanitizer_present = sanitizer_present;
    verdicts.reviewer_present = reviewer_present;
    verdicts.sanitizer_safe = sanitizer_present && text_affirms(sanitizer_text, settings_.sanitizer_marker);
    verdicts.reviewer_approved = reviewer_present && text_affirms(reviewer_text, settings_.reviewer_marker);
    return verdicts;
}

} // namespace forge
