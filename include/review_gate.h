#pragma once

#include "message.h"
#include "pipeline_config.h"
#include <string>

namespace forge {

/**
 * @brief Pure decision between sandboxed execution and irreversible delivery
 *
 * PROCEED requires a successful run whose output affirms the safety marker:
 * the marker appears as a standalone, case-sensitive word and is contradicted
 * nowhere in the output. A contradiction is the marker directly after one of
 * not, never, no, isn't (or isnt) joined by spaces, tabs or hyphens on the same
 * line ("NOT SAFE", "isn't SAFE", "not-SAFE"), or the marker prefixed with
 * "un" ("UNSAFE", "un-SAFE"). Other phrasings ("not really SAFE") are not
 * recognised. With require_sanitizer_verdict set, the Sanitizer's own verdict
 * must be safe too.
 */
class ReviewGate {
public:
    explicit ReviewGate(const GateSettings& settings = GateSettings());

    GateDecision decide(const ExecutionResult& result) const;
    GateDecision decide(const ExecutionResult& result, const AgentVerdicts& verdicts) const;

    // Marker present as a whole word and never contradicted
    static bool text_affirms(const std::string& text, const std::string& marker);

    // Parses the latest Sanitizer and Reviewer replies
    AgentVerdicts parse_verdicts(const std::string& sanitizer_text, bool sanitizer_present,
                                 const std::string& reviewer_text, bool reviewer_present) const;

    const GateSettings& get_settings() const { return settings_; }

private:
    GateSettings settings_;
};

} // namespace forge
