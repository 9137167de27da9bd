#include <gtest/gtest.h>
#include "review_gate.h"

using namespace forge;

class ReviewGateTest : public ::testing::Test {
protected:
    static ExecutionResult succeeded_with(const std::string& output) {
        ExecutionResult result;
        result.stdout_stderr_combined = output;
        result.succeeded = true;
        result.exit_code = 0;
        return result;
    }

    static ExecutionResult failed_with(const std::string& output, const std::string& reason) {
        ExecutionResult result;
        result.stdout_stderr_combined = output;
        result.succeeded = false;
        result.failure_reason = reason;
        return result;
    }

    ReviewGate gate;
};

TEST_F(ReviewGateTest, ProceedsOnStandaloneMarker) {
    EXPECT_TRUE(gate.decide(succeeded_with("SAFE")).proceed());
    EXPECT_TRUE(gate.decide(succeeded_with("checks done\nSAFE\n")).proceed());
    EXPECT_TRUE(gate.decide(succeeded_with("Result: SAFE.")).proceed());
}

TEST_F(ReviewGateTest, AbortsWhenMarkerAbsent) {
    GateDecision decision = gate.decide(succeeded_with("3\n"));

    EXPECT_EQ(decision.outcome, GateOutcome::ABORT);
    EXPECT_NE(decision.reason.find("absent"), std::string::npos);
}

TEST_F(ReviewGateTest, MatchIsCaseSensitive) {
    EXPECT_FALSE(gate.decide(succeeded_with("safe")).proceed());
    EXPECT_FALSE(gate.decide(succeeded_with("Safe")).proceed());
}

TEST_F(ReviewGateTest, ContradictedMarkerAborts) {
    EXPECT_FALSE(gate.decide(succeeded_with("UNSAFE")).proceed());
    EXPECT_FALSE(gate.decide(succeeded_with("NOT SAFE")).proceed());
    EXPECT_FALSE(gate.decide(succeeded_with("This is not SAFE to run")).proceed());
    EXPECT_FALSE(gate.decide(succeeded_with("SAFE\nactually UNSAFE")).proceed());

    GateDecision decision = gate.decide(succeeded_with("NOT SAFE"));
    EXPECT_NE(decision.reason.find("contradicted"), std::string::npos);
}

TEST_F(ReviewGateTest, WiderNegationFormsAbort) {
    for (const char* output : {"isn't SAFE", "This code isnt SAFE", "ISN'T SAFE", "not-SAFE",
                               "NEVER SAFE", "Never  SAFE", "NO SAFE", "un-SAFE", "Un-SAFE",
                               "SAFE\nbut it is not-SAFE on Windows"}) {
        GateDecision decision = gate.decide(succeeded_with(output));
        EXPECT_EQ(decision.outcome, GateOutcome::ABORT) << output;
        EXPECT_NE(decision.reason.find("contradicted"), std::string::npos) << output;
    }
}

TEST_F(ReviewGateTest, NegationOnPreviousLineDoesNotContradict) {
    EXPECT_TRUE(gate.decide(succeeded_with("Errors: NO\nSAFE")).proceed());
    EXPECT_TRUE(gate.decide(succeeded_with("No issues found.\nSAFE")).proceed());
    EXPECT_TRUE(gate.decide(succeeded_with("Nothing unusual - SAFE")).proceed());
}

TEST_F(ReviewGateTest, MarkerInsideLongerWordDoesNotCount) {
    EXPECT_FALSE(gate.decide(succeeded_with("SAFEGUARD engaged")).proceed());
    EXPECT_FALSE(gate.decide(succeeded_with("FAILSAFE")).proceed());
}

TEST_F(ReviewGateTest, FailedExecutionAlwaysAborts) {
    GateDecision timeout = gate.decide(failed_with("SAFE", "timeout"));
    EXPECT_EQ(timeout.outcome, GateOutcome::ABORT);
    EXPECT_NE(timeout.reason.find("timeout"), std::string::npos);

    GateDecision setup = gate.decide(failed_with("SAFE", "setup_error: docker not found"));
    EXPECT_EQ(setup.outcome, GateOutcome::ABORT);
    EXPECT_NE(setup.reason.find("setup_error"), std::string::npos);

    EXPECT_FALSE(gate.decide(failed_with("SAFE SAFE SAFE", "exit_code: 1")).proceed());
}

TEST_F(ReviewGateTest, DecideIsIdempotent) {
    ExecutionResult result = succeeded_with("NOT SAFE");
    EXPECT_EQ(gate.decide(result), gate.decide(result));

    ExecutionResult good = succeeded_with("SAFE");
    EXPECT_EQ(gate.decide(good), gate.decide(good));
}

TEST_F(ReviewGateTest, CustomMarker) {
    GateSettings settings;
    settings.safety_marker = "OK-TO-SHIP";
    ReviewGate custom(settings);

    EXPECT_TRUE(custom.decide(succeeded_with("status: OK-TO-SHIP")).proceed());
    EXPECT_FALSE(custom.decide(succeeded_with("status: SAFE")).proceed());
    EXPECT_FALSE(custom.decide(succeeded_with("NOT OK-TO-SHIP")).proceed());
}

TEST_F(ReviewGateTest, SanitizerVerdictRequiredWhenConfigured) {
    GateSettings settings;
    settings.require_sanitizer_verdict = true;
    ReviewGate strict(settings);
    ExecutionResult result = succeeded_with("SAFE");

    AgentVerdicts missing;
    EXPECT_FALSE(strict.decide(result, missing).proceed());

    AgentVerdicts unsafe = strict.parse_verdicts("UNSAFE: deletes files", true, "APPROVED", true);
    EXPECT_FALSE(unsafe.sanitizer_safe);
    EXPECT_FALSE(strict.decide(result, unsafe).proceed());

    AgentVerdicts safe = strict.parse_verdicts("SAFE", true, "APPROVED", true);
    EXPECT_TRUE(safe.sanitizer_safe);
    EXPECT_TRUE(safe.reviewer_approved);
    EXPECT_TRUE(strict.decide(result, safe).proceed());
}

TEST_F(ReviewGateTest, SanitizerVerdictCannotRescueFailedRun) {
    GateSettings settings;
    settings.require_sanitizer_verdict = true;
    ReviewGate strict(settings);

    AgentVerdicts safe = strict.parse_verdicts("SAFE", true, "", false);
    EXPECT_FALSE(strict.decide(failed_with("SAFE", "timeout"), safe).proceed());
}

TEST_F(ReviewGateTest, VerdictsIgnoredByDefault) {
    AgentVerdicts none;
    EXPECT_TRUE(gate.decide(succeeded_with("SAFE"), none).proceed());
}

TEST_F(ReviewGateTest, TextAffirmsHandlesRegexCharacters) {
    EXPECT_TRUE(ReviewGate::text_affirms("verdict: [ok]", "[ok]"));
    EXPECT_FALSE(ReviewGate::text_affirms("verdict: ok", "[ok]"));
    EXPECT_FALSE(ReviewGate::text_affirms("anything", ""));
}
