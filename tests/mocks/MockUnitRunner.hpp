/**
 * @file MockUnitRunner.hpp
 * @brief Google Mock implementation of IUnitRunner
 */

#pragma once

#include "services/IUnitRunner.hpp"

#include <gmock/gmock.h>

class MockUnitRunner : public IUnitRunner {
public:
    MOCK_METHOD(UnitOutcome, run, (const WipeTarget& target, const core::UnitContext& context),
                (override));

    // Helper: outcome of a unit that finished cleanly
    static UnitOutcome Succeeded(const WipeTarget& target) {
        UnitOutcome outcome;
        outcome.target = target;
        outcome.status = Outcome::SUCCESS;
        outcome.verification = VerificationResult::skipped("verification not requested");
        return outcome;
    }

    // Helper: outcome of a unit whose read-back did not match
    static UnitOutcome Failed(const WipeTarget& target) {
        UnitOutcome outcome;
        outcome.target = target;
        outcome.status = Outcome::PARTIAL_FAILURE;
        outcome.detail = "verification mismatch at offset 0";
        outcome.verification = VerificationResult::mismatch(0, "byte differs from random pattern");
        return outcome;
    }

    // Helper: outcome of a unit refused by the safety guard
    static UnitOutcome Denied(const WipeTarget& target) {
        UnitOutcome outcome;
        outcome.target = target;
        outcome.status = Outcome::ABORTED;
        outcome.safety_denied = true;
        outcome.detail = "denied";
        outcome.verification = VerificationResult::skipped("safety denied");
        return outcome;
    }
};
