/**
 * @file IUnitRunner.hpp
 * @brief Interface the scheduler uses to process one erasure unit
 */

#pragma once

#include "core/UnitContext.hpp"
#include "models/WipeTypes.hpp"

/**
 * @class IUnitRunner
 * @brief Runs guard, passes, verification and removal for a single unit
 *
 * Implementations are called concurrently from scheduler workers and must
 * report every failure in the returned outcome rather than throw.
 */
class IUnitRunner {
public:
    virtual ~IUnitRunner() = default;

    [[nodiscard]] virtual auto run(const WipeTarget& target, const core::UnitContext& context)
        -> UnitOutcome = 0;
};
