/**
 * @file Scheduler.hpp
 * @brief Dispatches erasure units to a bounded pool of worker threads
 */

#pragma once

#include "core/CancellationToken.hpp"
#include "models/EngineConfig.hpp"
#include "models/WipeTypes.hpp"
#include "services/IUnitRunner.hpp"
#include "services/RecordBuilder.hpp"

#include <atomic>
#include <vector>

/**
 * @enum SchedulerState
 */
enum class SchedulerState {
    PENDING,
    RUNNING,
    COMPLETED,            ///< Every unit succeeded
    PARTIALLY_COMPLETED,  ///< At least one unit did not succeed
    CANCELLED             ///< The token fired before or during the run
};

/**
 * @class Scheduler
 * @brief Runs units concurrently under the engine's ordering rules
 *
 * - At most one BLOCK_DEVICE unit runs at any time.
 * - A DIRECTORY_ENTRY unit waits until every earlier unit with the same root
 *   has an outcome, and is recorded Aborted without running unless all of
 *   them succeeded.
 * - After cancellation no further unit is dispatched; units that never
 *   started are recorded Aborted.
 *
 * Every outcome reaches the record through RecordBuilder::append.
 */
class Scheduler {
public:
    explicit Scheduler(EngineConfig config);

    /**
     * @brief Run @p units to completion or cancellation
     * @param units Units in resolver order
     * @param runner Performs one unit (called from worker threads)
     * @param record Receives one outcome per unit
     * @param token Cancellation shared with the caller
     * @param progress Optional progress sink (called from worker threads)
     * @return Final state
     * @throws Whatever RecordBuilder::append threw, once every worker has stopped
     */
    auto run(std::vector<WipeTarget> units, IUnitRunner& runner, RecordBuilder& record,
             core::CancellationToken& token, const ProgressCallback& progress = {})
        -> SchedulerState;

    [[nodiscard]] auto state() const -> SchedulerState { return state_.load(); }

private:
    EngineConfig config_;
    std::atomic<SchedulerState> state_{SchedulerState::PENDING};
};
