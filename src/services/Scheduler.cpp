#include "services/Scheduler.hpp"

#include "core/UnitContext.hpp"
#include "util/Logger.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace {

constexpr auto CANCEL_POLL_INTERVAL = std::chrono::milliseconds{50};

struct Slot {
    WipeTarget target;
    bool dispatched = false;
    bool done = false;
    Outcome status = Outcome::ABORTED;
};

/**
 * @brief Dispatch bookkeeping shared by the workers, guarded by mutex
 */
struct DispatchState {
    std::mutex mutex;
    std::condition_variable changed;
    std::vector<Slot> slots;
    size_t first_pending = 0;
    bool device_busy = false;
    std::exception_ptr append_failure;  ///< First exception thrown by RecordBuilder::append
};

enum class Readiness {
    READY,
    WAITING,
    BLOCKED  ///< Directory entry whose members did not all succeed
};

auto readiness(const DispatchState& state, size_t index) -> Readiness {
    const auto& target = state.slots[index].target;
    if (target.kind == TargetKind::BLOCK_DEVICE) {
        return state.device_busy ? Readiness::WAITING : Readiness::READY;
    }
    if (target.kind != TargetKind::DIRECTORY_ENTRY) {
        return Readiness::READY;
    }

    bool blocked = false;
    for (size_t i = 0; i < index; ++i) {
        const auto& earlier = state.slots[i];
        if (earlier.target.root != target.root) {
            continue;
        }
        if (!earlier.done) {
            return Readiness::WAITING;
        }
        blocked = blocked || earlier.status != Outcome::SUCCESS;
    }
    return blocked ? Readiness::BLOCKED : Readiness::READY;
}

auto not_run(const WipeTarget& target, std::string detail) -> UnitOutcome {
    UnitOutcome outcome;
    outcome.target = target;
    outcome.status = Outcome::ABORTED;
    outcome.detail = std::move(detail);
    outcome.verification = VerificationResult::skipped("no pass executed");
    return outcome;
}

}  // namespace

Scheduler::Scheduler(EngineConfig config) : config_(std::move(config)) {}

auto Scheduler::run(std::vector<WipeTarget> units, IUnitRunner& runner, RecordBuilder& record,
                    core::CancellationToken& token, const ProgressCallback& progress)
    -> SchedulerState {
    state_.store(SchedulerState::RUNNING);

    DispatchState dispatch;
    dispatch.slots.reserve(units.size());
    for (auto& unit : units) {
        dispatch.slots.push_back(Slot{.target = std::move(unit)});
    }

    const auto worker_count = static_cast<unsigned>(std::max<size_t>(
        1, std::min<size_t>(config_.effective_concurrency(), dispatch.slots.size())));
    LOG_INFO("Scheduler", "Scheduling " + std::to_string(dispatch.slots.size()) +
                              " unit(s) on " + std::to_string(worker_count) + " worker(s)");

    auto worker = [&]() {
        std::unique_lock lock{dispatch.mutex};
        while (!token.is_cancelled() && !dispatch.append_failure) {
            while (dispatch.first_pending < dispatch.slots.size() &&
                   dispatch.slots[dispatch.first_pending].dispatched) {
                ++dispatch.first_pending;
            }
            if (dispatch.first_pending == dispatch.slots.size()) {
                break;
            }

            std::optional<size_t> pick;
            Readiness pick_state = Readiness::WAITING;
            for (size_t i = dispatch.first_pending; i < dispatch.slots.size(); ++i) {
                if (dispatch.slots[i].dispatched) {
                    continue;
                }
                if (const auto ready = readiness(dispatch, i); ready != Readiness::WAITING) {
                    pick = i;
                    pick_state = ready;
                    break;
                }
            }

            if (!pick) {
                dispatch.changed.wait_for(lock, CANCEL_POLL_INTERVAL);
                continue;
            }

            auto& slot = dispatch.slots[*pick];
            slot.dispatched = true;
            const bool is_device = slot.target.kind == TargetKind::BLOCK_DEVICE;
            if (is_device) {
                dispatch.device_busy = true;
            }
            const auto target = slot.target;
            lock.unlock();

            UnitOutcome outcome;
            if (pick_state == Readiness::BLOCKED) {
                outcome = not_run(target, "directory kept: not every member was wiped");
                LOG_WARNING("Scheduler", target.path.string() + ": " + outcome.detail);
            } else {
                core::UnitContext context{.token = &token, .deadline = std::nullopt,
                                          .progress = progress};
                if (config_.unit_timeout.count() > 0) {
                    context.deadline = std::chrono::steady_clock::now() + config_.unit_timeout;
                }
                try {
                    outcome = runner.run(target, context);
                } catch (const std::exception& e) {
                    outcome = not_run(target, std::string{"internal error: "} + e.what());
                    LOG_ERROR("Scheduler", target.path.string() + ": " + outcome.detail);
                }
            }

            if (outcome.safety_denied && config_.abort_all_on_denial) {
                LOG_WARNING("Scheduler", "Denial of " + target.path.string() +
                                             " cancels the remaining units");
                token.cancel(core::CancelReason::SAFETY_TRIGGERED);
            }

            const auto status = outcome.status;
            std::exception_ptr failure;
            try {
                record.append(std::move(outcome));
            } catch (const std::exception& e) {
                LOG_ERROR("Scheduler", "Cannot record outcome of " + target.path.string() +
                                           ": " + e.what());
                failure = std::current_exception();
            }

            lock.lock();
            if (failure && !dispatch.append_failure) {
                dispatch.append_failure = failure;
            }
            slot.done = true;
            slot.status = status;
            if (is_device) {
                dispatch.device_busy = false;
            }
            dispatch.changed.notify_all();
        }
        dispatch.changed.notify_all();
    };

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (unsigned i = 0; i < worker_count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
        thread.join();
    }

    if (dispatch.append_failure) {
        state_.store(SchedulerState::CANCELLED);
        std::rethrow_exception(dispatch.append_failure);
    }

    size_t never_dispatched = 0;
    for (auto& slot : dispatch.slots) {
        if (!slot.dispatched) {
            record.append(not_run(slot.target, "cancelled before dispatch"));
            slot.status = Outcome::ABORTED;
            ++never_dispatched;
        }
    }

    SchedulerState final_state = SchedulerState::COMPLETED;
    if (token.is_cancelled()) {
        final_state = SchedulerState::CANCELLED;
        LOG_WARNING("Scheduler", "Run cancelled; " + std::to_string(never_dispatched) +
                                     " unit(s) never dispatched");
    } else if (!std::ranges::all_of(dispatch.slots, [](const Slot& slot) {
                   return slot.status == Outcome::SUCCESS;
               })) {
        final_state = SchedulerState::PARTIALLY_COMPLETED;
    }

    state_.store(final_state);
    return final_state;
}
