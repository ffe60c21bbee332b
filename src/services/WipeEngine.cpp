#include "services/WipeEngine.hpp"

#include "algorithms/PatternLibrary.hpp"
#include "services/MountTable.hpp"
#include "services/RecordBuilder.hpp"
#include "services/RecordNames.hpp"
#include "services/SafetyGuard.hpp"
#include "services/Scheduler.hpp"
#include "services/TargetResolver.hpp"
#include "services/UnitPipeline.hpp"
#include "util/Logger.hpp"

#include <exception>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace fs = std::filesystem;

namespace {

auto describe(const WipeRequestTarget& target) -> std::string {
    if (const auto* descriptor = std::get_if<DeviceDescriptor>(&target)) {
        return descriptor->path;
    }
    const auto& path = std::get<fs::path>(target);
    if (path.empty()) {
        return {};
    }
    std::error_code ec;
    auto absolute = fs::absolute(path, ec);
    return (ec ? path : absolute).lexically_normal().string();
}

auto policy_name(const VerificationPolicy& policy) -> std::string {
    switch (policy.mode) {
        case VerificationPolicy::Mode::NONE:
            return "none";
        case VerificationPolicy::Mode::FULL:
            return "full";
        case VerificationPolicy::Mode::SAMPLED:
            return "sampled(" + std::to_string(policy.samples) + ")";
    }
    return "none";
}

/**
 * @brief The requested target as a unit, for recording a denial of the whole request
 */
auto requested_unit(const WipeRequestTarget& target, const std::string& description)
    -> WipeTarget {
    if (const auto* descriptor = std::get_if<DeviceDescriptor>(&target)) {
        return WipeTarget{.path = descriptor->path,
                          .length = descriptor->size_bytes,
                          .kind = TargetKind::BLOCK_DEVICE,
                          .root = descriptor->path};
    }
    std::error_code ec;
    const auto status = fs::symlink_status(description, ec);
    const auto kind = fs::is_directory(status) ? TargetKind::DIRECTORY_ENTRY : TargetKind::FILE;
    return WipeTarget{.path = description, .length = 0, .kind = kind, .root = description};
}

/**
 * @brief Everything owned by a single run_wipe call
 */
class InvocationContext {
public:
    InvocationContext(const EngineConfig& base, const WipeRequest& request,
                      std::vector<PassSpec> method_passes, VerificationPolicy effective,
                      std::shared_ptr<const IMountTable> mount_table)
        : config(base),
          policy(effective),
          passes(std::move(method_passes)),
          description(describe(request.target)),
          guard(config.safety, std::move(mount_table)),
          record(description, request.method) {
        if (request.concurrency_limit > 0) {
            config.concurrency_limit = request.concurrency_limit;
        }
    }

    EngineConfig config;
    VerificationPolicy policy;
    std::vector<PassSpec> passes;
    std::string description;
    SafetyGuard guard;
    RecordBuilder record;
};

}  // namespace

WipeEngine::WipeEngine(EngineConfig config, std::shared_ptr<const IMountTable> mount_table)
    : config_(std::move(config)),
      mount_table_(mount_table ? std::move(mount_table) : std::make_shared<MountTable>()) {}

auto WipeEngine::effective_policy(const WipeRequest& request) const -> VerificationPolicy {
    auto policy = request.policy;
    if (policy.mode == VerificationPolicy::Mode::SAMPLED && policy.samples == 0) {
        policy.samples = config_.default_sample_count;
    }
    if (policy.mode != VerificationPolicy::Mode::NONE ||
        !algorithms::requires_verification(request.method)) {
        return policy;
    }
    if (std::holds_alternative<DeviceDescriptor>(request.target)) {
        return VerificationPolicy::sampled(config_.default_sample_count);
    }
    return VerificationPolicy::full();
}

auto WipeEngine::run_wipe(const WipeRequest& request, core::CancellationToken& token)
    -> std::expected<WipeRecord, util::Error> {
    auto passes = algorithms::passes_for(request.method);
    if (!passes) {
        LOG_ERROR("WipeEngine", passes.error().message);
        return std::unexpected(passes.error());
    }

    const auto policy = effective_policy(request);
    if (policy.mode != request.policy.mode) {
        LOG_WARNING("WipeEngine", std::string{algorithms::method_display_name(request.method)} +
                                      " requires verification; using " + policy_name(policy));
    }

    InvocationContext invocation{config_, request, std::move(*passes), policy, mount_table_};
    LOG_INFO("WipeEngine", "Wipe of " + invocation.description + " with " +
                               std::string{algorithms::method_display_name(request.method)} +
                               ", verification " + policy_name(policy));

    if (auto authorized = invocation.guard.authorize_request(request.target); !authorized) {
        UnitOutcome denied;
        denied.target = requested_unit(request.target, invocation.description);
        denied.status = Outcome::ABORTED;
        denied.safety_denied = true;
        denied.detail = authorized.error().message;
        denied.verification = VerificationResult::skipped("safety denied");
        invocation.record.append(std::move(denied));
        return invocation.record.seal(false);
    }

    auto units = TargetResolver{}.resolve(request.target);
    if (!units) {
        LOG_ERROR("WipeEngine", units.error().message);
        return std::unexpected(units.error());
    }

    UnitPipeline pipeline{invocation.passes, invocation.policy, invocation.config,
                          invocation.guard, device_locks_};
    Scheduler scheduler{invocation.config};
    SchedulerState state = SchedulerState::PENDING;
    try {
        state = scheduler.run(std::move(*units), pipeline, invocation.record, token,
                              request.progress);
    } catch (const std::exception& e) {
        LOG_ERROR("WipeEngine", "Wipe of " + invocation.description +
                                    " lost its record: " + e.what());
        return std::unexpected(util::Error{util::ErrorCode::INTERNAL_ERROR,
                                           std::string{"record failure: "} + e.what()});
    }

    const auto& record = invocation.record.seal(state == SchedulerState::CANCELLED);
    LOG_INFO("WipeEngine", "Wipe of " + invocation.description + " finished: " +
                               std::string{record_names::outcome_name(record.outcome)});
    return record;
}

auto WipeEngine::exit_code_for(const WipeRecord& record) -> int {
    if (record.units.size() == 1 && record.units.front().safety_denied) {
        return 3;
    }
    switch (record.outcome) {
        case Outcome::SUCCESS:
            return 0;
        case Outcome::PARTIAL_FAILURE:
            return 1;
        case Outcome::ABORTED:
            return 2;
    }
    return 2;
}
