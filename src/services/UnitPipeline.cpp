#include "services/UnitPipeline.hpp"

#include "algorithms/PatternLibrary.hpp"
#include "util/FileDescriptor.hpp"
#include "util/Logger.hpp"
#include "util/SecureRandom.hpp"
#include "util/Sha256.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {

auto io_error(const std::string& message) -> std::unexpected<util::Error> {
    return std::unexpected(util::Error{util::ErrorCode::IO_ERROR, message});
}

auto errno_text() -> std::string {
    return std::strerror(errno);
}

auto is_gone(const fs::path& path) -> bool {
    std::error_code ec;
    return !fs::exists(fs::symlink_status(path, ec));
}

}  // namespace

UnitPipeline::UnitPipeline(std::vector<PassSpec> passes, VerificationPolicy policy,
                           const EngineConfig& config, const SafetyGuard& guard,
                           DeviceLockRegistry& device_locks)
    : passes_(std::move(passes)),
      policy_(policy),
      config_(config),
      guard_(guard),
      device_locks_(device_locks),
      executor_(config.chunk_size),
      verifier_(config.chunk_size) {}

auto UnitPipeline::run(const WipeTarget& target, const core::UnitContext& context)
    -> UnitOutcome {
    UnitOutcome outcome;
    outcome.target = target;
    outcome.status = Outcome::ABORTED;

    if (auto authorized = guard_.authorize(target); !authorized) {
        outcome.safety_denied = true;
        outcome.detail = authorized.error().message;
        outcome.verification = VerificationResult::skipped("safety denied");
        return outcome;
    }

    if (auto stop = context.stop_reason()) {
        outcome.detail = stop->message;
        outcome.verification = VerificationResult::skipped("no pass executed");
        return outcome;
    }

    if (target.kind == TargetKind::DIRECTORY_ENTRY) {
        return run_directory_entry(target, std::move(outcome));
    }
    return run_extent(target, context, std::move(outcome));
}

auto UnitPipeline::run_extent(const WipeTarget& target, const core::UnitContext& context,
                              UnitOutcome outcome) -> UnitOutcome {
    const bool is_device = target.kind == TargetKind::BLOCK_DEVICE;
    const auto path = target.path.string();

    // Held from open until verification is done
    std::shared_ptr<std::mutex> device_mutex;
    std::unique_lock<std::mutex> device_lock;
    if (is_device) {
        device_mutex = device_locks_.lock_for(path);
        device_lock = std::unique_lock{*device_mutex};
    }

    int flags = O_WRONLY | O_SYNC | O_NOFOLLOW;
    if (is_device) {
        flags |= O_EXCL;
    }
    auto write_fd = util::FileDescriptor::open(path, flags);
    if (!write_fd) {
        outcome.detail = write_fd.error().message;
        outcome.verification = VerificationResult::skipped("no pass executed");
        LOG_ERROR("UnitPipeline", outcome.detail);
        return outcome;
    }

    const bool verifying = policy_.mode != VerificationPolicy::Mode::NONE;
    const bool wants_fingerprint = verifying && config_.capture_prewipe_fingerprint &&
                                   policy_.mode == VerificationPolicy::Mode::FULL &&
                                   target.length > 0 && !passes_.empty() &&
                                   passes_.back().pattern == PatternKind::RANDOM;

    util::FileDescriptor read_fd;
    if (verifying) {
        if (auto opened = util::FileDescriptor::open(path, O_RDONLY | O_NOFOLLOW)) {
            read_fd = std::move(*opened);
        } else {
            LOG_WARNING("UnitPipeline", opened.error().message);
        }
    }

    std::optional<util::Sha256::Digest> prewipe;
    if (wants_fingerprint && read_fd) {
        auto fingerprint = verifier_.capture_fingerprint(read_fd.get(), target.length, context);
        if (fingerprint) {
            prewipe = *fingerprint;
        } else if (fingerprint.error().is(util::ErrorCode::CANCELLED) ||
                   fingerprint.error().is(util::ErrorCode::TIMEOUT)) {
            outcome.detail = fingerprint.error().message;
            outcome.verification = VerificationResult::skipped("no pass executed");
            return outcome;
        } else {
            LOG_WARNING("UnitPipeline", path + ": pre-wipe fingerprint unavailable: " +
                                            fingerprint.error().message);
        }
    }

    const auto total_passes = static_cast<int>(passes_.size());
    for (const auto& spec : passes_) {
        auto result = executor_.execute(write_fd->get(), target, spec, total_passes, context);
        const bool completed = result.completed();
        outcome.passes.push_back(std::move(result));
        if (!completed) {
            break;
        }
    }
    write_fd->reset();

    if (outcome.passes.empty()) {
        outcome.verification = VerificationResult::skipped("no pass executed");
    } else if (!verifying) {
        outcome.verification = VerificationResult::skipped("verification not requested");
    } else if (!read_fd) {
        outcome.verification =
            VerificationResult::mismatch(0, "extent could not be opened for read-back");
    } else {
        outcome.verification = verifier_.verify(read_fd.get(), target, outcome.passes.back(),
                                                policy_, prewipe, context);
    }
    read_fd.reset();
    device_lock = {};

    const bool all_completed = outcome.passes.size() == passes_.size() &&
                               (outcome.passes.empty() || outcome.passes.back().completed());
    // A unit left mid-method is aborted whatever stopped the pass sequence
    if (!all_completed) {
        const auto& last = outcome.passes.back();
        outcome.status = Outcome::ABORTED;
        if (last.outcome == PassOutcome::ABORTED) {
            outcome.detail = last.detail;
        } else {
            outcome.detail = "pass " + std::to_string(last.spec.index + 1) + " (" +
                             std::string{algorithms::pattern_name(last.spec.pattern)} +
                             ") failed: " + last.detail;
        }
        return outcome;
    }

    if (outcome.verification.outcome == VerificationOutcome::MISMATCH) {
        outcome.status = Outcome::PARTIAL_FAILURE;
        outcome.detail = "verification mismatch";
        if (outcome.verification.mismatch_offset) {
            outcome.detail += " at offset " + std::to_string(*outcome.verification.mismatch_offset);
        }
        LOG_ERROR("UnitPipeline", path + ": " + outcome.detail + ": " +
                                      outcome.verification.detail);
        return outcome;
    }

    if (verifying && outcome.verification.outcome == VerificationOutcome::SKIPPED) {
        // Verification was interrupted by cancellation or the deadline
        outcome.status = Outcome::ABORTED;
        auto stop = context.stop_reason();
        outcome.detail = stop ? stop->message : outcome.verification.detail;
        return outcome;
    }

    if (config_.remove_after_wipe && !is_device) {
        if (auto removed = remove_entry(target.path); !removed) {
            outcome.status = Outcome::PARTIAL_FAILURE;
            outcome.detail = removed.error().message;
            LOG_ERROR("UnitPipeline", outcome.detail);
            return outcome;
        }
    }

    outcome.status = Outcome::SUCCESS;
    LOG_INFO("UnitPipeline", path + " wiped with " + std::to_string(total_passes) +
                                 " pass(es), " + std::to_string(target.length) + " bytes");
    return outcome;
}

auto UnitPipeline::run_directory_entry(const WipeTarget& target, UnitOutcome outcome)
    -> UnitOutcome {
    if (!config_.remove_after_wipe) {
        outcome.status = Outcome::SUCCESS;
        outcome.detail = "directory kept";
        outcome.verification = VerificationResult::skipped("entry removal disabled");
        return outcome;
    }

    if (auto removed = remove_tree(target.path); !removed) {
        outcome.status = Outcome::PARTIAL_FAILURE;
        outcome.detail = removed.error().message;
        outcome.verification = VerificationResult::skipped("directory not removed");
        LOG_ERROR("UnitPipeline", outcome.detail);
        return outcome;
    }

    const bool gone = is_gone(target.path);
    if (policy_.mode == VerificationPolicy::Mode::NONE) {
        outcome.verification = VerificationResult::skipped("verification not requested");
    } else if (gone) {
        outcome.verification.outcome = VerificationOutcome::VERIFIED;
        outcome.verification.detail = "directory removed";
    } else {
        outcome.verification = VerificationResult::mismatch(0, "directory still present");
    }

    if (!gone) {
        outcome.status = Outcome::PARTIAL_FAILURE;
        outcome.detail = "directory still present after removal";
        return outcome;
    }

    outcome.status = Outcome::SUCCESS;
    LOG_INFO("UnitPipeline", "Removed directory " + target.path.string());
    return outcome;
}

auto UnitPipeline::remove_entry(const fs::path& path) -> std::expected<void, util::Error> {
    {
        auto fd = util::FileDescriptor::open(path.string(), O_WRONLY | O_NOFOLLOW);
        if (!fd) {
            return std::unexpected(fd.error());
        }
        if (::ftruncate(fd->get(), 0) != 0) {
            return io_error("truncate failed for " + path.string() + ": " + errno_text());
        }
    }

    // Replace the name so the directory entry no longer reveals it
    util::Sha256::Digest noise{};
    if (auto filled = util::SecureRandom::fill(noise); !filled) {
        return std::unexpected(filled.error());
    }
    const auto scrubbed = path.parent_path() / util::Sha256::to_hex(noise).substr(0, 16);

    if (::rename(path.c_str(), scrubbed.c_str()) != 0) {
        return io_error("rename failed for " + path.string() + ": " + errno_text());
    }
    if (::unlink(scrubbed.c_str()) != 0) {
        return io_error("unlink failed for " + scrubbed.string() + ": " + errno_text());
    }

    const auto parent = path.parent_path().string();
    if (auto dir = util::FileDescriptor::open(parent, O_RDONLY | O_DIRECTORY)) {
        if (::fsync(dir->get()) != 0) {
            LOG_WARNING("UnitPipeline", "fsync of " + parent + " failed: " + errno_text());
        }
    }
    return {};
}

auto UnitPipeline::remove_tree(const fs::path& directory) -> std::expected<void, util::Error> {
    std::error_code ec;
    std::vector<fs::path> entries;
    for (fs::recursive_directory_iterator it{directory, ec}, end; !ec && it != end;
         it.increment(ec)) {
        entries.push_back(it->path());
    }
    if (ec) {
        return io_error("cannot list " + directory.string() + ": " + ec.message());
    }

    // Pre-order listing: walking it backwards removes children before parents
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        const auto status = fs::symlink_status(*it, ec);
        if (ec) {
            return io_error("cannot stat " + it->string() + ": " + ec.message());
        }
        if (fs::is_regular_file(status)) {
            return io_error("regular file still present: " + it->string());
        }
        if (fs::is_directory(status)) {
            if (::rmdir(it->c_str()) != 0) {
                return io_error("rmdir failed for " + it->string() + ": " + errno_text());
            }
        } else if (::unlink(it->c_str()) != 0) {
            return io_error("unlink failed for " + it->string() + ": " + errno_text());
        }
    }

    if (::rmdir(directory.c_str()) != 0) {
        return io_error("rmdir failed for " + directory.string() + ": " + errno_text());
    }
    return {};
}
