#include "services/OverwriteExecutor.hpp"

#include "algorithms/PatternLibrary.hpp"
#include "algorithms/PatternSource.hpp"
#include "util/IoHelpers.hpp"
#include "util/Logger.hpp"
#include "util/Sha256.hpp"

#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <vector>

OverwriteExecutor::OverwriteExecutor(size_t chunk_size)
    : chunk_size_(chunk_size > 0 ? chunk_size : EngineConfig::DEFAULT_CHUNK_SIZE) {}

auto OverwriteExecutor::execute(int fd, const WipeTarget& target, const PassSpec& spec,
                                int total_passes, const core::UnitContext& context) const
    -> PassResult {
    PassResult result;
    result.spec = spec;
    result.chunk_size = chunk_size_;
    result.started_at = util::now_ms();

    const algorithms::PatternSource source{spec.pattern};
    const auto pass_label = std::string{algorithms::pattern_name(spec.pattern)} + " pass " +
                            std::to_string(spec.index + 1) + "/" + std::to_string(total_passes);

    std::vector<uint8_t> buffer(
        static_cast<size_t>(std::min<uint64_t>(chunk_size_, std::max<uint64_t>(target.length, 1))));
    if (source.is_random()) {
        result.chunk_digests.reserve(
            static_cast<size_t>((target.length + chunk_size_ - 1) / chunk_size_));
    }

    std::optional<PassOutcome> failure;
    uint64_t written = 0;

    while (written < target.length) {
        if (auto stop = context.stop_reason()) {
            failure = PassOutcome::ABORTED;
            result.detail = stop->message;
            break;
        }

        const auto to_write =
            static_cast<size_t>(std::min<uint64_t>(buffer.size(), target.length - written));
        const std::span<uint8_t> chunk{buffer.data(), to_write};

        if (auto filled = source.fill(chunk); !filled) {
            failure = PassOutcome::IO_ERROR;
            result.detail = filled.error().message;
            break;
        }
        if (source.is_random()) {
            result.chunk_digests.push_back(util::Sha256::hash(chunk));
        }

        const auto done = util::pwrite_all(fd, chunk.data(), chunk.size(), written);
        written += done;

        if (done < to_write) {
            const int err = errno;
            failure = PassOutcome::IO_ERROR;
            result.detail = "write failed at offset " + std::to_string(written) + ": " +
                            std::strerror(err);
            break;
        }

        WipeProgress progress{};
        progress.target = target.path.string();
        progress.bytes_written = written;
        progress.total_bytes = target.length;
        progress.current_pass = spec.index + 1;
        progress.total_passes = total_passes;
        progress.percentage =
            (static_cast<double>(written) / static_cast<double>(target.length)) * 100.0;
        progress.status = "Writing " + pass_label;
        context.report(progress);
    }

    result.bytes_written = written;

    if (failure) {
        // Bytes already on the medium stay there; push them out before reporting
        if (::fsync(fd) != 0) {
            LOG_WARNING("OverwriteExecutor", "fsync after failed " + pass_label + " on " +
                                                 target.path.string() + ": " +
                                                 std::strerror(errno));
        }
        result.outcome = *failure;
        result.ended_at = util::now_ms();
        if (result.outcome == PassOutcome::IO_ERROR) {
            LOG_ERROR("OverwriteExecutor",
                      target.path.string() + ": " + pass_label + " failed: " + result.detail);
        } else {
            LOG_WARNING("OverwriteExecutor", target.path.string() + ": " + pass_label +
                                                 " stopped: " + result.detail);
        }
        return result;
    }

    // A pass counts only once the medium has acknowledged it
    if (::fsync(fd) != 0) {
        const int err = errno;
        result.outcome = PassOutcome::IO_ERROR;
        result.detail = std::string{"fsync failed: "} + std::strerror(err);
        result.ended_at = util::now_ms();
        LOG_ERROR("OverwriteExecutor",
                  target.path.string() + ": " + pass_label + " " + result.detail);
        return result;
    }

    result.outcome = PassOutcome::COMPLETED;
    result.ended_at = util::now_ms();
    LOG_DEBUG("OverwriteExecutor", target.path.string() + ": " + pass_label + " completed, " +
                                       std::to_string(written) + " bytes");
    return result;
}
