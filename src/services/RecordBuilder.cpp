#include "services/RecordBuilder.hpp"

#include "algorithms/PatternLibrary.hpp"
#include "services/RecordNames.hpp"
#include "util/Logger.hpp"

#include <algorithm>
#include <array>
#include <span>
#include <string_view>
#include <utility>

namespace {

constexpr std::string_view RECORD_DOMAIN = "secure-eraser/record/v1";

/**
 * @brief Feeds length-prefixed fields into a digest
 */
class FieldEncoder {
public:
    explicit FieldEncoder(util::Sha256& hasher) : hasher_(hasher) {}

    void field(std::string_view value) {
        std::array<uint8_t, 8> length{};
        auto size = static_cast<uint64_t>(value.size());
        for (auto it = length.rbegin(); it != length.rend(); ++it) {
            *it = static_cast<uint8_t>(size & 0xFF);
            size >>= 8;
        }
        hasher_.update(std::span<const uint8_t>{length});
        hasher_.update(value);
    }

    void field(uint64_t value) { field(std::to_string(value)); }

    void field(bool value) { field(std::string_view{value ? "1" : "0"}); }

    void field(util::Timestamp value) { field(util::format_iso8601(value)); }

private:
    util::Sha256& hasher_;
};

}  // namespace

RecordBuilder::RecordBuilder(std::string target, WipeMethod method, util::Timestamp started_at) {
    record_.target = std::move(target);
    record_.method = method;
    record_.started_at = started_at;
    chain_ = header_digest(record_);
}

auto RecordBuilder::append(UnitOutcome unit) -> const WipeRecord& {
    std::lock_guard lock{mutex_};
    if (record_.sealed) {
        throw RecordSealedError{"cannot append to a sealed record"};
    }
    chain_ = chain_step(chain_, unit);
    unit.chain_digest = util::Sha256::to_hex(chain_);
    record_.units.push_back(std::move(unit));
    return record_;
}

auto RecordBuilder::seal(bool cancelled) -> const WipeRecord& {
    std::lock_guard lock{mutex_};
    if (record_.sealed) {
        throw AlreadySealedError{"record is already sealed"};
    }
    record_.ended_at = std::max(util::now_ms(), record_.started_at);
    record_.outcome = overall_outcome(record_.units, cancelled);
    record_.integrity_digest = util::Sha256::to_hex(seal_digest(chain_, record_));
    record_.sealed = true;

    LOG_INFO("RecordBuilder", "Sealed record for " + record_.target + ": " +
                                  std::string{record_names::outcome_name(record_.outcome)} +
                                  ", " + std::to_string(record_.units.size()) + " unit(s)");
    return record_;
}

auto RecordBuilder::snapshot() const -> WipeRecord {
    std::lock_guard lock{mutex_};
    return record_;
}

auto RecordBuilder::unit_count() const -> size_t {
    std::lock_guard lock{mutex_};
    return record_.units.size();
}

auto RecordBuilder::overall_outcome(const std::vector<UnitOutcome>& units, bool cancelled)
    -> Outcome {
    if (cancelled) {
        return Outcome::ABORTED;
    }
    const auto is = [](Outcome expected) {
        return [expected](const UnitOutcome& unit) { return unit.status == expected; };
    };
    if (std::ranges::all_of(units, is(Outcome::ABORTED))) {
        return Outcome::ABORTED;
    }
    if (std::ranges::all_of(units, is(Outcome::SUCCESS))) {
        return Outcome::SUCCESS;
    }
    return Outcome::PARTIAL_FAILURE;
}

auto RecordBuilder::compute_digest(const WipeRecord& record) -> std::string {
    auto chain = header_digest(record);
    for (const auto& unit : record.units) {
        chain = chain_step(chain, unit);
    }
    return util::Sha256::to_hex(seal_digest(chain, record));
}

auto RecordBuilder::verify_integrity(const WipeRecord& record) -> bool {
    if (!record.sealed) {
        return false;
    }
    auto chain = header_digest(record);
    for (const auto& unit : record.units) {
        chain = chain_step(chain, unit);
        if (util::Sha256::to_hex(chain) != unit.chain_digest) {
            return false;
        }
    }
    return util::Sha256::to_hex(seal_digest(chain, record)) == record.integrity_digest;
}

auto RecordBuilder::header_digest(const WipeRecord& record) -> util::Sha256::Digest {
    util::Sha256 hasher;
    FieldEncoder encoder{hasher};
    encoder.field(RECORD_DOMAIN);
    encoder.field(std::string_view{record.target});
    encoder.field(algorithms::method_name(record.method));
    encoder.field(record.started_at);
    return hasher.finish();
}

auto RecordBuilder::chain_step(const util::Sha256::Digest& previous, const UnitOutcome& unit)
    -> util::Sha256::Digest {
    util::Sha256 hasher;
    hasher.update(std::span<const uint8_t>{previous});

    FieldEncoder encoder{hasher};
    encoder.field(std::string_view{unit.target.path.string()});
    encoder.field(record_names::target_kind_name(unit.target.kind));
    encoder.field(unit.target.length);
    encoder.field(record_names::outcome_name(unit.status));
    encoder.field(std::string_view{unit.detail});
    encoder.field(unit.safety_denied);

    encoder.field(static_cast<uint64_t>(unit.passes.size()));
    for (const auto& pass : unit.passes) {
        encoder.field(static_cast<uint64_t>(pass.spec.index));
        encoder.field(algorithms::pattern_name(pass.spec.pattern));
        encoder.field(record_names::pass_outcome_name(pass.outcome));
        encoder.field(std::string_view{pass.detail});
        encoder.field(pass.bytes_written);
        encoder.field(pass.started_at);
        encoder.field(pass.ended_at);
    }

    const auto& verification = unit.verification;
    encoder.field(record_names::verification_outcome_name(verification.outcome));
    encoder.field(verification.mismatch_offset.has_value());
    encoder.field(verification.mismatch_offset.value_or(0));
    encoder.field(std::string_view{verification.detail});
    encoder.field(std::string_view{verification.fingerprint});
    return hasher.finish();
}

auto RecordBuilder::seal_digest(const util::Sha256::Digest& chain, const WipeRecord& record)
    -> util::Sha256::Digest {
    util::Sha256 hasher;
    hasher.update(std::span<const uint8_t>{chain});
    FieldEncoder encoder{hasher};
    encoder.field(record_names::outcome_name(record.outcome));
    encoder.field(record.ended_at);
    return hasher.finish();
}
