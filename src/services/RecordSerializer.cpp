#include "services/RecordSerializer.hpp"

#include "algorithms/PatternLibrary.hpp"
#include "services/RecordNames.hpp"
#include "util/Time.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {

using Json = nlohmann::ordered_json;

auto pass_json(const PassResult& pass) -> Json {
    Json j;
    j["index"] = pass.spec.index;
    j["pattern"] = std::string{algorithms::pattern_name(pass.spec.pattern)};
    j["outcome"] = std::string{record_names::pass_outcome_name(pass.outcome)};
    j["bytes_written"] = pass.bytes_written;
    j["started_at"] = util::format_iso8601(pass.started_at);
    j["ended_at"] = util::format_iso8601(pass.ended_at);
    if (!pass.detail.empty()) {
        j["detail"] = pass.detail;
    }
    return j;
}

auto verification_json(const VerificationResult& verification) -> Json {
    Json j;
    j["outcome"] = std::string{record_names::verification_outcome_name(verification.outcome)};
    if (verification.mismatch_offset) {
        j["offset"] = *verification.mismatch_offset;
    }
    if (!verification.fingerprint.empty()) {
        j["fingerprint"] = verification.fingerprint;
    }
    if (!verification.detail.empty()) {
        j["detail"] = verification.detail;
    }
    return j;
}

auto unit_json(const UnitOutcome& unit) -> Json {
    Json j;
    j["target"] = unit.target.path.string();
    j["kind"] = std::string{record_names::target_kind_name(unit.target.kind)};
    j["bytes"] = unit.target.length;
    j["outcome"] = std::string{record_names::outcome_name(unit.status)};
    if (!unit.detail.empty()) {
        j["detail"] = unit.detail;
    }
    j["chain_digest"] = unit.chain_digest;

    j["passes"] = Json::array();
    for (const auto& pass : unit.passes) {
        j["passes"].push_back(pass_json(pass));
    }
    j["verification"] = verification_json(unit.verification);
    return j;
}

}  // namespace

auto RecordSerializer::to_json(const WipeRecord& record) -> std::string {
    Json j;
    j["record_version"] = RECORD_VERSION;
    j["target"] = record.target;
    j["method"] = std::string{algorithms::method_name(record.method)};
    j["units"] = Json::array();
    for (const auto& unit : record.units) {
        j["units"].push_back(unit_json(unit));
    }
    j["outcome"] = std::string{record_names::outcome_name(record.outcome)};
    j["started_at"] = util::format_iso8601(record.started_at);
    j["ended_at"] = util::format_iso8601(record.ended_at);
    j["integrity_digest"] = record.integrity_digest;

    // Paths are raw bytes; invalid UTF-8 sequences become U+FFFD
    return j.dump(2, ' ', false, Json::error_handler_t::replace) + "\n";
}

auto RecordSerializer::write_file(const WipeRecord& record, const fs::path& path)
    -> std::expected<void, util::Error> {
    auto temp_path = path;
    temp_path += ".tmp";

    {
        std::ofstream file{temp_path, std::ios::out | std::ios::trunc};
        if (!file) {
            return std::unexpected(
                util::Error{util::ErrorCode::IO_ERROR, "Cannot create " + temp_path.string()});
        }
        file << to_json(record);
        file.flush();
        if (!file) {
            return std::unexpected(
                util::Error{util::ErrorCode::IO_ERROR, "Cannot write " + temp_path.string()});
        }
    }

    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        const auto reason = ec.message();
        fs::remove(temp_path, ec);
        return std::unexpected(util::Error{
            util::ErrorCode::IO_ERROR,
            "Cannot move record into place at " + path.string() + ": " + reason});
    }
    return {};
}
