/**
 * @file RecordSerializerTest.cpp
 * @brief Unit tests for the JSON record form
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "fixtures/TestFixtures.hpp"
#include "services/RecordBuilder.hpp"
#include "services/RecordSerializer.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

using ::testing::HasSubstr;

class RecordSerializerTest : public FileTestFixture {
protected:
    static WipeRecord SealedRecord() {
        RecordBuilder builder{"/data/tree", WipeMethod::DOD,
                              util::Timestamp{std::chrono::milliseconds{1'769'092'365'123}}};

        UnitOutcome file;
        file.target = WipeTarget{.path = "/data/tree/a.txt", .length = 10,
                                 .kind = TargetKind::DIRECTORY_MEMBER, .root = "/data/tree"};
        file.status = Outcome::SUCCESS;
        PassResult pass;
        pass.spec = PassSpec{PatternKind::ZEROS, 0};
        pass.outcome = PassOutcome::COMPLETED;
        pass.bytes_written = 10;
        file.passes.push_back(pass);
        file.verification.outcome = VerificationOutcome::VERIFIED;
        file.verification.fingerprint = std::string(64, 'a');
        builder.append(file);

        UnitOutcome entry;
        entry.target = WipeTarget{.path = "/data/tree", .length = 0,
                                  .kind = TargetKind::DIRECTORY_ENTRY, .root = "/data/tree"};
        entry.status = Outcome::PARTIAL_FAILURE;
        entry.detail = "rmdir failed: \"busy\"";
        entry.verification = VerificationResult::mismatch(0, "directory still present");
        builder.append(entry);

        return builder.seal(false);
    }
};

TEST_F(RecordSerializerTest, ToJson_ContainsRecordFields) {
    const auto record = SealedRecord();
    const auto json = nlohmann::json::parse(RecordSerializer::to_json(record));

    EXPECT_EQ(json["record_version"], 1);
    EXPECT_EQ(json["target"], "/data/tree");
    EXPECT_EQ(json["method"], "dod");
    EXPECT_EQ(json["outcome"], "partial_failure");
    EXPECT_EQ(json["started_at"], "2026-01-22T14:32:45.123Z");
    EXPECT_EQ(json["integrity_digest"].get<std::string>(), record.integrity_digest);
}

TEST_F(RecordSerializerTest, ToJson_ContainsUnitsPassesAndVerification) {
    const auto json = nlohmann::json::parse(RecordSerializer::to_json(SealedRecord()));

    ASSERT_EQ(json["units"].size(), 2u);
    const auto& file = json["units"][0];
    EXPECT_EQ(file["kind"], "file");
    EXPECT_EQ(file["bytes"], 10);
    ASSERT_EQ(file["passes"].size(), 1u);
    EXPECT_EQ(file["passes"][0]["pattern"], "zeros");
    EXPECT_EQ(file["passes"][0]["outcome"], "completed");
    EXPECT_EQ(file["passes"][0]["bytes_written"], 10);
    EXPECT_EQ(file["verification"]["outcome"], "verified");
    EXPECT_EQ(file["verification"]["fingerprint"].get<std::string>(), std::string(64, 'a'));

    const auto& entry = json["units"][1];
    EXPECT_EQ(entry["kind"], "dir-entry");
    EXPECT_TRUE(entry["passes"].is_array());
    EXPECT_TRUE(entry["passes"].empty());
    EXPECT_EQ(entry["verification"]["offset"], 0);
}

TEST_F(RecordSerializerTest, ToJson_EscapesDetailStrings) {
    const auto text = RecordSerializer::to_json(SealedRecord());
    EXPECT_THAT(text, HasSubstr("\"detail\": \"rmdir failed: \\\"busy\\\"\""));

    const auto json = nlohmann::json::parse(text);
    EXPECT_EQ(json["units"][1]["detail"], "rmdir failed: \"busy\"");
}

TEST_F(RecordSerializerTest, ToJson_EscapesControlCharacters) {
    RecordBuilder builder{"/data/f", WipeMethod::QUICK};
    UnitOutcome unit;
    unit.target = WipeTarget{.path = "/data/f", .length = 0, .kind = TargetKind::FILE,
                             .root = "/data/f"};
    unit.detail = std::string{"line\nnext\x01"};
    builder.append(unit);

    const auto text = RecordSerializer::to_json(builder.seal(false));

    EXPECT_THAT(text, HasSubstr("line\\nnext\\u0001"));
    EXPECT_EQ(nlohmann::json::parse(text)["units"][0]["detail"], "line\nnext\x01");
}

TEST_F(RecordSerializerTest, ToJson_NonUtf8PathStillYieldsValidJson) {
    const std::string raw_path = "/data/bad\xff\xfe.bin";
    RecordBuilder builder{raw_path, WipeMethod::QUICK};
    UnitOutcome unit;
    unit.target = WipeTarget{.path = raw_path, .length = 4, .kind = TargetKind::FILE,
                             .root = raw_path};
    unit.status = Outcome::SUCCESS;
    builder.append(unit);

    const auto text = RecordSerializer::to_json(builder.seal(false));

    EXPECT_EQ(text.find('\xff'), std::string::npos);
    EXPECT_EQ(text.find('\xfe'), std::string::npos);
    nlohmann::json json;
    ASSERT_NO_THROW(json = nlohmann::json::parse(text));
    const auto target = json["target"].get<std::string>();
    EXPECT_THAT(target, HasSubstr("/data/bad"));
    EXPECT_THAT(target, HasSubstr("\xEF\xBF\xBD"));
    EXPECT_EQ(json["units"][0]["target"].get<std::string>(), target);
}

TEST_F(RecordSerializerTest, WriteFile_WritesJsonAndNoTempFile) {
    const auto record = SealedRecord();
    const auto path = temp->path() / "record.json";

    auto written = RecordSerializer::write_file(record, path);

    ASSERT_TRUE(written.has_value()) << written.error().message;
    std::ifstream in{path};
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str(), RecordSerializer::to_json(record));
    EXPECT_FALSE(std::filesystem::exists(temp->path() / "record.json.tmp"));
}

TEST_F(RecordSerializerTest, WriteFile_MissingDirectoryIsIoError) {
    auto written = RecordSerializer::write_file(SealedRecord(), temp->path() / "no" / "r.json");

    ASSERT_FALSE(written.has_value());
    EXPECT_TRUE(written.error().is(util::ErrorCode::IO_ERROR));
}

TEST_F(RecordSerializerTest, ToJson_OmitsEmptyOptionalFields) {
    const auto json = nlohmann::json::parse(RecordSerializer::to_json(SealedRecord()));
    // The verified unit has no detail and no mismatch offset
    const auto& file = json["units"][0];
    EXPECT_FALSE(file.contains("detail"));
    EXPECT_FALSE(file["verification"].contains("offset"));
    EXPECT_FALSE(file["verification"].contains("detail"));
    EXPECT_FALSE(file["passes"][0].contains("detail"));
}
