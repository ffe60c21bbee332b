/**
 * @file WipeEngineTest.cpp
 * @brief End-to-end tests of run_wipe over real files
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "fixtures/TestFixtures.hpp"
#include "services/RecordBuilder.hpp"
#include "services/RecordSerializer.hpp"
#include "services/WipeEngine.hpp"

#include <sys/resource.h>

#include <csignal>

using ::testing::HasSubstr;

class WipeEngineTest : public MountTableTestFixture {
protected:
    EngineConfig config;

    void SetUp() override {
        MountTableTestFixture::SetUp();
        config.chunk_size = 4096;
        config.concurrency_limit = 2;
    }

    std::unique_ptr<WipeEngine> CreateEngine() {
        return std::make_unique<WipeEngine>(config, mount_table);
    }

    static const UnitOutcome* FindUnit(const WipeRecord& record,
                                       const std::filesystem::path& path) {
        for (const auto& unit : record.units) {
            if (unit.target.path == path) {
                return &unit;
            }
        }
        return nullptr;
    }
};

TEST_F(WipeEngineTest, DirectoryWithDod_WipesVerifiesAndRemovesEverything) {
    const auto dir = temp->CreateDir("tree");
    temp->CreateFile("tree/a.txt", 10);
    temp->CreateFile("tree/b.txt", 0);
    auto engine = CreateEngine();

    auto record = engine->run_wipe(WipeRequest{.target = dir,
                                               .method = WipeMethod::DOD,
                                               .policy = VerificationPolicy::full()},
                                   token);

    ASSERT_TRUE(record.has_value()) << record.error().message;
    EXPECT_EQ(record->outcome, Outcome::SUCCESS);
    ASSERT_EQ(record->units.size(), 3u);

    for (const auto* name : {"a.txt", "b.txt"}) {
        const auto* unit = FindUnit(*record, dir / name);
        ASSERT_NE(unit, nullptr) << name;
        EXPECT_EQ(unit->status, Outcome::SUCCESS);
        ASSERT_EQ(unit->passes.size(), 3u);
        for (const auto& pass : unit->passes) {
            EXPECT_EQ(pass.outcome, PassOutcome::COMPLETED);
        }
        EXPECT_EQ(unit->verification.outcome, VerificationOutcome::VERIFIED);
    }
    EXPECT_EQ(FindUnit(*record, dir / "b.txt")->passes[0].bytes_written, 0u);
    EXPECT_EQ(FindUnit(*record, dir / "a.txt")->passes[2].bytes_written, 10u);

    EXPECT_EQ(record->units.back().target.kind, TargetKind::DIRECTORY_ENTRY);
    EXPECT_EQ(record->units.back().status, Outcome::SUCCESS);
    EXPECT_FALSE(std::filesystem::exists(dir));

    EXPECT_TRUE(record->sealed);
    EXPECT_TRUE(RecordBuilder::verify_integrity(*record));
    EXPECT_EQ(WipeEngine::exit_code_for(*record), 0);
}

TEST_F(WipeEngineTest, RootWithNist_IsDeniedWithInvocationExitCode) {
    auto engine = CreateEngine();

    auto record = engine->run_wipe(
        WipeRequest{.target = std::filesystem::path{"/"}, .method = WipeMethod::NIST}, token);

    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->outcome, Outcome::ABORTED);
    ASSERT_EQ(record->units.size(), 1u);
    EXPECT_TRUE(record->units[0].safety_denied);
    EXPECT_TRUE(record->units[0].passes.empty());
    EXPECT_EQ(WipeEngine::exit_code_for(*record), 3);
    EXPECT_TRUE(RecordBuilder::verify_integrity(*record));
}

TEST_F(WipeEngineTest, MissingPath_IsInvalidTarget) {
    auto engine = CreateEngine();

    auto record = engine->run_wipe(WipeRequest{.target = temp->path() / "missing"}, token);

    ASSERT_FALSE(record.has_value());
    EXPECT_TRUE(record.error().is(util::ErrorCode::INVALID_TARGET));
}

TEST_F(WipeEngineTest, UnknownMethod_IsInvalidMethod) {
    const auto file = temp->CreateFile("f.bin", 10);
    auto engine = CreateEngine();

    auto record = engine->run_wipe(
        WipeRequest{.target = file, .method = static_cast<WipeMethod>(99)}, token);

    ASSERT_FALSE(record.has_value());
    EXPECT_TRUE(record.error().is(util::ErrorCode::INVALID_METHOD));
    EXPECT_TRUE(std::filesystem::exists(file));
}

TEST_F(WipeEngineTest, EffectivePolicy_ForcesVerificationForStandards) {
    auto engine = CreateEngine();
    const std::filesystem::path file{"/data/f"};
    const DeviceDescriptor device{.path = "/dev/sdb", .size_bytes = 1'000'000};

    EXPECT_EQ(engine->effective_policy(WipeRequest{.target = file, .method = WipeMethod::QUICK}),
              VerificationPolicy::none());
    EXPECT_EQ(engine->effective_policy(WipeRequest{.target = file, .method = WipeMethod::NIST}),
              VerificationPolicy::full());
    EXPECT_EQ(engine->effective_policy(WipeRequest{.target = device, .method = WipeMethod::DOD}),
              VerificationPolicy::sampled(config.default_sample_count));
    EXPECT_EQ(engine->effective_policy(WipeRequest{.target = file,
                                                   .method = WipeMethod::QUICK,
                                                   .policy = VerificationPolicy::sampled(0)}),
              VerificationPolicy::sampled(config.default_sample_count));
}

TEST_F(WipeEngineTest, NistWithoutPolicy_StillVerifies) {
    const auto file = temp->CreateFile("f.bin", 10'000);
    auto engine = CreateEngine();

    auto record =
        engine->run_wipe(WipeRequest{.target = file, .method = WipeMethod::NIST}, token);

    ASSERT_TRUE(record.has_value());
    ASSERT_EQ(record->units.size(), 1u);
    EXPECT_EQ(record->units[0].verification.outcome, VerificationOutcome::VERIFIED);
    EXPECT_EQ(record->outcome, Outcome::SUCCESS);
}

TEST_F(WipeEngineTest, CancelledBeforeStart_LeavesDataAndAborts) {
    const auto file = temp->CreateFile("f.bin", 10'000, 0x41);
    auto engine = CreateEngine();
    token.cancel();

    auto record = engine->run_wipe(WipeRequest{.target = file}, token);

    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->outcome, Outcome::ABORTED);
    ASSERT_EQ(record->units.size(), 1u);
    EXPECT_EQ(record->units[0].status, Outcome::ABORTED);
    EXPECT_EQ(WipeEngine::exit_code_for(*record), 2);
    const auto content = ReadFileBytes(file);
    EXPECT_TRUE(std::ranges::all_of(content, [](uint8_t b) { return b == 0x41; }));
}

TEST_F(WipeEngineTest, CancelDuringRun_EveryUnitHasOutcome) {
    const auto dir = temp->CreateDir("tree");
    for (int i = 0; i < 6; ++i) {
        temp->CreateFile("tree/f" + std::to_string(i) + ".bin", 8 * 4096);
    }
    config.concurrency_limit = 1;
    auto engine = CreateEngine();

    auto record = engine->run_wipe(WipeRequest{.target = dir,
                                               .method = WipeMethod::DOD,
                                               .progress =
                                                   [this](const WipeProgress& progress) {
                                                       if (progress.current_pass == 2) {
                                                           token.cancel();
                                                       }
                                                   }},
                                   token);

    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->outcome, Outcome::ABORTED);
    EXPECT_EQ(record->units.size(), 7u);
    for (const auto& unit : record->units) {
        EXPECT_NE(unit.status, Outcome::SUCCESS) << unit.target.path;
    }
    EXPECT_TRUE(std::filesystem::exists(dir));
    EXPECT_EQ(WipeEngine::exit_code_for(*record), 2);
}

TEST_F(WipeEngineTest, WriteFailureMidMethod_IsAbortedWithPassDetail) {
    const auto file = temp->CreateFile("big.bin", 16 * 4096, 0xA5);
    auto engine = CreateEngine();

    // Writes past this offset fail with EFBIG
    rlimit original{};
    ASSERT_EQ(::getrlimit(RLIMIT_FSIZE, &original), 0);
    auto* previous_handler = std::signal(SIGXFSZ, SIG_IGN);
    rlimit limited = original;
    limited.rlim_cur = 2 * 4096;
    ASSERT_EQ(::setrlimit(RLIMIT_FSIZE, &limited), 0);

    auto record = engine->run_wipe(WipeRequest{.target = file,
                                               .method = WipeMethod::DOD,
                                               .policy = VerificationPolicy::full()},
                                   token);

    ::setrlimit(RLIMIT_FSIZE, &original);
    std::signal(SIGXFSZ, previous_handler);

    ASSERT_TRUE(record.has_value());
    ASSERT_EQ(record->units.size(), 1u);
    const auto& unit = record->units[0];
    EXPECT_EQ(unit.status, Outcome::ABORTED);
    EXPECT_THAT(unit.detail, HasSubstr("pass 1 (zeros) failed"));
    ASSERT_EQ(unit.passes.size(), 1u);
    EXPECT_EQ(unit.passes[0].outcome, PassOutcome::IO_ERROR);
    EXPECT_EQ(unit.passes[0].bytes_written, 2u * 4096);
    EXPECT_EQ(unit.verification.outcome, VerificationOutcome::MISMATCH);
    EXPECT_EQ(record->outcome, Outcome::ABORTED);
    EXPECT_EQ(WipeEngine::exit_code_for(*record), 2);
    EXPECT_TRUE(std::filesystem::exists(file));
}

TEST_F(WipeEngineTest, Progress_IsReportedForEachPass) {
    const auto file = temp->CreateFile("f.bin", 3 * 4096);
    auto engine = CreateEngine();

    auto record = engine->run_wipe(WipeRequest{.target = file,
                                               .method = WipeMethod::DOD,
                                               .policy = VerificationPolicy::full(),
                                               .progress = CreateThreadSafeCallback()},
                                   token);

    ASSERT_TRUE(record.has_value());
    std::lock_guard lock{progress_mutex};
    for (int pass = 1; pass <= 3; ++pass) {
        EXPECT_TRUE(std::ranges::any_of(captured_progress, [pass](const WipeProgress& p) {
            return !p.verification_in_progress && p.current_pass == pass;
        }));
    }
    EXPECT_TRUE(std::ranges::any_of(captured_progress, [](const WipeProgress& p) {
        return p.verification_in_progress;
    }));
}

TEST_F(WipeEngineTest, SealedRecord_SerializesToJson) {
    const auto file = temp->CreateFile("f.bin", 100);
    auto engine = CreateEngine();

    auto record = engine->run_wipe(WipeRequest{.target = file}, token);

    ASSERT_TRUE(record.has_value());
    const auto json = RecordSerializer::to_json(*record);
    EXPECT_THAT(json, HasSubstr("\"method\": \"quick\""));
    EXPECT_THAT(json, HasSubstr("\"outcome\": \"success\""));
    EXPECT_THAT(json, HasSubstr("\"target\": \"" + file.string() + "\""));
}
