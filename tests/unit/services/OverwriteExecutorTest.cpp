/**
 * @file OverwriteExecutorTest.cpp
 * @brief Unit tests for single-pass overwrite execution
 */

#include <gtest/gtest.h>

#include "fixtures/TestFixtures.hpp"
#include "services/OverwriteExecutor.hpp"
#include "util/FileDescriptor.hpp"
#include "util/Sha256.hpp"

#include <fcntl.h>

#include <algorithm>
#include <span>

class OverwriteExecutorTest : public FileTestFixture {
protected:
    static constexpr size_t CHUNK = 4096;
    OverwriteExecutor executor{CHUNK};

    util::FileDescriptor OpenForWrite(const std::filesystem::path& path) {
        auto fd = util::FileDescriptor::open(path.string(), O_WRONLY);
        EXPECT_TRUE(fd.has_value());
        return fd ? std::move(*fd) : util::FileDescriptor{};
    }
};

TEST_F(OverwriteExecutorTest, ZerosPass_OverwritesWholeExtent) {
    const auto file = temp->CreateFile("data.bin", 10'000);
    auto fd = OpenForWrite(file);

    auto result = executor.execute(fd.get(), FileTarget(file, 10'000),
                                   PassSpec{PatternKind::ZEROS, 0}, 1, CreateContext());

    EXPECT_EQ(result.outcome, PassOutcome::COMPLETED);
    EXPECT_EQ(result.bytes_written, 10'000u);
    EXPECT_TRUE(result.chunk_digests.empty());
    EXPECT_LE(result.started_at, result.ended_at);

    const auto content = ReadFileBytes(file);
    ASSERT_EQ(content.size(), 10'000u);
    EXPECT_TRUE(std::ranges::all_of(content, [](uint8_t b) { return b == 0x00; }));
}

TEST_F(OverwriteExecutorTest, OnesPass_WritesComplementOfZeros) {
    const auto file = temp->CreateFile("data.bin", 5'000, 0x00);
    auto fd = OpenForWrite(file);

    auto result = executor.execute(fd.get(), FileTarget(file, 5'000),
                                   PassSpec{PatternKind::ONES, 1}, 3, CreateContext());

    EXPECT_TRUE(result.completed());
    const auto content = ReadFileBytes(file);
    EXPECT_TRUE(std::ranges::all_of(content, [](uint8_t b) { return b == 0xFF; }));
}

TEST_F(OverwriteExecutorTest, RandomPass_RecordsDigestOfEveryChunk) {
    const auto file = temp->CreateFile("data.bin", 10'000);
    auto fd = OpenForWrite(file);

    auto result = executor.execute(fd.get(), FileTarget(file, 10'000),
                                   PassSpec{PatternKind::RANDOM, 0}, 1, CreateContext());

    ASSERT_TRUE(result.completed());
    EXPECT_EQ(result.chunk_size, CHUNK);
    ASSERT_EQ(result.chunk_digests.size(), 3u);

    const auto content = ReadFileBytes(file);
    for (size_t i = 0; i < result.chunk_digests.size(); ++i) {
        const auto offset = i * CHUNK;
        const auto length = std::min(CHUNK, content.size() - offset);
        EXPECT_EQ(util::Sha256::hash(std::span<const uint8_t>{content.data() + offset, length}),
                  result.chunk_digests[i]);
    }
}

TEST_F(OverwriteExecutorTest, Progress_ReportedPerChunkUpToHundredPercent) {
    const auto file = temp->CreateFile("data.bin", 10'000);
    auto fd = OpenForWrite(file);

    (void)executor.execute(fd.get(), FileTarget(file, 10'000), PassSpec{PatternKind::ZEROS, 1}, 3,
                           CreateContext());

    ASSERT_EQ(captured_progress.size(), 3u);
    EXPECT_EQ(captured_progress.back().bytes_written, 10'000u);
    EXPECT_DOUBLE_EQ(captured_progress.back().percentage, 100.0);
    EXPECT_EQ(captured_progress.back().current_pass, 2);
    EXPECT_EQ(captured_progress.back().total_passes, 3);
    EXPECT_FALSE(captured_progress.back().verification_in_progress);
}

TEST_F(OverwriteExecutorTest, CancelledToken_AbortsBeforeFirstChunk) {
    const auto file = temp->CreateFile("data.bin", 10'000, 0x11);
    auto fd = OpenForWrite(file);
    token.cancel();

    auto result = executor.execute(fd.get(), FileTarget(file, 10'000),
                                   PassSpec{PatternKind::ZEROS, 0}, 1, CreateContext());

    EXPECT_EQ(result.outcome, PassOutcome::ABORTED);
    EXPECT_EQ(result.bytes_written, 0u);
    EXPECT_EQ(result.detail, "Cancelled");
    const auto content = ReadFileBytes(file);
    EXPECT_TRUE(std::ranges::all_of(content, [](uint8_t b) { return b == 0x11; }));
}

TEST_F(OverwriteExecutorTest, ExpiredDeadline_AbortsWithTimeout) {
    const auto file = temp->CreateFile("data.bin", 10'000);
    auto fd = OpenForWrite(file);
    auto context = CreateContext();
    context.deadline = std::chrono::steady_clock::now() - std::chrono::seconds{1};

    auto result = executor.execute(fd.get(), FileTarget(file, 10'000),
                                   PassSpec{PatternKind::RANDOM, 0}, 1, context);

    EXPECT_EQ(result.outcome, PassOutcome::ABORTED);
    EXPECT_EQ(result.detail, "Timeout");
}

TEST_F(OverwriteExecutorTest, CancelMidPass_KeepsBytesAlreadyWritten) {
    const auto file = temp->CreateFile("data.bin", 4 * CHUNK, 0x11);
    auto fd = OpenForWrite(file);
    auto context = CreateContext();
    context.progress = [this](const WipeProgress& progress) {
        if (progress.bytes_written >= CHUNK) {
            token.cancel();
        }
    };

    auto result = executor.execute(fd.get(), FileTarget(file, 4 * CHUNK),
                                   PassSpec{PatternKind::ZEROS, 0}, 1, context);

    EXPECT_EQ(result.outcome, PassOutcome::ABORTED);
    EXPECT_EQ(result.bytes_written, CHUNK);
    const auto content = ReadFileBytes(file);
    EXPECT_EQ(content[0], 0x00);
    EXPECT_EQ(content[CHUNK], 0x11);
}

TEST_F(OverwriteExecutorTest, InvalidDescriptor_ReportsIoError) {
    const auto file = temp->CreateFile("data.bin", 100);

    auto result = executor.execute(-1, FileTarget(file, 100), PassSpec{PatternKind::ZEROS, 0}, 1,
                                   CreateContext());

    EXPECT_EQ(result.outcome, PassOutcome::IO_ERROR);
    EXPECT_EQ(result.bytes_written, 0u);
    EXPECT_NE(result.detail.find("write failed at offset 0"), std::string::npos);
}

TEST_F(OverwriteExecutorTest, EmptyExtent_CompletesWithoutWriting) {
    const auto file = temp->CreateFile("empty.bin", 0);
    auto fd = OpenForWrite(file);

    auto result = executor.execute(fd.get(), FileTarget(file, 0),
                                   PassSpec{PatternKind::RANDOM, 0}, 1, CreateContext());

    EXPECT_TRUE(result.completed());
    EXPECT_EQ(result.bytes_written, 0u);
    EXPECT_TRUE(result.chunk_digests.empty());
    EXPECT_TRUE(captured_progress.empty());
}
