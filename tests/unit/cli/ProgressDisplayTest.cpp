/**
 * @file ProgressDisplayTest.cpp
 * @brief Unit tests for CLI progress formatting
 */

#include <gtest/gtest.h>

#include "cli/ProgressDisplay.hpp"

using cli::ProgressDisplay;

TEST(ProgressDisplayTest, FormatBytes_PicksLargestUnit) {
    EXPECT_EQ(ProgressDisplay::format_bytes(0), "0 B");
    EXPECT_EQ(ProgressDisplay::format_bytes(512), "512 B");
    EXPECT_EQ(ProgressDisplay::format_bytes(1'536), "1.5 KB");
    EXPECT_EQ(ProgressDisplay::format_bytes(245ULL * 1'024 * 1'024), "245.0 MB");
    EXPECT_EQ(ProgressDisplay::format_bytes(2ULL * 1'024 * 1'024 * 1'024 * 1'024), "2.0 TB");
}

TEST(ProgressDisplayTest, FormatDuration_MinutesAndHours) {
    EXPECT_EQ(ProgressDisplay::format_duration(-1), "--:--");
    EXPECT_EQ(ProgressDisplay::format_duration(0), "00:00");
    EXPECT_EQ(ProgressDisplay::format_duration(754), "12:34");
    EXPECT_EQ(ProgressDisplay::format_duration(3'661), "1:01:01");
}
