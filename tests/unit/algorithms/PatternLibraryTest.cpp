/**
 * @file PatternLibraryTest.cpp
 * @brief Unit tests for the method to pass-sequence table
 */

#include <gtest/gtest.h>

#include "algorithms/PatternLibrary.hpp"

using algorithms::passes_for;

TEST(PatternLibraryTest, Quick_IsSingleRandomPass) {
    auto passes = passes_for(WipeMethod::QUICK);
    ASSERT_TRUE(passes.has_value());
    ASSERT_EQ(passes->size(), 1u);
    EXPECT_EQ(passes->at(0).pattern, PatternKind::RANDOM);
    EXPECT_EQ(passes->at(0).index, 0);
}

TEST(PatternLibraryTest, Nist_IsSingleRandomPass) {
    auto passes = passes_for(WipeMethod::NIST);
    ASSERT_TRUE(passes.has_value());
    ASSERT_EQ(passes->size(), 1u);
    EXPECT_EQ(passes->at(0).pattern, PatternKind::RANDOM);
}

TEST(PatternLibraryTest, Dod_IsZerosOnesRandomInOrder) {
    auto passes = passes_for(WipeMethod::DOD);
    ASSERT_TRUE(passes.has_value());
    ASSERT_EQ(passes->size(), 3u);
    EXPECT_EQ(passes->at(0), (PassSpec{PatternKind::ZEROS, 0}));
    EXPECT_EQ(passes->at(1), (PassSpec{PatternKind::ONES, 1}));
    EXPECT_EQ(passes->at(2), (PassSpec{PatternKind::RANDOM, 2}));
}

TEST(PatternLibraryTest, PassesFor_UnknownMethodFails) {
    auto passes = passes_for(static_cast<WipeMethod>(42));
    ASSERT_FALSE(passes.has_value());
    EXPECT_TRUE(passes.error().is(util::ErrorCode::INVALID_METHOD));
}

TEST(PatternLibraryTest, PassesFor_IsStableAcrossCalls) {
    EXPECT_EQ(*passes_for(WipeMethod::DOD), *passes_for(WipeMethod::DOD));
}

TEST(PatternLibraryTest, ParseMethod_AcceptsNamesCaseInsensitive) {
    EXPECT_EQ(algorithms::parse_method("quick").value(), WipeMethod::QUICK);
    EXPECT_EQ(algorithms::parse_method("NIST").value(), WipeMethod::NIST);
    EXPECT_EQ(algorithms::parse_method("DoD").value(), WipeMethod::DOD);
    EXPECT_EQ(algorithms::parse_method("dod-5220-22-m").value(), WipeMethod::DOD);
}

TEST(PatternLibraryTest, ParseMethod_RejectsUnknownName) {
    auto method = algorithms::parse_method("gutmann");
    ASSERT_FALSE(method.has_value());
    EXPECT_TRUE(method.error().is(util::ErrorCode::INVALID_METHOD));
    EXPECT_NE(method.error().message.find("gutmann"), std::string::npos);
}

TEST(PatternLibraryTest, RequiresVerification_OnlyForNistAndDod) {
    EXPECT_FALSE(algorithms::requires_verification(WipeMethod::QUICK));
    EXPECT_TRUE(algorithms::requires_verification(WipeMethod::NIST));
    EXPECT_TRUE(algorithms::requires_verification(WipeMethod::DOD));
}

TEST(PatternLibraryTest, Names_AreStable) {
    EXPECT_EQ(algorithms::method_name(WipeMethod::DOD), "dod");
    EXPECT_EQ(algorithms::pattern_name(PatternKind::ZEROS), "zeros");
    EXPECT_EQ(algorithms::pattern_name(PatternKind::ONES), "ones");
    EXPECT_EQ(algorithms::pattern_name(PatternKind::RANDOM), "random");
}

TEST(PatternLibraryTest, FillByte_OnesIsComplementOfZeros) {
    EXPECT_EQ(algorithms::pattern_fill_byte(PatternKind::ZEROS), uint8_t{0x00});
    EXPECT_EQ(algorithms::pattern_fill_byte(PatternKind::ONES), uint8_t{0xFF});
    EXPECT_FALSE(algorithms::pattern_fill_byte(PatternKind::RANDOM).has_value());
}
