//! # Capture Options Tests
//!
//! Tests for borrow policy parsing and the SHAPEBUF_MAX_DEPTH /
//! SHAPEBUF_BORROW environment overrides.

#include "shapebuf/buffer/buffer_options.hpp"

#include <cstdlib>
#include <gtest/gtest.h>

using namespace shapebuf;

// ============================================================================
// Borrow Policy
// ============================================================================

TEST(BorrowPolicyTest, ParseKnownNames) {
    EXPECT_EQ(parse_borrow_policy("prefer"), BorrowPolicy::PreferBorrow);
    EXPECT_EQ(parse_borrow_policy("PREFER"), BorrowPolicy::PreferBorrow);
    EXPECT_EQ(parse_borrow_policy("copy"), BorrowPolicy::Copy);
    EXPECT_EQ(parse_borrow_policy("COPY"), BorrowPolicy::Copy);
}

TEST(BorrowPolicyTest, ParseUnknownName) {
    EXPECT_FALSE(parse_borrow_policy("borrow").has_value());
    EXPECT_FALSE(parse_borrow_policy("").has_value());
}

TEST(BorrowPolicyTest, NameRoundTrip) {
    for (auto policy : {BorrowPolicy::PreferBorrow, BorrowPolicy::Copy}) {
        EXPECT_EQ(parse_borrow_policy(borrow_policy_name(policy)), policy);
    }
}

// ============================================================================
// Environment Overrides
// ============================================================================

class CaptureOptionsEnvTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("SHAPEBUF_MAX_DEPTH");
        unsetenv("SHAPEBUF_BORROW");
    }

    void TearDown() override {
        unsetenv("SHAPEBUF_MAX_DEPTH");
        unsetenv("SHAPEBUF_BORROW");
    }
};

TEST_F(CaptureOptionsEnvTest, DefaultsWithoutEnvironment) {
    CaptureOptions options = CaptureOptions::from_env();
    EXPECT_EQ(options.max_depth, CaptureOptions::DEFAULT_MAX_DEPTH);
    EXPECT_EQ(options.borrow, BorrowPolicy::PreferBorrow);
}

TEST_F(CaptureOptionsEnvTest, MaxDepthOverride) {
    setenv("SHAPEBUF_MAX_DEPTH", "16", 1);
    EXPECT_EQ(CaptureOptions::from_env().max_depth, 16u);
}

TEST_F(CaptureOptionsEnvTest, InvalidMaxDepthIgnored) {
    setenv("SHAPEBUF_MAX_DEPTH", "deep", 1);
    EXPECT_EQ(CaptureOptions::from_env().max_depth, CaptureOptions::DEFAULT_MAX_DEPTH);

    setenv("SHAPEBUF_MAX_DEPTH", "0", 1);
    EXPECT_EQ(CaptureOptions::from_env().max_depth, CaptureOptions::DEFAULT_MAX_DEPTH);

    setenv("SHAPEBUF_MAX_DEPTH", "12abc", 1);
    EXPECT_EQ(CaptureOptions::from_env().max_depth, CaptureOptions::DEFAULT_MAX_DEPTH);
}

TEST_F(CaptureOptionsEnvTest, BorrowOverride) {
    setenv("SHAPEBUF_BORROW", "copy", 1);
    EXPECT_EQ(CaptureOptions::from_env().borrow, BorrowPolicy::Copy);
}

TEST_F(CaptureOptionsEnvTest, InvalidBorrowIgnored) {
    setenv("SHAPEBUF_BORROW", "sometimes", 1);
    EXPECT_EQ(CaptureOptions::from_env().borrow, BorrowPolicy::PreferBorrow);
}

TEST_F(CaptureOptionsEnvTest, ApplyEnvKeepsUnsetFields) {
    setenv("SHAPEBUF_BORROW", "copy", 1);

    CaptureOptions options;
    options.max_depth = 4;
    options.apply_env();
    EXPECT_EQ(options.max_depth, 4u);
    EXPECT_EQ(options.borrow, BorrowPolicy::Copy);
}
