// SPDX-License-Identifier: Apache-2.0
// Part of the VpnCtl (VCTL) project.
// tests/test_context.cpp

#include <gtest/gtest.h>
#include <chrono>
#include <thread>

#include "vctl/context.hpp"
#include "vctl/error.hpp"

namespace {

using namespace std::chrono_literals;

TEST(ContextTest, BackgroundIsUnbounded) {
    const auto ctx = vctl::Context::background();
    EXPECT_FALSE(ctx.cancelled());
    EXPECT_FALSE(ctx.expired());
    EXPECT_FALSE(ctx.err());
    EXPECT_EQ(ctx.remaining_ms(), -1);
    EXPECT_FALSE(ctx.deadline().has_value());
}

TEST(ContextTest, CancelReachesChildrenNotParents) {
    const auto root = vctl::Context::background();
    const auto child = root.with_cancel();
    const auto grandchild = child.with_timeout(10s);

    child.cancel();
    EXPECT_FALSE(root.cancelled());
    EXPECT_TRUE(child.cancelled());
    EXPECT_TRUE(grandchild.cancelled());
    EXPECT_EQ(grandchild.err(), vctl::errc::cancelled);

    const auto sibling = root.with_cancel();
    EXPECT_FALSE(sibling.cancelled());

    root.cancel();
    EXPECT_TRUE(sibling.cancelled());
}

TEST(ContextTest, CopiesShareCancellation) {
    const auto ctx = vctl::Context::background().with_cancel();
    const vctl::Context copy = ctx;
    copy.cancel();
    EXPECT_TRUE(ctx.cancelled());
}

TEST(ContextTest, NestedDeadlineIsEarliest) {
    const auto root = vctl::Context::background();
    const auto outer = root.with_timeout(200ms);
    const auto inner = outer.with_timeout(10s);

    ASSERT_TRUE(outer.deadline().has_value());
    ASSERT_TRUE(inner.deadline().has_value());
    EXPECT_EQ(*inner.deadline(), *outer.deadline());
    EXPECT_LE(inner.remaining_ms(), 200);

    const auto tighter = outer.with_timeout(1ms);
    EXPECT_LT(*tighter.deadline(), *outer.deadline());
}

TEST(ContextTest, ExpiresAfterDeadline) {
    const auto ctx = vctl::Context::background().with_timeout(20ms);
    EXPECT_FALSE(ctx.expired());
    std::this_thread::sleep_for(40ms);
    EXPECT_TRUE(ctx.expired());
    EXPECT_EQ(ctx.err(), vctl::errc::timed_out);
    EXPECT_EQ(ctx.remaining_ms(), 0);
}

TEST(ContextTest, CancellationWinsOverDeadline) {
    const auto ctx = vctl::Context::background().with_timeout(1ms);
    std::this_thread::sleep_for(5ms);
    ctx.cancel();
    EXPECT_EQ(ctx.err(), vctl::errc::cancelled);
}

} // namespace
