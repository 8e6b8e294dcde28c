// tests/test_layer1_base/test_scope_guard.cpp
/**
 * @file test_scope_guard.cpp
 * @brief Unit tests for blkpipe::basics::ScopeGuard.
 */
#include "bp_base.hpp"
#include "shared_test_helpers.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

using blkpipe::basics::make_scope_guard;
using blkpipe::basics::ScopeGuard;
using namespace blkpipe::tests::helper;
using namespace ::testing;

TEST(ScopeGuardTest, ExecutesOnScopeExit)
{
    bool executed = false;
    {
        auto guard = make_scope_guard([&]() { executed = true; });
        ASSERT_FALSE(executed);
        ASSERT_TRUE(static_cast<bool>(guard));
    }
    ASSERT_TRUE(executed);
}

TEST(ScopeGuardTest, ExecutesWithLvalueLambda)
{
    bool executed = false;
    auto my_lambda = [&]() { executed = true; };
    {
        auto guard = make_scope_guard(my_lambda);
    }
    ASSERT_TRUE(executed);
}

TEST(ScopeGuardTest, Dismiss)
{
    bool executed = false;
    {
        auto guard = make_scope_guard([&]() { executed = true; });
        guard.dismiss();
        guard.dismiss();
        ASSERT_FALSE(static_cast<bool>(guard));
    }
    ASSERT_FALSE(executed);
}

// invoke() runs the action once, immediately; the destructor then does nothing.
TEST(ScopeGuardTest, InvokeRunsOnce)
{
    int count = 0;
    {
        auto guard = make_scope_guard([&]() { ++count; });
        guard.invoke();
        ASSERT_EQ(count, 1);
        guard.invoke();
    }
    ASSERT_EQ(count, 1);
}

TEST(ScopeGuardTest, MoveTransfersOwnership)
{
    int count = 0;
    {
        auto first = make_scope_guard([&]() { ++count; });
        {
            auto second = std::move(first);
            ASSERT_FALSE(static_cast<bool>(first));
        }
        ASSERT_EQ(count, 1);
    }
    ASSERT_EQ(count, 1);
}

TEST(ScopeGuardTest, RunsDuringExceptionUnwinding)
{
    bool executed = false;
    try
    {
        auto guard = make_scope_guard([&]() { executed = true; });
        throw std::runtime_error("unwind");
    }
    catch (const std::runtime_error &)
    {
    }
    ASSERT_TRUE(executed);
}

TEST(ScopeGuardTest, ThrowingActionIsReportedNotPropagated)
{
    StringCapture capture(STDERR_FILENO);
    {
        auto guard = make_scope_guard([]() { throw std::runtime_error("cleanup failed"); });
    }
    EXPECT_THAT(capture.GetOutput(), HasSubstr("[ScopeGuard] cleanup action threw: cleanup failed"));
}
