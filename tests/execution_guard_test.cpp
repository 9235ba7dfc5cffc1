#include <gtest/gtest.h>

#include "scheduler/execution_guard.hpp"

using cronkit::scheduler::ExecutionGuard;
using cronkit::scheduler::ScopedExecution;

TEST(ExecutionGuardTest, ConcurrentGuardAlwaysAdmits) {
    ExecutionGuard guard(true);
    EXPECT_TRUE(guard.TryAcquire());
    EXPECT_TRUE(guard.TryAcquire());
    EXPECT_EQ(guard.InFlight(), 2);
    EXPECT_FALSE(guard.Busy());
    guard.Release();
    guard.Release();
    EXPECT_EQ(guard.InFlight(), 0);
}

TEST(ExecutionGuardTest, NonConcurrentGuardRejectsOverlap) {
    ExecutionGuard guard(false);
    ASSERT_TRUE(guard.TryAcquire());
    EXPECT_TRUE(guard.Busy());
    EXPECT_FALSE(guard.TryAcquire());
    EXPECT_EQ(guard.InFlight(), 1);
    guard.Release();
    EXPECT_FALSE(guard.Busy());
    EXPECT_TRUE(guard.TryAcquire());
    guard.Release();
}

TEST(ExecutionGuardTest, ScopedExecutionReleasesOnExit) {
    ExecutionGuard guard(false);
    ASSERT_TRUE(guard.TryAcquire());
    {
        ScopedExecution execution(guard);
        EXPECT_FALSE(guard.TryAcquire());
    }
    EXPECT_FALSE(guard.Busy());
    EXPECT_EQ(guard.InFlight(), 0);
}
