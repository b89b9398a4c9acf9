/**
 * @file test_recovery_supervisor.cpp
 * @brief Unit tests for the per-slot restart ledger.
 */

#include "pool/recovery_supervisor.hpp"

#include <gtest/gtest.h>

using namespace adaptive_pool;

TEST(RecoverySupervisorTest, ReplacesBelowCap) {
    RecoverySupervisor supervisor(3);

    auto first = supervisor.on_crash(1);
    EXPECT_TRUE(first.replace());
    EXPECT_EQ(first.restarts, 1u);

    auto second = supervisor.on_crash(1);
    EXPECT_TRUE(second.replace());
    EXPECT_EQ(second.restarts, 2u);
    EXPECT_EQ(supervisor.restarts(1), 2u);
}

TEST(RecoverySupervisorTest, FatalAtCap) {
    RecoverySupervisor supervisor(3);
    (void)supervisor.on_crash(1);
    (void)supervisor.on_crash(1);

    auto third = supervisor.on_crash(1);
    EXPECT_FALSE(third.replace());
    EXPECT_EQ(third.action, RecoveryDecision::Action::Fatal);
    EXPECT_EQ(third.restarts, 3u);
    EXPECT_TRUE(supervisor.exhausted(1));
    EXPECT_TRUE(supervisor.any_exhausted());
}

TEST(RecoverySupervisorTest, SlotsAreIndependent) {
    RecoverySupervisor supervisor(2);
    (void)supervisor.on_crash(1);

    EXPECT_TRUE(supervisor.on_crash(2).replace());
    EXPECT_EQ(supervisor.restarts(1), 1u);
    EXPECT_EQ(supervisor.restarts(2), 1u);
    EXPECT_EQ(supervisor.restarts(3), 0u);
}

TEST(RecoverySupervisorTest, CapOfOneIsFatalOnFirstCrash) {
    RecoverySupervisor supervisor(1);
    EXPECT_FALSE(supervisor.on_crash(5).replace());
}

TEST(RecoverySupervisorTest, ResetExhaustedZeroesCounts) {
    RecoverySupervisor supervisor(2);
    (void)supervisor.on_crash(1);
    (void)supervisor.on_crash(1);   // exhausted
    (void)supervisor.on_crash(2);   // one restart, not exhausted

    auto slots = supervisor.reset_exhausted();
    ASSERT_EQ(slots.size(), 1u);
    EXPECT_EQ(slots.front(), 1u);
    EXPECT_EQ(supervisor.restarts(1), 0u);
    EXPECT_EQ(supervisor.restarts(2), 1u);
    EXPECT_FALSE(supervisor.any_exhausted());
    EXPECT_TRUE(supervisor.on_crash(1).replace());
}

TEST(RecoverySupervisorTest, ForgetDropsHistory) {
    RecoverySupervisor supervisor(3);
    (void)supervisor.on_crash(4);
    supervisor.forget(4);
    EXPECT_EQ(supervisor.restarts(4), 0u);
}
