/**
 * @file test_scaling_controller.cpp
 * @brief Unit tests for the scaling decision rules and cooldown.
 * @author Dimitris Kafetzis
 */

#include "pool/scaling_controller.hpp"

#include <gtest/gtest.h>
#include <chrono>

using namespace adaptive_pool;
using namespace std::chrono_literals;

class ScalingControllerTest : public ::testing::Test {
protected:
    ScalingConfig config_{
        .scale_up_threshold = 10,
        .scale_down_threshold = 0,
        .cool_down_ms = 1000,
        .check_interval_ms = 100
    };
    ScalingController scaler_{config_, 2, 8};
    SteadyTime t0_ = std::chrono::steady_clock::now();
};

TEST_F(ScalingControllerTest, NoActionBeforeFirstCooldown) {
    scaler_.mark_initialized(t0_);
    LoadSample backlog{.units = 2, .idle = 0, .queue_depth = 50};

    EXPECT_EQ(scaler_.evaluate(backlog, t0_ + 999ms), ScaleAction::None);
    EXPECT_EQ(scaler_.evaluate(backlog, t0_ + 1000ms), ScaleAction::ScaleUp);
}

TEST_F(ScalingControllerTest, ScaleUpOnBacklogAboveThreshold) {
    scaler_.mark_initialized(t0_);
    LoadSample sample{.units = 2, .idle = 1, .queue_depth = 11};
    EXPECT_EQ(scaler_.evaluate(sample, t0_ + 2s), ScaleAction::ScaleUp);
}

TEST_F(ScalingControllerTest, ScaleUpWhenSaturated) {
    scaler_.mark_initialized(t0_);
    // Below the threshold, but nobody is free to take the queued work.
    LoadSample sample{.units = 2, .idle = 0, .queue_depth = 3};
    EXPECT_EQ(scaler_.evaluate(sample, t0_ + 2s), ScaleAction::ScaleUp);
}

TEST_F(ScalingControllerTest, NoScaleUpAtMaxUnits) {
    scaler_.mark_initialized(t0_);
    LoadSample sample{.units = 8, .idle = 0, .queue_depth = 100};
    EXPECT_EQ(scaler_.evaluate(sample, t0_ + 2s), ScaleAction::None);
}

TEST_F(ScalingControllerTest, NoActionWhileQueueBelowThresholdWithIdleUnits) {
    scaler_.mark_initialized(t0_);
    LoadSample sample{.units = 2, .idle = 1, .queue_depth = 5};
    EXPECT_EQ(scaler_.evaluate(sample, t0_ + 2s), ScaleAction::None);
}

TEST_F(ScalingControllerTest, ScaleDownWhenIdleAboveThreshold) {
    scaler_.mark_initialized(t0_);
    LoadSample sample{.units = 4, .idle = 2, .queue_depth = 0};
    EXPECT_EQ(scaler_.evaluate(sample, t0_ + 2s), ScaleAction::ScaleDown);
}

TEST_F(ScalingControllerTest, NoScaleDownAtMinUnits) {
    scaler_.mark_initialized(t0_);
    LoadSample sample{.units = 2, .idle = 2, .queue_depth = 0};
    EXPECT_EQ(scaler_.evaluate(sample, t0_ + 2s), ScaleAction::None);
}

TEST_F(ScalingControllerTest, NoScaleDownWithQueuedWork) {
    scaler_.mark_initialized(t0_);
    LoadSample sample{.units = 4, .idle = 2, .queue_depth = 1};
    EXPECT_EQ(scaler_.evaluate(sample, t0_ + 2s), ScaleAction::None);
}

TEST_F(ScalingControllerTest, ScaleDownRespectsIdleThreshold) {
    ScalingConfig tolerant = config_;
    tolerant.scale_down_threshold = 2;
    ScalingController scaler(tolerant, 2, 8);
    scaler.mark_initialized(t0_);

    EXPECT_EQ(scaler.evaluate({.units = 5, .idle = 2, .queue_depth = 0}, t0_ + 2s),
              ScaleAction::None);
    EXPECT_EQ(scaler.evaluate({.units = 5, .idle = 3, .queue_depth = 0}, t0_ + 2s),
              ScaleAction::ScaleDown);
}

TEST_F(ScalingControllerTest, CooldownIsGlobalAcrossDirections) {
    scaler_.mark_initialized(t0_);
    auto t1 = t0_ + 2s;
    ASSERT_EQ(scaler_.evaluate({.units = 2, .idle = 0, .queue_depth = 20}, t1),
              ScaleAction::ScaleUp);
    scaler_.record_action(t1);

    // An immediate opposite decision is held back by the same cooldown.
    LoadSample quiet{.units = 3, .idle = 3, .queue_depth = 0};
    EXPECT_EQ(scaler_.evaluate(quiet, t1 + 500ms), ScaleAction::None);
    EXPECT_EQ(scaler_.evaluate(quiet, t1 + 1000ms), ScaleAction::ScaleDown);
}

TEST_F(ScalingControllerTest, SaturatedPoolAboveMinStillGrows) {
    scaler_.mark_initialized(t0_);
    LoadSample sample{.units = 4, .idle = 0, .queue_depth = 1};
    EXPECT_EQ(scaler_.evaluate(sample, t0_ + 2s), ScaleAction::ScaleUp);
}

TEST_F(ScalingControllerTest, UninitializedControllerHasNoCooldown) {
    EXPECT_FALSE(scaler_.last_action_at().has_value());
    EXPECT_TRUE(scaler_.cooldown_elapsed(t0_));
}

TEST(ScaleActionTest, ToString) {
    EXPECT_EQ(to_string(ScaleAction::None), "none");
    EXPECT_EQ(to_string(ScaleAction::ScaleUp), "scale_up");
    EXPECT_EQ(to_string(ScaleAction::ScaleDown), "scale_down");
}
