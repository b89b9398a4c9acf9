/**
 * @file test_metrics_collector.cpp
 * @brief Unit tests for MetricsCollector and snapshot rendering.
 */

#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace adaptive_pool;

namespace {

class SharedSink : public ILogSink {
public:
    explicit SharedSink(std::vector<std::string>& lines) : lines_(lines) {}
    void write(std::string_view json_line) override { lines_.emplace_back(json_line); }
    void flush() override {}

private:
    std::vector<std::string>& lines_;
};

bool contains(const std::vector<std::string>& lines, std::string_view needle) {
    for (const auto& line : lines) {
        if (line.find(needle) != std::string::npos) return true;
    }
    return false;
}

}  // namespace

class MetricsCollectorTest : public ::testing::Test {
protected:
    std::vector<std::string> lines_;
    MetricsCollector metrics_{std::make_unique<SharedSink>(lines_)};
};

TEST_F(MetricsCollectorTest, CountsTaskOutcomes) {
    metrics_.record_submitted(1);
    metrics_.record_submitted(2);
    metrics_.record_submitted(3);
    metrics_.record_completed(1, 10, Duration{3000});
    metrics_.record_completed(2, 11, Duration{1000});
    metrics_.record_failed(3, 10, Duration{500});

    auto c = metrics_.counters();
    EXPECT_EQ(c.tasks_submitted, 3u);
    EXPECT_EQ(c.tasks_processed, 2u);
    EXPECT_EQ(c.tasks_failed, 1u);
    EXPECT_EQ(c.total_processing_time, Duration{4000});
    EXPECT_TRUE(contains(lines_, R"("outcome":"completed")"));
    EXPECT_TRUE(contains(lines_, R"("outcome":"failed")"));
}

TEST_F(MetricsCollectorTest, CountsRejectionsByKind) {
    metrics_.record_rejected(1, ErrorKind::QueueFull);
    metrics_.record_cancelled(2);
    metrics_.record_timed_out(3, 7);
    metrics_.record_shutdown(4);
    metrics_.record_requeued(5, 7);

    auto c = metrics_.counters();
    EXPECT_EQ(c.tasks_rejected, 1u);
    EXPECT_EQ(c.tasks_cancelled, 1u);
    EXPECT_EQ(c.tasks_timed_out, 1u);
    EXPECT_EQ(c.tasks_shutdown, 1u);
    EXPECT_EQ(c.tasks_requeued, 1u);
    EXPECT_TRUE(contains(lines_, R"("reason":"queue_full")"));
    EXPECT_TRUE(contains(lines_, R"("event":"task_requeued")"));
}

TEST_F(MetricsCollectorTest, ScaleEventsTrackPeakUnits) {
    metrics_.observe_units(2);
    metrics_.record_scale_up(3);
    metrics_.record_scale_up(4);
    metrics_.record_scale_down(3);

    auto c = metrics_.counters();
    EXPECT_EQ(c.scale_up_events, 2u);
    EXPECT_EQ(c.scale_down_events, 1u);
    EXPECT_EQ(c.peak_units, 4u);
    EXPECT_TRUE(contains(lines_, R"({"event":"scale_up","units":4})"));
}

TEST_F(MetricsCollectorTest, PeakQueueDepthIsHighWaterMark) {
    metrics_.observe_queue_depth(3);
    metrics_.observe_queue_depth(9);
    metrics_.observe_queue_depth(1);
    EXPECT_EQ(metrics_.counters().peak_queue_depth, 9u);
}

TEST_F(MetricsCollectorTest, RecoveryEvents) {
    metrics_.record_crash(5, 2, 137);
    metrics_.record_restart(2, 1);
    metrics_.record_fatal(2, 3);

    auto c = metrics_.counters();
    EXPECT_EQ(c.unit_crashes, 1u);
    EXPECT_EQ(c.unit_restarts, 1u);
    EXPECT_EQ(c.fatal_events, 1u);
    EXPECT_TRUE(contains(lines_, R"("event":"unit_crash")"));
    EXPECT_TRUE(contains(lines_, R"("event":"pool_fatal")"));
}

TEST_F(MetricsCollectorTest, UnitLifecycleEvents) {
    metrics_.record_unit_spawned(1, 1, "initial");
    metrics_.record_unit_exited(1, 0, true);
    metrics_.record_terminated();

    EXPECT_TRUE(contains(lines_, R"("reason":"initial")"));
    EXPECT_TRUE(contains(lines_, R"("voluntary":true)"));
    EXPECT_TRUE(contains(lines_, R"("event":"pool_terminated")"));
}

TEST(MetricsSnapshotTest, AverageProcessingTime) {
    MetricsSnapshot snapshot;
    EXPECT_EQ(snapshot.average_processing_time(), Duration{0});

    snapshot.tasks_processed = 4;
    snapshot.total_processing_time = Duration{2000};
    EXPECT_EQ(snapshot.average_processing_time(), Duration{500});
}

TEST(MetricsSnapshotTest, FindUnit) {
    MetricsSnapshot snapshot;
    snapshot.per_unit.push_back(UnitMetrics{.id = 3, .slot = 1});
    snapshot.per_unit.push_back(UnitMetrics{.id = 8, .slot = 2, .restarts = 1});

    ASSERT_NE(snapshot.find_unit(8), nullptr);
    EXPECT_EQ(snapshot.find_unit(8)->restarts, 1u);
    EXPECT_EQ(snapshot.find_unit(42), nullptr);
}

TEST(MetricsSnapshotTest, JsonRendering) {
    MetricsSnapshot snapshot;
    snapshot.state = PoolState::Running;
    snapshot.current_units = 2;
    snapshot.tasks_processed = 5;
    snapshot.per_unit.push_back(UnitMetrics{.id = 1, .slot = 1, .status = UnitStatus::Busy,
                                            .current_task = TaskId{17}});

    auto json = to_json(snapshot);
    EXPECT_NE(json.find(R"("state":"running")"), std::string::npos);
    EXPECT_NE(json.find(R"("units":2)"), std::string::npos);
    EXPECT_NE(json.find(R"("tasks_processed":5)"), std::string::npos);
    EXPECT_NE(json.find(R"("status":"busy")"), std::string::npos);
    EXPECT_NE(json.find(R"("current_task":17)"), std::string::npos);
}
