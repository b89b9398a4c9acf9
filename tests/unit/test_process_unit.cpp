/**
 * @file test_process_unit.cpp
 * @brief Unit tests for the fork-backed execution unit.
 * @author Dimitris Kafetzis
 */

#include "executor/process_unit.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace adaptive_pool;
using namespace std::chrono_literals;

namespace {

class EventRecorder {
public:
    UnitEventSink sink() {
        return [this](UnitEvent event) {
            std::lock_guard lock(mutex_);
            events_.push_back(std::move(event));
            cv_.notify_all();
        };
    }

    bool wait_for_count(size_t count, std::chrono::milliseconds timeout = 5000ms) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return events_.size() >= count; });
    }

    std::vector<UnitEvent> events() {
        std::lock_guard lock(mutex_);
        return events_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<UnitEvent> events_;
};

constexpr size_t kOversized = 17 * 1024 * 1024;

/// "fail" → handler error, "crash" → process dies, "sleep" → 2s,
/// "big" → output larger than a frame, else echo.
Result<Output> scripted(const Payload& payload, std::stop_token) {
    if (payload == "fail") return Error{"scripted failure", ErrorKind::Task};
    if (payload == "big") return Output(kOversized, 'x');
    if (payload == "crash") std::abort();
    if (payload == "sleep") std::this_thread::sleep_for(2s);
    return Output{"child:" + payload};
}

std::unique_ptr<ProcessUnit> spawn_unit(UnitId id, EventRecorder& recorder) {
    auto unit = ProcessUnit::spawn(id, scripted, recorder.sink());
    EXPECT_TRUE(unit.has_value());
    return unit ? std::move(unit).value() : nullptr;
}

}  // namespace

TEST(ProcessUnitTest, SpawnsChildProcess) {
    EventRecorder recorder;
    auto unit = spawn_unit(1, recorder);
    ASSERT_NE(unit, nullptr);

    EXPECT_GT(unit->pid(), 0);
    EXPECT_EQ(::kill(unit->pid(), 0), 0);
    EXPECT_TRUE(unit->alive());
}

TEST(ProcessUnitTest, ReturnsResultAcrossBoundary) {
    EventRecorder recorder;
    auto unit = spawn_unit(2, recorder);
    ASSERT_NE(unit, nullptr);

    ASSERT_TRUE(unit->assign(11, "ping").has_value());
    ASSERT_TRUE(recorder.wait_for_count(1));

    auto events = recorder.events();
    const auto* result = std::get_if<UnitResult>(&events[0]);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->unit, 2u);
    EXPECT_EQ(result->task, 11u);
    EXPECT_EQ(result->output, "child:ping");

    // The unit accepts another task afterwards
    ASSERT_TRUE(unit->assign(12, "pong").has_value());
    ASSERT_TRUE(recorder.wait_for_count(2));
}

TEST(ProcessUnitTest, HandlerErrorBecomesFailure) {
    EventRecorder recorder;
    auto unit = spawn_unit(3, recorder);
    ASSERT_NE(unit, nullptr);

    ASSERT_TRUE(unit->assign(1, "fail").has_value());
    ASSERT_TRUE(recorder.wait_for_count(1));

    auto events = recorder.events();
    const auto* failure = std::get_if<UnitFailure>(&events[0]);
    ASSERT_NE(failure, nullptr);
    EXPECT_EQ(failure->message, "scripted failure");
    EXPECT_TRUE(unit->alive());
}

TEST(ProcessUnitTest, ChildCrashReportsSignalExit) {
    EventRecorder recorder;
    auto unit = spawn_unit(4, recorder);
    ASSERT_NE(unit, nullptr);

    ASSERT_TRUE(unit->assign(1, "crash").has_value());
    ASSERT_TRUE(recorder.wait_for_count(1));

    auto events = recorder.events();
    ASSERT_EQ(events.size(), 1u);
    const auto* exit = std::get_if<UnitExit>(&events[0]);
    ASSERT_NE(exit, nullptr);
    EXPECT_EQ(exit->exit_code, 128 + SIGABRT);
    EXPECT_FALSE(unit->alive());
}

TEST(ProcessUnitTest, KillDuringTaskReportsKilledExit) {
    EventRecorder recorder;
    auto unit = spawn_unit(5, recorder);
    ASSERT_NE(unit, nullptr);

    ASSERT_TRUE(unit->assign(1, "sleep").has_value());
    std::this_thread::sleep_for(50ms);
    unit->kill();

    ASSERT_TRUE(recorder.wait_for_count(1));
    auto events = recorder.events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(std::get<UnitExit>(events[0]).exit_code, kKilledExit);
}

TEST(ProcessUnitTest, ExternalSigkillIsObserved) {
    EventRecorder recorder;
    auto unit = spawn_unit(6, recorder);
    ASSERT_NE(unit, nullptr);

    ::kill(unit->pid(), SIGKILL);
    ASSERT_TRUE(recorder.wait_for_count(1));
    EXPECT_EQ(std::get<UnitExit>(recorder.events()[0]).exit_code, 128 + SIGKILL);
}

TEST(ProcessUnitTest, RequestStopExitsClean) {
    EventRecorder recorder;
    auto unit = spawn_unit(7, recorder);
    ASSERT_NE(unit, nullptr);

    unit->request_stop();
    ASSERT_TRUE(recorder.wait_for_count(1));
    EXPECT_EQ(std::get<UnitExit>(recorder.events()[0]).exit_code, kCleanExit);

    auto late = unit->assign(1, "x");
    EXPECT_FALSE(late.has_value());
}

TEST(ProcessUnitTest, RejectsSecondAssignWhileBusy) {
    EventRecorder recorder;
    auto unit = spawn_unit(8, recorder);
    ASSERT_NE(unit, nullptr);

    ASSERT_TRUE(unit->assign(1, "sleep").has_value());
    auto second = unit->assign(2, "x");
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().kind, ErrorKind::UnitBusy);
    unit->kill();
}

TEST(ProcessUnitTest, OversizedPayloadIsRefusedWithoutHarm) {
    EventRecorder recorder;
    auto unit = spawn_unit(9, recorder);
    ASSERT_NE(unit, nullptr);

    auto refused = unit->assign(1, Payload(kOversized, 'p'));
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error().kind, ErrorKind::Protocol);

    // Nothing was sent, so the unit is still free for the next task.
    ASSERT_TRUE(unit->assign(2, "after").has_value());
    ASSERT_TRUE(recorder.wait_for_count(1));
    auto events = recorder.events();
    const auto* result = std::get_if<UnitResult>(&events[0]);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->output, "child:after");
}

TEST(ProcessUnitTest, OversizedOutputBecomesFailure) {
    EventRecorder recorder;
    auto unit = spawn_unit(10, recorder);
    ASSERT_NE(unit, nullptr);

    ASSERT_TRUE(unit->assign(1, "big").has_value());
    ASSERT_TRUE(recorder.wait_for_count(1));

    auto events = recorder.events();
    const auto* failure = std::get_if<UnitFailure>(&events[0]);
    ASSERT_NE(failure, nullptr);
    EXPECT_NE(failure->message.find("exceeds maximum frame size"), std::string::npos);
    EXPECT_TRUE(unit->alive());
}
