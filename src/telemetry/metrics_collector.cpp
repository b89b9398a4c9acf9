/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include <algorithm>
#include <sstream>

namespace adaptive_pool {

const UnitMetrics* MetricsSnapshot::find_unit(UnitId id) const noexcept {
    auto it = std::find_if(per_unit.begin(), per_unit.end(),
                           [id](const UnitMetrics& u) { return u.id == id; });
    return it == per_unit.end() ? nullptr : &*it;
}

std::string to_json(const MetricsSnapshot& s) {
    std::ostringstream oss;
    oss << R"({"state":")" << to_string(s.state) << "\""
        << R"(,"fatal":)" << (s.fatal ? "true" : "false")
        << R"(,"units":)" << s.current_units
        << R"(,"idle":)" << s.idle_units
        << R"(,"busy":)" << s.busy_units
        << R"(,"queue_depth":)" << s.queue_depth
        << R"(,"tasks_submitted":)" << s.tasks_submitted
        << R"(,"tasks_processed":)" << s.tasks_processed
        << R"(,"tasks_failed":)" << s.tasks_failed
        << R"(,"tasks_cancelled":)" << s.tasks_cancelled
        << R"(,"tasks_timed_out":)" << s.tasks_timed_out
        << R"(,"tasks_rejected":)" << s.tasks_rejected
        << R"(,"tasks_requeued":)" << s.tasks_requeued
        << R"(,"tasks_shutdown":)" << s.tasks_shutdown
        << R"(,"unit_crashes":)" << s.unit_crashes
        << R"(,"unit_restarts":)" << s.unit_restarts
        << R"(,"fatal_events":)" << s.fatal_events
        << R"(,"scale_up_events":)" << s.scale_up_events
        << R"(,"scale_down_events":)" << s.scale_down_events
        << R"(,"peak_units":)" << s.peak_units
        << R"(,"peak_queue_depth":)" << s.peak_queue_depth
        << R"(,"avg_processing_us":)" << s.average_processing_time().count()
        << R"(,"per_unit":[)";

    for (size_t i = 0; i < s.per_unit.size(); ++i) {
        const auto& u = s.per_unit[i];
        if (i > 0) oss << ',';
        oss << R"({"id":)" << u.id
            << R"(,"slot":)" << u.slot
            << R"(,"status":")" << to_string(u.status) << "\""
            << R"(,"tasks_completed":)" << u.tasks_completed
            << R"(,"tasks_failed":)" << u.tasks_failed
            << R"(,"restarts":)" << u.restarts
            << R"(,"uptime_us":)" << u.uptime.count();
        if (u.current_task) {
            oss << R"(,"current_task":)" << *u.current_task;
        }
        oss << '}';
    }
    oss << "]}";
    return oss.str();
}

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

// ── Task events ──────────────────────────────

void MetricsCollector::record_submitted(TaskId /*task*/) {
    std::lock_guard lock(mutex_);
    ++counters_.tasks_submitted;
}

void MetricsCollector::record_rejected(TaskId task, ErrorKind reason) {
    {
        std::lock_guard lock(mutex_);
        ++counters_.tasks_rejected;
    }
    std::ostringstream oss;
    oss << R"({"event":"task_rejected")"
        << R"(,"task":)" << task
        << R"(,"reason":")" << to_string(reason) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_completed(TaskId task, UnitId unit, Duration duration) {
    {
        std::lock_guard lock(mutex_);
        ++counters_.tasks_processed;
        counters_.total_processing_time += duration;
    }
    record_task_settled(task, "completed", unit, duration);
}

void MetricsCollector::record_failed(TaskId task, UnitId unit, Duration duration) {
    {
        std::lock_guard lock(mutex_);
        ++counters_.tasks_failed;
    }
    record_task_settled(task, "failed", unit, duration);
}

void MetricsCollector::record_cancelled(TaskId task) {
    {
        std::lock_guard lock(mutex_);
        ++counters_.tasks_cancelled;
    }
    record_task_settled(task, "cancelled", std::nullopt, Duration{0});
}

void MetricsCollector::record_timed_out(TaskId task, UnitId unit) {
    {
        std::lock_guard lock(mutex_);
        ++counters_.tasks_timed_out;
    }
    record_task_settled(task, "timed_out", unit, Duration{0});
}

void MetricsCollector::record_requeued(TaskId task, UnitId crashed_unit) {
    {
        std::lock_guard lock(mutex_);
        ++counters_.tasks_requeued;
    }
    std::ostringstream oss;
    oss << R"({"event":"task_requeued")"
        << R"(,"task":)" << task
        << R"(,"crashed_unit":)" << crashed_unit
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_shutdown(TaskId task) {
    {
        std::lock_guard lock(mutex_);
        ++counters_.tasks_shutdown;
    }
    record_task_settled(task, "shutdown", std::nullopt, Duration{0});
}

void MetricsCollector::record_task_settled(TaskId task, std::string_view outcome,
                                           std::optional<UnitId> unit, Duration duration) {
    std::ostringstream oss;
    oss << R"({"event":"task_settled")"
        << R"(,"task":)" << task
        << R"(,"outcome":")" << outcome << "\"";
    if (unit) oss << R"(,"unit":)" << *unit;
    oss << R"(,"duration_us":)" << duration.count()
        << "}";
    emit(oss.str());
}

// ── Unit / pool events ───────────────────────

void MetricsCollector::record_unit_spawned(UnitId unit, SlotId slot, std::string_view reason) {
    std::ostringstream oss;
    oss << R"({"event":"unit_spawned")"
        << R"(,"unit":)" << unit
        << R"(,"slot":)" << slot
        << R"(,"reason":")" << reason << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_unit_exited(UnitId unit, int exit_code, bool voluntary) {
    std::ostringstream oss;
    oss << R"({"event":"unit_exited")"
        << R"(,"unit":)" << unit
        << R"(,"code":)" << exit_code
        << R"(,"voluntary":)" << (voluntary ? "true" : "false")
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_scale_up(size_t units) {
    {
        std::lock_guard lock(mutex_);
        ++counters_.scale_up_events;
        counters_.peak_units = std::max(counters_.peak_units, units);
    }
    std::ostringstream oss;
    oss << R"({"event":"scale_up","units":)" << units << "}";
    emit(oss.str());
}

void MetricsCollector::record_scale_down(size_t units) {
    {
        std::lock_guard lock(mutex_);
        ++counters_.scale_down_events;
    }
    std::ostringstream oss;
    oss << R"({"event":"scale_down","units":)" << units << "}";
    emit(oss.str());
}

void MetricsCollector::record_crash(UnitId unit, SlotId slot, int exit_code) {
    {
        std::lock_guard lock(mutex_);
        ++counters_.unit_crashes;
    }
    std::ostringstream oss;
    oss << R"({"event":"unit_crash")"
        << R"(,"unit":)" << unit
        << R"(,"slot":)" << slot
        << R"(,"code":)" << exit_code
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_restart(SlotId slot, uint32_t restarts) {
    {
        std::lock_guard lock(mutex_);
        ++counters_.unit_restarts;
    }
    std::ostringstream oss;
    oss << R"({"event":"unit_restart")"
        << R"(,"slot":)" << slot
        << R"(,"restarts":)" << restarts
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_fatal(SlotId slot, uint32_t restarts) {
    {
        std::lock_guard lock(mutex_);
        ++counters_.fatal_events;
    }
    std::ostringstream oss;
    oss << R"({"event":"pool_fatal")"
        << R"(,"slot":)" << slot
        << R"(,"restarts":)" << restarts
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_terminated() {
    PoolCounters c = counters();
    std::ostringstream oss;
    oss << R"({"event":"pool_terminated")"
        << R"(,"tasks_processed":)" << c.tasks_processed
        << R"(,"tasks_failed":)" << c.tasks_failed
        << R"(,"tasks_shutdown":)" << c.tasks_shutdown
        << R"(,"unit_crashes":)" << c.unit_crashes
        << "}";
    emit(oss.str());
}

// ── Gauges ───────────────────────────────────

void MetricsCollector::observe_units(size_t units) {
    std::lock_guard lock(mutex_);
    counters_.peak_units = std::max(counters_.peak_units, units);
}

void MetricsCollector::observe_queue_depth(size_t depth) {
    std::lock_guard lock(mutex_);
    counters_.peak_queue_depth = std::max(counters_.peak_queue_depth, depth);
}

PoolCounters MetricsCollector::counters() const {
    std::lock_guard lock(mutex_);
    return counters_;
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(mutex_);
    if (sink_) sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(mutex_);
    if (sink_) sink_->flush();
}

}  // namespace adaptive_pool
