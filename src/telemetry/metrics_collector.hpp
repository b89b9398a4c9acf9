/**
 * @file metrics_collector.hpp
 * @brief Pool counters, peak tracking, and structured telemetry events.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace adaptive_pool {

/**
 * @brief Monotonic pool-wide counters and high-water marks.
 */
struct PoolCounters {
    uint64_t tasks_submitted = 0;
    uint64_t tasks_processed = 0;     ///< Resolved with an Output
    uint64_t tasks_failed = 0;        ///< Rejected with TaskError
    uint64_t tasks_cancelled = 0;
    uint64_t tasks_timed_out = 0;
    uint64_t tasks_rejected = 0;      ///< Refused at admission (fatal, queue full)
    uint64_t tasks_requeued = 0;      ///< Crash requeues
    uint64_t tasks_shutdown = 0;      ///< Rejected with ShutdownError

    uint64_t unit_crashes = 0;
    uint64_t unit_restarts = 0;
    uint64_t fatal_events = 0;
    uint64_t scale_up_events = 0;
    uint64_t scale_down_events = 0;

    size_t peak_units = 0;
    size_t peak_queue_depth = 0;

    Duration total_processing_time{0};
};

struct UnitMetrics {
    UnitId id = 0;
    SlotId slot = 0;
    UnitStatus status = UnitStatus::Idle;
    uint64_t tasks_completed = 0;
    uint64_t tasks_failed = 0;
    uint32_t restarts = 0;            ///< Restarts of this unit's slot so far
    Duration uptime{0};
    std::optional<TaskId> current_task;
};

/**
 * @brief Read-only copy of the pool's observable state.
 */
struct MetricsSnapshot : PoolCounters {
    PoolState state = PoolState::Initializing;
    bool fatal = false;

    size_t current_units = 0;
    size_t idle_units = 0;
    size_t busy_units = 0;
    size_t queue_depth = 0;

    std::vector<UnitMetrics> per_unit;

    [[nodiscard]] Duration average_processing_time() const noexcept {
        if (tasks_processed == 0) return Duration{0};
        return Duration{total_processing_time.count()
                        / static_cast<Duration::rep>(tasks_processed)};
    }

    [[nodiscard]] const UnitMetrics* find_unit(UnitId id) const noexcept;
};

/**
 * @brief Render a snapshot as a single JSON object.
 */
std::string to_json(const MetricsSnapshot& snapshot);

/**
 * @brief Maintains PoolCounters and logs every lifecycle event as NDJSON.
 *
 * Thread-safe. In the pool every call originates on the dispatcher thread;
 * counters() may be read from anywhere.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    // ── Task events ──────────────────────────
    void record_submitted(TaskId task);
    void record_rejected(TaskId task, ErrorKind reason);
    void record_completed(TaskId task, UnitId unit, Duration duration);
    void record_failed(TaskId task, UnitId unit, Duration duration);
    void record_cancelled(TaskId task);
    void record_timed_out(TaskId task, UnitId unit);
    void record_requeued(TaskId task, UnitId crashed_unit);
    void record_shutdown(TaskId task);

    // ── Unit / pool events ───────────────────
    void record_unit_spawned(UnitId unit, SlotId slot, std::string_view reason);
    void record_unit_exited(UnitId unit, int exit_code, bool voluntary);
    void record_scale_up(size_t units);
    void record_scale_down(size_t units);
    void record_crash(UnitId unit, SlotId slot, int exit_code);
    void record_restart(SlotId slot, uint32_t restarts);
    void record_fatal(SlotId slot, uint32_t restarts);
    void record_terminated();

    // ── Gauges ───────────────────────────────
    void observe_units(size_t units);
    void observe_queue_depth(size_t depth);

    [[nodiscard]] PoolCounters counters() const;

    void flush();

private:
    void emit(std::string_view json_line);
    void record_task_settled(TaskId task, std::string_view outcome,
                             std::optional<UnitId> unit, Duration duration);

    std::unique_ptr<ILogSink> sink_;
    PoolCounters counters_;
    mutable std::mutex mutex_;
};

}  // namespace adaptive_pool
