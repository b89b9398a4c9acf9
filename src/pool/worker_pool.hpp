/**
 * @file worker_pool.hpp
 * @brief Adaptive worker pool: dispatcher, scaling, crash recovery, shutdown.
 * @author Dimitris Kafetzis
 *
 * Every mutation of pool state (units, idle list, queue, scaling clock)
 * happens on one dispatcher thread that drains a single ordered mailbox:
 *
 *   execute()/cancel()/get_metrics()/reset()/terminate()  ─┐
 *                                                          ├─> Mailbox ─> dispatcher thread
 *   unit results / failures / exits (any thread)         ─┘        │
 *                                                         scaling tick, task deadlines,
 *                                                         drain grace deadline
 *
 * Callers never touch pool state directly and units never call back into
 * it; both only enqueue events.
 */

#pragma once

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/execution_unit.hpp"
#include "pool/mailbox.hpp"
#include "pool/recovery_supervisor.hpp"
#include "pool/scaling_controller.hpp"
#include "pool/task.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <variant>
#include <vector>

namespace adaptive_pool {

using FatalCallback = std::function<void(const PoolFatalError&)>;

class WorkerPool {
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    struct Options {
        PoolConfig config;
        UnitFactory unit_factory;
        std::unique_ptr<ILogSink> log_sink;        ///< nullptr = discard
        LogLevel log_level = LogLevel::Info;
        std::unique_ptr<ILogSink> metrics_sink;    ///< NDJSON telemetry events; nullptr = discard
    };

    /**
     * @brief Validate the configuration, spawn min_units units and start dispatching.
     */
    static Result<std::unique_ptr<WorkerPool>> create(Options options);

    /// Use create(); the key keeps construction private.
    WorkerPool(ConstructionKey, Options options, PoolConfig config);

    /// Terminates (with the configured grace period) and waits.
    ~WorkerPool();

    // Non-copyable, non-movable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Submit a payload. Never blocks.
     *
     * The future yields the unit's Output or throws TaskError, ShutdownError,
     * PoolFatalError, QueueFullError, CancelledError, TimeoutError, or
     * WorkerCrashError (crash during shutdown).
     */
    TaskHandle execute(Payload payload, TaskOptions options = {});

    CancelOutcome cancel(TaskId task);

    /// Snapshot consistent with every event processed before the call.
    MetricsSnapshot get_metrics();

    /**
     * @brief Begin draining. Idempotent; every call returns the same future,
     *        ready once all units are gone.
     */
    std::shared_future<void> terminate();

    /// Clear a fatal condition and respawn up to min_units.
    Result<void> reset();

    /// Listeners run on the dispatcher thread and must not block on the pool.
    void on_fatal(FatalCallback callback);

    [[nodiscard]] PoolState state() const noexcept { return state_.load(); }
    [[nodiscard]] const PoolConfig& config() const noexcept { return config_; }

private:
    // ── Mailbox events ───────────────────────
    struct SubmitEvent { Task task; };
    struct CancelEvent { TaskId task; std::promise<CancelOutcome> reply; };
    struct MetricsRequest { std::promise<MetricsSnapshot> reply; };
    struct ResetRequest { std::promise<Result<void>> reply; };
    struct TerminateRequest {};

    using PoolEvent = std::variant<SubmitEvent, CancelEvent, MetricsRequest, ResetRequest,
                                   TerminateRequest, UnitResult, UnitFailure, UnitExit>;

    struct UnitRecord {
        std::unique_ptr<IExecutionUnit> handle;
        UnitId id = 0;
        SlotId slot = 0;
        UnitStatus status = UnitStatus::Idle;
        uint64_t tasks_completed = 0;
        uint64_t tasks_failed = 0;
        std::optional<TaskId> current_task;
        SteadyTime started_at{};
        bool voluntary_stop = false;   ///< Told to stop (scale-down, shutdown)
        bool force_killed = false;     ///< Killed when the drain grace period ran out
    };

    Result<void> start();
    void run_loop(std::stop_token stop);
    void handle(PoolEvent event);
    void post(PoolEvent event);
    [[nodiscard]] bool on_loop_thread() const noexcept;

    // ── Event handlers (dispatcher thread) ───
    void on_submit(Task task);
    CancelOutcome on_cancel(TaskId task);
    void on_unit_result(UnitResult result);
    void on_unit_failure(UnitFailure failure);
    void on_unit_exit(const UnitExit& exit);
    Result<void> on_reset();
    void begin_drain();

    // ── Dispatcher ───────────────────────────
    void dispatch();
    UnitRecord* release_unit(UnitId unit, TaskId task);

    // ── Units ────────────────────────────────
    bool spawn_unit(SlotId slot, std::string_view reason);
    void replenish();
    /// Units holding a slot: all but those retiring voluntarily. A killed
    /// unit keeps its slot until its exit arrives.
    [[nodiscard]] size_t active_units() const noexcept;
    void drop_idle(UnitId unit);
    void retire(std::unique_ptr<IExecutionUnit> handle);
    void reap_loop(std::stop_token stop);

    // ── Supervisor ───────────────────────────
    void recover(UnitRecord& unit, int exit_code);
    void enter_fatal(SlotId slot, uint32_t restarts);

    // ── Timers ───────────────────────────────
    [[nodiscard]] SteadyTime next_wakeup() const;
    void fire_timers(SteadyTime now);
    void on_tick(SteadyTime now);
    void expire_tasks(SteadyTime now);

    // ── Shutdown ─────────────────────────────
    void finish_if_drained();
    void settle_after_close(PoolEvent event);

    [[nodiscard]] MetricsSnapshot build_snapshot() const;

    PoolConfig config_;
    UnitFactory factory_;
    Logger logger_;
    MetricsCollector metrics_;
    ScalingController scaler_;
    RecoverySupervisor supervisor_;

    std::atomic<PoolState> state_{PoolState::Initializing};
    std::atomic<TaskId> next_task_id_{1};
    std::atomic<bool> terminate_requested_{false};
    std::promise<void> terminated_;
    std::shared_future<void> terminated_future_;

    std::mutex callbacks_mutex_;
    std::vector<FatalCallback> fatal_callbacks_;

    mutable std::mutex final_snapshot_mutex_;
    std::optional<MetricsSnapshot> final_snapshot_;

    Mailbox<PoolEvent> mailbox_;

    // Dispatcher-owned state
    std::map<UnitId, UnitRecord> units_;
    std::deque<UnitId> idle_;                 ///< Least-recently-idle first
    std::deque<Task> queue_;
    std::map<TaskId, Task> inflight_;
    UnitId next_unit_id_ = 1;
    SlotId next_slot_ = 1;
    bool fatal_ = false;
    std::optional<PoolFatalError> fatal_error_;
    SteadyTime next_tick_{};
    std::optional<SteadyTime> grace_deadline_;
    bool grace_expired_ = false;

    /// Exited units; destroying one joins its threads, so it happens on reaper_.
    Mailbox<std::unique_ptr<IExecutionUnit>> retired_;
    std::jthread reaper_;

    std::atomic<std::thread::id> loop_thread_id_{};
    std::jthread loop_;   // Declared last: joins before the members above go away
};

}  // namespace adaptive_pool
