/**
 * @file worker_pool.cpp
 * @brief WorkerPool implementation: dispatcher loop and its event handlers.
 * @author Dimitris Kafetzis
 */

#include "pool/worker_pool.hpp"

#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <type_traits>

namespace adaptive_pool {

namespace {

constexpr std::string_view kDispatcher = "dispatcher";
constexpr std::string_view kScaler = "scaler";
constexpr std::string_view kSupervisor = "supervisor";
constexpr std::string_view kShutdown = "shutdown";

/// Upper bound on one mailbox wait when no timer is pending.
constexpr auto kIdleWakeup = std::chrono::seconds(1);

std::unique_ptr<ILogSink> or_null_sink(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

SteadyTime steady_now() {
    return std::chrono::steady_clock::now();
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

Result<std::unique_ptr<WorkerPool>> WorkerPool::create(Options options) {
    if (!options.unit_factory) {
        return Error{"A unit factory is required", ErrorKind::Config};
    }

    PoolConfig config = resolve_defaults(options.config);
    if (auto valid = validate(config); !valid) {
        return valid.error();
    }

    auto pool = std::make_unique<WorkerPool>(ConstructionKey{}, std::move(options), config);
    if (auto started = pool->start(); !started) {
        return started.error();
    }
    return Result<std::unique_ptr<WorkerPool>>{std::move(pool)};
}

WorkerPool::WorkerPool(ConstructionKey, Options options, PoolConfig config)
    : config_(config)
    , factory_(std::move(options.unit_factory))
    , logger_(or_null_sink(std::move(options.log_sink)), options.log_level)
    , metrics_(or_null_sink(std::move(options.metrics_sink)))
    , scaler_(config.scaling, config.min_units, config.max_units)
    , supervisor_(config.recovery.max_restarts_per_slot)
    , terminated_future_(terminated_.get_future().share()) {}

WorkerPool::~WorkerPool() {
    terminate().wait();
}

Result<void> WorkerPool::start() {
    reaper_ = std::jthread([this](std::stop_token stop) { reap_loop(stop); });

    for (uint32_t i = 0; i < config_.min_units; ++i) {
        if (!spawn_unit(next_slot_++, "initial")) {
            units_.clear();
            idle_.clear();
            mailbox_.close();
            state_ = PoolState::Terminated;
            terminated_.set_value();
            return Error{"Could not spawn the initial " + std::to_string(config_.min_units)
                         + " units", ErrorKind::Spawn};
        }
    }

    auto now = steady_now();
    scaler_.mark_initialized(now);
    next_tick_ = now + std::chrono::milliseconds(config_.scaling.check_interval_ms);
    state_ = PoolState::Running;

    logger_.info(kDispatcher, "Pool running: " + std::to_string(config_.min_units) + ".."
                 + std::to_string(config_.max_units) + " units, tick "
                 + std::to_string(config_.scaling.check_interval_ms) + "ms, cooldown "
                 + std::to_string(config_.scaling.cool_down_ms) + "ms");

    loop_ = std::jthread([this](std::stop_token stop) { run_loop(stop); });
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Public API (any thread)
// ─────────────────────────────────────────────

TaskHandle WorkerPool::execute(Payload payload, TaskOptions options) {
    Task task;
    task.id = next_task_id_.fetch_add(1);
    task.payload = std::move(payload);
    task.submitted_at = steady_now();
    task.timeout = options.timeout;
    if (!task.timeout && config_.recovery.task_timeout_ms > 0) {
        task.timeout = std::chrono::milliseconds(config_.recovery.task_timeout_ms);
    }

    TaskHandle handle{task.id, task.completion.get_future()};
    post(SubmitEvent{std::move(task)});
    return handle;
}

CancelOutcome WorkerPool::cancel(TaskId task) {
    if (on_loop_thread()) return on_cancel(task);

    std::promise<CancelOutcome> reply;
    auto outcome = reply.get_future();
    post(CancelEvent{task, std::move(reply)});
    return outcome.get();
}

MetricsSnapshot WorkerPool::get_metrics() {
    if (on_loop_thread()) return build_snapshot();

    std::promise<MetricsSnapshot> reply;
    auto snapshot = reply.get_future();
    post(MetricsRequest{std::move(reply)});
    return snapshot.get();
}

std::shared_future<void> WorkerPool::terminate() {
    if (!terminate_requested_.exchange(true)) {
        post(TerminateRequest{});
    }
    return terminated_future_;
}

Result<void> WorkerPool::reset() {
    if (on_loop_thread()) return on_reset();

    std::promise<Result<void>> reply;
    auto outcome = reply.get_future();
    post(ResetRequest{std::move(reply)});
    return outcome.get();
}

void WorkerPool::on_fatal(FatalCallback callback) {
    std::lock_guard lock(callbacks_mutex_);
    fatal_callbacks_.push_back(std::move(callback));
}

void WorkerPool::post(PoolEvent event) {
    // push() leaves the event intact when the mailbox is closed.
    if (!mailbox_.push(std::move(event))) {
        settle_after_close(std::move(event));
    }
}

bool WorkerPool::on_loop_thread() const noexcept {
    return loop_thread_id_.load() == std::this_thread::get_id();
}

// ─────────────────────────────────────────────
// Dispatcher Loop
// ─────────────────────────────────────────────

void WorkerPool::run_loop(std::stop_token stop) {
    loop_thread_id_ = std::this_thread::get_id();

    while (state_ != PoolState::Terminated && !stop.stop_requested()) {
        auto event = mailbox_.pop_until(next_wakeup(), stop);
        if (event) handle(std::move(*event));
        fire_timers(steady_now());
    }

    // Whatever raced with close() still gets an answer.
    while (auto event = mailbox_.try_pop()) {
        settle_after_close(std::move(*event));
    }
    terminated_.set_value();
}

void WorkerPool::handle(PoolEvent event) {
    std::visit([this](auto&& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, SubmitEvent>) {
            on_submit(std::move(e.task));
        } else if constexpr (std::is_same_v<T, CancelEvent>) {
            e.reply.set_value(on_cancel(e.task));
        } else if constexpr (std::is_same_v<T, MetricsRequest>) {
            e.reply.set_value(build_snapshot());
        } else if constexpr (std::is_same_v<T, ResetRequest>) {
            e.reply.set_value(on_reset());
        } else if constexpr (std::is_same_v<T, TerminateRequest>) {
            begin_drain();
        } else if constexpr (std::is_same_v<T, UnitResult>) {
            on_unit_result(std::move(e));
        } else if constexpr (std::is_same_v<T, UnitFailure>) {
            on_unit_failure(std::move(e));
        } else if constexpr (std::is_same_v<T, UnitExit>) {
            on_unit_exit(e);
        }
    }, std::move(event));
}

void WorkerPool::settle_after_close(PoolEvent event) {
    std::visit([this](auto&& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, SubmitEvent>) {
            metrics_.record_submitted(e.task.id);
            e.task.reject(ShutdownError{"Pool is terminated"});
            metrics_.record_shutdown(e.task.id);
        } else if constexpr (std::is_same_v<T, CancelEvent>) {
            e.reply.set_value(CancelOutcome::NotFound);
        } else if constexpr (std::is_same_v<T, MetricsRequest>) {
            std::lock_guard lock(final_snapshot_mutex_);
            e.reply.set_value(final_snapshot_.value_or(MetricsSnapshot{}));
        } else if constexpr (std::is_same_v<T, ResetRequest>) {
            e.reply.set_value(Result<void>{Error{"Pool is terminated", ErrorKind::Shutdown}});
        }
        // Terminate requests and unit events need no answer once closed.
    }, std::move(event));
}

// ─────────────────────────────────────────────
// Task Events
// ─────────────────────────────────────────────

void WorkerPool::on_submit(Task task) {
    metrics_.record_submitted(task.id);

    if (state_ != PoolState::Running) {
        task.reject(ShutdownError{});
        metrics_.record_shutdown(task.id);
        return;
    }
    if (fatal_) {
        task.reject(*fatal_error_);
        metrics_.record_rejected(task.id, ErrorKind::PoolFatal);
        return;
    }
    if (config_.max_queue_depth > 0 && queue_.size() >= config_.max_queue_depth) {
        task.reject(QueueFullError{queue_.size()});
        metrics_.record_rejected(task.id, ErrorKind::QueueFull);
        return;
    }

    queue_.push_back(std::move(task));
    dispatch();
    metrics_.observe_queue_depth(queue_.size());
}

CancelOutcome WorkerPool::on_cancel(TaskId id) {
    auto queued = std::find_if(queue_.begin(), queue_.end(),
                               [id](const Task& t) { return t.id == id; });
    if (queued != queue_.end()) {
        queued->reject(CancelledError{id});
        metrics_.record_cancelled(id);
        queue_.erase(queued);
        return CancelOutcome::Removed;
    }

    auto inflight = inflight_.find(id);
    if (inflight != inflight_.end()) {
        inflight->second.cancel_requested = true;
        logger_.debug(kDispatcher, "Cancel of in-flight task " + std::to_string(id)
                      + " deferred to its completion");
        return CancelOutcome::Deferred;
    }

    return CancelOutcome::NotFound;
}

// ─────────────────────────────────────────────
// Dispatcher
// ─────────────────────────────────────────────

void WorkerPool::dispatch() {
    if (state_ != PoolState::Running) return;

    while (!queue_.empty() && !idle_.empty()) {
        UnitId unit_id = idle_.front();
        idle_.pop_front();
        UnitRecord& unit = units_.at(unit_id);

        auto assigned = unit.handle->assign(queue_.front().id, queue_.front().payload);
        if (!assigned && assigned.error().kind == ErrorKind::Protocol) {
            // The payload cannot be delivered; the task fails, the unit stays idle.
            idle_.push_front(unit_id);
            Task task = std::move(queue_.front());
            queue_.pop_front();
            logger_.warn(kDispatcher, "Task " + std::to_string(task.id) + " rejected by unit "
                         + std::to_string(unit_id) + ": " + assigned.error().message);
            task.reject(TaskError{assigned.error().message});
            metrics_.record_failed(task.id, unit_id, Duration{0});
            continue;
        }
        if (!assigned) {
            // Any other refusal is treated as a crash; the exit drives recovery.
            logger_.warn(kDispatcher, "Unit " + std::to_string(unit_id) + " refused task "
                         + std::to_string(queue_.front().id) + ": "
                         + assigned.error().message);
            unit.status = UnitStatus::Terminating;
            unit.handle->kill();
            continue;
        }

        Task task = std::move(queue_.front());
        queue_.pop_front();
        task.dispatched_at = steady_now();
        task.unit = unit_id;
        ++task.attempts;

        unit.status = UnitStatus::Busy;
        unit.current_task = task.id;

        auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
            *task.dispatched_at - task.submitted_at);
        logger_.debug(kDispatcher, "Task " + std::to_string(task.id) + " -> unit "
                      + std::to_string(unit_id) + " (attempt "
                      + std::to_string(task.attempts) + ", queued "
                      + std::to_string(waited.count()) + "ms)");

        TaskId id = task.id;
        inflight_.emplace(id, std::move(task));
    }
}

WorkerPool::UnitRecord* WorkerPool::release_unit(UnitId unit_id, TaskId task) {
    auto it = units_.find(unit_id);
    if (it == units_.end()) return nullptr;

    UnitRecord& unit = it->second;
    if (unit.current_task != task) {
        logger_.warn(kDispatcher, "Unit " + std::to_string(unit_id) + " reported task "
                     + std::to_string(task) + " it does not hold");
        return nullptr;
    }

    unit.current_task.reset();
    if (unit.status == UnitStatus::Busy) {
        unit.status = UnitStatus::Idle;
        idle_.push_back(unit.id);
    }
    return &unit;
}

void WorkerPool::on_unit_result(UnitResult result) {
    UnitRecord* unit = release_unit(result.unit, result.task);
    if (!unit) return;

    // Absent when the task already timed out.
    auto it = inflight_.find(result.task);
    if (it != inflight_.end()) {
        Task& task = it->second;
        if (task.cancel_requested) {
            task.reject(CancelledError{task.id});
            metrics_.record_cancelled(task.id);
        } else {
            task.resolve(std::move(result.output));
            ++unit->tasks_completed;
            metrics_.record_completed(task.id, unit->id, result.duration);
        }
        inflight_.erase(it);
    }

    dispatch();
}

void WorkerPool::on_unit_failure(UnitFailure failure) {
    UnitRecord* unit = release_unit(failure.unit, failure.task);
    if (!unit) return;

    auto it = inflight_.find(failure.task);
    if (it != inflight_.end()) {
        Task& task = it->second;
        if (task.cancel_requested) {
            task.reject(CancelledError{task.id});
            metrics_.record_cancelled(task.id);
        } else {
            task.reject(TaskError{failure.message});
            ++unit->tasks_failed;
            metrics_.record_failed(task.id, unit->id, failure.duration);
        }
        inflight_.erase(it);
    }

    dispatch();
}

// ─────────────────────────────────────────────
// Units
// ─────────────────────────────────────────────

bool WorkerPool::spawn_unit(SlotId slot, std::string_view reason) {
    UnitId id = next_unit_id_++;
    auto unit = factory_(id, [this](UnitEvent event) {
        std::visit([this](auto&& e) { post(PoolEvent{std::move(e)}); }, std::move(event));
    });
    if (!unit) {
        logger_.error(kDispatcher, "Failed to spawn unit for slot " + std::to_string(slot)
                      + ": " + unit.error().message);
        return false;
    }

    UnitRecord record;
    record.handle = std::move(unit).value();
    record.id = id;
    record.slot = slot;
    record.started_at = steady_now();
    units_.emplace(id, std::move(record));
    idle_.push_back(id);

    metrics_.record_unit_spawned(id, slot, reason);
    metrics_.observe_units(active_units());
    logger_.debug(kDispatcher, "Spawned unit " + std::to_string(id) + " in slot "
                  + std::to_string(slot) + " (" + std::string(reason) + ")");
    return true;
}

void WorkerPool::replenish() {
    while (!fatal_ && state_ == PoolState::Running && active_units() < config_.min_units) {
        if (!spawn_unit(next_slot_++, "replenish")) break;
    }
}

size_t WorkerPool::active_units() const noexcept {
    return static_cast<size_t>(std::count_if(units_.begin(), units_.end(), [](const auto& entry) {
        return !entry.second.voluntary_stop;
    }));
}

void WorkerPool::drop_idle(UnitId unit) {
    std::erase(idle_, unit);
}

void WorkerPool::retire(std::unique_ptr<IExecutionUnit> handle) {
    if (!handle) return;
    // push() leaves the handle intact when the mailbox is closed.
    if (!retired_.push(std::move(handle))) handle.reset();
}

void WorkerPool::reap_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        // Discarding the popped handle destroys it here.
        retired_.pop_until(steady_now() + kIdleWakeup, stop);
    }
    while (retired_.try_pop()) {}
}

void WorkerPool::on_unit_exit(const UnitExit& exit) {
    auto it = units_.find(exit.unit);
    if (it == units_.end()) return;

    UnitRecord unit = std::move(it->second);
    units_.erase(it);
    drop_idle(unit.id);
    retire(std::move(unit.handle));

    metrics_.record_unit_exited(unit.id, exit.exit_code, unit.voluntary_stop);

    if (state_ == PoolState::Draining) {
        if (unit.current_task) {
            auto task = inflight_.find(*unit.current_task);
            if (task != inflight_.end()) {
                if (task->second.cancel_requested) {
                    task->second.reject(CancelledError{task->first});
                    metrics_.record_cancelled(task->first);
                } else if (unit.force_killed || exit.exit_code == kCleanExit) {
                    task->second.reject(ShutdownError{"Unit force-terminated during shutdown"});
                    metrics_.record_shutdown(task->first);
                } else {
                    // No replacement during a drain: the crash reaches the caller.
                    task->second.reject(WorkerCrashError{unit.id, exit.exit_code});
                    metrics_.record_crash(unit.id, unit.slot, exit.exit_code);
                    metrics_.record_failed(task->first, unit.id, Duration{0});
                }
                inflight_.erase(task);
            }
        }
        logger_.debug(kShutdown, "Unit " + std::to_string(unit.id) + " exited with code "
                      + std::to_string(exit.exit_code) + ", " + std::to_string(units_.size())
                      + " remaining");
        finish_if_drained();
        return;
    }

    if (unit.voluntary_stop) {
        logger_.debug(kScaler, "Unit " + std::to_string(unit.id) + " retired (slot "
                      + std::to_string(unit.slot) + ")");
        supervisor_.forget(unit.slot);
        return;
    }

    recover(unit, exit.exit_code);
    dispatch();
}

// ─────────────────────────────────────────────
// Supervisor
// ─────────────────────────────────────────────

void WorkerPool::recover(UnitRecord& unit, int exit_code) {
    metrics_.record_crash(unit.id, unit.slot, exit_code);
    logger_.warn(kSupervisor, "Unit " + std::to_string(unit.id) + " (slot "
                 + std::to_string(unit.slot) + ") exited unexpectedly with code "
                 + std::to_string(exit_code));

    // A task that already timed out is no longer in flight and is not retried.
    if (unit.current_task) {
        auto it = inflight_.find(*unit.current_task);
        if (it != inflight_.end()) {
            Task task = std::move(it->second);
            inflight_.erase(it);
            if (task.cancel_requested) {
                task.reject(CancelledError{task.id});
                metrics_.record_cancelled(task.id);
            } else {
                task.unit.reset();
                task.dispatched_at.reset();
                metrics_.record_requeued(task.id, unit.id);
                logger_.info(kSupervisor, "Requeued task " + std::to_string(task.id)
                             + " at the front of the queue");
                queue_.push_front(std::move(task));
                metrics_.observe_queue_depth(queue_.size());
            }
        }
    }

    auto decision = supervisor_.on_crash(unit.slot);
    if (!decision.replace()) {
        enter_fatal(unit.slot, decision.restarts);
        return;
    }

    metrics_.record_restart(unit.slot, decision.restarts);
    logger_.info(kSupervisor, "Replacing unit in slot " + std::to_string(unit.slot)
                 + " (restart " + std::to_string(decision.restarts) + " of "
                 + std::to_string(supervisor_.max_restarts()) + ")");
    if (!spawn_unit(unit.slot, "restart")) {
        logger_.error(kSupervisor, "Replacement for slot " + std::to_string(unit.slot)
                      + " failed; the next scaling tick will top the pool up");
    }
}

void WorkerPool::enter_fatal(SlotId slot, uint32_t restarts) {
    fatal_ = true;
    fatal_error_.emplace(slot, restarts);
    metrics_.record_fatal(slot, restarts);
    logger_.error(kSupervisor, std::string(fatal_error_->what())
                  + "; rejecting new tasks until reset()");

    std::vector<FatalCallback> callbacks;
    {
        std::lock_guard lock(callbacks_mutex_);
        callbacks = fatal_callbacks_;
    }
    for (const auto& callback : callbacks) {
        try {
            callback(*fatal_error_);
        } catch (const std::exception& e) {
            logger_.error(kSupervisor, std::string("Fatal listener threw: ") + e.what());
        }
    }
}

Result<void> WorkerPool::on_reset() {
    if (state_ != PoolState::Running) {
        return Error{"Pool is not running", ErrorKind::Shutdown};
    }
    if (!fatal_) return Result<void>{};

    fatal_ = false;
    fatal_error_.reset();

    size_t respawned = 0;
    for (SlotId slot : supervisor_.reset_exhausted()) {
        if (active_units() >= config_.min_units) break;
        if (spawn_unit(slot, "reset")) ++respawned;
    }
    replenish();

    logger_.info(kSupervisor, "Fatal condition cleared, " + std::to_string(respawned)
                 + " exhausted slot(s) respawned, " + std::to_string(active_units())
                 + " units active");
    dispatch();
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Timers
// ─────────────────────────────────────────────

SteadyTime WorkerPool::next_wakeup() const {
    auto now = steady_now();
    SteadyTime wake = now + kIdleWakeup;

    if (state_ == PoolState::Running) wake = std::min(wake, next_tick_);
    if (grace_deadline_ && !grace_expired_) wake = std::min(wake, *grace_deadline_);
    for (const auto& [id, task] : inflight_) {
        if (auto deadline = task.deadline()) wake = std::min(wake, *deadline);
    }
    return wake;
}

void WorkerPool::fire_timers(SteadyTime now) {
    expire_tasks(now);

    if (state_ == PoolState::Running && now >= next_tick_) {
        on_tick(now);
        next_tick_ = now + std::chrono::milliseconds(config_.scaling.check_interval_ms);
    }

    if (state_ == PoolState::Draining && grace_deadline_ && !grace_expired_
        && now >= *grace_deadline_) {
        grace_expired_ = true;
        logger_.warn(kShutdown, "Grace period elapsed, force-terminating "
                     + std::to_string(units_.size()) + " unit(s)");
        for (auto& [id, unit] : units_) {
            unit.force_killed = true;
            unit.handle->kill();
        }
    }
}

void WorkerPool::expire_tasks(SteadyTime now) {
    for (auto it = inflight_.begin(); it != inflight_.end();) {
        Task& task = it->second;
        auto deadline = task.deadline();
        if (!deadline || now < *deadline) {
            ++it;
            continue;
        }

        UnitId owner = task.unit.value_or(0);
        task.reject(TimeoutError{task.id, *task.timeout});
        metrics_.record_timed_out(task.id, owner);
        logger_.warn(kDispatcher, "Task " + std::to_string(task.id) + " timed out on unit "
                     + std::to_string(owner));
        it = inflight_.erase(it);

        if (!config_.recovery.kill_on_timeout) continue;

        // The kill surfaces as a crash exit and goes through recovery.
        auto unit = units_.find(owner);
        if (unit != units_.end() && unit->second.status != UnitStatus::Terminating) {
            unit->second.status = UnitStatus::Terminating;
            unit->second.handle->kill();
        }
    }
}

void WorkerPool::on_tick(SteadyTime now) {
    replenish();
    if (fatal_) return;

    LoadSample sample{
        .units = active_units(),
        .idle = idle_.size(),
        .queue_depth = queue_.size()
    };

    switch (scaler_.evaluate(sample, now)) {
        case ScaleAction::ScaleUp: {
            if (!spawn_unit(next_slot_++, "scale_up")) break;
            scaler_.record_action(now);
            metrics_.record_scale_up(active_units());
            logger_.info(kScaler, "Scaled up to " + std::to_string(active_units())
                         + " units (queue depth " + std::to_string(sample.queue_depth)
                         + ", idle " + std::to_string(sample.idle) + ")");
            dispatch();
            break;
        }
        case ScaleAction::ScaleDown: {
            UnitId victim = idle_.front();
            idle_.pop_front();
            UnitRecord& unit = units_.at(victim);
            unit.status = UnitStatus::Terminating;
            unit.voluntary_stop = true;
            unit.handle->request_stop();

            scaler_.record_action(now);
            metrics_.record_scale_down(active_units());
            logger_.info(kScaler, "Scaled down to " + std::to_string(active_units())
                         + " units (retired unit " + std::to_string(victim) + ")");
            break;
        }
        case ScaleAction::None:
            break;
    }
}

// ─────────────────────────────────────────────
// Shutdown
// ─────────────────────────────────────────────

void WorkerPool::begin_drain() {
    if (state_ != PoolState::Running) return;
    state_ = PoolState::Draining;

    logger_.info(kShutdown, "Draining: rejecting " + std::to_string(queue_.size())
                 + " queued task(s), " + std::to_string(inflight_.size()) + " in flight, grace "
                 + std::to_string(config_.grace_period_ms) + "ms");

    while (!queue_.empty()) {
        Task task = std::move(queue_.front());
        queue_.pop_front();
        task.reject(ShutdownError{});
        metrics_.record_shutdown(task.id);
    }

    idle_.clear();
    for (auto& [id, unit] : units_) {
        unit.voluntary_stop = true;
        unit.status = UnitStatus::Terminating;
        unit.handle->request_stop();
    }

    grace_deadline_ = steady_now() + std::chrono::milliseconds(config_.grace_period_ms);
    finish_if_drained();
}

void WorkerPool::finish_if_drained() {
    if (state_ != PoolState::Draining || !units_.empty()) return;

    for (auto& [id, task] : inflight_) {
        task.reject(ShutdownError{});
        metrics_.record_shutdown(id);
    }
    inflight_.clear();

    state_ = PoolState::Terminated;
    metrics_.record_terminated();
    metrics_.flush();
    {
        std::lock_guard lock(final_snapshot_mutex_);
        final_snapshot_ = build_snapshot();
    }
    logger_.info(kShutdown, "Pool terminated");
    logger_.flush();
    mailbox_.close();
}

// ─────────────────────────────────────────────
// Metrics
// ─────────────────────────────────────────────

MetricsSnapshot WorkerPool::build_snapshot() const {
    MetricsSnapshot snapshot;
    static_cast<PoolCounters&>(snapshot) = metrics_.counters();

    snapshot.state = state_.load();
    snapshot.fatal = fatal_;
    snapshot.current_units = active_units();
    snapshot.idle_units = idle_.size();
    snapshot.busy_units = static_cast<size_t>(std::count_if(
        units_.begin(), units_.end(),
        [](const auto& entry) { return entry.second.status == UnitStatus::Busy; }));
    snapshot.queue_depth = queue_.size();

    auto now = steady_now();
    snapshot.per_unit.reserve(units_.size());
    for (const auto& [id, unit] : units_) {
        snapshot.per_unit.push_back(UnitMetrics{
            .id = id,
            .slot = unit.slot,
            .status = unit.status,
            .tasks_completed = unit.tasks_completed,
            .tasks_failed = unit.tasks_failed,
            .restarts = supervisor_.restarts(unit.slot),
            .uptime = std::chrono::duration_cast<Duration>(now - unit.started_at),
            .current_task = unit.current_task
        });
    }
    return snapshot;
}

}  // namespace adaptive_pool
