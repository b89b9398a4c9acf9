/**
 * @file thread_unit.cpp
 * @brief ThreadUnit implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/thread_unit.hpp"

#include <chrono>
#include <system_error>

namespace adaptive_pool {

ThreadUnit::ThreadUnit(UnitId id, TaskHandler handler, UnitEventSink sink)
    : id_(id)
    , handler_(std::move(handler))
    , sink_(std::move(sink))
    , worker_([this](std::stop_token stop) { worker_loop(stop); }) {}

ThreadUnit::~ThreadUnit() {
    // No events after destruction; the owner has already forgotten this unit.
    exited_.store(true);
    killed_.store(true);
    worker_.request_stop();
    cv_.notify_all();
    // jthread joins in its destructor
}

Result<void> ThreadUnit::assign(TaskId task, const Payload& payload) {
    {
        std::lock_guard lock(mutex_);
        if (exited_.load() || killed_.load()) {
            return Error{"Unit " + std::to_string(id_) + " is not alive", ErrorKind::WorkerCrash};
        }
        if (stop_after_current_) {
            return Error{"Unit " + std::to_string(id_) + " is stopping", ErrorKind::Shutdown};
        }
        if (busy_) {
            return Error{"Unit " + std::to_string(id_) + " already holds a task",
                         ErrorKind::UnitBusy};
        }
        pending_.emplace(task, payload);
        busy_ = true;
    }
    cv_.notify_one();
    return Result<void>{};
}

void ThreadUnit::request_stop() {
    {
        std::lock_guard lock(mutex_);
        stop_after_current_ = true;
    }
    cv_.notify_all();
}

void ThreadUnit::kill() {
    if (killed_.exchange(true)) return;
    worker_.request_stop();
    cv_.notify_all();
    emit_exit(kKilledExit);
}

bool ThreadUnit::alive() const noexcept {
    return !exited_.load();
}

bool ThreadUnit::busy() const {
    std::lock_guard lock(mutex_);
    return busy_;
}

void ThreadUnit::emit_exit(int exit_code) {
    if (exited_.exchange(true)) return;
    sink_(UnitExit{.unit = id_, .exit_code = exit_code});
}

void ThreadUnit::worker_loop(std::stop_token stop) {
    while (!killed_.load()) {
        std::pair<TaskId, Payload> job;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, stop, [this] { return pending_.has_value() || stop_after_current_; });

            if (killed_.load() || !pending_) break;

            job = std::move(*pending_);
            pending_.reset();
        }

        auto start = std::chrono::steady_clock::now();
        std::optional<Result<Output>> outcome;
        try {
            outcome.emplace(handler_(job.second, stop));
        } catch (...) {
            // A throwing handler takes the whole unit down.
            emit_exit(kHandlerCrashExit);
            return;
        }
        auto duration = std::chrono::duration_cast<Duration>(
            std::chrono::steady_clock::now() - start);

        if (killed_.load()) break;  // result belongs to a task the pool already wrote off

        {
            std::lock_guard lock(mutex_);
            busy_ = false;
        }

        if (outcome->has_value()) {
            sink_(UnitResult{.unit = id_, .task = job.first,
                             .output = std::move(outcome->value()), .duration = duration});
        } else {
            sink_(UnitFailure{.unit = id_, .task = job.first,
                              .message = outcome->error().message, .duration = duration});
        }
    }

    emit_exit(killed_.load() ? kKilledExit : kCleanExit);
}

UnitFactory make_thread_unit_factory(TaskHandler handler) {
    return [handler = std::move(handler)](UnitId id, UnitEventSink sink)
               -> Result<std::unique_ptr<IExecutionUnit>> {
        try {
            std::unique_ptr<IExecutionUnit> unit =
                std::make_unique<ThreadUnit>(id, handler, std::move(sink));
            return Result<std::unique_ptr<IExecutionUnit>>{std::move(unit)};
        } catch (const std::system_error& err) {
            return Error{"Failed to start unit thread: " + std::string{err.what()},
                         ErrorKind::Spawn};
        }
    };
}

}  // namespace adaptive_pool
