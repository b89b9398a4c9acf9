/**
 * @file errors.hpp
 * @brief Exception types used to reject task futures.
 * @author Dimitris Kafetzis
 *
 * A task's std::future carries either its Output or one of these. Every
 * type derives from PoolError so callers can catch the family and switch
 * on kind(), or catch the concrete type.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <stdexcept>
#include <string>

namespace adaptive_pool {

class PoolError : public std::runtime_error {
public:
    PoolError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/// The unit ran the task and the task's own work failed.
class TaskError : public PoolError {
public:
    explicit TaskError(const std::string& message)
        : PoolError(ErrorKind::Task, message) {}
};

/// A unit exited unexpectedly. Handled by the supervisor; reaches a caller
/// only when the interrupted task can no longer be retried.
class WorkerCrashError : public PoolError {
public:
    WorkerCrashError(UnitId unit, int exit_code)
        : PoolError(ErrorKind::WorkerCrash,
                    "Unit " + std::to_string(unit) + " exited with code "
                    + std::to_string(exit_code))
        , unit_(unit), exit_code_(exit_code) {}

    [[nodiscard]] UnitId unit() const noexcept { return unit_; }
    [[nodiscard]] int exit_code() const noexcept { return exit_code_; }

private:
    UnitId unit_;
    int exit_code_;
};

/// A slot exhausted its restart budget; admissions halt until reset().
class PoolFatalError : public PoolError {
public:
    PoolFatalError(SlotId slot, uint32_t restarts)
        : PoolError(ErrorKind::PoolFatal,
                    "Slot " + std::to_string(slot) + " exceeded restart limit ("
                    + std::to_string(restarts) + " restarts)")
        , slot_(slot), restarts_(restarts) {}

    [[nodiscard]] SlotId slot() const noexcept { return slot_; }
    [[nodiscard]] uint32_t restarts() const noexcept { return restarts_; }

private:
    SlotId slot_;
    uint32_t restarts_;
};

class ShutdownError : public PoolError {
public:
    explicit ShutdownError(const std::string& message = "Pool is shutting down")
        : PoolError(ErrorKind::Shutdown, message) {}
};

class QueueFullError : public PoolError {
public:
    explicit QueueFullError(size_t depth)
        : PoolError(ErrorKind::QueueFull,
                    "Task queue is full (" + std::to_string(depth) + " queued)") {}
};

class CancelledError : public PoolError {
public:
    explicit CancelledError(TaskId task)
        : PoolError(ErrorKind::Cancelled, "Task " + std::to_string(task) + " cancelled") {}
};

class TimeoutError : public PoolError {
public:
    TimeoutError(TaskId task, std::chrono::milliseconds timeout)
        : PoolError(ErrorKind::Timeout,
                    "Task " + std::to_string(task) + " timed out after "
                    + std::to_string(timeout.count()) + "ms") {}
};

}  // namespace adaptive_pool
