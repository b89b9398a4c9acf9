/**
 * @file thread_unit.hpp
 * @brief Execution unit backed by a single std::jthread.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "executor/execution_unit.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

namespace adaptive_pool {

/**
 * @brief One worker thread running a TaskHandler for one task at a time.
 *
 * A handler returning an error yields a UnitFailure; a handler that throws
 * ends the unit with kHandlerCrashExit, the in-thread analogue of an
 * uncaught error killing a worker. kill() cannot preempt a running handler:
 * it reports kKilledExit immediately, requests stop through the handler's
 * stop token, and discards whatever the handler eventually returns.
 * Destruction joins the thread, so handlers must honor the stop token.
 */
class ThreadUnit : public IExecutionUnit {
public:
    ThreadUnit(UnitId id, TaskHandler handler, UnitEventSink sink);
    ~ThreadUnit() override;

    // Non-copyable, non-movable
    ThreadUnit(const ThreadUnit&) = delete;
    ThreadUnit& operator=(const ThreadUnit&) = delete;

    [[nodiscard]] UnitId id() const noexcept override { return id_; }
    Result<void> assign(TaskId task, const Payload& payload) override;
    void request_stop() override;
    void kill() override;
    [[nodiscard]] bool alive() const noexcept override;

    [[nodiscard]] bool busy() const;

private:
    void worker_loop(std::stop_token stop);
    void emit_exit(int exit_code);

    UnitId id_;
    TaskHandler handler_;
    UnitEventSink sink_;

    std::optional<std::pair<TaskId, Payload>> pending_;
    bool busy_ = false;
    bool stop_after_current_ = false;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;

    std::atomic<bool> killed_{false};
    std::atomic<bool> exited_{false};

    std::jthread worker_;   // Declared last: starts once the members above exist
};

/**
 * @brief Factory producing ThreadUnits that all run the same handler.
 */
UnitFactory make_thread_unit_factory(TaskHandler handler);

}  // namespace adaptive_pool
