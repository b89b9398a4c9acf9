/**
 * @file execution_unit.hpp
 * @brief Execution unit interface, unit events, and the unit factory seam.
 * @author Dimitris Kafetzis
 *
 * An execution unit wraps one isolated concurrent context that runs at most
 * one task at a time. Units never call back into the pool directly: every
 * outcome is reported as a UnitEvent through the sink the factory received,
 * and the pool consumes those events in order on its dispatcher thread.
 *
 * State machine (as seen by the pool):
 *   Idle --assign--> Busy --result/error--> Idle
 *   Busy --exit(code != 0)--> removed (crash, recovery applies)
 *   Idle --exit--> removed (voluntary stop or crash)
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <variant>

namespace adaptive_pool {

// ─────────────────────────────────────────────
// Unit Events
// ─────────────────────────────────────────────

struct UnitResult {
    UnitId unit;
    TaskId task;
    Output output;
    Duration duration{0};
};

struct UnitFailure {
    UnitId unit;
    TaskId task;
    std::string message;
    Duration duration{0};
};

struct UnitExit {
    UnitId unit;
    int exit_code;
};

using UnitEvent = std::variant<UnitResult, UnitFailure, UnitExit>;

/// Delivery channel from a unit to its owner. Must be safe to call from any thread.
using UnitEventSink = std::function<void(UnitEvent)>;

/// The work a unit performs for one payload. Long-running handlers should
/// observe the stop token.
using TaskHandler = std::function<Result<Output>(const Payload&, std::stop_token)>;

// ─────────────────────────────────────────────
// IExecutionUnit (Virtual, chosen at runtime by the factory)
// ─────────────────────────────────────────────

/**
 * @brief Handle to one isolated execution context.
 *
 * Every unit emits exactly one UnitExit over its lifetime, after its last
 * result or failure. Destroying a unit that is still alive force-terminates
 * it without emitting further events.
 */
class IExecutionUnit {
public:
    virtual ~IExecutionUnit() = default;

    [[nodiscard]] virtual UnitId id() const noexcept = 0;

    /// Hand one task to the unit. Fails with ErrorKind::UnitBusy while a task
    /// is in flight, or ErrorKind::WorkerCrash when the unit is gone.
    virtual Result<void> assign(TaskId task, const Payload& payload) = 0;

    /// Finish the current task (if any), then exit with code 0.
    virtual void request_stop() = 0;

    /// Force termination. The unit reports a non-zero exit and suppresses
    /// any result of the interrupted task.
    virtual void kill() = 0;

    [[nodiscard]] virtual bool alive() const noexcept = 0;
};

/**
 * @brief Spawns one unit with the given id, reporting through the sink.
 */
using UnitFactory =
    std::function<Result<std::unique_ptr<IExecutionUnit>>(UnitId, UnitEventSink)>;

}  // namespace adaptive_pool
