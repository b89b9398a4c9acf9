/**
 * @file task.hpp
 * @brief Pool-internal task record and the caller-facing handle.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/errors.hpp"
#include "core/types.hpp"

#include <chrono>
#include <exception>
#include <future>
#include <optional>

namespace adaptive_pool {

/**
 * @brief Per-call options for WorkerPool::execute().
 */
struct TaskOptions {
    /// Overrides [recovery] task_timeout_ms. Measured from dispatch.
    std::optional<std::chrono::milliseconds> timeout;
};

/**
 * @brief What the caller gets back from execute().
 */
struct TaskHandle {
    TaskId id = 0;
    std::future<Output> result;
};

enum class CancelOutcome : uint8_t {
    Removed,     ///< Was queued; future already rejected with CancelledError
    Deferred,    ///< In flight; rejects at the unit's next completion or crash
    NotFound     ///< Unknown or already settled
};

[[nodiscard]] constexpr std::string_view to_string(CancelOutcome outcome) noexcept {
    switch (outcome) {
        case CancelOutcome::Removed:  return "removed";
        case CancelOutcome::Deferred: return "deferred";
        case CancelOutcome::NotFound: return "not_found";
    }
    return "unknown";
}

/**
 * @brief A submitted unit of work. Owned by the dispatcher; move-only.
 *
 * The completion promise is settled exactly once, through resolve() or
 * reject(), after which the record is dropped.
 */
struct Task {
    TaskId id = 0;
    Payload payload;
    SteadyTime submitted_at{};
    std::promise<Output> completion;

    std::optional<std::chrono::milliseconds> timeout;
    std::optional<SteadyTime> dispatched_at;
    std::optional<UnitId> unit;           ///< Owning unit while in flight
    bool cancel_requested = false;
    uint32_t attempts = 0;                ///< Dispatch count; > 1 after a crash requeue

    void resolve(Output output) { completion.set_value(std::move(output)); }

    template <typename E>
    void reject(const E& error) { completion.set_exception(std::make_exception_ptr(error)); }

    [[nodiscard]] std::optional<SteadyTime> deadline() const {
        if (!timeout || !dispatched_at) return std::nullopt;
        return *dispatched_at + *timeout;
    }
};

}  // namespace adaptive_pool
