/**
 * @file synthetic_task.hpp
 * @brief Synthetic CPU-bound tasks for demos, scenario tests and benchmarks.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <stop_token>
#include <string_view>

namespace adaptive_pool {

enum class TaskBehavior : uint8_t {
    Succeed,   ///< Output is the decimal value
    Fail,      ///< Handler returns an error (TaskError for the caller)
    Crash      ///< Handler throws, taking its unit down
};

[[nodiscard]] constexpr std::string_view to_string(TaskBehavior behavior) noexcept {
    switch (behavior) {
        case TaskBehavior::Succeed: return "succeed";
        case TaskBehavior::Fail:    return "fail";
        case TaskBehavior::Crash:   return "crash";
    }
    return "unknown";
}

struct SyntheticTask {
    Duration compute_cost{0};
    TaskBehavior behavior = TaskBehavior::Succeed;
    uint64_t value = 0;
};

/**
 * @brief Encode as [1B behavior][8B compute_us][8B value], big-endian.
 */
Payload encode_synthetic_task(const SyntheticTask& task);

Result<SyntheticTask> decode_synthetic_task(const Payload& payload);

/**
 * @brief TaskHandler for synthetic payloads.
 *
 * Busy-computes for compute_cost (stopping early if @p stop fires), then
 * acts out the requested behavior.
 */
Result<Output> run_synthetic_task(const Payload& payload, std::stop_token stop);

/**
 * @brief Burn CPU for roughly @p target_duration, polling @p stop.
 */
void simulate_compute(Duration target_duration, std::stop_token stop);

}  // namespace adaptive_pool
