/**
 * @file scaling_controller.hpp
 * @brief Threshold-based pool sizing with a global cooldown.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"

#include <optional>
#include <string_view>

namespace adaptive_pool {

enum class ScaleAction : uint8_t {
    None,
    ScaleUp,
    ScaleDown
};

[[nodiscard]] constexpr std::string_view to_string(ScaleAction action) noexcept {
    switch (action) {
        case ScaleAction::None:      return "none";
        case ScaleAction::ScaleUp:   return "scale_up";
        case ScaleAction::ScaleDown: return "scale_down";
    }
    return "unknown";
}

/**
 * @brief Load observed by the dispatcher at one scaling tick.
 *
 * `units` excludes units that are already terminating.
 */
struct LoadSample {
    size_t units = 0;
    size_t idle = 0;
    size_t queue_depth = 0;
};

/**
 * @brief Decides at most one scaling action per tick.
 *
 * Algorithm (evaluated in order, first match wins):
 *   ScaleUp   if units < max AND (queue > up_threshold OR (queue > 0 AND idle == 0))
 *   ScaleDown if units > min AND queue == 0 AND idle > down_threshold
 * Both require the cooldown to have elapsed since the last recorded action.
 * The cooldown clock starts at mark_initialized(), so a freshly sized pool
 * waits one cooldown before its first action.
 *
 * evaluate() is pure; the dispatcher calls record_action() only once the
 * action actually happened (a failed spawn does not consume the cooldown).
 */
class ScalingController {
public:
    ScalingController(ScalingConfig config, uint32_t min_units, uint32_t max_units);

    void mark_initialized(SteadyTime now) noexcept;

    [[nodiscard]] ScaleAction evaluate(const LoadSample& sample, SteadyTime now) const noexcept;

    void record_action(SteadyTime now) noexcept;

    [[nodiscard]] bool cooldown_elapsed(SteadyTime now) const noexcept;
    [[nodiscard]] std::optional<SteadyTime> last_action_at() const noexcept { return last_action_at_; }

    [[nodiscard]] const ScalingConfig& config() const noexcept { return config_; }

private:
    ScalingConfig config_;
    uint32_t min_units_;
    uint32_t max_units_;
    std::optional<SteadyTime> last_action_at_;
};

}  // namespace adaptive_pool
