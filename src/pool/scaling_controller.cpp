/**
 * @file scaling_controller.cpp
 * @brief ScalingController implementation.
 * @author Dimitris Kafetzis
 */

#include "pool/scaling_controller.hpp"

namespace adaptive_pool {

ScalingController::ScalingController(ScalingConfig config, uint32_t min_units, uint32_t max_units)
    : config_(config)
    , min_units_(min_units)
    , max_units_(max_units) {}

void ScalingController::mark_initialized(SteadyTime now) noexcept {
    last_action_at_ = now;
}

bool ScalingController::cooldown_elapsed(SteadyTime now) const noexcept {
    if (!last_action_at_) return true;
    return now - *last_action_at_ >= std::chrono::milliseconds(config_.cool_down_ms);
}

ScaleAction ScalingController::evaluate(const LoadSample& sample, SteadyTime now) const noexcept {
    if (!cooldown_elapsed(now)) return ScaleAction::None;

    bool backlog = sample.queue_depth > config_.scale_up_threshold;
    bool saturated = sample.queue_depth > 0 && sample.idle == 0;
    if (sample.units < max_units_ && (backlog || saturated)) {
        return ScaleAction::ScaleUp;
    }

    if (sample.units > min_units_
        && sample.queue_depth == 0
        && sample.idle > config_.scale_down_threshold) {
        return ScaleAction::ScaleDown;
    }

    return ScaleAction::None;
}

void ScalingController::record_action(SteadyTime now) noexcept {
    last_action_at_ = now;
}

}  // namespace adaptive_pool
