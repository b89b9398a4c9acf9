/**
 * @file recovery_supervisor.cpp
 * @brief RecoverySupervisor implementation.
 * @author Dimitris Kafetzis
 */

#include "pool/recovery_supervisor.hpp"

namespace adaptive_pool {

RecoverySupervisor::RecoverySupervisor(uint32_t max_restarts_per_slot)
    : max_restarts_(max_restarts_per_slot) {}

RecoveryDecision RecoverySupervisor::on_crash(SlotId slot) {
    uint32_t count = ++restarts_[slot];
    if (count < max_restarts_) {
        return {RecoveryDecision::Action::Replace, count};
    }
    exhausted_.insert(slot);
    return {RecoveryDecision::Action::Fatal, count};
}

uint32_t RecoverySupervisor::restarts(SlotId slot) const {
    auto it = restarts_.find(slot);
    return it == restarts_.end() ? 0 : it->second;
}

bool RecoverySupervisor::exhausted(SlotId slot) const {
    return exhausted_.contains(slot);
}

bool RecoverySupervisor::any_exhausted() const noexcept {
    return !exhausted_.empty();
}

std::vector<SlotId> RecoverySupervisor::reset_exhausted() {
    std::vector<SlotId> slots;
    slots.reserve(exhausted_.size());
    for (SlotId slot : exhausted_) {
        slots.push_back(slot);
        restarts_[slot] = 0;
    }
    exhausted_.clear();
    return slots;
}

void RecoverySupervisor::forget(SlotId slot) {
    restarts_.erase(slot);
    exhausted_.erase(slot);
}

}  // namespace adaptive_pool
