/**
 * @file recovery_supervisor.hpp
 * @brief Per-slot restart ledger deciding between replacement and fatal.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <set>
#include <vector>

namespace adaptive_pool {

struct RecoveryDecision {
    enum class Action : uint8_t { Replace, Fatal };

    Action action;
    uint32_t restarts;    ///< Slot restart count after this crash

    [[nodiscard]] bool replace() const noexcept { return action == Action::Replace; }
};

/**
 * @brief Counts crashes per slot and applies the restart cap.
 *
 * Each crash increments the slot's count. A count still below
 * max_restarts_per_slot earns a replacement in the same slot; reaching the
 * cap marks the slot exhausted and the pool fatal. Exhausted slots stay
 * exhausted until reset_exhausted().
 */
class RecoverySupervisor {
public:
    explicit RecoverySupervisor(uint32_t max_restarts_per_slot);

    RecoveryDecision on_crash(SlotId slot);

    [[nodiscard]] uint32_t restarts(SlotId slot) const;
    [[nodiscard]] bool exhausted(SlotId slot) const;
    [[nodiscard]] bool any_exhausted() const noexcept;

    /// Zero the exhausted slots' counts and return them, oldest first.
    std::vector<SlotId> reset_exhausted();

    /// Drop a slot's history (the slot was retired by scale-down).
    void forget(SlotId slot);

    [[nodiscard]] uint32_t max_restarts() const noexcept { return max_restarts_; }

private:
    uint32_t max_restarts_;
    std::map<SlotId, uint32_t> restarts_;
    std::set<SlotId> exhausted_;
};

}  // namespace adaptive_pool
