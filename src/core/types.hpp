/**
 * @file types.hpp
 * @brief Fundamental types used throughout AdaptivePool.
 * @author Dimitris Kafetzis
 *
 * Defines TaskId, UnitId, Payload, lifecycle enums, and other shared
 * vocabulary types. All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace adaptive_pool {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TaskId = uint64_t;
using UnitId = uint64_t;
using SlotId = uint64_t;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

/// Opaque bytes handed to an execution unit. Process units copy them across
/// the isolation boundary unchanged.
using Payload = std::string;

/// Opaque bytes a unit returns for a successful task.
using Output = std::string;

// ─────────────────────────────────────────────
// Execution Unit Status
// ─────────────────────────────────────────────

enum class UnitStatus : uint8_t {
    Idle,          ///< Alive, no current task
    Busy,          ///< Executing exactly one task
    Terminating    ///< Told to stop (scale-down, shutdown) or killed
};

[[nodiscard]] constexpr std::string_view to_string(UnitStatus status) noexcept {
    switch (status) {
        case UnitStatus::Idle:        return "idle";
        case UnitStatus::Busy:        return "busy";
        case UnitStatus::Terminating: return "terminating";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Pool Lifecycle
// ─────────────────────────────────────────────

enum class PoolState : uint8_t {
    Initializing,
    Running,
    Draining,
    Terminated     ///< Terminal, no transitions out
};

[[nodiscard]] constexpr std::string_view to_string(PoolState state) noexcept {
    switch (state) {
        case PoolState::Initializing: return "initializing";
        case PoolState::Running:      return "running";
        case PoolState::Draining:     return "draining";
        case PoolState::Terminated:   return "terminated";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Exit Codes
// ─────────────────────────────────────────────

/// Exit code for a unit that returned voluntarily.
inline constexpr int kCleanExit = 0;

/// Exit code of a unit whose handler threw (uncaught error inside the unit).
inline constexpr int kHandlerCrashExit = 1;

/// Exit code reported for a force-terminated unit (128 + SIGKILL).
inline constexpr int kKilledExit = 137;

}  // namespace adaptive_pool
