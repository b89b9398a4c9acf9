/**
 * @file config.hpp
 * @brief Pool configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace adaptive_pool {

/// Fallback when std::thread::hardware_concurrency() reports 0.
inline constexpr uint32_t kFallbackMaxUnits = 4;

struct ScalingConfig {
    uint32_t scale_up_threshold = 5;      ///< Queue depth that triggers growth
    uint32_t scale_down_threshold = 0;    ///< Idle units tolerated before shrinking
    uint32_t cool_down_ms = 1000;         ///< Minimum gap between scaling actions
    uint32_t check_interval_ms = 1000;    ///< Scaling tick period
};

struct RecoveryConfig {
    uint32_t max_restarts_per_slot = 3;
    uint32_t task_timeout_ms = 0;         ///< 0 = no default timeout
    bool kill_on_timeout = false;         ///< Force-terminate the unit of a timed-out task
};

/**
 * @brief Everything the pool needs except the unit factory (which is code).
 */
struct PoolConfig {
    uint32_t min_units = 2;
    uint32_t max_units = 0;               ///< 0 = hardware_concurrency
    uint32_t max_queue_depth = 0;         ///< 0 = unbounded
    uint32_t grace_period_ms = 5000;      ///< Drain budget before force-kill
    ScalingConfig scaling;
    RecoveryConfig recovery;
};

struct UnitConfig {
    std::string kind = "thread";          ///< "thread" or "process"
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level application configuration.
 */
struct Config {
    PoolConfig pool;
    UnitConfig unit;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Replace max_units == 0 with the host's hardware concurrency.
 */
PoolConfig resolve_defaults(PoolConfig config);

/**
 * @brief Reject bounds and intervals the pool cannot honor.
 */
Result<void> validate(const PoolConfig& config);

}  // namespace adaptive_pool
