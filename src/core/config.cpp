/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <limits>
#include <stdexcept>
#include <thread>

#include <toml++/toml.hpp>

namespace adaptive_pool {

namespace {

/// Throws std::out_of_range when the value does not fit a uint32_t.
uint32_t read_u32(const toml::node_view<toml::node>& table, std::string_view key, uint32_t fallback) {
    int64_t value = table[key].value_or(static_cast<int64_t>(fallback));
    constexpr int64_t kMax = std::numeric_limits<uint32_t>::max();
    if (value < 0 || value > kMax) {
        throw std::out_of_range(std::string{key} + " must be between 0 and "
                                + std::to_string(kMax) + ", got " + std::to_string(value));
    }
    return static_cast<uint32_t>(value);
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string(), ErrorKind::Config};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [pool]
        if (auto pool = tbl["pool"]; pool.is_table()) {
            config.pool.min_units = read_u32(pool, "min_units", config.pool.min_units);
            config.pool.max_units = read_u32(pool, "max_units", config.pool.max_units);
            config.pool.max_queue_depth =
                read_u32(pool, "max_queue_depth", config.pool.max_queue_depth);
        }

        // [scaling]
        if (auto scaling = tbl["scaling"]; scaling.is_table()) {
            auto& s = config.pool.scaling;
            s.scale_up_threshold = read_u32(scaling, "scale_up_threshold", s.scale_up_threshold);
            s.scale_down_threshold = read_u32(scaling, "scale_down_threshold", s.scale_down_threshold);
            s.cool_down_ms = read_u32(scaling, "cool_down_ms", s.cool_down_ms);
            s.check_interval_ms = read_u32(scaling, "check_interval_ms", s.check_interval_ms);
        }

        // [recovery]
        if (auto recovery = tbl["recovery"]; recovery.is_table()) {
            auto& r = config.pool.recovery;
            r.max_restarts_per_slot =
                read_u32(recovery, "max_restarts_per_slot", r.max_restarts_per_slot);
            r.task_timeout_ms = read_u32(recovery, "task_timeout_ms", r.task_timeout_ms);
            r.kill_on_timeout = recovery["kill_on_timeout"].value_or(r.kill_on_timeout);
        }

        // [shutdown]
        if (auto shutdown = tbl["shutdown"]; shutdown.is_table()) {
            config.pool.grace_period_ms =
                read_u32(shutdown, "grace_period_ms", config.pool.grace_period_ms);
        }

        // [unit]
        if (auto unit = tbl["unit"]; unit.is_table()) {
            config.unit.kind = unit["kind"].value_or(std::string{"thread"});
            if (config.unit.kind != "thread" && config.unit.kind != "process") {
                return Error{"Unknown unit kind: " + config.unit.kind, ErrorKind::Config};
            }
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb =
                read_u32(telemetry, "max_file_size_mb", config.telemetry.max_file_size_mb);
            config.telemetry.rotate_count =
                read_u32(telemetry, "rotate_count", config.telemetry.rotate_count);
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            if (auto level = parse_log_level(config.telemetry.log_level); !level) {
                return level.error();
            }
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()},
                     ErrorKind::Config};
    } catch (const std::out_of_range& err) {
        return Error{err.what(), ErrorKind::Config};
    }
}

Config default_config() {
    return Config{};
}

PoolConfig resolve_defaults(PoolConfig config) {
    if (config.max_units == 0) {
        config.max_units = std::thread::hardware_concurrency();
        if (config.max_units == 0) config.max_units = kFallbackMaxUnits;
        if (config.max_units < config.min_units) config.max_units = config.min_units;
    }
    return config;
}

Result<void> validate(const PoolConfig& config) {
    if (config.min_units == 0) {
        return Error{"min_units must be at least 1", ErrorKind::Config};
    }
    if (config.max_units != 0 && config.min_units > config.max_units) {
        return Error{"min_units (" + std::to_string(config.min_units)
                     + ") exceeds max_units (" + std::to_string(config.max_units) + ")",
                     ErrorKind::Config};
    }
    if (config.scaling.check_interval_ms == 0) {
        return Error{"check_interval_ms must be positive", ErrorKind::Config};
    }
    if (config.recovery.max_restarts_per_slot == 0) {
        return Error{"max_restarts_per_slot must be at least 1", ErrorKind::Config};
    }
    return Result<void>{};
}

}  // namespace adaptive_pool
