/**
 * @file main.cpp
 * @brief AdaptivePool demo entry point.
 * @author Dimitris Kafetzis
 *
 * Wires the modules into a load simulation:
 *   Config → Logger → UnitFactory → WorkerPool → synthetic load → Metrics
 *
 * The load runs in three phases (light, burst, cool-down) so the scaling
 * controller has something to react to in both directions.
 */

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/process_unit.hpp"
#include "executor/thread_unit.hpp"
#include "pool/worker_pool.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"
#include "workload/synthetic_task.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace adaptive_pool;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║           AdaptivePool v1.0.0             ║
  ║   Self-scaling, self-healing worker pool  ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string unit_kind;
    std::string log_dir;
    uint32_t tasks = 40;
    uint32_t task_ms = 200;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--unit" && i + 1 < argc) {
            args.unit_kind = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--tasks" && i + 1 < argc) {
            args.tasks = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--task-ms" && i + 1 < argc) {
            args.task_ms = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: adaptive_pool [OPTIONS]\n"
                      << "  --config <path>        Configuration file (default: config/default.toml)\n"
                      << "  --unit thread|process  Execution unit kind (overrides [unit] kind)\n"
                      << "  --log-dir <path>       Log output directory\n"
                      << "  --tasks <n>            Burst size (default: 40)\n"
                      << "  --task-ms <ms>         Compute cost per task (default: 200)\n"
                      << "  --help, -h             Show this help message\n";
            std::exit(0);
        }
    }
    return args;
}

struct PhaseOutcome {
    size_t completed = 0;
    size_t failed = 0;
};

/**
 * @brief Submit @p count tasks spaced by @p spacing and wait for all of them.
 */
PhaseOutcome run_phase(WorkerPool& pool, Logger& logger, std::string_view name,
                       uint32_t count, std::chrono::milliseconds spacing, Duration cost) {
    logger.info("demo", "Phase " + std::string(name) + ": " + std::to_string(count) + " tasks");

    std::vector<TaskHandle> handles;
    handles.reserve(count);
    for (uint32_t i = 0; i < count && !g_shutdown_requested; ++i) {
        SyntheticTask task{.compute_cost = cost, .behavior = TaskBehavior::Succeed, .value = i};
        handles.push_back(pool.execute(encode_synthetic_task(task)));
        if (spacing.count() > 0) std::this_thread::sleep_for(spacing);
    }

    PhaseOutcome outcome;
    for (auto& handle : handles) {
        try {
            handle.result.get();
            ++outcome.completed;
        } catch (const PoolError& e) {
            ++outcome.failed;
            logger.warn("demo", "Task " + std::to_string(handle.id) + " failed ("
                        + std::string(to_string(e.kind())) + "): " + e.what());
        }
    }

    auto metrics = pool.get_metrics();
    logger.info("demo", "Phase " + std::string(name) + " done: "
                + std::to_string(outcome.completed) + " completed, "
                + std::to_string(outcome.failed) + " failed, "
                + std::to_string(metrics.current_units) + " units");
    return outcome;
}

/**
 * @brief Idle for @p duration, waking early on SIGINT/SIGTERM.
 */
void idle_for(std::chrono::milliseconds duration) {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!g_shutdown_requested && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.unit_kind.empty()) config.unit.kind = args.unit_kind;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (config.unit.kind != "thread" && config.unit.kind != "process") {
        std::cerr << "Unknown unit kind: " << config.unit.kind << std::endl;
        return 1;
    }

    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);

    // ── Initialize Logger ────────────────────
    auto make_sink = [&config](const std::string& prefix) -> std::unique_ptr<ILogSink> {
        if (config.telemetry.log_dir.empty()) return std::make_unique<StdoutSink>();
        return std::make_unique<JsonFileSink>(config.telemetry.log_dir, prefix,
                                              config.telemetry.max_file_size_mb,
                                              config.telemetry.rotate_count);
    };
    Logger logger(make_sink("adaptive_pool"), level);
    logger.info("demo", "AdaptivePool starting...");
    logger.info("demo", "Unit kind: " + config.unit.kind);

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Build the pool ───────────────────────
    UnitFactory factory = config.unit.kind == "process"
        ? make_process_unit_factory(run_synthetic_task)
        : make_thread_unit_factory(run_synthetic_task);

    WorkerPool::Options options{
        .config = config.pool,
        .unit_factory = std::move(factory),
        .log_sink = make_sink("pool"),
        .log_level = level,
        .metrics_sink = make_sink("telemetry")
    };

    auto pool_result = WorkerPool::create(std::move(options));
    if (!pool_result) {
        logger.error("demo", "Failed to create pool: " + pool_result.error().message);
        std::cerr << "Failed to create pool: " << pool_result.error().message << std::endl;
        return 1;
    }
    auto pool = std::move(pool_result).value();

    pool->on_fatal([&logger](const PoolFatalError& error) {
        logger.error("demo", std::string("Pool fatal: ") + error.what());
    });

    const Duration cost = std::chrono::milliseconds(args.task_ms);
    const auto tick = std::chrono::milliseconds(config.pool.scaling.check_interval_ms);
    const auto cooldown = std::chrono::milliseconds(config.pool.scaling.cool_down_ms);

    // ── Load simulation ──────────────────────
    run_phase(*pool, logger, "light", 4, std::chrono::milliseconds(args.task_ms), cost);
    if (!g_shutdown_requested) {
        run_phase(*pool, logger, "burst", args.tasks, std::chrono::milliseconds(0), cost);
    }
    if (!g_shutdown_requested) {
        logger.info("demo", "Phase cool-down: idling to let the pool shrink");
        idle_for(4 * (tick + cooldown));
    }

    // ── Graceful Shutdown ────────────────────
    if (g_shutdown_requested) logger.info("demo", "Shutdown requested. Draining pool...");

    auto before_shutdown = pool->get_metrics();
    pool->terminate().wait();
    auto final_metrics = pool->get_metrics();

    std::cout << to_json(final_metrics) << std::endl;
    logger.info("demo", "Peak units " + std::to_string(before_shutdown.peak_units)
                + ", scale-ups " + std::to_string(final_metrics.scale_up_events)
                + ", scale-downs " + std::to_string(final_metrics.scale_down_events));
    logger.info("demo", "AdaptivePool stopped.");
    logger.flush();
    return 0;
}
