/**
 * @file synthetic_task.cpp
 * @brief Synthetic task codec and handler.
 * @author Dimitris Kafetzis
 */

#include "workload/synthetic_task.hpp"

#include "executor/unit_codec.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace adaptive_pool {

namespace {

constexpr size_t kEncodedSize = 1 + 8 + 8;

}  // anonymous namespace

Payload encode_synthetic_task(const SyntheticTask& task) {
    std::vector<uint8_t> buf;
    buf.reserve(kEncodedSize);
    buf.push_back(static_cast<uint8_t>(task.behavior));
    UnitCodec::put_u64(buf, static_cast<uint64_t>(task.compute_cost.count()));
    UnitCodec::put_u64(buf, task.value);
    return Payload(buf.begin(), buf.end());
}

Result<SyntheticTask> decode_synthetic_task(const Payload& payload) {
    if (payload.size() != kEncodedSize) {
        return Error{"Synthetic task payload must be " + std::to_string(kEncodedSize)
                     + " bytes, got " + std::to_string(payload.size()), ErrorKind::Protocol};
    }

    const auto* p = reinterpret_cast<const uint8_t*>(payload.data());
    if (p[0] > static_cast<uint8_t>(TaskBehavior::Crash)) {
        return Error{"Unknown synthetic behavior: " + std::to_string(p[0]), ErrorKind::Protocol};
    }

    SyntheticTask task;
    task.behavior = static_cast<TaskBehavior>(p[0]);
    task.compute_cost = Duration{static_cast<Duration::rep>(UnitCodec::get_u64(p + 1))};
    task.value = UnitCodec::get_u64(p + 9);
    return task;
}

Result<Output> run_synthetic_task(const Payload& payload, std::stop_token stop) {
    auto decoded = decode_synthetic_task(payload);
    if (!decoded) {
        return Error{decoded.error().message, ErrorKind::Task};
    }
    const auto& task = *decoded;

    simulate_compute(task.compute_cost, stop);
    if (stop.stop_requested()) {
        return Error{"Cancelled via stop token", ErrorKind::Cancelled};
    }

    switch (task.behavior) {
        case TaskBehavior::Succeed:
            return Output{std::to_string(task.value)};
        case TaskBehavior::Fail:
            return Error{"Synthetic failure for value " + std::to_string(task.value),
                         ErrorKind::Task};
        case TaskBehavior::Crash:
            throw std::runtime_error("Synthetic crash for value " + std::to_string(task.value));
    }
    return Error{"Unreachable synthetic behavior", ErrorKind::Task};
}

void simulate_compute(Duration target_duration, std::stop_token stop) {
    // Busy-wait simulation calibrated to target duration
    auto start = std::chrono::steady_clock::now();
    volatile uint64_t counter = 0;

    while (!stop.stop_requested()) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<Duration>(elapsed) >= target_duration) break;

        // Synthetic work to burn CPU cycles
        for (int i = 0; i < 1000; ++i) {
            counter += static_cast<uint64_t>(i) * static_cast<uint64_t>(i);
        }
    }
}

}  // namespace adaptive_pool
