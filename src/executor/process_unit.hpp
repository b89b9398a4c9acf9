/**
 * @file process_unit.hpp
 * @brief Execution unit backed by a forked child process.
 * @author Dimitris Kafetzis
 *
 * The child runs the TaskHandler in its own address space and talks to the
 * parent over one AF_UNIX stream socketpair using UnitCodec frames:
 *
 *   parent --[request frame]--> child --[response frame]--> parent
 *
 * A reader thread in the parent turns responses into UnitEvents and, once
 * the channel hits EOF, reaps the child and reports its exit status
 * (signal deaths map to 128 + signo). Graceful stop half-closes the channel;
 * the child exits 0 after finishing its current task.
 */

#pragma once

#include "executor/execution_unit.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include <sys/types.h>

namespace adaptive_pool {

class ProcessUnit : public IExecutionUnit {
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    /**
     * @brief Fork a child running @p handler. The handler must be fork-safe:
     *        it may allocate but must not depend on other parent threads.
     */
    static Result<std::unique_ptr<ProcessUnit>> spawn(UnitId id,
                                                      TaskHandler handler,
                                                      UnitEventSink sink);

    /// Use spawn(); the key keeps construction private.
    ProcessUnit(ConstructionKey, UnitId id, pid_t pid, int channel_fd, UnitEventSink sink);
    ~ProcessUnit() override;

    // Non-copyable, non-movable
    ProcessUnit(const ProcessUnit&) = delete;
    ProcessUnit& operator=(const ProcessUnit&) = delete;

    [[nodiscard]] UnitId id() const noexcept override { return id_; }
    Result<void> assign(TaskId task, const Payload& payload) override;
    void request_stop() override;
    void kill() override;
    [[nodiscard]] bool alive() const noexcept override;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

private:
    void reader_loop(std::stop_token stop);
    void handle_frame(const std::vector<uint8_t>& body);
    int reap();
    void emit(UnitEvent event);

    UnitId id_;
    pid_t pid_;
    int channel_fd_;
    UnitEventSink sink_;

    std::mutex mutex_;
    std::optional<TaskId> current_task_;
    bool stopping_ = false;

    std::atomic<bool> killed_{false};
    std::atomic<bool> reaped_{false};
    std::atomic<bool> silenced_{false};   ///< Set by the destructor: no more events

    std::jthread reader_;
};

/**
 * @brief Factory producing ProcessUnits that all run the same handler.
 */
UnitFactory make_process_unit_factory(TaskHandler handler);

}  // namespace adaptive_pool
