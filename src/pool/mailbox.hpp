/**
 * @file mailbox.hpp
 * @brief Ordered multi-producer / single-consumer event queue.
 * @author Dimitris Kafetzis
 *
 * Callers and execution units push from any thread; the dispatcher thread
 * is the only consumer. Closing the mailbox refuses further pushes but
 * leaves already-queued items poppable so the consumer can settle them.
 */

#pragma once

#include "core/types.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace adaptive_pool {

template <typename T>
class Mailbox {
public:
    Mailbox() = default;

    // Non-copyable, non-movable
    Mailbox(const Mailbox&) = delete;
    Mailbox& operator=(const Mailbox&) = delete;

    /// Enqueue an item. Returns false (and leaves @p item untouched) once closed.
    [[nodiscard]] bool push(T&& item) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) return false;
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /// Wait for the next item until @p deadline or a stop request.
    std::optional<T> pop_until(SteadyTime deadline, std::stop_token stop) {
        std::unique_lock lock(mutex_);
        cv_.wait_until(lock, stop, deadline, [this] { return !items_.empty() || closed_; });
        return take_front();
    }

    std::optional<T> try_pop() {
        std::lock_guard lock(mutex_);
        return take_front();
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

private:
    // Caller holds mutex_.
    std::optional<T> take_front() {
        if (items_.empty()) return std::nullopt;
        std::optional<T> item{std::move(items_.front())};
        items_.pop_front();
        return item;
    }

    std::deque<T> items_;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
};

}  // namespace adaptive_pool
