#pragma once

/**
 * @file event_queue.hpp
 * @brief Thread-safe FIFO with WakeSignal attachment
 *
 * Carries hotkey events into the event loop, playback progress back out
 * of the scheduler, and jobs into the scheduler's worker. push() never
 * blocks, so a producer can't stall on a slow consumer.
 *
 * Two ways to consume:
 * - single queue: waitForWork() on the queue's own condition variable
 * - several queues: attach them all to one WakeSignal and wait on that
 *
 * After shutdown() pushes are dropped, pops drain what is left, and
 * waitForWork() returns false.
 */

#include "valtime/core/wake_signal.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace valtime {

template<typename T>
class EventQueue {
public:
    EventQueue() = default;

    // Non-copyable, non-movable (owns mutex/condition_variable)
    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;
    EventQueue(EventQueue&&) = delete;
    EventQueue& operator=(EventQueue&&) = delete;

    /// Signal `signal` on every push. If items are already queued it is
    /// signaled immediately. The signal must outlive the queue or be detached.
    void attach(WakeSignal* signal) {
        std::lock_guard<std::mutex> lock(mutex_);
        signal_ = signal;
        if (signal_ && !items_.empty()) {
            signal_->signal();
        }
    }

    void detach() {
        std::lock_guard<std::mutex> lock(mutex_);
        signal_ = nullptr;
    }

    void push(const T& item) {
        WakeSignal* toNotify = nullptr;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_) return;
            items_.push_back(item);
            toNotify = signal_;
        }
        condition_.notify_all();
        if (toNotify) toNotify->signal();
    }

    void push(T&& item) {
        WakeSignal* toNotify = nullptr;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_) return;
            items_.push_back(std::move(item));
            toNotify = signal_;
        }
        condition_.notify_all();
        if (toNotify) toNotify->signal();
    }

    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    std::vector<T> drainAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> result;
        result.reserve(items_.size());
        while (!items_.empty()) {
            result.push_back(std::move(items_.front()));
            items_.pop_front();
        }
        return result;
    }

    /// Block until an item is queued or shutdown. Does not pop.
    /// @return false on shutdown (even if items remain)
    bool waitForWork() {
        std::unique_lock<std::mutex> lock(mutex_);
        condition_.wait(lock, [this]() { return shutdown_ || !items_.empty(); });
        return !shutdown_;
    }

    void shutdown() {
        WakeSignal* toNotify = nullptr;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
            toNotify = signal_;
        }
        condition_.notify_all();
        if (toNotify) toNotify->signal();
    }

    [[nodiscard]] bool isShutdown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }

    [[nodiscard]] bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<T> items_;
    WakeSignal* signal_ = nullptr;
    bool shutdown_ = false;
};

}  // namespace valtime
