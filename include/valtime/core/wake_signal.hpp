#pragma once

/**
 * @file wake_signal.hpp
 * @brief Wakes one consumer when any attached queue receives an item
 *
 * The overlay's event loop sleeps on a single WakeSignal fed by two
 * queues (hotkey events, playback progress) and a deadline (the menu's
 * pending auto-hide). Whichever comes first wakes it.
 *
 * Usage:
 *   WakeSignal wake;
 *   EventQueue<HotkeyEvent> hotkeys;
 *   EventQueue<PlaybackEvent> progress;
 *   hotkeys.attach(&wake);
 *   progress.attach(&wake);
 *
 *   while (true) {
 *       if (auto due = menu.nextDeadline()) wake.setDeadline(*due);
 *       else wake.clearDeadline();
 *       if (!wake.wait()) break;  // shutdown
 *       while (auto e = hotkeys.tryPop()) handle(*e);
 *       while (auto p = progress.tryPop()) report(*p);
 *       menu.update();
 *   }
 */

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace valtime {

class WakeSignal {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    WakeSignal() = default;

    // Non-copyable, non-movable (owns synchronization primitives)
    WakeSignal(const WakeSignal&) = delete;
    WakeSignal& operator=(const WakeSignal&) = delete;
    WakeSignal(WakeSignal&&) = delete;
    WakeSignal& operator=(WakeSignal&&) = delete;

    /// Producer side: work is available.
    void signal() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            signaled_ = true;
        }
        cv_.notify_all();
    }

    /// Block until signaled, the deadline passes, or shutdown.
    /// Clears the signaled state before returning.
    /// @return false if shutdown was requested
    bool wait() {
        std::unique_lock<std::mutex> lock(mutex_);

        auto ready = [this]() {
            return shutdown_ || signaled_ || (hasDeadline_ && Clock::now() >= deadline_);
        };

        while (!ready()) {
            if (hasDeadline_) {
                cv_.wait_until(lock, deadline_);
            } else {
                cv_.wait(lock);
            }
        }

        signaled_ = false;
        return !shutdown_;
    }

    /// wait() bounded by a timeout (ignores the deadline)
    bool waitFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() { return shutdown_ || signaled_; });
        signaled_ = false;
        return !shutdown_;
    }

    /// Replace any existing deadline. A past deadline makes the next wait() return at once.
    void setDeadline(TimePoint when) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            deadline_ = when;
            hasDeadline_ = true;
        }
        cv_.notify_all();
    }

    void clearDeadline() {
        std::lock_guard<std::mutex> lock(mutex_);
        hasDeadline_ = false;
    }

    [[nodiscard]] bool hasDeadline() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return hasDeadline_;
    }

    /// All current and future wait() calls return false.
    void requestShutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool isShutdown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    bool signaled_ = false;
    bool shutdown_ = false;
    bool hasDeadline_ = false;
    TimePoint deadline_;
};

}  // namespace valtime
