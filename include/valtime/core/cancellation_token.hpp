#pragma once

/**
 * @file cancellation_token.hpp
 * @brief Cooperative cancellation flag with an interruptible sleep
 *
 * Copies share state. The scheduler hands one token to each playback;
 * cancelling it stops the playback at its next check (between frames,
 * never mid-keystroke) and cuts short any inter-frame sleep.
 */

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace valtime {

class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->cancelled = true;
        }
        state_->cv.notify_all();
    }

    [[nodiscard]] bool isCancelled() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->cancelled;
    }

    /// Sleep for `duration` unless cancelled first.
    /// @return true if the full duration elapsed, false if cancelled
    template<typename Rep, typename Period>
    bool sleepFor(std::chrono::duration<Rep, Period> duration) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return !state_->cv.wait_for(lock, duration, [this]() { return state_->cancelled; });
    }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
    };

    std::shared_ptr<State> state_;
};

}  // namespace valtime
