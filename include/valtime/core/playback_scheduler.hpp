#pragma once

/**
 * @file playback_scheduler.hpp
 * @brief Timed, cancellable emission of overlay actions on a worker thread
 *
 * Everything that takes wall-clock time (animation playback, the chat and
 * voice-wheel key sequences) runs here so the event loop never sleeps.
 *
 * Exactly one request is live at a time. submit() cancels the previous
 * request before queueing the new one; the worker only starts a request
 * after the previous one has returned, so two keystroke streams never
 * interleave. Cancellation is checked between frames only, so a cancelled
 * playback may still emit the frame it was in the middle of.
 *
 * Every request produces exactly one PlaybackEvent::finished on the
 * progress queue, whether it completed, was cancelled (even before it
 * started), or failed.
 *
 * Design: animation frames are stride-sampled from index 0, and the last
 * frame is appended by index if the stride skipped it, so the final pose
 * always shows.
 */

#include "valtime/core/animation_store.hpp"
#include "valtime/core/cancellation_token.hpp"
#include "valtime/core/event_queue.hpp"
#include "valtime/core/input_injector.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace valtime {

// ============================================================================
// Frame selection
// ============================================================================

/// Indices 0, k, 2k, ... plus frameCount-1 if not already last.
/// Empty for frameCount == 0. Strides below 1 are treated as 1.
[[nodiscard]] std::vector<size_t> selectPlaybackIndices(size_t frameCount, int stride);

// ============================================================================
// PlaybackRequest
// ============================================================================

struct PlaybackRequest {
    std::string label;
    std::chrono::milliseconds leadIn{0};  ///< Wait before the first step
    Seconds stepDelay{0.0};               ///< Wait between steps (not after the last)

    // Animation playback (frames != nullptr): one step per selected frame,
    // formatted lazily. Frames are shared, not copied.
    SharedFrames frames;
    std::vector<size_t> frameIndices;
    size_t screenWidth = DEFAULT_SCREEN_WIDTH;

    // One-shot dispatch (frames == nullptr): a single pre-encoded step
    InputSequence sequence;

    [[nodiscard]] size_t stepCount() const { return frames ? frameIndices.size() : 1; }

    static PlaybackRequest animation(const Animation& animation,
                                     size_t screenWidth = DEFAULT_SCREEN_WIDTH,
                                     std::chrono::milliseconds leadIn = InjectionTiming::ANIMATION_LEAD_IN);

    static PlaybackRequest oneShot(std::string label, InputSequence sequence,
                                   std::chrono::milliseconds leadIn);
};

// ============================================================================
// PlaybackEvent - progress sent from the worker to the event loop
// ============================================================================

enum class PlaybackOutcome : uint8_t {
    Completed,
    Cancelled,
    Failed,
};

[[nodiscard]] const char* outcomeName(PlaybackOutcome outcome);

enum class PlaybackEventType : uint8_t {
    FrameProgress,  // One more step emitted
    Finished,       // Terminal; exactly one per request
};

struct PlaybackEvent {
    PlaybackEventType type = PlaybackEventType::FrameProgress;
    uint64_t requestId = 0;
    std::string label;
    size_t played = 0;
    size_t total = 0;
    PlaybackOutcome outcome = PlaybackOutcome::Completed;
    std::string error;  // Failed only

    static PlaybackEvent progress(uint64_t id, const std::string& label, size_t played, size_t total);
    static PlaybackEvent finished(uint64_t id, const std::string& label, size_t played, size_t total,
                                  PlaybackOutcome outcome, std::string error = {});
};

using PlaybackEventQueue = EventQueue<PlaybackEvent>;

// ============================================================================
// PlaybackScheduler
// ============================================================================

class PlaybackScheduler {
public:
    /// @param injector  Target for emitted steps (must outlive the scheduler)
    /// @param events    Optional progress channel (must outlive the scheduler)
    explicit PlaybackScheduler(InputInjector& injector, PlaybackEventQueue* events = nullptr);
    ~PlaybackScheduler();

    PlaybackScheduler(const PlaybackScheduler&) = delete;
    PlaybackScheduler& operator=(const PlaybackScheduler&) = delete;

    /// Launch the worker thread. No-op if already running or stopped.
    void start();

    /// Cancel everything, finish queued requests as Cancelled, join the worker.
    /// A stopped scheduler stays stopped; later submits finish as Cancelled.
    void stop();

    [[nodiscard]] bool isRunning() const { return running_; }

    /// Cancel the current request and queue this one.
    /// @return request id carried by its PlaybackEvents
    uint64_t submit(PlaybackRequest request);

    /// Convenience for submit(PlaybackRequest::animation(...))
    uint64_t play(const Animation& animation, size_t screenWidth = DEFAULT_SCREEN_WIDTH);

    /// Request cancellation of the current request (advisory).
    void cancel();

    /// True when no request is queued or running
    [[nodiscard]] bool isIdle() const;

    /// Block until idle or timeout. Not for the event loop; for shutdown and tests.
    bool waitUntilIdle(std::chrono::milliseconds timeout);

private:
    struct Job {
        uint64_t id = 0;
        PlaybackRequest request;
        CancellationToken token;
    };

    void workerLoop();
    void runJob(Job& job);
    void emitStep(const Job& job, size_t step);
    void finishCancelled(const Job& job);
    void publish(PlaybackEvent event);
    void markFinished();

    InputInjector& injector_;
    PlaybackEventQueue* events_;

    EventQueue<Job> jobs_;
    std::thread worker_;
    std::atomic<bool> running_{false};

    mutable std::mutex mutex_;  // guards everything below
    std::condition_variable idleCv_;
    CancellationToken currentToken_;
    uint64_t nextId_ = 1;
    size_t outstanding_ = 0;
    bool stopped_ = false;
};

}  // namespace valtime
