#include "valtime/core/playback_scheduler.hpp"
#include "valtime/core/errors.hpp"
#include "valtime/core/text.hpp"
#include "valtime/core/wire_format.hpp"

#include <algorithm>
#include <iostream>

namespace valtime {

std::vector<size_t> selectPlaybackIndices(size_t frameCount, int stride) {
    std::vector<size_t> indices;
    if (frameCount == 0) {
        return indices;
    }

    const size_t step = static_cast<size_t>(std::max(stride, 1));
    indices.reserve(frameCount / step + 2);
    for (size_t i = 0; i < frameCount; i += step) {
        indices.push_back(i);
    }
    if (indices.back() != frameCount - 1) {
        indices.push_back(frameCount - 1);
    }
    return indices;
}

// ============================================================================
// PlaybackRequest / PlaybackEvent
// ============================================================================

PlaybackRequest PlaybackRequest::animation(const Animation& animation, size_t screenWidth,
                                           std::chrono::milliseconds leadIn) {
    PlaybackRequest request;
    request.label = animation.name;
    request.leadIn = leadIn;
    request.stepDelay = animation.settings.frameDelay;
    request.frames = animation.frames;
    request.frameIndices = selectPlaybackIndices(animation.frameCount(), animation.settings.skipStride);
    request.screenWidth = screenWidth;
    return request;
}

PlaybackRequest PlaybackRequest::oneShot(std::string label, InputSequence sequence,
                                         std::chrono::milliseconds leadIn) {
    PlaybackRequest request;
    request.label = std::move(label);
    request.leadIn = leadIn;
    request.sequence = std::move(sequence);
    return request;
}

const char* outcomeName(PlaybackOutcome outcome) {
    switch (outcome) {
        case PlaybackOutcome::Completed: return "completed";
        case PlaybackOutcome::Cancelled: return "cancelled";
        case PlaybackOutcome::Failed: return "failed";
    }
    return "unknown";
}

PlaybackEvent PlaybackEvent::progress(uint64_t id, const std::string& label,
                                      size_t played, size_t total) {
    PlaybackEvent event;
    event.type = PlaybackEventType::FrameProgress;
    event.requestId = id;
    event.label = label;
    event.played = played;
    event.total = total;
    return event;
}

PlaybackEvent PlaybackEvent::finished(uint64_t id, const std::string& label, size_t played,
                                      size_t total, PlaybackOutcome outcome, std::string error) {
    PlaybackEvent event;
    event.type = PlaybackEventType::Finished;
    event.requestId = id;
    event.label = label;
    event.played = played;
    event.total = total;
    event.outcome = outcome;
    event.error = std::move(error);
    return event;
}

// ============================================================================
// PlaybackScheduler
// ============================================================================

PlaybackScheduler::PlaybackScheduler(InputInjector& injector, PlaybackEventQueue* events)
    : injector_(injector)
    , events_(events)
{
}

PlaybackScheduler::~PlaybackScheduler() {
    stop();
}

void PlaybackScheduler::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_ || stopped_) {
            return;
        }
        running_ = true;
    }
    worker_ = std::thread(&PlaybackScheduler::workerLoop, this);
}

void PlaybackScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
        currentToken_.cancel();
        jobs_.shutdown();
    }

    if (worker_.joinable()) {
        worker_.join();
    }
    running_ = false;

    // Jobs that never reached a worker (never started, or queued behind the
    // one that was running) still owe their Finished event
    for (Job& job : jobs_.drainAll()) {
        finishCancelled(job);
    }
}

uint64_t PlaybackScheduler::submit(PlaybackRequest request) {
    std::lock_guard<std::mutex> lock(mutex_);
    const uint64_t id = nextId_++;

    if (stopped_) {
        publish(PlaybackEvent::finished(id, request.label, 0, request.stepCount(),
                                        PlaybackOutcome::Cancelled));
        return id;
    }

    currentToken_.cancel();

    Job job;
    job.id = id;
    job.request = std::move(request);
    currentToken_ = job.token;
    ++outstanding_;
    jobs_.push(std::move(job));
    return id;
}

uint64_t PlaybackScheduler::play(const Animation& animation, size_t screenWidth) {
    return submit(PlaybackRequest::animation(animation, screenWidth));
}

void PlaybackScheduler::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    currentToken_.cancel();
}

bool PlaybackScheduler::isIdle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_ == 0;
}

bool PlaybackScheduler::waitUntilIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idleCv_.wait_for(lock, timeout, [this]() { return outstanding_ == 0; });
}

void PlaybackScheduler::workerLoop() {
    while (jobs_.waitForWork()) {
        while (auto job = jobs_.tryPop()) {
            runJob(*job);
        }
    }
}

void PlaybackScheduler::runJob(Job& job) {
    const PlaybackRequest& request = job.request;
    const size_t total = request.stepCount();

    if (job.token.isCancelled()) {
        finishCancelled(job);
        return;
    }

    if (request.frames) {
        std::cout << "[PlaybackScheduler] Playing '" << request.label << "': " << total
                  << " of " << request.frames->size() << " frames\n";
    }

    size_t played = 0;
    PlaybackOutcome outcome = PlaybackOutcome::Completed;
    std::string error;

    try {
        if (!job.token.sleepFor(request.leadIn)) {
            outcome = PlaybackOutcome::Cancelled;
        } else {
            const auto stepDelay = std::chrono::ceil<std::chrono::microseconds>(
                std::clamp(request.stepDelay, Seconds(0.0), MAX_FRAME_DELAY));
            for (size_t step = 0; step < total; ++step) {
                if (job.token.isCancelled()) {
                    outcome = PlaybackOutcome::Cancelled;
                    break;
                }

                emitStep(job, step);
                ++played;
                publish(PlaybackEvent::progress(job.id, request.label, played, total));

                if (step + 1 < total && !job.token.sleepFor(stepDelay)) {
                    outcome = PlaybackOutcome::Cancelled;
                    break;
                }
            }
        }
    } catch (const InjectionError& e) {
        outcome = PlaybackOutcome::Failed;
        error = e.what();
    } catch (const std::exception& e) {
        outcome = PlaybackOutcome::Failed;
        error = e.what();
    }

    if (outcome == PlaybackOutcome::Failed) {
        std::cerr << "[PlaybackScheduler] ERROR: '" << request.label << "' failed after "
                  << played << "/" << total << " steps: " << error << '\n';
    }

    publish(PlaybackEvent::finished(job.id, request.label, played, total, outcome, std::move(error)));
    markFinished();
}

void PlaybackScheduler::emitStep(const Job& job, size_t step) {
    const PlaybackRequest& request = job.request;

    if (!request.frames) {
        injector_.send(request.sequence);
        return;
    }

    const Frame& frame = request.frames->at(request.frameIndices.at(step));
    std::u32string payload = formatPayload(frame, request.screenWidth);

    // Blank frames count toward progress but send nothing
    if (isBlank(payload)) {
        return;
    }
    injector_.sendFrame(utf32ToUtf8(payload));
}

void PlaybackScheduler::finishCancelled(const Job& job) {
    publish(PlaybackEvent::finished(job.id, job.request.label, 0, job.request.stepCount(),
                                    PlaybackOutcome::Cancelled));
    markFinished();
}

void PlaybackScheduler::publish(PlaybackEvent event) {
    if (events_) {
        events_->push(std::move(event));
    }
}

void PlaybackScheduler::markFinished() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (outstanding_ > 0) {
            --outstanding_;
        }
    }
    idleCv_.notify_all();
}

}  // namespace valtime
