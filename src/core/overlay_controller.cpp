#include "valtime/core/overlay_controller.hpp"

#include <iostream>

namespace valtime {

OverlayController::OverlayController(const MenuGraph& graph, AnimationStore& store,
                                     InputInjector& injector, size_t screenWidth)
    : store_(store)
    , screenWidth_(screenWidth)
    , scheduler_(injector, &progress_)
    , menu_(graph, *this)
    , exited_(true)
{
    hotkeys_.attach(&wake_);
    progress_.attach(&wake_);
}

OverlayController::~OverlayController() {
    stop();
    hotkeys_.detach();
    progress_.detach();
}

void OverlayController::start() {
    // A stopped controller stays stopped
    if (running_ || wake_.isShutdown()) {
        return;
    }
    running_ = true;
    {
        std::lock_guard<std::mutex> lock(exitMutex_);
        exited_ = false;
    }

    scheduler_.start();
    thread_ = std::thread(&OverlayController::loop, this);
    std::cout << "[Overlay] Started\n";
}

void OverlayController::stop() {
    if (!running_) {
        return;
    }

    wake_.requestShutdown();
    if (thread_.joinable()) {
        thread_.join();
    }
    scheduler_.stop();
    hotkeys_.shutdown();
    running_ = false;

    // Terminal events published while the scheduler wound down
    for (const auto& event : progress_.drainAll()) {
        report(event);
    }
    std::cout << "[Overlay] Stopped\n";
}

bool OverlayController::waitForExit(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(exitMutex_);
    return exitCv_.wait_for(lock, timeout, [this]() { return exited_; });
}

OverlayView OverlayController::view() const {
    std::lock_guard<std::mutex> lock(viewMutex_);
    return view_;
}

// ============================================================================
// Event loop
// ============================================================================

void OverlayController::loop() {
    publishView();

    bool quit = false;
    while (!quit) {
        if (auto due = menu_.nextDeadline()) {
            wake_.setDeadline(*due);
        } else {
            wake_.clearDeadline();
        }

        if (!wake_.wait()) {
            break;
        }

        for (const auto& event : hotkeys_.drainAll()) {
            if (event.type == HotkeyEventType::Quit) {
                quit = true;
                break;
            }
            handle(event);
        }

        for (const auto& event : progress_.drainAll()) {
            report(event);
        }

        menu_.update();
        publishView();
    }

    {
        std::lock_guard<std::mutex> lock(exitMutex_);
        exited_ = true;
    }
    exitCv_.notify_all();
}

void OverlayController::handle(const HotkeyEvent& event) {
    switch (event.type) {
        case HotkeyEventType::Toggle:
            menu_.toggle();
            break;
        case HotkeyEventType::Select:
            menu_.select(event.index);
            break;
        case HotkeyEventType::Back:
            menu_.back();
            break;
        case HotkeyEventType::Quit:
            break;
    }
}

void OverlayController::report(const PlaybackEvent& event) {
    if (event.type == PlaybackEventType::FrameProgress) {
        status_ = event.label + " " + std::to_string(event.played) + "/" + std::to_string(event.total);
        return;
    }

    status_ = event.label + " " + outcomeName(event.outcome);
    if (event.outcome == PlaybackOutcome::Failed) {
        std::cerr << "[Overlay] WARNING: " << event.label << " failed: " << event.error << '\n';
    } else {
        std::cout << "[Overlay] " << event.label << " " << outcomeName(event.outcome) << " ("
                  << event.played << "/" << event.total << ")\n";
    }
}

void OverlayController::publishView() {
    OverlayView next;
    if (const MenuNode* node = menu_.currentNode()) {
        next.visible = true;
        next.title = headerTitle(*node);
        next.options = node->options;
        next.footer = footerHint(*node);
    }
    next.status = status_;

    {
        std::lock_guard<std::mutex> lock(viewMutex_);
        if (next == view_) {
            return;
        }
        view_ = next;
    }

    if (viewListener_) {
        viewListener_(next);
    }
}

// ============================================================================
// ActionDispatcher
// ============================================================================

void OverlayController::dispatchFreeText(const std::string& message) {
    scheduler_.submit(PlaybackRequest::oneShot("Message '" + message + "'",
                                               InputInjector::encodeFreeText(message),
                                               InjectionTiming::TEXT_LEAD_IN));
}

void OverlayController::dispatchVoiceWheel(int wheelKey, int lineIndex) {
    scheduler_.submit(PlaybackRequest::oneShot(
        "Voice line " + std::to_string(wheelKey) + "-" + std::to_string(lineIndex),
        InputInjector::encodeVoiceWheel(wheelKey, lineIndex),
        InjectionTiming::WHEEL_LEAD_IN));
}

void OverlayController::dispatchAnimation(const std::string& name) {
    scheduler_.play(store_.get(name), screenWidth_);
}

}  // namespace valtime
