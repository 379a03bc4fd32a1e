#pragma once

/**
 * @file overlay_controller.hpp
 * @brief The overlay's event loop: hotkeys in, menu transitions, actions out
 *
 * One loop thread owns the MenuStateMachine. It sleeps on a WakeSignal fed
 * by the hotkey queue, the scheduler's progress queue and the menu's
 * auto-hide deadline, handles whatever woke it, and republishes the view.
 * Terminal actions are handed to the PlaybackScheduler, so nothing on the
 * loop thread ever waits on the game.
 *
 * Usage:
 *   OverlayController overlay(graph, store, injector, 26);
 *   overlay.setViewListener([](const OverlayView& v) { render(v); });
 *   overlay.start();
 *   hotkeySource.run(overlay.hotkeys());  // until Quit
 *   overlay.stop();
 */

#include "valtime/core/animation_store.hpp"
#include "valtime/core/hotkey_source.hpp"
#include "valtime/core/input_injector.hpp"
#include "valtime/core/menu.hpp"
#include "valtime/core/menu_state_machine.hpp"
#include "valtime/core/playback_scheduler.hpp"
#include "valtime/core/wake_signal.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace valtime {

/// What the host UI should draw
struct OverlayView {
    bool visible = false;
    std::string title;
    std::vector<std::string> options;
    std::string footer;
    std::string status;  ///< Last playback report, empty if none

    bool operator==(const OverlayView&) const = default;
};

class OverlayController : public ActionDispatcher {
public:
    using ViewListener = std::function<void(const OverlayView&)>;

    /// All references must outlive the controller.
    OverlayController(const MenuGraph& graph, AnimationStore& store, InputInjector& injector,
                      size_t screenWidth = DEFAULT_SCREEN_WIDTH);
    ~OverlayController() override;

    OverlayController(const OverlayController&) = delete;
    OverlayController& operator=(const OverlayController&) = delete;

    /// Start the scheduler worker and the loop thread. No-op if running or stopped.
    void start();

    /// Stop the loop and the scheduler. Safe to call more than once.
    void stop();

    /// Block until the loop exits (Quit or stop()) or the timeout passes.
    /// @return true if the loop has exited
    bool waitForExit(std::chrono::milliseconds timeout);

    /// Producers push hotkey events here
    [[nodiscard]] HotkeyQueue& hotkeys() { return hotkeys_; }

    /// Called on the loop thread whenever the view changes. Set before start().
    void setViewListener(ViewListener listener) { viewListener_ = std::move(listener); }

    /// Snapshot of the current view (any thread)
    [[nodiscard]] OverlayView view() const;

    [[nodiscard]] PlaybackScheduler& scheduler() { return scheduler_; }

    // ========================================================================
    // ActionDispatcher (loop thread only)
    // ========================================================================

    void dispatchFreeText(const std::string& message) override;
    void dispatchVoiceWheel(int wheelKey, int lineIndex) override;
    void dispatchAnimation(const std::string& name) override;

private:
    void loop();
    void handle(const HotkeyEvent& event);
    void report(const PlaybackEvent& event);
    void publishView();

    AnimationStore& store_;
    size_t screenWidth_;

    WakeSignal wake_;
    HotkeyQueue hotkeys_;
    PlaybackEventQueue progress_;

    PlaybackScheduler scheduler_;
    MenuStateMachine menu_;
    std::string status_;  // loop thread

    ViewListener viewListener_;
    mutable std::mutex viewMutex_;
    OverlayView view_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::mutex exitMutex_;
    std::condition_variable exitCv_;
    bool exited_ = false;
};

}  // namespace valtime
