#pragma once

/**
 * @file menu_state_machine.hpp
 * @brief Overlay navigation: Hidden / AtRoot / AtSubmenu
 *
 *   Toggle     Hidden -> AtRoot; any visible state -> Hidden
 *   Select(n)  AtRoot: open the submenu named by option n
 *              AtSubmenu: terminal action, dispatched once, then auto-hide
 *   Back       AtSubmenu -> AtRoot; AtRoot -> Hidden
 *
 * A terminal Select sets selectionPending. Until the next Toggle or Back,
 * further Selects are ignored, so a burst of digit presses dispatches one
 * action. Out-of-range and hidden-state Selects are ignored silently.
 *
 * The auto-hide is a deadline, not a timer thread: the event loop asks
 * nextDeadline(), sleeps until then, and calls update(). Showing the
 * overlay or pressing Back drops a pending auto-hide, so a menu the user
 * reopened or stepped back into during the settle delay stays open. Every transition
 * is synchronous and never blocks; anything slow happens behind the
 * ActionDispatcher.
 *
 * Thread safety: none. Owned and driven by the event loop thread only.
 */

#include "valtime/core/menu.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace valtime {

enum class MenuState : uint8_t {
    Hidden,
    AtRoot,
    AtSubmenu,
};

[[nodiscard]] const char* menuStateName(MenuState state);

/// Abstract sink for terminal menu actions.
/// The state machine routes every action through this instead of touching
/// the injector or scheduler directly. Implementations must return quickly.
class ActionDispatcher {
public:
    virtual ~ActionDispatcher() = default;

    /// Send `message` to chat.
    virtual void dispatchFreeText(const std::string& message) = 0;

    /// Open the native voice wheel at category `wheelKey`, then pick line `lineIndex`.
    virtual void dispatchVoiceWheel(int wheelKey, int lineIndex) = 0;

    /// Play the named animation.
    virtual void dispatchAnimation(const std::string& name) = 0;
};

/// Delay between a terminal action and the overlay hiding itself.
/// Lets the game's own UI finish drawing first.
struct SettleDelays {
    static constexpr std::chrono::milliseconds VOICE_WHEEL{500};
    static constexpr std::chrono::milliseconds DEFAULT{50};

    [[nodiscard]] static std::chrono::milliseconds forAction(const ActionKind& kind);
};

class MenuStateMachine {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    /// @param graph       Menu structure (must outlive the state machine)
    /// @param dispatcher  Terminal action target (must outlive the state machine)
    /// @param now         Clock, injectable for tests
    MenuStateMachine(const MenuGraph& graph, ActionDispatcher& dispatcher,
                     TimeSource now = &Clock::now);

    MenuStateMachine(const MenuStateMachine&) = delete;
    MenuStateMachine& operator=(const MenuStateMachine&) = delete;

    // ========================================================================
    // Events
    // ========================================================================

    void toggle();

    /// @return true if the event navigated or dispatched
    bool select(size_t n);

    void back();

    /// Apply the auto-hide if its deadline has passed.
    /// @return true if the overlay was hidden by this call
    bool update();

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] MenuState state() const { return state_; }
    [[nodiscard]] bool isVisible() const { return state_ != MenuState::Hidden; }
    [[nodiscard]] bool selectionPending() const { return selectionPending_; }

    /// Node currently shown; nullptr while hidden
    [[nodiscard]] const MenuNode* currentNode() const;

    /// Root option (1-based) that opened the current submenu, 0 otherwise
    [[nodiscard]] size_t originIndex() const { return originIndex_; }

    /// When update() should next be called, if an auto-hide is pending
    [[nodiscard]] std::optional<Clock::time_point> nextDeadline() const { return hideDeadline_; }

    /// Terminal actions dispatched so far (including ones that threw)
    [[nodiscard]] uint64_t dispatchCount() const { return dispatchCount_; }

    [[nodiscard]] const MenuGraph& graph() const { return graph_; }

private:
    void show();
    void hide();
    void dispatch(const MenuNode& node, size_t n);

    const MenuGraph& graph_;
    ActionDispatcher& dispatcher_;
    TimeSource now_;

    MenuState state_ = MenuState::Hidden;
    const MenuNode* submenu_ = nullptr;
    size_t originIndex_ = 0;
    bool selectionPending_ = false;
    std::optional<Clock::time_point> hideDeadline_;
    uint64_t dispatchCount_ = 0;
};

}  // namespace valtime
