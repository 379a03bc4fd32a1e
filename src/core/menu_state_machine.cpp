#include "valtime/core/menu_state_machine.hpp"

#include <iostream>
#include <type_traits>
#include <variant>

namespace valtime {

const char* menuStateName(MenuState state) {
    switch (state) {
        case MenuState::Hidden: return "Hidden";
        case MenuState::AtRoot: return "AtRoot";
        case MenuState::AtSubmenu: return "AtSubmenu";
    }
    return "Unknown";
}

std::chrono::milliseconds SettleDelays::forAction(const ActionKind& kind) {
    return std::holds_alternative<VoiceWheelAction>(kind) ? VOICE_WHEEL : DEFAULT;
}

MenuStateMachine::MenuStateMachine(const MenuGraph& graph, ActionDispatcher& dispatcher,
                                   TimeSource now)
    : graph_(graph)
    , dispatcher_(dispatcher)
    , now_(std::move(now))
{
}

const MenuNode* MenuStateMachine::currentNode() const {
    switch (state_) {
        case MenuState::AtRoot: return &graph_.root();
        case MenuState::AtSubmenu: return submenu_;
        case MenuState::Hidden: break;
    }
    return nullptr;
}

void MenuStateMachine::show() {
    state_ = MenuState::AtRoot;
    submenu_ = nullptr;
    originIndex_ = 0;
    selectionPending_ = false;
    hideDeadline_.reset();
}

void MenuStateMachine::hide() {
    state_ = MenuState::Hidden;
    submenu_ = nullptr;
    originIndex_ = 0;
    hideDeadline_.reset();
}

// ============================================================================
// Events
// ============================================================================

void MenuStateMachine::toggle() {
    if (state_ == MenuState::Hidden) {
        show();
    } else {
        hide();
    }
}

bool MenuStateMachine::select(size_t n) {
    if (state_ == MenuState::Hidden || selectionPending_) {
        return false;
    }

    if (state_ == MenuState::AtRoot) {
        // Options that name no submenu are accepted and do nothing
        const MenuNode* target = graph_.submenuAt(n);
        if (!target) {
            return false;
        }
        state_ = MenuState::AtSubmenu;
        submenu_ = target;
        originIndex_ = n;
        selectionPending_ = false;
        return true;
    }

    if (n < 1 || n > submenu_->optionCount()) {
        return false;
    }

    selectionPending_ = true;
    dispatch(*submenu_, n);
    hideDeadline_ = now_() + SettleDelays::forAction(*submenu_->action);
    return true;
}

void MenuStateMachine::back() {
    switch (state_) {
        case MenuState::AtSubmenu:
            state_ = MenuState::AtRoot;
            submenu_ = nullptr;
            originIndex_ = 0;
            selectionPending_ = false;
            hideDeadline_.reset();
            break;
        case MenuState::AtRoot:
            hide();
            break;
        case MenuState::Hidden:
            break;
    }
}

bool MenuStateMachine::update() {
    if (!hideDeadline_ || now_() < *hideDeadline_) {
        return false;
    }
    hide();
    return true;
}

void MenuStateMachine::dispatch(const MenuNode& node, size_t n) {
    const std::string& label = node.options[n - 1];
    ++dispatchCount_;

    try {
        std::visit([&](const auto& action) {
            using T = std::decay_t<decltype(action)>;
            if constexpr (std::is_same_v<T, VoiceWheelAction>) {
                dispatcher_.dispatchVoiceWheel(action.wheelKey, static_cast<int>(n));
            } else if constexpr (std::is_same_v<T, AnimationAction>) {
                dispatcher_.dispatchAnimation(label);
            } else {
                dispatcher_.dispatchFreeText(label);
            }
        }, *node.action);
    } catch (const std::exception& e) {
        std::cerr << "[MenuStateMachine] ERROR: " << actionKindName(*node.action) << " '"
                  << label << "' failed: " << e.what() << '\n';
    }
}

}  // namespace valtime
