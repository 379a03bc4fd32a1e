#pragma once

/**
 * @file input_event.hpp
 * @brief Synthesized input events emitted by the injector
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace valtime {

/// Keys the injection protocols use. Mapped to OS key codes by each InputSink.
enum class KeyCode : uint8_t {
    Shift,
    Control,
    Enter,
    Backslash,
    V,
    Digit0,
    Digit1,
    Digit2,
    Digit3,
    Digit4,
    Digit5,
    Digit6,
    Digit7,
    Digit8,
    Digit9,
};

/// Digit key for 0..9, nullopt otherwise
[[nodiscard]] std::optional<KeyCode> digitKey(int digit);

[[nodiscard]] std::string_view keyName(KeyCode key);

enum class InputEventType : uint8_t {
    SetClipboard,  // Replace clipboard contents with `text`
    KeyDown,
    KeyUp,
    Pause,         // Settle delay before the next event
};

struct InputEvent {
    InputEventType type = InputEventType::Pause;
    KeyCode key = KeyCode::Enter;
    std::string text;  // UTF-8, SetClipboard only
    std::chrono::milliseconds delay{0};

    bool operator==(const InputEvent&) const = default;

    // ========================================================================
    // Factory Methods
    // ========================================================================

    static InputEvent setClipboard(std::string utf8Text);
    static InputEvent keyDown(KeyCode key);
    static InputEvent keyUp(KeyCode key);
    static InputEvent pause(std::chrono::milliseconds delay);
};

using InputSequence = std::vector<InputEvent>;

/// Human-readable form for logs, e.g. "key down Shift", "pause 10ms"
[[nodiscard]] std::string describe(const InputEvent& event);

}  // namespace valtime
