#pragma once

/**
 * @file input_injector.hpp
 * @brief Encodes overlay actions into exact input event sequences
 *
 * Three protocols, each a fixed ordered event list with empirically tuned
 * settle delays for the game's input polling:
 *
 *   Free text    clipboard <- message, Shift+Enter (open all-chat),
 *                Ctrl+V (paste), Enter (send)
 *   Frame        same wire mechanics with a pre-formatted frame payload
 *   Voice wheel  Backslash (open wheel), wheel digit, line digit
 *
 * Encoding is pure and static; send() plays a sequence through an
 * InputSink. The clipboard and keyboard are process-wide resources with
 * no OS lock, so the delays are the only ordering discipline. Best effort.
 */

#include "valtime/core/input_event.hpp"
#include "valtime/core/input_sink.hpp"

#include <chrono>
#include <string_view>

namespace valtime {

/// Protocol timing. Design constants, not user settings.
struct InjectionTiming {
    using ms = std::chrono::milliseconds;

    // Chat chord (free text)
    static constexpr ms CHAT_MODIFIER_SETTLE{10};  // between Shift/Enter edges
    static constexpr ms CHAT_OPEN_SETTLE{30};      // chat box opening before paste
    static constexpr ms CHAT_PASTE_SETTLE{20};     // paste landing before send

    // Chat chord (animation frames, tighter)
    static constexpr ms FRAME_CLIPBOARD_SETTLE{10};
    static constexpr ms FRAME_OPEN_SETTLE{20};
    static constexpr ms FRAME_PASTE_SETTLE{10};

    // Voice wheel: long enough for the wheel to advance one level
    static constexpr ms WHEEL_LEVEL_SETTLE{80};

    // Delay before a dispatched action starts
    static constexpr ms TEXT_LEAD_IN{50};
    static constexpr ms WHEEL_LEAD_IN{50};
    static constexpr ms ANIMATION_LEAD_IN{100};
};

class InputInjector {
public:
    static constexpr KeyCode CHAT_MODIFIER = KeyCode::Shift;
    static constexpr KeyCode CHAT_OPEN_KEY = KeyCode::Enter;
    static constexpr KeyCode PASTE_MODIFIER = KeyCode::Control;
    static constexpr KeyCode PASTE_KEY = KeyCode::V;
    static constexpr KeyCode SEND_KEY = KeyCode::Enter;
    static constexpr KeyCode WHEEL_KEY = KeyCode::Backslash;

    explicit InputInjector(InputSink& sink) : sink_(sink) {}

    [[nodiscard]] static InputSequence encodeFreeText(std::string_view utf8Message);

    /// @param utf8Payload  Output of formatPayload(), already delimited
    [[nodiscard]] static InputSequence encodeFrame(std::string_view utf8Payload);

    /// @throws InjectionError if either index has no digit key (outside 0..9)
    [[nodiscard]] static InputSequence encodeVoiceWheel(int wheelIndex, int lineIndex);

    /// Play events in order. Stops at the first failure.
    /// @throws InjectionError from the sink
    void send(const InputSequence& events);

    void sendFreeText(std::string_view utf8Message) { send(encodeFreeText(utf8Message)); }
    void sendFrame(std::string_view utf8Payload) { send(encodeFrame(utf8Payload)); }
    void sendVoiceWheel(int wheelIndex, int lineIndex) { send(encodeVoiceWheel(wheelIndex, lineIndex)); }

    [[nodiscard]] InputSink& sink() { return sink_; }

private:
    InputSink& sink_;
};

}  // namespace valtime
