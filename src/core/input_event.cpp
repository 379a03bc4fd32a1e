#include "valtime/core/input_event.hpp"

namespace valtime {

std::optional<KeyCode> digitKey(int digit) {
    if (digit < 0 || digit > 9) {
        return std::nullopt;
    }
    return static_cast<KeyCode>(static_cast<int>(KeyCode::Digit0) + digit);
}

std::string_view keyName(KeyCode key) {
    switch (key) {
        case KeyCode::Shift:     return "Shift";
        case KeyCode::Control:   return "Control";
        case KeyCode::Enter:     return "Enter";
        case KeyCode::Backslash: return "Backslash";
        case KeyCode::V:         return "V";
        case KeyCode::Digit0:    return "0";
        case KeyCode::Digit1:    return "1";
        case KeyCode::Digit2:    return "2";
        case KeyCode::Digit3:    return "3";
        case KeyCode::Digit4:    return "4";
        case KeyCode::Digit5:    return "5";
        case KeyCode::Digit6:    return "6";
        case KeyCode::Digit7:    return "7";
        case KeyCode::Digit8:    return "8";
        case KeyCode::Digit9:    return "9";
    }
    return "?";
}

InputEvent InputEvent::setClipboard(std::string utf8Text) {
    InputEvent e;
    e.type = InputEventType::SetClipboard;
    e.text = std::move(utf8Text);
    return e;
}

InputEvent InputEvent::keyDown(KeyCode key) {
    InputEvent e;
    e.type = InputEventType::KeyDown;
    e.key = key;
    return e;
}

InputEvent InputEvent::keyUp(KeyCode key) {
    InputEvent e;
    e.type = InputEventType::KeyUp;
    e.key = key;
    return e;
}

InputEvent InputEvent::pause(std::chrono::milliseconds delay) {
    InputEvent e;
    e.type = InputEventType::Pause;
    e.delay = delay;
    return e;
}

std::string describe(const InputEvent& event) {
    switch (event.type) {
        case InputEventType::SetClipboard:
            return "clipboard \"" + event.text + "\"";
        case InputEventType::KeyDown:
            return "key down " + std::string(keyName(event.key));
        case InputEventType::KeyUp:
            return "key up " + std::string(keyName(event.key));
        case InputEventType::Pause:
            return "pause " + std::to_string(event.delay.count()) + "ms";
    }
    return "?";
}

}  // namespace valtime
