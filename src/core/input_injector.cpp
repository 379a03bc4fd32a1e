#include "valtime/core/input_injector.hpp"
#include "valtime/core/errors.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace valtime {

namespace {

using T = InjectionTiming;

void appendPress(InputSequence& seq, KeyCode key) {
    seq.push_back(InputEvent::keyDown(key));
    seq.push_back(InputEvent::keyUp(key));
}

void appendChord(InputSequence& seq, KeyCode modifier, KeyCode key) {
    seq.push_back(InputEvent::keyDown(modifier));
    appendPress(seq, key);
    seq.push_back(InputEvent::keyUp(modifier));
}

// Shift held, Enter tapped with settle pauses around each edge
void appendOpenChat(InputSequence& seq) {
    seq.push_back(InputEvent::keyDown(InputInjector::CHAT_MODIFIER));
    seq.push_back(InputEvent::pause(T::CHAT_MODIFIER_SETTLE));
    seq.push_back(InputEvent::keyDown(InputInjector::CHAT_OPEN_KEY));
    seq.push_back(InputEvent::pause(T::CHAT_MODIFIER_SETTLE));
    seq.push_back(InputEvent::keyUp(InputInjector::CHAT_OPEN_KEY));
    seq.push_back(InputEvent::pause(T::CHAT_MODIFIER_SETTLE));
    seq.push_back(InputEvent::keyUp(InputInjector::CHAT_MODIFIER));
}

KeyCode requireDigit(int index, const char* what) {
    auto key = digitKey(index);
    if (!key) {
        throw InjectionError(std::string("No digit key for ") + what + " index " +
                             std::to_string(index));
    }
    return *key;
}

}  // namespace

InputSequence InputInjector::encodeFreeText(std::string_view utf8Message) {
    InputSequence seq;
    seq.push_back(InputEvent::setClipboard(std::string(utf8Message)));
    appendOpenChat(seq);
    seq.push_back(InputEvent::pause(T::CHAT_OPEN_SETTLE));
    appendChord(seq, PASTE_MODIFIER, PASTE_KEY);
    seq.push_back(InputEvent::pause(T::CHAT_PASTE_SETTLE));
    appendPress(seq, SEND_KEY);
    return seq;
}

InputSequence InputInjector::encodeFrame(std::string_view utf8Payload) {
    InputSequence seq;
    seq.push_back(InputEvent::setClipboard(std::string(utf8Payload)));
    seq.push_back(InputEvent::pause(T::FRAME_CLIPBOARD_SETTLE));
    appendOpenChat(seq);
    seq.push_back(InputEvent::pause(T::FRAME_OPEN_SETTLE));
    appendChord(seq, PASTE_MODIFIER, PASTE_KEY);
    seq.push_back(InputEvent::pause(T::FRAME_PASTE_SETTLE));
    appendPress(seq, SEND_KEY);
    return seq;
}

InputSequence InputInjector::encodeVoiceWheel(int wheelIndex, int lineIndex) {
    KeyCode wheelDigit = requireDigit(wheelIndex, "wheel");
    KeyCode lineDigit = requireDigit(lineIndex, "voice line");

    InputSequence seq;
    appendPress(seq, WHEEL_KEY);
    seq.push_back(InputEvent::pause(T::WHEEL_LEVEL_SETTLE));
    appendPress(seq, wheelDigit);
    seq.push_back(InputEvent::pause(T::WHEEL_LEVEL_SETTLE));
    appendPress(seq, lineDigit);
    return seq;
}

void InputInjector::send(const InputSequence& events) {
    std::vector<KeyCode> held;

    try {
        for (const auto& event : events) {
            switch (event.type) {
                case InputEventType::SetClipboard:
                    sink_.setClipboard(event.text);
                    break;
                case InputEventType::KeyDown:
                    sink_.sendKey(event.key, true);
                    held.push_back(event.key);
                    break;
                case InputEventType::KeyUp:
                    sink_.sendKey(event.key, false);
                    std::erase(held, event.key);
                    break;
                case InputEventType::Pause:
                    sink_.pause(event.delay);
                    break;
            }
        }
    } catch (const InjectionError&) {
        // Don't leave a modifier stuck down in the game
        for (auto it = held.rbegin(); it != held.rend(); ++it) {
            try {
                sink_.sendKey(*it, false);
            } catch (const InjectionError& e) {
                std::cerr << "[InputInjector] Failed to release " << keyName(*it)
                          << ": " << e.what() << '\n';
            }
        }
        throw;
    }
}

}  // namespace valtime
