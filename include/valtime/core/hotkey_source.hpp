#pragma once

/**
 * @file hotkey_source.hpp
 * @brief Hotkey events and the abstract source that produces them
 */

#include "valtime/core/event_queue.hpp"

#include <cstdint>
#include <string>

namespace valtime {

enum class HotkeyEventType : uint8_t {
    Toggle,
    Select,  // index = 1-based option
    Back,
    Quit,    // Stop the overlay
};

struct HotkeyEvent {
    HotkeyEventType type = HotkeyEventType::Toggle;
    size_t index = 0;

    static HotkeyEvent toggle() { return {HotkeyEventType::Toggle, 0}; }
    static HotkeyEvent select(size_t n) { return {HotkeyEventType::Select, n}; }
    static HotkeyEvent back() { return {HotkeyEventType::Back, 0}; }
    static HotkeyEvent quit() { return {HotkeyEventType::Quit, 0}; }

    bool operator==(const HotkeyEvent&) const = default;
};

[[nodiscard]] std::string describe(const HotkeyEvent& event);

using HotkeyQueue = EventQueue<HotkeyEvent>;

/// Abstract producer of hotkey events.
/// run() blocks the calling thread, pushing events into `queue` until the
/// source ends or requestStop() is called from another thread.
class HotkeySource {
public:
    virtual ~HotkeySource() = default;

    virtual void run(HotkeyQueue& queue) = 0;

    virtual void requestStop() = 0;
};

}  // namespace valtime
