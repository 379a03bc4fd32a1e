#include "valtime/core/hotkey_source.hpp"

namespace valtime {

std::string describe(const HotkeyEvent& event) {
    switch (event.type) {
        case HotkeyEventType::Toggle: return "Toggle";
        case HotkeyEventType::Select: return "Select(" + std::to_string(event.index) + ")";
        case HotkeyEventType::Back: return "Back";
        case HotkeyEventType::Quit: return "Quit";
    }
    return "Unknown";
}

}  // namespace valtime
