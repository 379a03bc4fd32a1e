#include "valtime/core/console_hotkey_source.hpp"

#include <cctype>

namespace valtime {

ConsoleHotkeySource::ConsoleHotkeySource(std::istream& in, const std::vector<KeyBinding>& bindings)
    : in_(in)
    , map_(bindings)
{
}

std::optional<HotkeyEvent> ConsoleHotkeySource::translate(char c) const {
    if (c == 'q' || c == 'Q') return HotkeyEvent::quit();
    if (c == 'b' || c == 'B') return HotkeyEvent::back();
    if (std::isspace(static_cast<unsigned char>(c))) return std::nullopt;

    auto code = keyCodeForChar(c);
    if (!code) {
        return std::nullopt;
    }
    return map_.lookup(*code);
}

void ConsoleHotkeySource::run(HotkeyQueue& queue) {
    char c = 0;
    while (!stopRequested_ && in_.get(c)) {
        auto event = translate(c);
        if (!event) {
            continue;
        }
        queue.push(*event);
        if (event->type == HotkeyEventType::Quit) {
            return;
        }
    }

    if (!stopRequested_) {
        queue.push(HotkeyEvent::quit());
    }
}

}  // namespace valtime
