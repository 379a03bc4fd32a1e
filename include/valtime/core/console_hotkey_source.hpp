#pragma once

/**
 * @file console_hotkey_source.hpp
 * @brief Hotkeys typed on a text stream, for dry runs without a keyboard hook
 *
 * Each character is looked up through the key bindings, so the default
 * map gives '.' toggle, '1'..'9' select and Esc back. Two extras that
 * have no binding: 'b' is Back and 'q' is Quit. Whitespace is ignored.
 * End of stream pushes Quit.
 */

#include "valtime/core/hotkey_source.hpp"
#include "valtime/core/key_bindings.hpp"

#include <atomic>
#include <istream>
#include <optional>

namespace valtime {

class ConsoleHotkeySource : public HotkeySource {
public:
    ConsoleHotkeySource(std::istream& in, const std::vector<KeyBinding>& bindings);

    void run(HotkeyQueue& queue) override;

    /// Takes effect before the next character is read
    void requestStop() override { stopRequested_ = true; }

    [[nodiscard]] std::optional<HotkeyEvent> translate(char c) const;

private:
    std::istream& in_;
    HotkeyMap map_;
    std::atomic<bool> stopRequested_{false};
};

}  // namespace valtime
