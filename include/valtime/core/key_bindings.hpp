#pragma once

/**
 * @file key_bindings.hpp
 * @brief Hotkey binding persistence via ConfigFile
 *
 * Stores action->keycode mappings as integers under "hotkey.<action>".
 * Key codes are Windows virtual-key codes, kept as raw ints so the core
 * never includes <windows.h>. A single printable character is accepted
 * on read too ("hotkey.toggle: .").
 *
 * Actions: toggle, back, select.1 .. select.9
 */

#include "valtime/core/config_file.hpp"
#include "valtime/core/hotkey_source.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace valtime {

// Virtual-key codes used by the default bindings
namespace keycode {
inline constexpr int ESCAPE = 0x1B;
inline constexpr int PERIOD = 0xBE;  // VK_OEM_PERIOD
inline constexpr int DIGIT_0 = 0x30;
}  // namespace keycode

/// A single key binding: action name -> key code
struct KeyBinding {
    std::string action;
    int keyCode = 0;

    bool operator==(const KeyBinding&) const = default;
};

inline constexpr size_t MAX_SELECT_HOTKEYS = 9;

/// Default key bindings (hardcoded fallback)
std::vector<KeyBinding> getDefaultKeyBindings();

/// Load key bindings from config.
/// Returns defaults for any action not found or unparseable.
std::vector<KeyBinding> loadKeyBindings(const ConfigFile& config);

/// Write key bindings into config (caller saves).
void saveKeyBindings(ConfigFile& config, const std::vector<KeyBinding>& bindings);

/// Config key for an action (e.g., "toggle" -> "hotkey.toggle")
std::string bindingConfigKey(const std::string& action);

/// Key code for a typed character ('.', digits, letters, Esc)
[[nodiscard]] std::optional<int> keyCodeForChar(char c);

/// Integer code, or a single character
[[nodiscard]] std::optional<int> parseKeyCode(std::string_view text);

/// Event an action name stands for
[[nodiscard]] std::optional<HotkeyEvent> actionEvent(std::string_view action);

/// Reverse lookup from key code to event.
/// When two actions share a key, the one listed first wins.
class HotkeyMap {
public:
    explicit HotkeyMap(const std::vector<KeyBinding>& bindings);

    [[nodiscard]] std::optional<HotkeyEvent> lookup(int keyCode) const;

private:
    std::unordered_map<int, HotkeyEvent> byKey_;
};

}  // namespace valtime
