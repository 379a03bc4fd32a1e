#include "valtime/core/key_bindings.hpp"

#include <cctype>
#include <iostream>

namespace valtime {

namespace {

constexpr std::string_view SELECT_PREFIX = "select.";

}  // namespace

std::vector<KeyBinding> getDefaultKeyBindings() {
    std::vector<KeyBinding> bindings = {
        {"toggle", keycode::PERIOD},
        {"back",   keycode::ESCAPE},
    };
    for (size_t n = 1; n <= MAX_SELECT_HOTKEYS; ++n) {
        bindings.push_back({std::string(SELECT_PREFIX) + std::to_string(n),
                            keycode::DIGIT_0 + static_cast<int>(n)});
    }
    return bindings;
}

std::string bindingConfigKey(const std::string& action) {
    return "hotkey." + action;
}

std::vector<KeyBinding> loadKeyBindings(const ConfigFile& config) {
    auto bindings = getDefaultKeyBindings();

    for (auto& binding : bindings) {
        auto key = bindingConfigKey(binding.action);
        auto text = config.raw(key);
        if (!text) {
            continue;
        }
        auto code = parseKeyCode(*text);
        if (code) {
            binding.keyCode = *code;
        } else {
            std::cerr << "[KeyBindings] WARNING: " << key << ": cannot parse '" << *text
                      << "', using default\n";
        }
    }
    return bindings;
}

void saveKeyBindings(ConfigFile& config, const std::vector<KeyBinding>& bindings) {
    for (const auto& b : bindings) {
        config.set(bindingConfigKey(b.action), b.keyCode);
    }
}

std::optional<int> keyCodeForChar(char c) {
    if (c == '.') return keycode::PERIOD;
    if (c == '\x1b') return keycode::ESCAPE;
    if (c == ' ') return 0x20;
    if (std::isdigit(static_cast<unsigned char>(c))) return static_cast<int>(c);
    if (std::isalpha(static_cast<unsigned char>(c))) {
        return std::toupper(static_cast<unsigned char>(c));
    }
    return std::nullopt;
}

std::optional<int> parseKeyCode(std::string_view text) {
    if (text.size() == 1) {
        return keyCodeForChar(text[0]);
    }
    if (text.empty()) {
        return std::nullopt;
    }

    int value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
        if (value > 0xFF) {
            return std::nullopt;
        }
    }
    return value;
}

std::optional<HotkeyEvent> actionEvent(std::string_view action) {
    if (action == "toggle") return HotkeyEvent::toggle();
    if (action == "back") return HotkeyEvent::back();
    if (action.substr(0, SELECT_PREFIX.size()) != SELECT_PREFIX) {
        return std::nullopt;
    }

    auto digits = action.substr(SELECT_PREFIX.size());
    if (digits.empty() || digits.size() > 2) {
        return std::nullopt;
    }
    size_t n = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        n = n * 10 + static_cast<size_t>(c - '0');
    }
    if (n == 0) {
        return std::nullopt;
    }
    return HotkeyEvent::select(n);
}

HotkeyMap::HotkeyMap(const std::vector<KeyBinding>& bindings) {
    for (const auto& binding : bindings) {
        auto event = actionEvent(binding.action);
        if (!event) {
            std::cerr << "[KeyBindings] WARNING: unknown action '" << binding.action << "'\n";
            continue;
        }
        byKey_.emplace(binding.keyCode, *event);
    }
}

std::optional<HotkeyEvent> HotkeyMap::lookup(int keyCode) const {
    auto it = byKey_.find(keyCode);
    if (it == byKey_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace valtime
