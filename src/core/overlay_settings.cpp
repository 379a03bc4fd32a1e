#include "valtime/core/overlay_settings.hpp"
#include "valtime/core/frame.hpp"
#include "valtime/core/text.hpp"
#include "valtime/core/truck_sprite.hpp"

#include <iostream>

namespace valtime {

namespace {

constexpr const char* KEY_CONFIG_PATH = "animation.config_path";
constexpr const char* KEY_SCREEN_WIDTH = "animation.screen_width";
constexpr const char* KEY_BACKGROUND = "animation.background_glyph";
constexpr const char* KEY_DRY_RUN = "injector.dry_run";

constexpr const char* SETTINGS_HEADER =
    "# ValTime overlay settings\n"
    "# Hotkeys are virtual-key codes (190 = '.', 27 = Esc, 49..57 = '1'..'9')\n";

}  // namespace

bool OverlaySettings::load(const std::filesystem::path& path) {
    file_.setHeader(SETTINGS_HEADER);
    if (!file_.load(path)) {
        std::cout << "[OverlaySettings] No settings at " << path.string() << ", using defaults\n";
        return false;
    }
    return true;
}

bool OverlaySettings::save() {
    if (file_.path().empty()) {
        return false;
    }
    return file_.save();
}

void OverlaySettings::fillDefaults() {
    if (!file_.has(KEY_CONFIG_PATH)) {
        file_.set(KEY_CONFIG_PATH, DEFAULT_ANIMATION_CONFIG);
    }
    if (!file_.has(KEY_SCREEN_WIDTH)) {
        setScreenWidth(DEFAULT_SCREEN_WIDTH);
    }
    if (!file_.has(KEY_BACKGROUND)) {
        setBackgroundGlyph(DEFAULT_BACKGROUND_GLYPH);
    }
    if (!file_.has(KEY_DRY_RUN)) {
        setDryRun(false);
    }
    for (const auto& binding : getDefaultKeyBindings()) {
        auto key = bindingConfigKey(binding.action);
        if (!file_.has(key)) {
            file_.set(key, binding.keyCode);
        }
    }
}

std::filesystem::path OverlaySettings::animationConfigPath() const {
    std::filesystem::path configured = file_.getString(KEY_CONFIG_PATH, DEFAULT_ANIMATION_CONFIG);
    if (configured.empty()) {
        configured = DEFAULT_ANIMATION_CONFIG;
    }
    if (configured.is_relative() && !file_.path().empty()) {
        return file_.path().parent_path() / configured;
    }
    return configured;
}

void OverlaySettings::setAnimationConfigPath(const std::filesystem::path& path) {
    file_.set(KEY_CONFIG_PATH, path.string());
}

size_t OverlaySettings::screenWidth() const {
    const size_t minimum = truckSprite().width();
    auto width = file_.tryInt(KEY_SCREEN_WIDTH);
    if (!width) {
        if (file_.has(KEY_SCREEN_WIDTH)) {
            std::cerr << "[OverlaySettings] WARNING: " << KEY_SCREEN_WIDTH << " is not an integer, using "
                      << DEFAULT_SCREEN_WIDTH << '\n';
        }
        return DEFAULT_SCREEN_WIDTH;
    }
    if (*width < static_cast<int64_t>(minimum)) {
        std::cerr << "[OverlaySettings] WARNING: " << KEY_SCREEN_WIDTH << " " << *width
                  << " is narrower than the sprite, using " << minimum << '\n';
        return minimum;
    }
    return static_cast<size_t>(*width);
}

void OverlaySettings::setScreenWidth(size_t width) {
    file_.set(KEY_SCREEN_WIDTH, static_cast<int64_t>(width));
}

char32_t OverlaySettings::backgroundGlyph() const {
    auto text = file_.raw(KEY_BACKGROUND);
    if (!text) {
        return DEFAULT_BACKGROUND_GLYPH;
    }
    std::u32string glyphs = utf8ToUtf32(*text);
    if (glyphs.size() != 1) {
        std::cerr << "[OverlaySettings] WARNING: " << KEY_BACKGROUND
                  << " must be a single character, using default\n";
        return DEFAULT_BACKGROUND_GLYPH;
    }
    return glyphs.front();
}

void OverlaySettings::setBackgroundGlyph(char32_t glyph) {
    file_.set(KEY_BACKGROUND, utf32ToUtf8(std::u32string_view(&glyph, 1)));
}

bool OverlaySettings::dryRun() const {
    return file_.getBool(KEY_DRY_RUN, false);
}

void OverlaySettings::setDryRun(bool enabled) {
    file_.set(KEY_DRY_RUN, enabled);
}

}  // namespace valtime
