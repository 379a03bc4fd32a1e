#pragma once

/**
 * @file overlay_settings.hpp
 * @brief Typed access to the overlay's settings file
 *
 * Settings file format (key: value pairs):
 *   animation.config_path: animation_config.json
 *   animation.screen_width: 26
 *   animation.background_glyph: ▒
 *   injector.dry_run: false
 *   hotkey.toggle: 190
 *
 * A missing file is normal and yields the defaults. Unparseable values are
 * logged and replaced by their default.
 */

#include "valtime/core/config_file.hpp"
#include "valtime/core/key_bindings.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace valtime {

class OverlaySettings {
public:
    static constexpr const char* DEFAULT_ANIMATION_CONFIG = "animation_config.json";

    OverlaySettings() = default;

    /// @return false if the file could not be read (defaults apply)
    bool load(const std::filesystem::path& path);

    /// Write the current values back (comments in the file are kept)
    [[nodiscard]] bool save();

    /// Add every missing key with its default value; existing keys are untouched
    void fillDefaults();

    [[nodiscard]] const std::filesystem::path& path() const { return file_.path(); }

    // ========================================================================
    // Typed accessors
    // ========================================================================

    /// Relative paths resolve against the settings file's directory
    [[nodiscard]] std::filesystem::path animationConfigPath() const;
    void setAnimationConfigPath(const std::filesystem::path& path);

    /// Never narrower than the built-in sprite
    [[nodiscard]] size_t screenWidth() const;
    void setScreenWidth(size_t width);

    [[nodiscard]] char32_t backgroundGlyph() const;
    void setBackgroundGlyph(char32_t glyph);

    /// Print input events instead of sending them
    [[nodiscard]] bool dryRun() const;
    void setDryRun(bool enabled);

    [[nodiscard]] std::vector<KeyBinding> keyBindings() const { return loadKeyBindings(file_); }
    void setKeyBindings(const std::vector<KeyBinding>& bindings) { saveKeyBindings(file_, bindings); }

    [[nodiscard]] const ConfigFile& file() const { return file_; }

private:
    ConfigFile file_;
};

}  // namespace valtime
