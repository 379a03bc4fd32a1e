#pragma once

/**
 * @file config_file.hpp
 * @brief key: value settings file that keeps comments and ordering
 */

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace valtime {

// ============================================================================
// ConfigFile - A settings file that preserves structure when modified
// ============================================================================
//
// Reads and writes "key: value" lines while keeping comments, blank lines
// and ordering. Setting a value rewrites only that line; new keys are
// appended. Values are kept as text and converted on access, so
// "hotkey.select.1: 49" reads back as a string or an integer.
//
// Usage:
//   ConfigFile config;
//   if (config.load("overlay.conf")) {
//       auto width = config.getInt("animation.screen_width", 26);
//       config.set("injector.dry_run", true);
//       config.save();
//   }
//
class ConfigFile {
public:
    ConfigFile() = default;

    // Load from file (returns false if file doesn't exist or can't be read)
    [[nodiscard]] bool load(const std::filesystem::path& path);

    // Parse text directly (path stays unset)
    void parse(std::string_view content);

    // Save to the loaded path (creates directories if needed)
    [[nodiscard]] bool save();

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    // ========================================================================
    // Value access (read)
    // ========================================================================

    [[nodiscard]] bool has(std::string_view key) const;

    /// Raw value text, nullopt if absent
    [[nodiscard]] std::optional<std::string> raw(std::string_view key) const;

    [[nodiscard]] std::string getString(std::string_view key,
                                        std::string_view defaultVal = "") const;

    // Typed getters return the default when the key is absent or the text
    // does not parse as that type
    [[nodiscard]] int64_t getInt(std::string_view key, int64_t defaultVal = 0) const;
    [[nodiscard]] bool getBool(std::string_view key, bool defaultVal = false) const;

    [[nodiscard]] std::optional<int64_t> tryInt(std::string_view key) const;

    // ========================================================================
    // Value access (write)
    // ========================================================================

    void set(std::string_view key, std::string_view value);
    void set(std::string_view key, const char* value) { set(key, std::string_view(value)); }
    void set(std::string_view key, int64_t value);
    void set(std::string_view key, int value) { set(key, static_cast<int64_t>(value)); }
    void set(std::string_view key, bool value);

    // Written at the top of the file when it has no content yet
    void setHeader(std::string_view header) { header_ = header; }

private:
    struct Line {
        std::string content;      // Full line as written
        std::string key;          // Empty unless isKeyValue
        size_t valueStart = 0;    // Offset of the value within content
        size_t valueEnd = 0;
        bool isKeyValue = false;
    };

    [[nodiscard]] static Line parseLine(std::string_view text);
    [[nodiscard]] const Line* findLine(std::string_view key) const;
    void setImpl(std::string_view key, const std::string& formattedValue);

    std::filesystem::path path_;
    std::vector<Line> lines_;
    std::unordered_map<std::string, size_t> keyToLine_;
    std::string header_;
};

}  // namespace valtime
