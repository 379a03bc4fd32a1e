#pragma once

/**
 * @file animation_store.hpp
 * @brief Named animations and their persisted timing config
 *
 * Owns the animation table (name -> frames) and the timing config
 * (name -> skip stride + frame delay). The config is a JSON file:
 *
 *   {
 *     "animations": {
 *       "Truck": { "skip_frames": 5, "frame_delay": 0.5 }
 *     }
 *   }
 *
 * The bare inner mapping ({"Truck": {...}}) is accepted on read as well.
 * Reading is permissive field-by-field; a missing or corrupt file yields
 * the built-in default set. save() always writes the full snapshot.
 *
 * Thread safety: All public methods are thread-safe. Frames handed out by
 * get() are immutable and shared, so a playback can keep them after the
 * store replaces an animation.
 */

#include "valtime/core/animation_file.hpp"
#include "valtime/core/frame.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace valtime {

struct AnimationSettings {
    static constexpr int DEFAULT_SKIP_STRIDE = 5;
    static constexpr Seconds DEFAULT_FRAME_DELAY{0.5};

    int skipStride = DEFAULT_SKIP_STRIDE;   ///< Always >= 1
    Seconds frameDelay = DEFAULT_FRAME_DELAY;  ///< Always in (0, MAX_FRAME_DELAY]

    bool operator==(const AnimationSettings&) const = default;
};

/// Frames plus resolved timing, ready for playback
struct Animation {
    std::string name;
    SharedFrames frames;
    AnimationSettings settings;

    [[nodiscard]] size_t frameCount() const { return frames ? frames->size() : 0; }
};

class AnimationStore {
public:
    /// @param configPath   JSON config location (need not exist)
    /// @param screenWidth  Width of generated built-in frames
    /// @param background   Background glyph for generated built-in frames
    explicit AnimationStore(std::filesystem::path configPath,
                            size_t screenWidth = DEFAULT_SCREEN_WIDTH,
                            char32_t background = DEFAULT_BACKGROUND_GLYPH);

    AnimationStore(const AnimationStore&) = delete;
    AnimationStore& operator=(const AnimationStore&) = delete;

    /// Read the config file. Never fails: a missing file is normal and a
    /// corrupt one is logged; both leave the built-in defaults in place.
    /// @return true if settings were read from disk
    bool load();

    /// Upsert one animation's settings and persist the full snapshot.
    /// The in-memory config is updated even if the write fails.
    /// @throws std::invalid_argument if stride < 1 or delay is outside (0, MAX_FRAME_DELAY]
    /// @throws PersistenceError if the file cannot be written
    void save(const std::string& name, int skipStride, Seconds frameDelay);

    /// Frames plus resolved settings.
    /// @throws NotFoundError for an unknown name
    [[nodiscard]] Animation get(const std::string& name) const;

    [[nodiscard]] bool has(std::string_view name) const;

    /// Names with frames, in sorted order
    [[nodiscard]] std::vector<std::string> names() const;

    /// Settings resolved against per-animation defaults (works for any name)
    [[nodiscard]] AnimationSettings settings(const std::string& name) const;

    /// Names that currently have a config entry
    [[nodiscard]] std::vector<std::string> configuredNames() const;

    /// Register or replace an animation. `defaults` apply when the config
    /// has no entry for this name.
    void addAnimation(const std::string& name, FrameSequence frames,
                      std::optional<AnimationSettings> defaults = std::nullopt);

    /// Load an animation file and register it; the file's delay becomes the
    /// default delay for `name`.
    /// @return false if the file could not be read
    bool importAnimation(const std::string& name, const std::filesystem::path& path);

    /// Write an animation's frames and resolved delay as an animation file.
    /// @throws NotFoundError, PersistenceError
    void exportAnimation(const std::string& name, const std::filesystem::path& path) const;

    [[nodiscard]] const std::filesystem::path& configPath() const { return configPath_; }

    /// Parse config JSON into name -> settings.
    /// @throws ConfigLoadError if the text is not JSON or not an object
    [[nodiscard]] static std::map<std::string, AnimationSettings>
    parseConfig(std::string_view json, const std::map<std::string, AnimationSettings>& defaults);

    /// Serialize a full snapshot
    [[nodiscard]] static std::string formatConfig(const std::map<std::string, AnimationSettings>& config);

private:
    struct Entry {
        SharedFrames frames;
        AnimationSettings defaults;
    };

    void installBuiltins();
    void resetConfigToDefaults();
    [[nodiscard]] AnimationSettings resolveLocked(const std::string& name) const;
    [[nodiscard]] std::map<std::string, AnimationSettings> defaultsLocked() const;
    void writeSnapshotLocked() const;

    mutable std::shared_mutex mutex_;
    std::filesystem::path configPath_;
    size_t screenWidth_;
    char32_t background_;
    std::map<std::string, Entry, std::less<>> animations_;
    std::map<std::string, AnimationSettings> config_;
};

}  // namespace valtime
