#pragma once

/**
 * @file animation_file.hpp
 * @brief Authored animation files (frames + delay) as JSON
 *
 * Format:
 *   {
 *     "frames": [
 *       ["line 1", "line 2"],
 *       "single-line frame"
 *     ],
 *     "delay": 0.5
 *   }
 *
 * A frame may be an array of lines or a single string; a string containing
 * '\n' is split into lines. Reading is permissive: entries of other types
 * are skipped with a warning, and a missing or out-of-range delay falls
 * back to DEFAULT_FILE_DELAY.
 */

#include "valtime/core/frame.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string_view>

namespace valtime {

using Seconds = std::chrono::duration<double>;

inline constexpr Seconds DEFAULT_FILE_DELAY{0.5};

/// Upper bound for any per-frame delay read from or written to disk
inline constexpr Seconds MAX_FRAME_DELAY{60.0};

/// True if `delay` is a usable per-frame delay: in (0, MAX_FRAME_DELAY]
[[nodiscard]] inline bool isValidFrameDelay(Seconds delay) {
    return delay.count() > 0.0 && delay <= MAX_FRAME_DELAY;
}

struct AnimationFile {
    FrameSequence frames;
    Seconds delay = DEFAULT_FILE_DELAY;
};

/// Parse animation JSON text. Returns nullopt if the text is not a JSON object.
[[nodiscard]] std::optional<AnimationFile> parseAnimationFile(std::string_view json);

/// Serialize to JSON text (frames always written as arrays of lines)
[[nodiscard]] std::string formatAnimationFile(const AnimationFile& file);

/// Load from disk. Returns nullopt (and logs why) if the file is missing or malformed.
[[nodiscard]] std::optional<AnimationFile> loadAnimationFile(const std::filesystem::path& path);

/// Write to disk, creating parent directories.
/// @throws PersistenceError if the file cannot be written
void saveAnimationFile(const std::filesystem::path& path, const AnimationFile& file);

}  // namespace valtime
