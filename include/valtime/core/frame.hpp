#pragma once

/**
 * @file frame.hpp
 * @brief Frame and sprite data types
 */

#include <memory>
#include <string>
#include <vector>

namespace valtime {

/// Default screen width of a chat frame in glyphs
inline constexpr size_t DEFAULT_SCREEN_WIDTH = 26;

/// Default background glyph (MEDIUM SHADE)
inline constexpr char32_t DEFAULT_BACKGROUND_GLYPH = U'▒';

/// One animation frame: ordered lines of text.
/// Generated frames have equal-width lines; frames loaded from disk may not.
struct Frame {
    std::vector<std::u32string> lines;

    [[nodiscard]] size_t lineCount() const { return lines.size(); }
    [[nodiscard]] bool empty() const { return lines.empty(); }

    bool operator==(const Frame&) const = default;
};

/// Ordered frames of one animation, shared read-only between the store
/// and any playback borrowing it.
using FrameSequence = std::vector<Frame>;
using SharedFrames = std::shared_ptr<const FrameSequence>;

/// Unscrolled source bitmap for the frame generator.
/// All rows must have the same glyph width.
struct Sprite {
    std::vector<std::u32string> rows;

    [[nodiscard]] size_t width() const { return rows.empty() ? 0 : rows.front().size(); }
    [[nodiscard]] size_t height() const { return rows.size(); }
};

}  // namespace valtime
