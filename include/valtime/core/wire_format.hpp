#pragma once

/**
 * @file wire_format.hpp
 * @brief Frame -> chat payload serialization
 *
 * The game's chat box collapses text in fixed-size groups, so a multi-line
 * frame has to travel as one string with a delimiter after every run of
 * `width` glyphs. This is a hard compatibility requirement, not cosmetic.
 * Each line of a frame is chunked on its own, so a short line still ends
 * its group.
 *
 *   lines  ["abc", "def"], width 3  ->  "abc def"
 *   lines  ["ab", "cd"],   width 3  ->  "ab cd"
 *   text   "abcdefg",      width 3  ->  "abc def g"
 */

#include "valtime/core/frame.hpp"

#include <string>
#include <string_view>

namespace valtime {

inline constexpr char32_t WIRE_DELIMITER = U' ';

/// Chunk each line into runs of `width` glyphs, put `delimiter` after every
/// run (the last run of a line included), and drop the final delimiter.
/// @throws std::invalid_argument if width is zero
[[nodiscard]] std::u32string formatPayload(const Frame& frame,
                                           size_t width = DEFAULT_SCREEN_WIDTH,
                                           char32_t delimiter = WIRE_DELIMITER);

/// Chunk a single run of text every `width` glyphs.
[[nodiscard]] std::u32string formatPayload(std::u32string_view text,
                                           size_t width = DEFAULT_SCREEN_WIDTH,
                                           char32_t delimiter = WIRE_DELIMITER);

}  // namespace valtime
