#pragma once

/**
 * @file text.hpp
 * @brief UTF-8 / UTF-32 conversion for frame text
 *
 * Frames are measured in glyphs, and the art uses block characters that
 * take three bytes in UTF-8. The core therefore works on std::u32string
 * lines and converts at the edges (JSON files, clipboard payloads).
 */

#include <string>
#include <string_view>

namespace valtime {

/// Decode UTF-8. Malformed sequences decode to U+FFFD, one per bad byte.
[[nodiscard]] std::u32string utf8ToUtf32(std::string_view utf8);

/// Encode UTF-32 as UTF-8. Code points outside Unicode become U+FFFD.
[[nodiscard]] std::string utf32ToUtf8(std::u32string_view text);

/// Encode UTF-32 as UTF-16 (for the Windows clipboard).
[[nodiscard]] std::u16string utf32ToUtf16(std::u32string_view text);

/// True if every glyph is a space, tab, CR or LF (or the string is empty).
[[nodiscard]] bool isBlank(std::u32string_view text);

}  // namespace valtime
