#pragma once

/**
 * @file truck_sprite.hpp
 * @brief Built-in "Truck" animation source art
 */

#include "valtime/core/frame.hpp"

#include <string_view>

namespace valtime {

inline constexpr std::string_view TRUCK_ANIMATION_NAME = "Truck";

/// 13 rows x 26 glyphs of block art, drawn on the default background glyph.
[[nodiscard]] const Sprite& truckSprite();

}  // namespace valtime
