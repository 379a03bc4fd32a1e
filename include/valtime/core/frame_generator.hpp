#pragma once

/**
 * @file frame_generator.hpp
 * @brief Horizontal scroll animation from a sprite
 *
 * Slides a sprite across a fixed-width screen from fully off-screen left
 * (position = -S) to fully off-screen right (position = W), inclusive,
 * giving W + S + 1 frames. Frames are produced on demand; iterating twice
 * yields byte-identical output.
 *
 * Usage:
 *   FrameGenerator gen(truckSprite(), 26);
 *   for (const Frame& frame : gen) {
 *       ...
 *   }
 *   auto all = gen.generateAll();
 */

#include "valtime/core/frame.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>

namespace valtime {

class FrameGenerator {
public:
    // Lazy iterator over frame indices; dereferencing renders the frame.
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Frame;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = Frame;

        Iterator() = default;
        Iterator(const FrameGenerator* gen, size_t index) : gen_(gen), index_(index) {}

        Frame operator*() const { return gen_->frame(index_); }

        Iterator& operator++() {
            ++index_;
            return *this;
        }

        Iterator operator++(int) {
            Iterator tmp = *this;
            ++index_;
            return tmp;
        }

        bool operator==(const Iterator& other) const { return index_ == other.index_; }

    private:
        const FrameGenerator* gen_ = nullptr;
        size_t index_ = 0;
    };

    /// @throws std::invalid_argument if sprite rows differ in width or the
    ///         sprite is wider than the screen
    FrameGenerator(Sprite sprite,
                   size_t screenWidth = DEFAULT_SCREEN_WIDTH,
                   char32_t background = DEFAULT_BACKGROUND_GLYPH);

    /// W + S + 1
    [[nodiscard]] size_t frameCount() const { return screenWidth_ + sprite_.width() + 1; }

    [[nodiscard]] int64_t firstPosition() const { return -static_cast<int64_t>(sprite_.width()); }
    [[nodiscard]] int64_t lastPosition() const { return static_cast<int64_t>(screenWidth_); }

    [[nodiscard]] size_t screenWidth() const { return screenWidth_; }
    [[nodiscard]] char32_t background() const { return background_; }
    [[nodiscard]] const Sprite& sprite() const { return sprite_; }

    /// Render the frame with the sprite's left edge at screen column `position`.
    /// Any position is accepted; out-of-range positions render pure background.
    [[nodiscard]] Frame frameAt(int64_t position) const;

    /// Frame by sequence index; index 0 is position -S.
    [[nodiscard]] Frame frame(size_t index) const;

    [[nodiscard]] Iterator begin() const { return Iterator(this, 0); }
    [[nodiscard]] Iterator end() const { return Iterator(this, frameCount()); }

    /// Materialize the whole sequence.
    [[nodiscard]] FrameSequence generateAll() const;

private:
    Sprite sprite_;
    size_t screenWidth_;
    char32_t background_;
};

}  // namespace valtime
