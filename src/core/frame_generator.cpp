#include "valtime/core/frame_generator.hpp"

#include <stdexcept>
#include <string>

namespace valtime {

FrameGenerator::FrameGenerator(Sprite sprite, size_t screenWidth, char32_t background)
    : sprite_(std::move(sprite))
    , screenWidth_(screenWidth)
    , background_(background)
{
    size_t width = sprite_.width();
    for (const auto& row : sprite_.rows) {
        if (row.size() != width) {
            throw std::invalid_argument("FrameGenerator: sprite rows must have equal width");
        }
    }
    if (width > screenWidth_) {
        throw std::invalid_argument("FrameGenerator: sprite width " + std::to_string(width) +
                                    " exceeds screen width " + std::to_string(screenWidth_));
    }
}

Frame FrameGenerator::frameAt(int64_t position) const {
    const auto spriteWidth = static_cast<int64_t>(sprite_.width());

    Frame frame;
    frame.lines.reserve(sprite_.height());

    for (const auto& row : sprite_.rows) {
        std::u32string line(screenWidth_, background_);
        for (size_t x = 0; x < screenWidth_; ++x) {
            int64_t spriteX = static_cast<int64_t>(x) - position;
            if (spriteX >= 0 && spriteX < spriteWidth) {
                line[x] = row[static_cast<size_t>(spriteX)];
            }
        }
        frame.lines.push_back(std::move(line));
    }

    return frame;
}

Frame FrameGenerator::frame(size_t index) const {
    if (index >= frameCount()) {
        throw std::out_of_range("FrameGenerator: frame index " + std::to_string(index) +
                                " out of range");
    }
    return frameAt(firstPosition() + static_cast<int64_t>(index));
}

FrameSequence FrameGenerator::generateAll() const {
    FrameSequence frames;
    frames.reserve(frameCount());
    for (Frame frame : *this) {
        frames.push_back(std::move(frame));
    }
    return frames;
}

}  // namespace valtime
