#pragma once

/**
 * @file frame_list.hpp
 * @brief Editable frame list for hosts that author animations
 *
 * Index-based editing operations mirror what an authoring UI needs:
 * append, remove, reorder, replace a frame from pasted text. Out-of-range
 * indices are rejected by returning false rather than throwing.
 */

#include "valtime/core/frame.hpp"

#include <string_view>

namespace valtime {

class FrameList {
public:
    FrameList() = default;
    explicit FrameList(FrameSequence frames) : frames_(std::move(frames)) {}

    /// Append an empty frame; returns its index
    size_t appendEmpty();
    size_t append(Frame frame);

    bool remove(size_t index);
    bool moveUp(size_t index);
    bool moveDown(size_t index);

    /// Replace a frame with UTF-8 text split on '\n' (a trailing '\r' per line is dropped)
    bool replaceText(size_t index, std::string_view utf8Text);

    /// Frame text joined with '\n', as an editor would display it
    [[nodiscard]] std::string text(size_t index) const;

    [[nodiscard]] size_t size() const { return frames_.size(); }
    [[nodiscard]] bool empty() const { return frames_.empty(); }
    [[nodiscard]] const FrameSequence& frames() const { return frames_; }

    /// Immutable copy for registering with AnimationStore or playback
    [[nodiscard]] SharedFrames snapshot() const;

    /// Parse editor text into a frame
    [[nodiscard]] static Frame parseFrameText(std::string_view utf8Text);

private:
    FrameSequence frames_;
};

}  // namespace valtime
