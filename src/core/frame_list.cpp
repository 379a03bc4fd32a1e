#include "valtime/core/frame_list.hpp"
#include "valtime/core/text.hpp"

#include <utility>

namespace valtime {

size_t FrameList::appendEmpty() {
    frames_.emplace_back();
    return frames_.size() - 1;
}

size_t FrameList::append(Frame frame) {
    frames_.push_back(std::move(frame));
    return frames_.size() - 1;
}

bool FrameList::remove(size_t index) {
    if (index >= frames_.size()) return false;
    frames_.erase(frames_.begin() + static_cast<std::ptrdiff_t>(index));
    return true;
}

bool FrameList::moveUp(size_t index) {
    if (index == 0 || index >= frames_.size()) return false;
    std::swap(frames_[index], frames_[index - 1]);
    return true;
}

bool FrameList::moveDown(size_t index) {
    if (index + 1 >= frames_.size()) return false;
    std::swap(frames_[index], frames_[index + 1]);
    return true;
}

bool FrameList::replaceText(size_t index, std::string_view utf8Text) {
    if (index >= frames_.size()) return false;
    frames_[index] = parseFrameText(utf8Text);
    return true;
}

std::string FrameList::text(size_t index) const {
    if (index >= frames_.size()) return {};

    std::string result;
    const auto& lines = frames_[index].lines;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) result += '\n';
        result += utf32ToUtf8(lines[i]);
    }
    return result;
}

SharedFrames FrameList::snapshot() const {
    return std::make_shared<const FrameSequence>(frames_);
}

Frame FrameList::parseFrameText(std::string_view utf8Text) {
    Frame frame;
    if (utf8Text.empty()) {
        return frame;
    }

    size_t pos = 0;
    while (true) {
        size_t end = utf8Text.find('\n', pos);
        std::string_view line = (end == std::string_view::npos)
            ? utf8Text.substr(pos)
            : utf8Text.substr(pos, end - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        frame.lines.push_back(utf8ToUtf32(line));

        if (end == std::string_view::npos) break;
        pos = end + 1;
    }
    return frame;
}

}  // namespace valtime
