#include "valtime/core/wire_format.hpp"

#include <stdexcept>

namespace valtime {

namespace {

void appendChunked(std::u32string& out, std::u32string_view text, size_t width,
                   char32_t delimiter, size_t& run) {
    for (char32_t glyph : text) {
        out.push_back(glyph);
        if (++run == width) {
            out.push_back(delimiter);
            run = 0;
        }
    }
}

}  // namespace

std::u32string formatPayload(const Frame& frame, size_t width, char32_t delimiter) {
    if (width == 0) {
        throw std::invalid_argument("formatPayload: width must be positive");
    }

    std::u32string out;
    for (const auto& line : frame.lines) {
        // Every line ends its own group, even a short one
        size_t run = 0;
        appendChunked(out, line, width, delimiter, run);
        if (run != 0 || line.empty()) {
            out.push_back(delimiter);
        }
    }

    if (!out.empty() && out.back() == delimiter) {
        out.pop_back();
    }
    return out;
}

std::u32string formatPayload(std::u32string_view text, size_t width, char32_t delimiter) {
    if (width == 0) {
        throw std::invalid_argument("formatPayload: width must be positive");
    }

    std::u32string out;
    size_t run = 0;
    appendChunked(out, text, width, delimiter, run);
    if (!out.empty() && out.back() == delimiter && run == 0) {
        out.pop_back();
    }
    return out;
}

}  // namespace valtime
