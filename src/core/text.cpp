#include "valtime/core/text.hpp"

namespace valtime {

namespace {

constexpr char32_t REPLACEMENT = 0xFFFD;

bool isContinuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

}  // namespace

std::u32string utf8ToUtf32(std::string_view utf8) {
    std::u32string result;
    result.reserve(utf8.size());

    size_t i = 0;
    while (i < utf8.size()) {
        auto lead = static_cast<unsigned char>(utf8[i]);

        size_t length;
        char32_t cp;
        if (lead < 0x80) {
            result.push_back(lead);
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            cp = lead & 0x07;
        } else {
            result.push_back(REPLACEMENT);
            ++i;
            continue;
        }

        if (i + length > utf8.size()) {
            result.push_back(REPLACEMENT);
            ++i;
            continue;
        }

        bool valid = true;
        for (size_t k = 1; k < length; ++k) {
            auto byte = static_cast<unsigned char>(utf8[i + k]);
            if (!isContinuation(byte)) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (byte & 0x3F);
        }

        // Reject overlong forms and surrogates
        bool overlong = (length == 2 && cp < 0x80) ||
                        (length == 3 && cp < 0x800) ||
                        (length == 4 && cp < 0x10000);
        if (!valid || overlong || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            result.push_back(REPLACEMENT);
            ++i;
            continue;
        }

        result.push_back(cp);
        i += length;
    }

    return result;
}

std::string utf32ToUtf8(std::u32string_view text) {
    std::string result;
    result.reserve(text.size());

    for (char32_t cp : text) {
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            cp = REPLACEMENT;
        }

        if (cp < 0x80) {
            result.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            result.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            result.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            result.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            result.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    return result;
}

std::u16string utf32ToUtf16(std::u32string_view text) {
    std::u16string result;
    result.reserve(text.size());

    for (char32_t cp : text) {
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            cp = REPLACEMENT;
        }

        if (cp < 0x10000) {
            result.push_back(static_cast<char16_t>(cp));
        } else {
            cp -= 0x10000;
            result.push_back(static_cast<char16_t>(0xD800 + (cp >> 10)));
            result.push_back(static_cast<char16_t>(0xDC00 + (cp & 0x3FF)));
        }
    }

    return result;
}

bool isBlank(std::u32string_view text) {
    for (char32_t cp : text) {
        if (cp != U' ' && cp != U'\t' && cp != U'\r' && cp != U'\n') {
            return false;
        }
    }
    return true;
}

}  // namespace valtime
