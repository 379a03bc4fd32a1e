#pragma once

/**
 * @file win32_input_sink.hpp
 * @brief InputSink backed by SendInput and the Windows clipboard
 *
 * Only built on Windows (VALTIME_HAS_WIN32).
 */

#include "valtime/core/input_sink.hpp"

namespace valtime {

class Win32InputSink : public InputSink {
public:
    Win32InputSink() = default;

    /// @throws InjectionError if the clipboard stays locked or rejects the data
    void setClipboard(std::string_view utf8Text) override;

    /// @throws InjectionError if SendInput refuses the event (e.g. UIPI)
    void sendKey(KeyCode key, bool down) override;

    void pause(std::chrono::milliseconds delay) override;
};

}  // namespace valtime
