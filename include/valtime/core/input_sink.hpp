#pragma once

/**
 * @file input_sink.hpp
 * @brief OS boundary for synthesized keyboard and clipboard input
 */

#include "valtime/core/input_event.hpp"

#include <chrono>
#include <string_view>
#include <thread>

namespace valtime {

/// Abstract target for synthesized input.
/// The injector routes every event through this instead of calling the OS directly.
/// On Windows: SendInput + clipboard. Elsewhere: a logging dry run.
/// In tests: a recorder.
///
/// Implementations throw InjectionError when the OS refuses an event.
/// There is no readback; a successful call only means the event was queued.
class InputSink {
public:
    virtual ~InputSink() = default;

    /// Replace the shared clipboard with UTF-8 text.
    virtual void setClipboard(std::string_view utf8Text) = 0;

    /// Press (down=true) or release a key.
    virtual void sendKey(KeyCode key, bool down) = 0;

    /// Settle delay. Default sleeps the calling thread.
    virtual void pause(std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }
};

}  // namespace valtime
