#pragma once

/**
 * @file win32_hotkey_source.hpp
 * @brief Global hotkeys through a low-level keyboard hook
 *
 * Key presses are observed, never swallowed: the game still sees them.
 * Injected events (our own SendInput traffic) are ignored so the voice
 * wheel's digit presses cannot feed back in as Select events.
 *
 * Only one instance may run at a time; the hook procedure has no user
 * data pointer. Only built on Windows (VALTIME_HAS_WIN32).
 */

#include "valtime/core/hotkey_source.hpp"
#include "valtime/core/key_bindings.hpp"

#include <atomic>
#include <vector>

namespace valtime {

class Win32HotkeySource : public HotkeySource {
public:
    explicit Win32HotkeySource(const std::vector<KeyBinding>& bindings);

    /// Install the hook and pump messages until requestStop().
    /// @throws std::runtime_error if the hook cannot be installed
    void run(HotkeyQueue& queue) override;

    void requestStop() override;

private:
    HotkeyMap map_;
    std::atomic<unsigned long> threadId_{0};
    std::atomic<bool> stopRequested_{false};
};

}  // namespace valtime
