#include "valtime/platform/win32_hotkey_source.hpp"

#include <windows.h>

#include <atomic>
#include <iostream>
#include <stdexcept>
#include <string>

namespace valtime {

namespace {

// The hook procedure has no context argument
struct HookContext {
    const HotkeyMap* map = nullptr;
    HotkeyQueue* queue = nullptr;
    HHOOK hook = nullptr;
};

HookContext g_context;
std::atomic<bool> g_active{false};

LRESULT CALLBACK LowLevelKeyboardProc(int nCode, WPARAM wParam, LPARAM lParam) {
    if (nCode == HC_ACTION && (wParam == WM_KEYDOWN || wParam == WM_SYSKEYDOWN)) {
        const auto* kb = reinterpret_cast<const KBDLLHOOKSTRUCT*>(lParam);
        if (!(kb->flags & LLKHF_INJECTED)) {
            if (auto event = g_context.map->lookup(static_cast<int>(kb->vkCode))) {
                g_context.queue->push(*event);
            }
        }
    }
    return CallNextHookEx(g_context.hook, nCode, wParam, lParam);
}

}  // namespace

Win32HotkeySource::Win32HotkeySource(const std::vector<KeyBinding>& bindings)
    : map_(bindings)
{
}

void Win32HotkeySource::run(HotkeyQueue& queue) {
    if (g_active.exchange(true)) {
        throw std::runtime_error("Win32HotkeySource: another source is already running");
    }

    g_context.map = &map_;
    g_context.queue = &queue;
    g_context.hook = SetWindowsHookExW(WH_KEYBOARD_LL, LowLevelKeyboardProc,
                                       GetModuleHandleW(nullptr), 0);
    if (!g_context.hook) {
        DWORD error = GetLastError();
        g_active = false;
        throw std::runtime_error("Win32HotkeySource: SetWindowsHookEx failed (error " +
                                 std::to_string(error) + ")");
    }

    // Create this thread's message queue before anyone can post WM_QUIT to it
    MSG peek;
    PeekMessageW(&peek, nullptr, WM_USER, WM_USER, PM_NOREMOVE);
    threadId_ = GetCurrentThreadId();
    std::cout << "[Win32HotkeySource] Keyboard hook installed\n";

    // A stop requested before the thread id was published still counts
    if (!stopRequested_) {
        MSG msg;
        while (GetMessageW(&msg, nullptr, 0, 0) > 0) {
            TranslateMessage(&msg);
            DispatchMessageW(&msg);
        }
    }

    UnhookWindowsHookEx(g_context.hook);
    g_context = HookContext{};
    threadId_ = 0;
    g_active = false;
    std::cout << "[Win32HotkeySource] Keyboard hook removed\n";
}

void Win32HotkeySource::requestStop() {
    stopRequested_ = true;
    DWORD id = threadId_;
    if (id != 0) {
        PostThreadMessageW(id, WM_QUIT, 0, 0);
    }
}

}  // namespace valtime
