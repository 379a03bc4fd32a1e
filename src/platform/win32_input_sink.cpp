#include "valtime/platform/win32_input_sink.hpp"
#include "valtime/core/errors.hpp"
#include "valtime/core/text.hpp"

#include <windows.h>

#include <cstring>
#include <string>

namespace valtime {

namespace {

constexpr int CLIPBOARD_OPEN_ATTEMPTS = 5;
constexpr int SEND_RETRY_COUNT = 3;

std::string lastErrorText(const std::string& what) {
    return what + " (error " + std::to_string(GetLastError()) + ")";
}

WORD virtualKey(KeyCode key) {
    switch (key) {
        case KeyCode::Shift: return VK_SHIFT;
        case KeyCode::Control: return VK_CONTROL;
        case KeyCode::Enter: return VK_RETURN;
        case KeyCode::Backslash: return VK_OEM_5;
        case KeyCode::V: return 'V';
        case KeyCode::Digit0: return '0';
        case KeyCode::Digit1: return '1';
        case KeyCode::Digit2: return '2';
        case KeyCode::Digit3: return '3';
        case KeyCode::Digit4: return '4';
        case KeyCode::Digit5: return '5';
        case KeyCode::Digit6: return '6';
        case KeyCode::Digit7: return '7';
        case KeyCode::Digit8: return '8';
        case KeyCode::Digit9: return '9';
    }
    return 0;
}

// Another process can hold the clipboard briefly; retry before giving up
bool openClipboardWithRetry() {
    for (int attempt = 0; attempt < CLIPBOARD_OPEN_ATTEMPTS; ++attempt) {
        if (OpenClipboard(nullptr)) {
            return true;
        }
        Sleep(5);
    }
    return false;
}

}  // namespace

void Win32InputSink::setClipboard(std::string_view utf8Text) {
    std::u16string wide = utf32ToUtf16(utf8ToUtf32(utf8Text));
    const size_t bytes = (wide.size() + 1) * sizeof(char16_t);

    HGLOBAL memory = GlobalAlloc(GMEM_MOVEABLE, bytes);
    if (!memory) {
        throw InjectionError(lastErrorText("GlobalAlloc failed"));
    }

    void* locked = GlobalLock(memory);
    if (!locked) {
        GlobalFree(memory);
        throw InjectionError(lastErrorText("GlobalLock failed"));
    }
    std::memcpy(locked, wide.c_str(), bytes);
    GlobalUnlock(memory);

    if (!openClipboardWithRetry()) {
        GlobalFree(memory);
        throw InjectionError(lastErrorText("OpenClipboard failed"));
    }

    if (!EmptyClipboard()) {
        std::string message = lastErrorText("EmptyClipboard failed");
        CloseClipboard();
        GlobalFree(memory);
        throw InjectionError(message);
    }

    // On success the clipboard owns the memory
    if (!SetClipboardData(CF_UNICODETEXT, memory)) {
        std::string message = lastErrorText("SetClipboardData failed");
        CloseClipboard();
        GlobalFree(memory);
        throw InjectionError(message);
    }

    CloseClipboard();
}

void Win32InputSink::sendKey(KeyCode key, bool down) {
    INPUT input = {};
    input.type = INPUT_KEYBOARD;
    input.ki.wVk = virtualKey(key);
    input.ki.wScan = static_cast<WORD>(MapVirtualKeyW(input.ki.wVk, MAPVK_VK_TO_VSC));
    input.ki.dwFlags = down ? 0 : KEYEVENTF_KEYUP;

    for (int attempt = 0; attempt < SEND_RETRY_COUNT; ++attempt) {
        if (SendInput(1, &input, sizeof(INPUT)) == 1) {
            return;
        }
        Sleep(1);
    }
    throw InjectionError(lastErrorText(std::string("SendInput failed for ") +
                                       std::string(keyName(key)) + (down ? " down" : " up")));
}

void Win32InputSink::pause(std::chrono::milliseconds delay) {
    Sleep(static_cast<DWORD>(delay.count()));
}

}  // namespace valtime
