/**
 * @file overlay_main.cpp
 * @brief ValTime overlay - communication menu driven by global hotkeys
 *
 * Loads settings and animation timing, then runs the overlay until quit.
 * On Windows the hotkeys come from a keyboard hook and actions go to the
 * game through SendInput. Elsewhere (or with --dry-run) the hotkeys are
 * read from stdin and every synthesized event is printed instead.
 *
 * Command line:
 * - --settings <file>: Settings file (default: valtime.conf)
 * - --dry-run: Print input events instead of sending them
 * - --console: Read hotkeys from stdin even on Windows
 * - --import <name> <file>: Register an animation file under a menu name
 * - --write-settings: Save the effective settings (with defaults) and exit
 *
 * Console controls:
 * - .: Toggle the overlay
 * - 1-9: Select
 * - b / Esc: Back
 * - q: Quit
 */

#include <valtime/core/animation_store.hpp>
#include <valtime/core/console_hotkey_source.hpp>
#include <valtime/core/input_injector.hpp>
#include <valtime/core/logging_input_sink.hpp>
#include <valtime/core/menu.hpp>
#include <valtime/core/overlay_controller.hpp>
#include <valtime/core/overlay_settings.hpp>

#ifdef VALTIME_HAS_WIN32
#include <valtime/platform/win32_hotkey_source.hpp>
#include <valtime/platform/win32_input_sink.hpp>
#include <windows.h>
#endif

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace valtime;

namespace {

void renderView(const OverlayView& view) {
    if (!view.visible) {
        std::cout << "-- overlay hidden --";
        if (!view.status.empty()) {
            std::cout << "  [" << view.status << "]";
        }
        std::cout << "\n";
        return;
    }

    std::cout << "== " << view.title << " ==\n";
    for (size_t i = 0; i < view.options.size(); ++i) {
        std::cout << "  " << (i + 1) << ". " << view.options[i] << "\n";
    }
    std::cout << "  Esc. " << view.footer << "\n";
    if (!view.status.empty()) {
        std::cout << "  [" << view.status << "]\n";
    }
}

#ifdef VALTIME_HAS_WIN32
HotkeySource* g_stopTarget = nullptr;

BOOL WINAPI consoleCtrlHandler(DWORD type) {
    if (type == CTRL_C_EVENT || type == CTRL_CLOSE_EVENT) {
        if (g_stopTarget) {
            g_stopTarget->requestStop();
        }
        return TRUE;
    }
    return FALSE;
}
#endif

}  // namespace

int main(int argc, char* argv[]) {
    std::cout << "ValTime Overlay\n";
    std::cout << "===============\n\n";

    // Parse command line
    std::filesystem::path settingsPath = "valtime.conf";
    bool forceDryRun = false;
    bool useConsole = false;
    bool writeSettings = false;
    std::vector<std::pair<std::string, std::filesystem::path>> imports;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--settings" && i + 1 < argc) {
            settingsPath = argv[++i];
        } else if (arg == "--dry-run") {
            forceDryRun = true;
        } else if (arg == "--console") {
            useConsole = true;
        } else if (arg == "--write-settings") {
            writeSettings = true;
        } else if (arg == "--import" && i + 2 < argc) {
            std::string name = argv[++i];
            imports.emplace_back(name, argv[++i]);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return 2;
        }
    }

    try {
        OverlaySettings settings;
        settings.load(settingsPath);

        if (writeSettings) {
            settings.fillDefaults();
            if (!settings.save()) {
                std::cerr << "Error: could not write " << settingsPath.string() << "\n";
                return 1;
            }
            std::cout << "Wrote " << settingsPath.string() << "\n";
            return 0;
        }

        const size_t screenWidth = settings.screenWidth();
        AnimationStore store(settings.animationConfigPath(), screenWidth, settings.backgroundGlyph());
        if (store.load()) {
            std::cout << "Loaded animation config " << store.configPath().string() << "\n";
        }
        for (const auto& [name, path] : imports) {
            if (!store.importAnimation(name, path)) {
                std::cerr << "Warning: could not import '" << name << "' from " << path.string() << "\n";
            }
        }

        // Input backend
        std::unique_ptr<InputSink> sink;
        bool dryRun = forceDryRun || settings.dryRun();
#ifdef VALTIME_HAS_WIN32
        if (!dryRun) {
            sink = std::make_unique<Win32InputSink>();
        }
#else
        dryRun = true;
        (void)useConsole;
#endif
        if (dryRun) {
            std::cout << "Dry run: input events are printed, not sent\n";
            sink = std::make_unique<LoggingInputSink>(std::cout);
        }
        InputInjector injector(*sink);

        MenuGraph graph = buildDefaultMenu();
        OverlayController overlay(graph, store, injector, screenWidth);
        overlay.setViewListener(renderView);

        // Hotkey source
        auto bindings = settings.keyBindings();
        std::unique_ptr<HotkeySource> source;
#ifdef VALTIME_HAS_WIN32
        if (!useConsole) {
            source = std::make_unique<Win32HotkeySource>(bindings);
            g_stopTarget = source.get();
            SetConsoleCtrlHandler(consoleCtrlHandler, TRUE);
            std::cout << "Hotkeys: '.' toggle, 1-9 select, Esc back, Ctrl+C quit\n\n";
        }
#endif
        if (!source) {
            source = std::make_unique<ConsoleHotkeySource>(std::cin, bindings);
            std::cout << "Keys (then Enter): '.' toggle, 1-9 select, b back, q quit\n\n";
        }

        overlay.start();
        source->run(overlay.hotkeys());
        overlay.stop();

#ifdef VALTIME_HAS_WIN32
        g_stopTarget = nullptr;
#endif

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
