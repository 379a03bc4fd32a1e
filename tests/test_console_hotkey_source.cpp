#include <gtest/gtest.h>
#include "valtime/core/console_hotkey_source.hpp"

#include <sstream>

using namespace valtime;

namespace {

std::vector<HotkeyEvent> runOn(const std::string& input) {
    std::istringstream in(input);
    ConsoleHotkeySource source(in, getDefaultKeyBindings());
    HotkeyQueue queue;
    source.run(queue);
    return queue.drainAll();
}

}  // namespace

TEST(ConsoleHotkeySourceTest, TypedKeysBecomeEvents) {
    std::vector<HotkeyEvent> expected{
        HotkeyEvent::toggle(),
        HotkeyEvent::select(3),
        HotkeyEvent::select(1),
        HotkeyEvent::back(),
        HotkeyEvent::back(),
        HotkeyEvent::quit(),
    };
    EXPECT_EQ(runOn(".31b\x1b"), expected);
}

TEST(ConsoleHotkeySourceTest, WhitespaceAndUnboundKeysIgnored) {
    std::vector<HotkeyEvent> expected{
        HotkeyEvent::toggle(),
        HotkeyEvent::select(2),
        HotkeyEvent::quit(),
    };
    EXPECT_EQ(runOn(" .\n0 x 2\t"), expected);
}

TEST(ConsoleHotkeySourceTest, QuitStopsReading) {
    std::vector<HotkeyEvent> expected{HotkeyEvent::toggle(), HotkeyEvent::quit()};
    EXPECT_EQ(runOn(".q123"), expected);
}

TEST(ConsoleHotkeySourceTest, StopRequestedBeforeRun) {
    std::istringstream in("...");
    ConsoleHotkeySource source(in, getDefaultKeyBindings());
    HotkeyQueue queue;

    source.requestStop();
    source.run(queue);
    EXPECT_TRUE(queue.empty());
}

TEST(ConsoleHotkeySourceTest, CustomBindings) {
    auto bindings = getDefaultKeyBindings();
    bindings[0].keyCode = 'T';  // toggle on 't'

    std::istringstream in("t.");
    ConsoleHotkeySource source(in, bindings);
    EXPECT_EQ(source.translate('t'), HotkeyEvent::toggle());
    EXPECT_FALSE(source.translate('.').has_value());
}
