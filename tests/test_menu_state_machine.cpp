#include <gtest/gtest.h>
#include "valtime/core/menu_state_machine.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace valtime;
using namespace std::chrono_literals;

namespace {

class RecordingDispatcher : public ActionDispatcher {
public:
    void dispatchFreeText(const std::string& message) override {
        calls.push_back("text:" + message);
        if (throwOnDispatch) throw std::runtime_error("injector unavailable");
    }

    void dispatchVoiceWheel(int wheelKey, int lineIndex) override {
        calls.push_back("wheel:" + std::to_string(wheelKey) + "-" + std::to_string(lineIndex));
        if (throwOnDispatch) throw std::runtime_error("injector unavailable");
    }

    void dispatchAnimation(const std::string& name) override {
        calls.push_back("anim:" + name);
        if (throwOnDispatch) throw std::runtime_error("injector unavailable");
    }

    std::vector<std::string> calls;
    bool throwOnDispatch = false;
};

}  // namespace

class MenuStateMachineTest : public ::testing::Test {
protected:
    MenuStateMachineTest()
        : graph(buildDefaultMenu())
        , menu(graph, dispatcher, [this]() { return now; })
    {
    }

    void advance(std::chrono::milliseconds by) { now += by; }

    MenuStateMachine::Clock::time_point now{};
    MenuGraph graph;
    RecordingDispatcher dispatcher;
    MenuStateMachine menu;
};

TEST_F(MenuStateMachineTest, StartsHidden) {
    EXPECT_EQ(menu.state(), MenuState::Hidden);
    EXPECT_FALSE(menu.isVisible());
    EXPECT_EQ(menu.currentNode(), nullptr);
    EXPECT_FALSE(menu.nextDeadline().has_value());
}

TEST_F(MenuStateMachineTest, ToggleShowsAndHides) {
    menu.toggle();
    EXPECT_EQ(menu.state(), MenuState::AtRoot);
    EXPECT_EQ(menu.currentNode(), &graph.root());

    menu.toggle();
    EXPECT_EQ(menu.state(), MenuState::Hidden);
}

TEST_F(MenuStateMachineTest, ToggleFromSubmenuHides) {
    menu.toggle();
    menu.select(3);
    ASSERT_EQ(menu.state(), MenuState::AtSubmenu);

    menu.toggle();
    EXPECT_EQ(menu.state(), MenuState::Hidden);

    // Reopens at the root, not the old submenu
    menu.toggle();
    EXPECT_EQ(menu.state(), MenuState::AtRoot);
    EXPECT_EQ(menu.originIndex(), 0u);
}

TEST_F(MenuStateMachineTest, SelectAtRootOpensSubmenu) {
    menu.toggle();
    EXPECT_TRUE(menu.select(5));
    EXPECT_EQ(menu.state(), MenuState::AtSubmenu);
    EXPECT_EQ(menu.currentNode()->name, "Social");
    EXPECT_EQ(menu.originIndex(), 5u);
    EXPECT_TRUE(dispatcher.calls.empty());
}

TEST_F(MenuStateMachineTest, SelectWhileHiddenIsIgnored) {
    EXPECT_FALSE(menu.select(1));
    EXPECT_EQ(menu.state(), MenuState::Hidden);
    EXPECT_EQ(menu.dispatchCount(), 0u);
}

TEST_F(MenuStateMachineTest, OutOfRangeSelectIsIgnored) {
    menu.toggle();
    EXPECT_FALSE(menu.select(9));
    EXPECT_EQ(menu.state(), MenuState::AtRoot);

    menu.select(2);  // Animations has one option
    EXPECT_FALSE(menu.select(2));
    EXPECT_FALSE(menu.select(0));
    EXPECT_EQ(menu.state(), MenuState::AtSubmenu);
    EXPECT_FALSE(menu.selectionPending());
    EXPECT_TRUE(dispatcher.calls.empty());
}

TEST_F(MenuStateMachineTest, VoiceWheelSelectDispatchesWheelAndLine) {
    menu.toggle();
    menu.select(3);  // Combat
    EXPECT_TRUE(menu.select(4));

    EXPECT_EQ(dispatcher.calls, std::vector<std::string>{"wheel:1-4"});
    EXPECT_TRUE(menu.selectionPending());
    EXPECT_EQ(menu.state(), MenuState::AtSubmenu);
}

TEST_F(MenuStateMachineTest, FreeTextAndAnimationDispatch) {
    menu.toggle();
    menu.select(1);
    menu.select(2);
    EXPECT_EQ(dispatcher.calls, std::vector<std::string>{"text:Nice shot!"});

    menu.toggle();
    menu.toggle();
    menu.select(2);
    menu.select(1);
    EXPECT_EQ(dispatcher.calls, (std::vector<std::string>{"text:Nice shot!", "anim:Truck"}));
}

TEST_F(MenuStateMachineTest, BurstOfSelectsDispatchesOnce) {
    menu.toggle();
    menu.select(4);  // Tactics
    EXPECT_TRUE(menu.select(1));
    EXPECT_FALSE(menu.select(2));
    EXPECT_FALSE(menu.select(3));

    EXPECT_EQ(dispatcher.calls, std::vector<std::string>{"wheel:2-1"});
    EXPECT_EQ(menu.dispatchCount(), 1u);
}

TEST_F(MenuStateMachineTest, VoiceWheelHidesAfterLongSettle) {
    menu.toggle();
    menu.select(5);
    menu.select(1);

    ASSERT_TRUE(menu.nextDeadline().has_value());
    EXPECT_EQ(*menu.nextDeadline() - now, SettleDelays::VOICE_WHEEL);

    advance(499ms);
    EXPECT_FALSE(menu.update());
    EXPECT_TRUE(menu.isVisible());

    advance(1ms);
    EXPECT_TRUE(menu.update());
    EXPECT_EQ(menu.state(), MenuState::Hidden);
    EXPECT_FALSE(menu.nextDeadline().has_value());
}

TEST_F(MenuStateMachineTest, OtherActionsHideAfterShortSettle) {
    menu.toggle();
    menu.select(1);
    menu.select(1);
    EXPECT_EQ(*menu.nextDeadline() - now, SettleDelays::DEFAULT);

    advance(50ms);
    EXPECT_TRUE(menu.update());
    EXPECT_FALSE(menu.isVisible());
}

TEST_F(MenuStateMachineTest, BackNavigation) {
    menu.toggle();
    menu.select(6);

    menu.back();
    EXPECT_EQ(menu.state(), MenuState::AtRoot);
    EXPECT_EQ(menu.originIndex(), 0u);

    menu.back();
    EXPECT_EQ(menu.state(), MenuState::Hidden);

    menu.back();
    EXPECT_EQ(menu.state(), MenuState::Hidden);
}

TEST_F(MenuStateMachineTest, BackClearsPendingSelection) {
    menu.toggle();
    menu.select(1);
    menu.select(3);
    ASSERT_TRUE(menu.selectionPending());

    menu.back();
    EXPECT_FALSE(menu.selectionPending());
    EXPECT_FALSE(menu.nextDeadline().has_value());

    advance(1000ms);
    EXPECT_FALSE(menu.update());
    EXPECT_EQ(menu.state(), MenuState::AtRoot);

    // A new selection is accepted again
    menu.select(1);
    EXPECT_TRUE(menu.select(4));
    EXPECT_EQ(dispatcher.calls.size(), 2u);
}

TEST_F(MenuStateMachineTest, ToggleCancelsPendingHide) {
    menu.toggle();
    menu.select(3);
    menu.select(1);
    menu.toggle();
    EXPECT_FALSE(menu.nextDeadline().has_value());

    menu.toggle();
    advance(1000ms);
    EXPECT_FALSE(menu.update());
    EXPECT_EQ(menu.state(), MenuState::AtRoot);
    EXPECT_FALSE(menu.selectionPending());
}

TEST_F(MenuStateMachineTest, ThrowingDispatcherStillSchedulesHide) {
    dispatcher.throwOnDispatch = true;
    menu.toggle();
    menu.select(1);
    EXPECT_TRUE(menu.select(1));

    EXPECT_EQ(menu.dispatchCount(), 1u);
    EXPECT_TRUE(menu.selectionPending());
    ASSERT_TRUE(menu.nextDeadline().has_value());

    advance(SettleDelays::DEFAULT);
    EXPECT_TRUE(menu.update());
    EXPECT_FALSE(menu.isVisible());
}

TEST(MenuStateNameTest, Names) {
    EXPECT_STREQ(menuStateName(MenuState::Hidden), "Hidden");
    EXPECT_STREQ(menuStateName(MenuState::AtRoot), "AtRoot");
    EXPECT_STREQ(menuStateName(MenuState::AtSubmenu), "AtSubmenu");
}
