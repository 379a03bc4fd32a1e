#include <gtest/gtest.h>
#include "valtime/core/frame_list.hpp"

using namespace valtime;

class FrameListTest : public ::testing::Test {
protected:
    void SetUp() override {
        list.append(Frame{{U"one"}});
        list.append(Frame{{U"two"}});
        list.append(Frame{{U"three"}});
    }

    FrameList list;
};

TEST_F(FrameListTest, AppendReturnsIndex) {
    EXPECT_EQ(list.appendEmpty(), 3u);
    EXPECT_EQ(list.size(), 4u);
    EXPECT_TRUE(list.frames()[3].empty());
}

TEST_F(FrameListTest, RemoveShiftsLaterFrames) {
    EXPECT_TRUE(list.remove(0));
    EXPECT_EQ(list.size(), 2u);
    EXPECT_EQ(list.text(0), "two");
    EXPECT_FALSE(list.remove(5));
}

TEST_F(FrameListTest, MoveUpAndDown) {
    EXPECT_TRUE(list.moveUp(2));
    EXPECT_EQ(list.text(1), "three");
    EXPECT_EQ(list.text(2), "two");

    EXPECT_TRUE(list.moveDown(0));
    EXPECT_EQ(list.text(0), "three");
    EXPECT_EQ(list.text(1), "one");
}

TEST_F(FrameListTest, MovesAtTheEdgesAreRejected) {
    EXPECT_FALSE(list.moveUp(0));
    EXPECT_FALSE(list.moveDown(2));
    EXPECT_FALSE(list.moveUp(7));
    EXPECT_EQ(list.text(0), "one");
    EXPECT_EQ(list.text(2), "three");
}

TEST_F(FrameListTest, ReplaceTextSplitsLines) {
    EXPECT_TRUE(list.replaceText(1, "▒▀▒\r\n▒▄▒"));
    const Frame& frame = list.frames()[1];
    ASSERT_EQ(frame.lineCount(), 2u);
    EXPECT_EQ(frame.lines[0], U"▒▀▒");
    EXPECT_EQ(frame.lines[1], U"▒▄▒");
    EXPECT_EQ(list.text(1), "▒▀▒\n▒▄▒");

    EXPECT_FALSE(list.replaceText(3, "x"));
}

TEST_F(FrameListTest, SnapshotIsIndependentCopy) {
    SharedFrames snap = list.snapshot();
    list.remove(0);
    ASSERT_EQ(snap->size(), 3u);
    EXPECT_EQ((*snap)[0].lines[0], U"one");
}

TEST(FrameListParseTest, EmptyTextIsEmptyFrame) {
    EXPECT_TRUE(FrameList::parseFrameText("").empty());
}

TEST(FrameListParseTest, TrailingNewlineKeepsEmptyLastLine) {
    Frame frame = FrameList::parseFrameText("a\n");
    ASSERT_EQ(frame.lineCount(), 2u);
    EXPECT_EQ(frame.lines[1], U"");
}
