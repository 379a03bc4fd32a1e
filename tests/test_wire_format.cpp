#include <gtest/gtest.h>
#include "valtime/core/frame_generator.hpp"
#include "valtime/core/truck_sprite.hpp"
#include "valtime/core/wire_format.hpp"

#include <stdexcept>

using namespace valtime;

TEST(WireFormatTest, FullWidthLineHasTrailingDelimiterTrimmed) {
    std::u32string line(26, U'▒');
    EXPECT_EQ(formatPayload(std::u32string_view(line)), line);
}

TEST(WireFormatTest, DelimiterAfterEveryWidthRun) {
    Frame frame{{U"abc", U"def", U"ghi"}};
    EXPECT_EQ(formatPayload(frame, 3), U"abc def ghi");
}

TEST(WireFormatTest, LongLineIsChunked) {
    EXPECT_EQ(formatPayload(std::u32string_view(U"abcdefg"), 3), U"abc def g");
}

TEST(WireFormatTest, ShortLinesKeepTheirOwnGroup) {
    Frame frame{{U"ab", U"cd"}};
    EXPECT_EQ(formatPayload(frame, 3), U"ab cd");
    EXPECT_EQ(formatPayload(Frame{{U"hi", U"there"}}), U"hi there");
}

TEST(WireFormatTest, LongLinesAreChunkedPerLine) {
    Frame frame{{U"abcd", U"ef"}};
    EXPECT_EQ(formatPayload(frame, 3), U"abc d ef");
}

TEST(WireFormatTest, CustomDelimiter) {
    Frame frame{{U"ab", U"cd"}};
    EXPECT_EQ(formatPayload(frame, 2, U'|'), U"ab|cd");
}

TEST(WireFormatTest, EmptyFrame) {
    EXPECT_EQ(formatPayload(Frame{}), U"");
}

TEST(WireFormatTest, ZeroWidthThrows) {
    EXPECT_THROW((void)formatPayload(Frame{{U"a"}}, 0), std::invalid_argument);
}

TEST(WireFormatTest, TruckFrameLength) {
    FrameGenerator gen(truckSprite());
    std::u32string payload = formatPayload(gen.frameAt(0));

    // 13 runs of 26 glyphs, 12 delimiters between them
    EXPECT_EQ(payload.size(), 13u * 26u + 12u);
    for (size_t i = 26; i < payload.size(); i += 27) {
        EXPECT_EQ(payload[i], WIRE_DELIMITER) << "at " << i;
    }
}
