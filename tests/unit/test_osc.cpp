// test_osc.cpp - Unit tests for OSC color reply decoding

#include <gtest/gtest.h>
#include "input/EventParser.h"

namespace VTInput::Input {
namespace Tests {

class OscTest : public ::testing::Test {
protected:
    OscTest()
        : parser(SequenceTable::Build("xterm", SequenceFlags::None)) {}

    DecodeResult Next(const std::string& bytes, bool flush = false) {
        return parser.DecodeNext(bytes, flush);
    }

    EventParser parser;
};

TEST_F(OscTest, BackgroundColorWithBel) {
    std::string reply = "\x1b]11;rgb:1000/2000/3000\x07";
    DecodeResult result = Next(reply);

    EXPECT_EQ(result.consumed, reply.size());
    ASSERT_EQ(result.events.size(), 1u);
    const auto* bg = std::get_if<BackgroundColorEvent>(&result.events[0]);
    ASSERT_NE(bg, nullptr);
    EXPECT_EQ(bg->color, Color(0x10, 0x20, 0x30));
    EXPECT_EQ(bg->color.ToHex(), "#102030");
}

TEST_F(OscTest, BackgroundColorWithStringTerminator) {
    std::string reply = "\x1b]11;rgb:1000/2000/3000\x1b\\";
    DecodeResult result = Next(reply);

    EXPECT_EQ(result.consumed, reply.size());
    const auto* bg = std::get_if<BackgroundColorEvent>(&result.events[0]);
    ASSERT_NE(bg, nullptr);
    EXPECT_EQ(bg->color.ToHex(), "#102030");
}

TEST_F(OscTest, EightBitIntroducerAndTerminator) {
    std::string reply = "\x9d" "11;rgb:1000/2000/3000\x9c";
    DecodeResult result = Next(reply);

    EXPECT_EQ(result.consumed, reply.size());
    EXPECT_TRUE(std::holds_alternative<BackgroundColorEvent>(result.events[0]));
}

TEST_F(OscTest, ForegroundAndCursorColors) {
    DecodeResult fg = Next("\x1b]10;rgb:ffff/0000/8080\x07");
    const auto* fgEvent = std::get_if<ForegroundColorEvent>(&fg.events[0]);
    ASSERT_NE(fgEvent, nullptr);
    EXPECT_EQ(fgEvent->color, Color(0xff, 0x00, 0x80));

    DecodeResult cursor = Next("\x1b]12;#ff0000\x07");
    const auto* cursorEvent = std::get_if<CursorColorEvent>(&cursor.events[0]);
    ASSERT_NE(cursorEvent, nullptr);
    EXPECT_EQ(cursorEvent->color, Color(0xff, 0x00, 0x00));
}

TEST_F(OscTest, FollowedByKeys) {
    DecodeResult result = parser.Decode("\x1b]11;rgb:1000/2000/3000\x07" "a", false);

    ASSERT_EQ(result.events.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<BackgroundColorEvent>(result.events[0]));
    EXPECT_TRUE(std::holds_alternative<KeyEvent>(result.events[1]));
}

TEST_F(OscTest, BareEscapeTerminator) {
    // ESC not followed by a backslash still ends the string
    DecodeResult result = parser.Decode("\x1b]11;#102030\x1bx", false);

    ASSERT_EQ(result.events.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<BackgroundColorEvent>(result.events[0]));
    const auto* key = std::get_if<KeyEvent>(&result.events[1]);
    ASSERT_NE(key, nullptr);
    EXPECT_EQ(key->runes, U"x");
    // The ESC went with the string, so x carries no Alt
    EXPECT_EQ(key->mod, KeyMod::None);
}

TEST_F(OscTest, EscapeAtEndOfBufferIsIncomplete) {
    EXPECT_EQ(Next("\x1b]11;rgb:1000/2000/3000\x1b").consumed, 0u);
}

TEST_F(OscTest, MissingTerminator) {
    EXPECT_EQ(Next("\x1b]11;rgb:10").consumed, 0u);

    DecodeResult flushed = Next("\x1b]11;rgb:10", true);
    EXPECT_EQ(flushed.consumed, 11u);
    const auto* unknown = std::get_if<UnknownEvent>(&flushed.events[0]);
    ASSERT_NE(unknown, nullptr);
    EXPECT_EQ(unknown->raw, "\x1b]11;rgb:10");
}

TEST_F(OscTest, InvalidColorIsUnknown) {
    std::string reply = "\x1b]11;garbage\x07";
    DecodeResult result = Next(reply);

    EXPECT_EQ(result.consumed, reply.size());
    const auto* unknown = std::get_if<UnknownEvent>(&result.events[0]);
    ASSERT_NE(unknown, nullptr);
    EXPECT_EQ(unknown->raw, reply);
}

TEST_F(OscTest, OtherIdentifiersAreUnknown) {
    std::string clipboard = "\x1b]52;c;aGVsbG8=\x07";
    DecodeResult result = Next(clipboard);
    EXPECT_TRUE(std::holds_alternative<UnknownEvent>(result.events[0]));

    std::string noData = "\x1b]11\x07";
    EXPECT_TRUE(std::holds_alternative<UnknownEvent>(Next(noData).events[0]));
}

} // namespace Tests
} // namespace VTInput::Input
