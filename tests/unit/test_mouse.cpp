// test_mouse.cpp - Unit tests for X10 and SGR mouse report decoding

#include <gtest/gtest.h>
#include "input/Mouse.h"
#include <string>

namespace VTInput::Input {
namespace Tests {

namespace {

std::string X10(uint8_t cb, uint8_t cx, uint8_t cy) {
    std::string seq = "\x1b[M";
    seq += static_cast<char>(cb);
    seq += static_cast<char>(cx);
    seq += static_cast<char>(cy);
    return seq;
}

MouseEvent Mouse(MouseButton button, MouseAction action, int x, int y,
                 KeyMod mod = KeyMod::None) {
    MouseEvent ev;
    ev.button = button;
    ev.action = action;
    ev.x = x;
    ev.y = y;
    ev.mod = mod;
    return ev;
}

} // namespace

// ============================================================================
// SGR (mode 1006)
// ============================================================================

TEST(SgrMouseTest, LeftPress) {
    EXPECT_EQ(ParseSGRMouseEvent("\x1b[<0;10;20M"),
              Mouse(MouseButton::Left, MouseAction::Press, 9, 19));
}

TEST(SgrMouseTest, LowercaseFinalIsRelease) {
    EXPECT_EQ(ParseSGRMouseEvent("\x1b[<2;1;1m"),
              Mouse(MouseButton::Right, MouseAction::Release, 0, 0));
}

TEST(SgrMouseTest, MotionBit) {
    EXPECT_EQ(ParseSGRMouseEvent("\x1b[<32;5;6M"),
              Mouse(MouseButton::Left, MouseAction::Motion, 4, 5));
    // Motion with no button held
    EXPECT_EQ(ParseSGRMouseEvent("\x1b[<35;5;6M"),
              Mouse(MouseButton::None, MouseAction::Motion, 4, 5));
}

TEST(SgrMouseTest, WheelButtons) {
    EXPECT_EQ(ParseSGRMouseEvent("\x1b[<64;1;1M")->button, MouseButton::WheelUp);
    EXPECT_EQ(ParseSGRMouseEvent("\x1b[<65;1;1M")->button, MouseButton::WheelDown);
    EXPECT_EQ(ParseSGRMouseEvent("\x1b[<66;1;1M")->button, MouseButton::WheelLeft);
    EXPECT_EQ(ParseSGRMouseEvent("\x1b[<67;1;1M")->button, MouseButton::WheelRight);
}

TEST(SgrMouseTest, ExtraButtons) {
    EXPECT_EQ(ParseSGRMouseEvent("\x1b[<128;1;1M")->button, MouseButton::Backward);
    EXPECT_EQ(ParseSGRMouseEvent("\x1b[<129;1;1M")->button, MouseButton::Forward);
    EXPECT_EQ(ParseSGRMouseEvent("\x1b[<131;1;1M")->button, MouseButton::Button11);
}

TEST(SgrMouseTest, Modifiers) {
    EXPECT_EQ(ParseSGRMouseEvent("\x1b[<4;1;1M")->mod, KeyMod::Shift);
    EXPECT_EQ(ParseSGRMouseEvent("\x1b[<8;1;1M")->mod, KeyMod::Alt);
    EXPECT_EQ(ParseSGRMouseEvent("\x1b[<16;1;1M")->mod, KeyMod::Ctrl);
    EXPECT_EQ(ParseSGRMouseEvent("\x1b[<28;1;1M")->mod, KeyMod::Shift | KeyMod::Alt | KeyMod::Ctrl);
}

TEST(SgrMouseTest, LargeCoordinates) {
    auto ev = ParseSGRMouseEvent("\x1b[<0;500;300M");
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->x, 499);
    EXPECT_EQ(ev->y, 299);
}

TEST(SgrMouseTest, Malformed) {
    EXPECT_FALSE(ParseSGRMouseEvent("\x1b[<0;10M").has_value());
    EXPECT_FALSE(ParseSGRMouseEvent("\x1b[<0;0;1M").has_value());
    EXPECT_FALSE(ParseSGRMouseEvent("\x1b[<;1;1M").has_value());
    EXPECT_FALSE(ParseSGRMouseEvent("\x1b[0;1;1M").has_value());
    EXPECT_FALSE(ParseSGRMouseEvent("\x1b[<0;1;1X").has_value());
}

// ============================================================================
// X10
// ============================================================================

TEST(X10MouseTest, LeftPress) {
    EXPECT_EQ(ParseX10MouseEvent(X10(0x20, 0x2a, 0x34)),
              Mouse(MouseButton::Left, MouseAction::Press, 9, 19));
}

TEST(X10MouseTest, OriginCell) {
    EXPECT_EQ(ParseX10MouseEvent(X10(0x21, 0x21, 0x21)),
              Mouse(MouseButton::Middle, MouseAction::Press, 0, 0));
}

TEST(X10MouseTest, ReleaseHasNoButton) {
    EXPECT_EQ(ParseX10MouseEvent(X10(0x23, 0x21, 0x21)),
              Mouse(MouseButton::None, MouseAction::Release, 0, 0));
}

TEST(X10MouseTest, WheelAndModifiers) {
    auto wheel = ParseX10MouseEvent(X10(0x20 + 64, 0x30, 0x30));
    ASSERT_TRUE(wheel.has_value());
    EXPECT_EQ(wheel->button, MouseButton::WheelUp);

    auto ctrl = ParseX10MouseEvent(X10(0x20 + 16, 0x30, 0x30));
    ASSERT_TRUE(ctrl.has_value());
    EXPECT_EQ(ctrl->mod, KeyMod::Ctrl);
    EXPECT_EQ(ctrl->button, MouseButton::Left);
}

TEST(X10MouseTest, MaximumCoordinate) {
    auto ev = ParseX10MouseEvent(X10(0x20, 0xff, 0xff));
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->x, 222);
    EXPECT_EQ(ev->y, 222);
}

TEST(X10MouseTest, UnencodableBytes) {
    EXPECT_FALSE(ParseX10MouseEvent(X10(0x1f, 0x21, 0x21)).has_value());
    EXPECT_FALSE(ParseX10MouseEvent(X10(0x20, 0x20, 0x21)).has_value());
    EXPECT_FALSE(ParseX10MouseEvent(X10(0x20, 0x21, 0x00)).has_value());
}

TEST(MouseEventTest, ToString) {
    EXPECT_EQ(Mouse(MouseButton::Left, MouseAction::Press, 9, 19, KeyMod::Ctrl).ToString(),
              "ctrl+left press (9,19)");
    EXPECT_EQ(Mouse(MouseButton::WheelDown, MouseAction::Press, 0, 3).ToString(),
              "wheeldown press (0,3)");
    EXPECT_EQ(Mouse(MouseButton::None, MouseAction::Motion, 1, 2).ToString(),
              "none motion (1,2)");
}

} // namespace Tests
} // namespace VTInput::Input
