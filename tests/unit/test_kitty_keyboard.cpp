// test_kitty_keyboard.cpp - Unit tests for Kitty keyboard protocol reports

#include <gtest/gtest.h>
#include "input/KittyKeyboard.h"

namespace VTInput::Input {
namespace Tests {

namespace {

KeyEvent Parse(const char* seq) {
    return ParseKittyKeyEvent(CsiParams(seq));
}

} // namespace

TEST(KittyKeyboardTest, FunctionalCodes) {
    EXPECT_EQ(KittyKeySym(57364), KeySym::F1);
    EXPECT_EQ(KittyKeySym(57398), KeySym::F35);
    EXPECT_EQ(KittyKeySym(57399), KeySym::Kp0);
    EXPECT_EQ(KittyKeySym(57408), KeySym::Kp9);
    EXPECT_EQ(KittyKeySym(57441), KeySym::LeftShift);
    EXPECT_EQ(KittyKeySym(27), KeySym::Escape);
    EXPECT_EQ(KittyKeySym(13), KeySym::Enter);
    EXPECT_EQ(KittyKeySym(127), KeySym::Backspace);
    EXPECT_EQ(KittyKeySym(97), KeySym::None);
}

TEST(KittyKeyboardTest, ModifierBits) {
    EXPECT_EQ(FromKittyMod(0), KeyMod::None);
    EXPECT_EQ(FromKittyMod(1), KeyMod::Shift);
    EXPECT_EQ(FromKittyMod(2 | 4), KeyMod::Alt | KeyMod::Ctrl);
    EXPECT_EQ(FromKittyMod(8), KeyMod::Super);
    EXPECT_EQ(FromKittyMod(16), KeyMod::Hyper);
    EXPECT_EQ(FromKittyMod(32), KeyMod::Meta);
    EXPECT_EQ(FromKittyMod(64 | 128), KeyMod::CapsLock | KeyMod::NumLock);
}

TEST(KittyKeyboardTest, PlainKey) {
    KeyEvent key = Parse("\x1b[97u");

    EXPECT_EQ(key.sym, KeySym::None);
    EXPECT_EQ(key.runes, U"a");
    EXPECT_EQ(key.mod, KeyMod::None);
    EXPECT_EQ(key.action, KeyAction::Press);
}

TEST(KittyKeyboardTest, ShiftedAlternate) {
    KeyEvent key = Parse("\x1b[97:65;2u");

    EXPECT_EQ(key.runes, U"a");
    EXPECT_EQ(key.altRunes, U"A");
    EXPECT_EQ(key.mod, KeyMod::Shift);
}

TEST(KittyKeyboardTest, RepeatAndRelease) {
    EXPECT_EQ(Parse("\x1b[97;1:2u").action, KeyAction::Repeat);
    EXPECT_EQ(Parse("\x1b[97;1:1u").action, KeyAction::Press);

    KeyEvent release = Parse("\x1b[57441;2:3u");
    EXPECT_EQ(release.sym, KeySym::LeftShift);
    EXPECT_EQ(release.mod, KeyMod::Shift);
    EXPECT_EQ(release.action, KeyAction::Release);
}

TEST(KittyKeyboardTest, CtrlModifier) {
    KeyEvent key = Parse("\x1b[99;5u");

    EXPECT_EQ(key.runes, U"c");
    EXPECT_EQ(key.mod, KeyMod::Ctrl);
    EXPECT_EQ(key.ToString(), "ctrl+c");
}

TEST(KittyKeyboardTest, AssociatedText) {
    KeyEvent key = Parse("\x1b[97;;97u");

    EXPECT_EQ(key.runes, U"a");
    EXPECT_EQ(key.altRunes, U"a");
    EXPECT_EQ(key.mod, KeyMod::None);

    KeyEvent multi = Parse("\x1b[97;2;65:66u");
    EXPECT_EQ(multi.altRunes, U"AB");
}

TEST(KittyKeyboardTest, InvalidCodepointBecomesReplacement) {
    EXPECT_EQ(Parse("\x1b[55296u").runes, U"\uFFFD");
    EXPECT_EQ(Parse("\x1b[1114112u").runes, U"\uFFFD");
}

} // namespace Tests
} // namespace VTInput::Input
