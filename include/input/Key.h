#pragma once

#include <cstdint>
#include <string>

namespace VTInput::Input {

// Modifier bit set. The low four bits match the XTerm modifier
// parameter minus one (Shift=1, Alt=2, Ctrl=4, Meta=8).
enum class KeyMod : uint16_t {
    None       = 0,
    Shift      = 1 << 0,
    Alt        = 1 << 1,
    Ctrl       = 1 << 2,
    Meta       = 1 << 3,
    Hyper      = 1 << 4,
    Super      = 1 << 5,
    CapsLock   = 1 << 6,
    NumLock    = 1 << 7,
    ScrollLock = 1 << 8,
};

constexpr KeyMod operator|(KeyMod a, KeyMod b) {
    return static_cast<KeyMod>(static_cast<uint16_t>(a) | static_cast<uint16_t>(b));
}

constexpr KeyMod operator&(KeyMod a, KeyMod b) {
    return static_cast<KeyMod>(static_cast<uint16_t>(a) & static_cast<uint16_t>(b));
}

inline KeyMod& operator|=(KeyMod& a, KeyMod b) {
    a = a | b;
    return a;
}

constexpr bool HasMod(KeyMod set, KeyMod bit) {
    return (set & bit) != KeyMod::None;
}

// Key press state reported by the Kitty keyboard protocol.
// Legacy encodings only ever report Press.
enum class KeyAction : uint8_t {
    Press,
    Repeat,
    Release,
};

// Named (non-printable) keys
enum class KeySym : uint16_t {
    None,

    // Cursor and editing keys
    Up,
    Down,
    Right,
    Left,
    Begin,
    Find,
    Insert,
    Delete,
    Select,
    PgUp,
    PgDown,
    Home,
    End,

    // Keypad
    KpEnter,
    KpEqual,
    KpMultiply,
    KpPlus,
    KpComma,
    KpMinus,
    KpDecimal,
    KpDivide,
    Kp0,
    Kp1,
    Kp2,
    Kp3,
    Kp4,
    Kp5,
    Kp6,
    Kp7,
    Kp8,
    Kp9,
    KpSep,
    KpUp,
    KpDown,
    KpLeft,
    KpRight,
    KpPgUp,
    KpPgDown,
    KpHome,
    KpEnd,
    KpInsert,
    KpDelete,
    KpBegin,

    // Function keys, F1..F63 are contiguous
    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10,
    F11, F12, F13, F14, F15, F16, F17, F18, F19, F20,
    F21, F22, F23, F24, F25, F26, F27, F28, F29, F30,
    F31, F32, F33, F34, F35, F36, F37, F38, F39, F40,
    F41, F42, F43, F44, F45, F46, F47, F48, F49, F50,
    F51, F52, F53, F54, F55, F56, F57, F58, F59, F60,
    F61, F62, F63,

    // Lock and system keys
    CapsLock,
    ScrollLock,
    NumLock,
    PrintScreen,
    Pause,
    Menu,

    // Media keys
    MediaPlay,
    MediaPause,
    MediaPlayPause,
    MediaReverse,
    MediaStop,
    MediaFastForward,
    MediaRewind,
    MediaNext,
    MediaPrev,
    MediaRecord,
    LowerVol,
    RaiseVol,
    Mute,

    // Modifier keys reported on their own
    LeftShift,
    LeftAlt,
    LeftCtrl,
    LeftSuper,
    LeftHyper,
    LeftMeta,
    RightShift,
    RightAlt,
    RightCtrl,
    RightSuper,
    RightHyper,
    RightMeta,
    IsoLevel3Shift,
    IsoLevel5Shift,

    // Special names for C0 keys
    Backspace,
    Tab,
    Enter,
    Escape,
    Space,
};

// Returns F<n> for n in [1, 63], KeySym::None otherwise
KeySym FunctionKey(int n);

// Lower-case key name ("up", "pgdown", "f12"); empty for KeySym::None
std::string KeySymName(KeySym sym);

struct KeyEvent {
    KeySym sym = KeySym::None;
    std::u32string runes;       // Printable code points, may be a cluster
    std::u32string altRunes;    // Shifted/base-layout code points (Kitty)
    KeyMod mod = KeyMod::None;
    KeyAction action = KeyAction::Press;

    bool operator==(const KeyEvent& other) const {
        return sym == other.sym && runes == other.runes && altRunes == other.altRunes &&
               mod == other.mod && action == other.action;
    }
    bool operator!=(const KeyEvent& other) const { return !(*this == other); }

    // Human readable form, e.g. "ctrl+alt+a", "shift+f5", "space"
    std::string ToString() const;
};

} // namespace VTInput::Input
