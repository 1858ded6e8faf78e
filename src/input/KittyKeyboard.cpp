#include "input/KittyKeyboard.h"
#include "input/Utf8.h"

#include <unordered_map>

namespace VTInput::Input {

namespace {

// Functional key codes from the Kitty keyboard protocol. The C0 codes
// are the legacy values Kitty still reports for those keys.
const std::unordered_map<int, KeySym>& KittyKeyMap() {
    static const std::unordered_map<int, KeySym> map = [] {
        std::unordered_map<int, KeySym> m = {
            {0x08, KeySym::Backspace},
            {0x09, KeySym::Tab},
            {0x0D, KeySym::Enter},
            {0x1B, KeySym::Escape},
            {0x7F, KeySym::Backspace},

            {57344, KeySym::Escape},
            {57345, KeySym::Enter},
            {57346, KeySym::Tab},
            {57347, KeySym::Backspace},
            {57348, KeySym::Insert},
            {57349, KeySym::Delete},
            {57350, KeySym::Left},
            {57351, KeySym::Right},
            {57352, KeySym::Up},
            {57353, KeySym::Down},
            {57354, KeySym::PgUp},
            {57355, KeySym::PgDown},
            {57356, KeySym::Home},
            {57357, KeySym::End},
            {57358, KeySym::CapsLock},
            {57359, KeySym::ScrollLock},
            {57360, KeySym::NumLock},
            {57361, KeySym::PrintScreen},
            {57362, KeySym::Pause},
            {57363, KeySym::Menu},

            {57409, KeySym::KpDecimal},
            {57410, KeySym::KpDivide},
            {57411, KeySym::KpMultiply},
            {57412, KeySym::KpMinus},
            {57413, KeySym::KpPlus},
            {57414, KeySym::KpEnter},
            {57415, KeySym::KpEqual},
            {57416, KeySym::KpSep},
            {57417, KeySym::KpLeft},
            {57418, KeySym::KpRight},
            {57419, KeySym::KpUp},
            {57420, KeySym::KpDown},
            {57421, KeySym::KpPgUp},
            {57422, KeySym::KpPgDown},
            {57423, KeySym::KpHome},
            {57424, KeySym::KpEnd},
            {57425, KeySym::KpInsert},
            {57426, KeySym::KpDelete},
            {57427, KeySym::KpBegin},

            {57428, KeySym::MediaPlay},
            {57429, KeySym::MediaPause},
            {57430, KeySym::MediaPlayPause},
            {57431, KeySym::MediaReverse},
            {57432, KeySym::MediaStop},
            {57433, KeySym::MediaFastForward},
            {57434, KeySym::MediaRewind},
            {57435, KeySym::MediaNext},
            {57436, KeySym::MediaPrev},
            {57437, KeySym::MediaRecord},
            {57438, KeySym::LowerVol},
            {57439, KeySym::RaiseVol},
            {57440, KeySym::Mute},

            {57441, KeySym::LeftShift},
            {57442, KeySym::LeftCtrl},
            {57443, KeySym::LeftAlt},
            {57444, KeySym::LeftSuper},
            {57445, KeySym::LeftHyper},
            {57446, KeySym::LeftMeta},
            {57447, KeySym::RightShift},
            {57448, KeySym::RightCtrl},
            {57449, KeySym::RightAlt},
            {57450, KeySym::RightSuper},
            {57451, KeySym::RightHyper},
            {57452, KeySym::RightMeta},
            {57453, KeySym::IsoLevel3Shift},
            {57454, KeySym::IsoLevel5Shift},
        };

        // F1..F35
        for (int n = 1; n <= 35; ++n) {
            m[57363 + n] = FunctionKey(n);
        }
        // Keypad 0..9
        for (int n = 0; n <= 9; ++n) {
            m[57399 + n] = static_cast<KeySym>(static_cast<int>(KeySym::Kp0) + n);
        }
        return m;
    }();
    return map;
}

char32_t ToRune(int code) {
    char32_t r = static_cast<char32_t>(code);
    return (code < 0 || !IsValidCodepoint(r)) ? kReplacementChar : r;
}

} // namespace

KeySym KittyKeySym(int code) {
    const auto& map = KittyKeyMap();
    auto it = map.find(code);
    return it != map.end() ? it->second : KeySym::None;
}

KeyMod FromKittyMod(int mask) {
    KeyMod mod = KeyMod::None;
    if (mask & 1)   mod |= KeyMod::Shift;
    if (mask & 2)   mod |= KeyMod::Alt;
    if (mask & 4)   mod |= KeyMod::Ctrl;
    if (mask & 8)   mod |= KeyMod::Super;
    if (mask & 16)  mod |= KeyMod::Hyper;
    if (mask & 32)  mod |= KeyMod::Meta;
    if (mask & 64)  mod |= KeyMod::CapsLock;
    if (mask & 128) mod |= KeyMod::NumLock;
    return mod;
}

KeyEvent ParseKittyKeyEvent(const CsiParams& params) {
    KeyEvent key;

    if (params.Has(0)) {
        int code = params.Get(0);
        KeySym sym = KittyKeySym(code);
        if (sym != KeySym::None) {
            key.sym = sym;
        } else {
            key.runes.push_back(ToRune(code));
            if (params.SubCount(0) > 1) {
                int shifted = params.GetSub(0, 1, -1);
                if (shifted >= 0 && IsValidCodepoint(static_cast<char32_t>(shifted))) {
                    key.altRunes.push_back(static_cast<char32_t>(shifted));
                }
            }
        }
    }

    if (params.Count() > 1) {
        int mod = params.Get(1, 1);
        if (mod > 1) {
            key.mod = FromKittyMod(mod - 1);
        }
        switch (params.GetSub(1, 1, 1)) {
            case 2:
                key.action = KeyAction::Repeat;
                break;
            case 3:
                key.action = KeyAction::Release;
                break;
            default:
                key.action = KeyAction::Press;
                break;
        }
    }

    // Associated text, one code point per sub-value
    if (params.Count() > 2) {
        for (size_t i = 0; i < params.SubCount(2); ++i) {
            int cp = params.GetSub(2, i, -1);
            if (cp >= 0) {
                key.altRunes.push_back(ToRune(cp));
            }
        }
    }

    return key;
}

} // namespace VTInput::Input
