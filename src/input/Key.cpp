#include "input/Key.h"
#include "input/Utf8.h"

namespace VTInput::Input {

KeySym FunctionKey(int n) {
    if (n < 1 || n > 63) {
        return KeySym::None;
    }
    return static_cast<KeySym>(static_cast<int>(KeySym::F1) + n - 1);
}

std::string KeySymName(KeySym sym) {
    if (sym >= KeySym::F1 && sym <= KeySym::F63) {
        return "f" + std::to_string(static_cast<int>(sym) - static_cast<int>(KeySym::F1) + 1);
    }
    if (sym >= KeySym::Kp0 && sym <= KeySym::Kp9) {
        return "kp" + std::to_string(static_cast<int>(sym) - static_cast<int>(KeySym::Kp0));
    }

    switch (sym) {
        case KeySym::None:             return "";
        case KeySym::Up:               return "up";
        case KeySym::Down:             return "down";
        case KeySym::Right:            return "right";
        case KeySym::Left:             return "left";
        case KeySym::Begin:            return "begin";
        case KeySym::Find:             return "find";
        case KeySym::Insert:           return "insert";
        case KeySym::Delete:           return "delete";
        case KeySym::Select:           return "select";
        case KeySym::PgUp:             return "pgup";
        case KeySym::PgDown:           return "pgdown";
        case KeySym::Home:             return "home";
        case KeySym::End:              return "end";
        case KeySym::KpEnter:          return "kpenter";
        case KeySym::KpEqual:          return "kpequal";
        case KeySym::KpMultiply:       return "kpmul";
        case KeySym::KpPlus:           return "kpplus";
        case KeySym::KpComma:          return "kpcomma";
        case KeySym::KpMinus:          return "kpminus";
        case KeySym::KpDecimal:        return "kpperiod";
        case KeySym::KpDivide:         return "kpdiv";
        case KeySym::KpSep:            return "kpsep";
        case KeySym::KpUp:             return "kpup";
        case KeySym::KpDown:           return "kpdown";
        case KeySym::KpLeft:           return "kpleft";
        case KeySym::KpRight:          return "kpright";
        case KeySym::KpPgUp:           return "kppgup";
        case KeySym::KpPgDown:         return "kppgdown";
        case KeySym::KpHome:           return "kphome";
        case KeySym::KpEnd:            return "kpend";
        case KeySym::KpInsert:         return "kpinsert";
        case KeySym::KpDelete:         return "kpdelete";
        case KeySym::KpBegin:          return "kpbegin";
        case KeySym::CapsLock:         return "capslock";
        case KeySym::ScrollLock:       return "scrolllock";
        case KeySym::NumLock:          return "numlock";
        case KeySym::PrintScreen:      return "printscreen";
        case KeySym::Pause:            return "pause";
        case KeySym::Menu:             return "menu";
        case KeySym::MediaPlay:        return "mediaplay";
        case KeySym::MediaPause:       return "mediapause";
        case KeySym::MediaPlayPause:   return "mediaplaypause";
        case KeySym::MediaReverse:     return "mediareverse";
        case KeySym::MediaStop:        return "mediastop";
        case KeySym::MediaFastForward: return "mediafastforward";
        case KeySym::MediaRewind:      return "mediarewind";
        case KeySym::MediaNext:        return "medianext";
        case KeySym::MediaPrev:        return "mediaprev";
        case KeySym::MediaRecord:      return "mediarecord";
        case KeySym::LowerVol:         return "lowervol";
        case KeySym::RaiseVol:         return "raisevol";
        case KeySym::Mute:             return "mute";
        case KeySym::LeftShift:        return "leftshift";
        case KeySym::LeftAlt:          return "leftalt";
        case KeySym::LeftCtrl:         return "leftctrl";
        case KeySym::LeftSuper:        return "leftsuper";
        case KeySym::LeftHyper:        return "lefthyper";
        case KeySym::LeftMeta:         return "leftmeta";
        case KeySym::RightShift:       return "rightshift";
        case KeySym::RightAlt:         return "rightalt";
        case KeySym::RightCtrl:        return "rightctrl";
        case KeySym::RightSuper:       return "rightsuper";
        case KeySym::RightHyper:       return "righthyper";
        case KeySym::RightMeta:        return "rightmeta";
        case KeySym::IsoLevel3Shift:   return "isolevel3shift";
        case KeySym::IsoLevel5Shift:   return "isolevel5shift";
        case KeySym::Backspace:        return "backspace";
        case KeySym::Tab:              return "tab";
        case KeySym::Enter:            return "enter";
        case KeySym::Escape:           return "esc";
        case KeySym::Space:            return "space";
        default:
            break;
    }
    return "unknown";
}

std::string KeyEvent::ToString() const {
    std::string s;

    if (HasMod(mod, KeyMod::Ctrl))  s += "ctrl+";
    if (HasMod(mod, KeyMod::Alt))   s += "alt+";
    if (HasMod(mod, KeyMod::Shift)) s += "shift+";
    if (HasMod(mod, KeyMod::Meta))  s += "meta+";
    if (HasMod(mod, KeyMod::Hyper)) s += "hyper+";
    if (HasMod(mod, KeyMod::Super)) s += "super+";

    if (sym != KeySym::None) {
        s += KeySymName(sym);
    } else if (!runes.empty()) {
        s += EncodeUtf8(runes);
    } else {
        s += "unknown";
    }

    switch (action) {
        case KeyAction::Repeat:  s += " (repeat)"; break;
        case KeyAction::Release: s += " (release)"; break;
        case KeyAction::Press:   break;
    }
    return s;
}

} // namespace VTInput::Input
