#include "input/Mouse.h"
#include "input/CsiParams.h"

namespace VTInput::Input {

namespace {

// Button code bits shared by X10 and SGR reports
constexpr int kBitShift    = 0b0000'0100;
constexpr int kBitAlt      = 0b0000'1000;
constexpr int kBitCtrl     = 0b0001'0000;
constexpr int kBitMotion   = 0b0010'0000;
constexpr int kBitWheel    = 0b0100'0000;
constexpr int kBitExtra    = 0b1000'0000;  // buttons 8-11
constexpr int kButtonsMask = 0b0000'0011;

bool IsWheel(MouseButton button) {
    return button >= MouseButton::WheelUp && button <= MouseButton::WheelRight;
}

MouseButton OffsetButton(MouseButton base, int offset) {
    return static_cast<MouseButton>(static_cast<int>(base) + offset);
}

MouseEvent DecodeButtonCode(int code, bool sgr) {
    MouseEvent ev;
    int low = code & kButtonsMask;

    if (code & kBitExtra) {
        ev.button = OffsetButton(MouseButton::Backward, low);
    } else if (code & kBitWheel) {
        ev.button = OffsetButton(MouseButton::WheelUp, low);
    } else {
        ev.button = OffsetButton(MouseButton::Left, low);
        // X10 has no release per button: low bits 3 mean "released"
        if (low == kButtonsMask) {
            ev.button = MouseButton::None;
            ev.action = sgr ? MouseAction::Press : MouseAction::Release;
        }
    }

    // Wheel reports never carry the motion bit meaningfully
    if ((code & kBitMotion) && !IsWheel(ev.button)) {
        ev.action = MouseAction::Motion;
    }

    if (code & kBitShift) ev.mod |= KeyMod::Shift;
    if (code & kBitAlt)   ev.mod |= KeyMod::Alt;
    if (code & kBitCtrl)  ev.mod |= KeyMod::Ctrl;
    return ev;
}

} // namespace

std::string MouseButtonName(MouseButton button) {
    switch (button) {
        case MouseButton::None:       return "none";
        case MouseButton::Left:       return "left";
        case MouseButton::Middle:     return "middle";
        case MouseButton::Right:      return "right";
        case MouseButton::WheelUp:    return "wheelup";
        case MouseButton::WheelDown:  return "wheeldown";
        case MouseButton::WheelLeft:  return "wheelleft";
        case MouseButton::WheelRight: return "wheelright";
        case MouseButton::Backward:   return "backward";
        case MouseButton::Forward:    return "forward";
        case MouseButton::Button10:   return "button10";
        case MouseButton::Button11:   return "button11";
    }
    return "unknown";
}

std::string MouseEvent::ToString() const {
    std::string s;
    if (HasMod(mod, KeyMod::Ctrl))  s += "ctrl+";
    if (HasMod(mod, KeyMod::Alt))   s += "alt+";
    if (HasMod(mod, KeyMod::Shift)) s += "shift+";
    s += MouseButtonName(button);

    switch (action) {
        case MouseAction::Press:   s += " press"; break;
        case MouseAction::Release: s += " release"; break;
        case MouseAction::Motion:  s += " motion"; break;
    }

    s += " (" + std::to_string(x) + "," + std::to_string(y) + ")";
    return s;
}

std::optional<MouseEvent> ParseX10MouseEvent(std::string_view seq) {
    if (seq.size() < 3) {
        return std::nullopt;
    }

    // The payload is always the last three bytes
    std::string_view payload = seq.substr(seq.size() - 3);
    int cb = static_cast<uint8_t>(payload[0]);
    int cx = static_cast<uint8_t>(payload[1]);
    int cy = static_cast<uint8_t>(payload[2]);

    if (cb < kX10ByteOffset || cx <= kX10ByteOffset || cy <= kX10ByteOffset) {
        return std::nullopt;
    }

    MouseEvent ev = DecodeButtonCode(cb - kX10ByteOffset, false);
    // Coordinates are 1-based on the wire
    ev.x = cx - kX10ByteOffset - 1;
    ev.y = cy - kX10ByteOffset - 1;
    return ev;
}

std::optional<MouseEvent> ParseSGRMouseEvent(std::string_view seq) {
    CsiParams params(seq);
    if (params.Marker() != '<' || (params.Final() != 'M' && params.Final() != 'm')) {
        return std::nullopt;
    }
    if (params.Count() < 3 || !params.Has(0) || !params.Has(1) || !params.Has(2)) {
        return std::nullopt;
    }

    MouseEvent ev = DecodeButtonCode(params.Get(0), true);
    if (params.Final() == 'm' && ev.action != MouseAction::Motion) {
        ev.action = MouseAction::Release;
    }

    ev.x = params.Get(1) - 1;
    ev.y = params.Get(2) - 1;
    if (ev.x < 0 || ev.y < 0) {
        return std::nullopt;
    }
    return ev;
}

} // namespace VTInput::Input
