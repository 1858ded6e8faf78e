#pragma once

#include <string>
#include <variant>
#include <vector>
#include "Color.h"
#include "Key.h"
#include "Mouse.h"

namespace VTInput::Input {

// Bracketed paste markers (CSI 200 ~ / CSI 201 ~)
struct PasteStartEvent {
    bool operator==(const PasteStartEvent&) const { return true; }
};

struct PasteEndEvent {
    bool operator==(const PasteEndEvent&) const { return true; }
};

// Decoded content of a bracketed paste, emitted after PasteEndEvent
struct PasteEvent {
    std::u32string text;

    bool operator==(const PasteEvent& other) const { return text == other.text; }
};

// OSC 10 reply
struct ForegroundColorEvent {
    Color color;

    bool operator==(const ForegroundColorEvent& other) const { return color == other.color; }
};

// OSC 11 reply
struct BackgroundColorEvent {
    Color color;

    bool operator==(const BackgroundColorEvent& other) const { return color == other.color; }
};

// OSC 12 reply
struct CursorColorEvent {
    Color color;

    bool operator==(const CursorColorEvent& other) const { return color == other.color; }
};

// Raw bytes of a sequence nothing else recognized. DCS and APC strings
// always surface this way so callers can build protocols on top.
struct UnknownEvent {
    std::string raw;

    bool operator==(const UnknownEvent& other) const { return raw == other.raw; }
};

using Event = std::variant<
    KeyEvent,
    MouseEvent,
    PasteStartEvent,
    PasteEndEvent,
    PasteEvent,
    ForegroundColorEvent,
    BackgroundColorEvent,
    CursorColorEvent,
    UnknownEvent>;

using EventList = std::vector<Event>;

// One-line description for logs and the dump tool
std::string EventToString(const Event& event);

// Printable form of raw terminal bytes, non-printables as \xNN
std::string EscapeBytes(const std::string& bytes);

} // namespace VTInput::Input
