#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include "Key.h"

namespace VTInput::Input {

enum class MouseButton : uint8_t {
    None,
    Left,
    Middle,
    Right,
    WheelUp,
    WheelDown,
    WheelLeft,
    WheelRight,
    Backward,
    Forward,
    Button10,
    Button11,
};

enum class MouseAction : uint8_t {
    Press,
    Release,
    Motion,
};

struct MouseEvent {
    int x = 0;                          // 0-based column
    int y = 0;                          // 0-based row
    MouseButton button = MouseButton::None;
    MouseAction action = MouseAction::Press;
    KeyMod mod = KeyMod::None;          // Shift, Alt and Ctrl only

    bool operator==(const MouseEvent& other) const {
        return x == other.x && y == other.y && button == other.button &&
               action == other.action && mod == other.mod;
    }
    bool operator!=(const MouseEvent& other) const { return !(*this == other); }

    // e.g. "ctrl+left press (9,19)"
    std::string ToString() const;
};

std::string MouseButtonName(MouseButton button);

// Offset added to every X10 report byte
constexpr int kX10ByteOffset = 32;

/**
 * @brief Decode a legacy X10 mouse report.
 * @param seq The complete report, CSI M followed by the three payload
 *            bytes (7-bit "ESC [ M" or 8-bit 0x9B "M" introducer).
 * @return The event, or nullopt when a coordinate byte is below the
 *         protocol offset and cannot encode a cell.
 */
std::optional<MouseEvent> ParseX10MouseEvent(std::string_view seq);

/**
 * @brief Decode an SGR (mode 1006) mouse report.
 * @param seq The complete report, CSI < b ; x ; y followed by M or m.
 * @return The event, or nullopt when the parameters are malformed.
 */
std::optional<MouseEvent> ParseSGRMouseEvent(std::string_view seq);

} // namespace VTInput::Input
