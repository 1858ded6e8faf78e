#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace VTInput::Input {

// Color reported by an OSC 10/11/12 reply, represented as RGBA
struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    Color() = default;
    Color(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) : r(r), g(g), b(b), a(a) {}

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }

    // Parse "#RRGGBB" or "#RRGGBBAA"
    static std::optional<Color> FromHex(const std::string& hex);

    // "#rrggbb", alpha appended only when not opaque
    std::string ToHex() const;
};

/**
 * @brief Parse an X11 color specification as sent in OSC color replies.
 *
 * Supported forms:
 * - rgb:R/G/B and rgba:R/G/B/A with 1 to 4 hex digits per component
 * - #RGB, #RRGGBB, #RRRGGGBBB, #RRRRGGGGBBBB
 *
 * Components wider than 8 bits keep their most significant byte,
 * single-digit components are scaled so that "f" is 0xff.
 */
std::optional<Color> ParseXColor(const std::string& spec);

} // namespace VTInput::Input
