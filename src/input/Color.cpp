#include "input/Color.h"

#include <cstdio>
#include <vector>

namespace VTInput::Input {

namespace {

int HexDigit(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

// Scale a 1-4 digit hex component to 8 bits
std::optional<uint8_t> ParseComponent(const std::string& digits) {
    if (digits.empty() || digits.size() > 4) {
        return std::nullopt;
    }

    unsigned value = 0;
    for (char ch : digits) {
        int d = HexDigit(ch);
        if (d < 0) {
            return std::nullopt;
        }
        value = (value << 4) | static_cast<unsigned>(d);
    }

    switch (digits.size()) {
        case 1: return static_cast<uint8_t>(value * 0x11);
        case 2: return static_cast<uint8_t>(value);
        case 3: return static_cast<uint8_t>(value >> 4);
        default: return static_cast<uint8_t>(value >> 8);
    }
}

std::vector<std::string> SplitSlash(const std::string& s) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t slash = s.find('/', start);
        if (slash == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, slash - start));
        start = slash + 1;
    }
    return parts;
}

} // namespace

std::optional<Color> Color::FromHex(const std::string& hex) {
    if (hex.empty() || hex[0] != '#') {
        return std::nullopt;
    }
    if (hex.length() != 7 && hex.length() != 9) {
        return std::nullopt;
    }

    uint8_t channels[4] = {0, 0, 0, 255};
    size_t count = (hex.length() - 1) / 2;
    for (size_t i = 0; i < count; ++i) {
        auto c = ParseComponent(hex.substr(1 + i * 2, 2));
        if (!c) {
            return std::nullopt;
        }
        channels[i] = *c;
    }
    return Color(channels[0], channels[1], channels[2], channels[3]);
}

std::string Color::ToHex() const {
    char buf[10];
    if (a == 255) {
        snprintf(buf, sizeof(buf), "#%02x%02x%02x", r, g, b);
    } else {
        snprintf(buf, sizeof(buf), "#%02x%02x%02x%02x", r, g, b, a);
    }
    return buf;
}

std::optional<Color> ParseXColor(const std::string& spec) {
    if (spec.empty()) {
        return std::nullopt;
    }

    if (spec[0] == '#') {
        std::string digits = spec.substr(1);
        if (digits.empty() || digits.size() % 3 != 0 || digits.size() > 12) {
            return std::nullopt;
        }
        size_t width = digits.size() / 3;
        auto r = ParseComponent(digits.substr(0, width));
        auto g = ParseComponent(digits.substr(width, width));
        auto b = ParseComponent(digits.substr(width * 2, width));
        if (!r || !g || !b) {
            return std::nullopt;
        }
        return Color(*r, *g, *b);
    }

    bool hasAlpha = false;
    std::string body;
    if (spec.compare(0, 4, "rgb:") == 0) {
        body = spec.substr(4);
    } else if (spec.compare(0, 5, "rgba:") == 0) {
        body = spec.substr(5);
        hasAlpha = true;
    } else {
        return std::nullopt;
    }

    std::vector<std::string> parts = SplitSlash(body);
    if (parts.size() != (hasAlpha ? 4u : 3u)) {
        return std::nullopt;
    }

    uint8_t channels[4] = {0, 0, 0, 255};
    for (size_t i = 0; i < parts.size(); ++i) {
        auto c = ParseComponent(parts[i]);
        if (!c) {
            return std::nullopt;
        }
        channels[i] = *c;
    }
    return Color(channels[0], channels[1], channels[2], channels[3]);
}

} // namespace VTInput::Input
