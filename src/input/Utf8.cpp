#include "input/Utf8.h"

#include <cstdint>

namespace VTInput::Input {

bool IsValidCodepoint(char32_t cp) {
    return cp <= 0x10FFFF && !(cp >= 0xD800 && cp <= 0xDFFF);
}

Utf8Result DecodeUtf8(std::string_view data) {
    Utf8Result result;
    uint8_t lead = static_cast<uint8_t>(data[0]);

    size_t needed = 0;
    char32_t codepoint = 0;
    char32_t minimum = 0;

    if ((lead & 0x80) == 0) {
        // ASCII (0xxxxxxx)
        result.status = Utf8Status::Ok;
        result.codepoint = lead;
        result.length = 1;
        return result;
    } else if ((lead & 0xE0) == 0xC0) {
        // 2-byte sequence (110xxxxx)
        needed = 2;
        codepoint = lead & 0x1F;
        minimum = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        // 3-byte sequence (1110xxxx)
        needed = 3;
        codepoint = lead & 0x0F;
        minimum = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        // 4-byte sequence (11110xxx)
        needed = 4;
        codepoint = lead & 0x07;
        minimum = 0x10000;
    } else {
        // Continuation byte or 0xF8..0xFF as lead
        return result;
    }

    for (size_t i = 1; i < needed; ++i) {
        if (i >= data.size()) {
            result.status = Utf8Status::Incomplete;
            return result;
        }
        uint8_t byte = static_cast<uint8_t>(data[i]);
        if ((byte & 0xC0) != 0x80) {
            return result;
        }
        codepoint = (codepoint << 6) | (byte & 0x3F);
    }

    if (codepoint < minimum || !IsValidCodepoint(codepoint)) {
        return result;
    }

    result.status = Utf8Status::Ok;
    result.codepoint = codepoint;
    result.length = needed;
    return result;
}

std::string EncodeUtf8(char32_t cp) {
    std::string out;
    if (!IsValidCodepoint(cp)) {
        cp = kReplacementChar;
    }

    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return out;
}

std::string EncodeUtf8(const std::u32string& runes) {
    std::string out;
    for (char32_t r : runes) {
        out += EncodeUtf8(r);
    }
    return out;
}

} // namespace VTInput::Input
