// EventParserOSC.cpp - OSC, DCS and APC control string handling
// Part of EventParser implementation

#include "input/EventParser.h"
#include "input/Color.h"
#include <string>

namespace VTInput::Input {

namespace {

constexpr uint8_t BEL = 0x07;
constexpr uint8_t ESC = 0x1B;
constexpr uint8_t ST  = 0x9C;

enum class ScanStatus {
    Terminated,
    Incomplete,
};

struct StringScan {
    ScanStatus status = ScanStatus::Incomplete;
    size_t dataEnd = 0;   // Offset of the terminator
    size_t end = 0;       // Offset just past the terminator
};

// Find the terminator of a control string starting at from. ESC \ is one
// terminator; a bare ESC also ends the string and is consumed with it.
StringScan ScanControlString(std::string_view buffer, size_t from, bool allowBel) {
    StringScan scan;
    for (size_t i = from; i < buffer.size(); ++i) {
        uint8_t b = static_cast<uint8_t>(buffer[i]);

        if ((allowBel && b == BEL) || b == ST) {
            scan.status = ScanStatus::Terminated;
            scan.dataEnd = i;
            scan.end = i + 1;
            return scan;
        }

        if (b == ESC) {
            if (i + 1 >= buffer.size()) {
                // The backslash of ESC \ may still be on its way
                return scan;
            }
            scan.status = ScanStatus::Terminated;
            scan.dataEnd = i;
            scan.end = buffer[i + 1] == '\\' ? i + 2 : i + 1;
            return scan;
        }
    }
    return scan;
}

size_t IntroducerLength(std::string_view buffer, size_t start) {
    return static_cast<uint8_t>(buffer[start]) == ESC ? 2 : 1;
}

} // namespace

DecodeResult EventParser::ParseOSC(std::string_view buffer, size_t start, bool flush) const {
    size_t dataStart = start + IntroducerLength(buffer, start);

    StringScan scan = ScanControlString(buffer, dataStart, true);
    if (scan.status == ScanStatus::Incomplete) {
        if (!flush) {
            return {};
        }
        return {buffer.size(), {MakeUnknown(buffer)}};
    }

    std::string_view raw = buffer.substr(0, scan.end);
    std::string_view data = buffer.substr(dataStart, scan.dataEnd - dataStart);

    size_t semicolon = data.find(';');
    if (semicolon == std::string_view::npos) {
        return {scan.end, {MakeUnknown(raw)}};
    }

    std::string_view id = data.substr(0, semicolon);
    std::string spec(data.substr(semicolon + 1));

    if (id == "10" || id == "11" || id == "12") {
        auto color = ParseXColor(spec);
        if (!color) {
            return {scan.end, {MakeUnknown(raw)}};
        }
        if (id == "10") {
            return {scan.end, {ForegroundColorEvent{*color}}};
        }
        if (id == "11") {
            return {scan.end, {BackgroundColorEvent{*color}}};
        }
        return {scan.end, {CursorColorEvent{*color}}};
    }

    return {scan.end, {MakeUnknown(raw)}};
}

// DCS and APC: no payload is interpreted, the raw string is surfaced
DecodeResult EventParser::ParseControlString(std::string_view buffer, size_t start, bool flush) const {
    size_t dataStart = start + IntroducerLength(buffer, start);

    StringScan scan = ScanControlString(buffer, dataStart, false);
    if (scan.status == ScanStatus::Incomplete) {
        if (!flush) {
            return {};
        }
        return {buffer.size(), {MakeUnknown(buffer)}};
    }

    return {scan.end, {MakeUnknown(buffer.substr(0, scan.end))}};
}

} // namespace VTInput::Input
