// EventParserCSI.cpp - CSI and SS3 sequence handling
// Part of EventParser implementation

#include "input/EventParser.h"
#include "input/CsiParams.h"
#include "input/KittyKeyboard.h"
#include "input/Mouse.h"

namespace VTInput::Input {

namespace {

// Length of the introducer at start: ESC [ / ESC O, or one 8-bit byte
size_t IntroducerLength(std::string_view buffer, size_t start) {
    return static_cast<uint8_t>(buffer[start]) == 0x1B ? 2 : 1;
}

bool InRange(uint8_t b, uint8_t lo, uint8_t hi) {
    return b >= lo && b <= hi;
}

} // namespace

// CSI: parameter bytes 0x30-0x3F, intermediate bytes 0x20-0x2F, then
// one final byte 0x40-0x7E
DecodeResult EventParser::ParseCSI(std::string_view buffer, size_t start, bool flush) const {
    const size_t size = buffer.size();
    size_t paramStart = start + IntroducerLength(buffer, start);
    size_t i = paramStart;

    while (i < size && InRange(static_cast<uint8_t>(buffer[i]), 0x30, 0x3F)) {
        ++i;
    }
    while (i < size && InRange(static_cast<uint8_t>(buffer[i]), 0x20, 0x2F)) {
        ++i;
    }

    if (i >= size) {
        // URxvt sends CSI n $ for shifted keys, which never gets a final byte
        if (auto key = LookupKey(buffer.substr(start, i - start))) {
            return {i, {*key}};
        }
        if (!flush) {
            return {};
        }
        return {i, {MakeUnknown(buffer.substr(0, i))}};
    }

    if (!InRange(static_cast<uint8_t>(buffer[i]), 0x40, 0x7E)) {
        return LookupOrUnknown(buffer, start, i);
    }
    ++i;

    std::string_view seq = buffer.substr(start, i - start);
    if (auto key = LookupKey(seq)) {
        return {i, {*key}};
    }

    CsiParams params(seq);

    // X10 mouse: CSI M followed by three raw bytes
    if (params.Final() == 'M' && i == paramStart + 1) {
        if (size - i < 3) {
            if (!flush) {
                return {};
            }
            return {size, {MakeUnknown(buffer)}};
        }
        size_t end = i + 3;
        if (auto mouse = ParseX10MouseEvent(buffer.substr(start, end - start))) {
            return {end, {*mouse}};
        }
        return {end, {MakeUnknown(buffer.substr(0, end))}};
    }

    if (params.Marker() == '<' && (params.Final() == 'M' || params.Final() == 'm')) {
        if (auto mouse = ParseSGRMouseEvent(seq)) {
            return {i, {*mouse}};
        }
        return {i, {MakeUnknown(buffer.substr(0, i))}};
    }

    if (params.Marker() == 0 && params.Intermediate() == 0) {
        if (params.Final() == '~' && params.Count() == 1) {
            switch (params.Get(0, -1)) {
                case 200:
                    return {i, {PasteStartEvent{}}};
                case 201:
                    return {i, {PasteEndEvent{}}};
                default:
                    break;
            }
        }

        if (params.Final() == 'u') {
            return {i, {ParseKittyKeyEvent(params)}};
        }
    }

    return {i, {MakeUnknown(buffer.substr(0, i))}};
}

// SS3: optional XTerm modifier digits, then one GL character 0x21-0x7E
DecodeResult EventParser::ParseSS3(std::string_view buffer, size_t start, bool flush) const {
    const size_t size = buffer.size();
    size_t i = start + IntroducerLength(buffer, start);

    while (i < size && InRange(static_cast<uint8_t>(buffer[i]), '0', '9')) {
        ++i;
    }

    if (i >= size) {
        if (auto key = LookupKey(buffer.substr(start, i - start))) {
            return {i, {*key}};
        }
        if (!flush) {
            return {};
        }
        return {i, {MakeUnknown(buffer.substr(0, i))}};
    }

    if (!InRange(static_cast<uint8_t>(buffer[i]), 0x21, 0x7E)) {
        return LookupOrUnknown(buffer, start, i);
    }

    return LookupOrUnknown(buffer, start, i + 1);
}

} // namespace VTInput::Input
