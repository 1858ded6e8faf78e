#include "input/EventParser.h"
#include "input/PasteAccumulator.h"
#include "input/Utf8.h"
#include <spdlog/spdlog.h>
#include <utility>

namespace VTInput::Input {

namespace {

constexpr uint8_t ESC = 0x1B;
constexpr uint8_t SP  = 0x20;
constexpr uint8_t DEL = 0x7F;

// 8-bit C1 sequence introducers
constexpr uint8_t SS3 = 0x8F;
constexpr uint8_t DCS = 0x90;
constexpr uint8_t CSI = 0x9B;
constexpr uint8_t OSC = 0x9D;
constexpr uint8_t APC = 0x9F;

bool IsControlRune(char32_t cp) {
    return cp <= 0x1F || cp == DEL || cp == SP;
}

} // namespace

void ApplyAlt(DecodeResult& result) {
    for (auto& ev : result.events) {
        if (auto* key = std::get_if<KeyEvent>(&ev)) {
            key->mod |= KeyMod::Alt;
        }
    }
}

Event MakeUnknown(std::string_view raw) {
    std::string bytes(raw);
    spdlog::debug("EventParser: unknown sequence \"{}\"", EscapeBytes(bytes));
    return UnknownEvent{std::move(bytes)};
}

EventParser::EventParser(SequenceTable table)
    : m_table(std::move(table))
{
}

DecodeResult EventParser::Decode(std::string_view buffer, bool flush) const {
    PasteAccumulator paste;
    return Decode(buffer, flush, paste);
}

DecodeResult EventParser::Decode(std::string_view buffer, bool flush, PasteAccumulator& paste) const {
    DecodeResult result;

    while (result.consumed < buffer.size()) {
        std::string_view rest = buffer.substr(result.consumed);

        if (paste.IsPasting()) {
            size_t n = paste.Feed(rest, flush, result.events);
            if (n == 0) {
                break;
            }
            result.consumed += n;
            continue;
        }

        DecodeResult next = DecodeNext(rest, flush);
        if (next.consumed == 0) {
            break;
        }
        result.consumed += next.consumed;

        for (auto& ev : next.events) {
            if (std::holds_alternative<PasteStartEvent>(ev)) {
                paste.Begin();
            }
            result.events.push_back(std::move(ev));
        }
    }

    return result;
}

DecodeResult EventParser::DecodeNext(std::string_view buffer, bool flush) const {
    if (buffer.empty()) {
        return {};
    }

    // The whole buffer may be a single known sequence
    if (auto key = m_table.Lookup(buffer)) {
        return {buffer.size(), {*key}};
    }

    bool alt = false;
    size_t i = 0;

    while (true) {
        uint8_t b = static_cast<uint8_t>(buffer[i]);

        switch (b) {
            case ESC: {
                if (i + 1 >= buffer.size()) {
                    // Lone ESC is the Escape key
                    return ParseControl(buffer, i, alt);
                }

                uint8_t next = static_cast<uint8_t>(buffer[i + 1]);
                bool introducer = next == 'O' || next == 'P' || next == '[' ||
                                  next == ']' || next == '_';

                if (!introducer) {
                    if (alt) {
                        // ESC ESC x: Alt+Escape, x is decoded on its own
                        return ParseControl(buffer, i, alt);
                    }
                    alt = true;
                    ++i;
                    continue;
                }

                if (i + 2 >= buffer.size()) {
                    // Nothing follows the introducer: Alt+O, Alt+[, ...
                    KeyEvent key;
                    key.runes.push_back(static_cast<char32_t>(next));
                    key.mod = KeyMod::Alt;
                    return {i + 2, {key}};
                }

                DecodeResult result;
                switch (next) {
                    case 'O': result = ParseSS3(buffer, i, flush); break;
                    case '[': result = ParseCSI(buffer, i, flush); break;
                    case ']': result = ParseOSC(buffer, i, flush); break;
                    default:  result = ParseControlString(buffer, i, flush); break;
                }
                if (alt) {
                    ApplyAlt(result);
                }
                return result;
            }

            case SS3:
            case CSI:
            case OSC:
            case DCS:
            case APC: {
                DecodeResult result;
                if (b == SS3) {
                    result = ParseSS3(buffer, i, flush);
                } else if (b == CSI) {
                    result = ParseCSI(buffer, i, flush);
                } else if (b == OSC) {
                    result = ParseOSC(buffer, i, flush);
                } else {
                    result = ParseControlString(buffer, i, flush);
                }
                if (alt) {
                    ApplyAlt(result);
                }
                return result;
            }

            default:
                break;
        }

        // C0, SP, DEL and the remaining C1 bytes map by literal value
        if (b <= 0x1F || b == SP || b == DEL || (b >= 0x80 && b <= 0x9F)) {
            return ParseControl(buffer, i, alt);
        }

        return ParseRunes(buffer, i, alt, flush);
    }
}

DecodeResult EventParser::ParseControl(std::string_view buffer, size_t start, bool alt) const {
    auto key = m_table.Lookup(buffer.substr(start, 1));
    if (!key) {
        return {start + 1, {MakeUnknown(buffer.substr(0, start + 1))}};
    }
    if (alt) {
        key->mod |= KeyMod::Alt;
    }
    return {start + 1, {*key}};
}

DecodeResult EventParser::ParseRunes(std::string_view buffer, size_t start, bool alt, bool flush) const {
    KeyEvent key;
    size_t i = start;

    while (i < buffer.size()) {
        Utf8Result r = DecodeUtf8(buffer.substr(i));

        if (r.status == Utf8Status::Incomplete) {
            if (!key.runes.empty()) {
                break;
            }
            if (!flush) {
                return {};
            }
            // Truncated for good
            key.runes.push_back(kReplacementChar);
            i = buffer.size();
            break;
        }

        if (r.status == Utf8Status::Invalid) {
            if (key.runes.empty()) {
                key.runes.push_back(kReplacementChar);
                ++i;
            }
            break;
        }

        if (IsControlRune(r.codepoint)) {
            break;
        }

        key.runes.push_back(r.codepoint);
        i += r.length;

        // An ESC prefix applies to a single key
        if (alt) {
            break;
        }
    }

    if (alt) {
        key.mod |= KeyMod::Alt;
    }
    return {i, {key}};
}

std::optional<KeyEvent> EventParser::LookupKey(std::string_view seq) const {
    if (auto key = m_table.Lookup(seq)) {
        return key;
    }
    if (seq.empty()) {
        return std::nullopt;
    }

    // The table holds 7-bit forms only
    uint8_t b = static_cast<uint8_t>(seq[0]);
    if (b == CSI || b == SS3) {
        std::string normalized = b == CSI ? "\x1b[" : "\x1bO";
        normalized.append(seq.substr(1));
        return m_table.Lookup(normalized);
    }
    return std::nullopt;
}

DecodeResult EventParser::LookupOrUnknown(std::string_view buffer, size_t start, size_t end) const {
    if (auto key = LookupKey(buffer.substr(start, end - start))) {
        return {end, {*key}};
    }
    return {end, {MakeUnknown(buffer.substr(0, end))}};
}

} // namespace VTInput::Input
