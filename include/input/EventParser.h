#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include "Event.h"
#include "SequenceTable.h"

namespace VTInput::Input {

class PasteAccumulator;

// Outcome of decoding from the front of a buffer. consumed == 0 means
// the buffer holds an incomplete unit and more bytes are needed.
struct DecodeResult {
    size_t consumed = 0;
    EventList events;
};

/**
 * @brief Decodes terminal input bytes into events.
 *
 * Classifies the byte at the front of the buffer and dispatches to the
 * CSI, SS3, OSC, DCS/APC, control-byte or UTF-8 parser. Stateless apart
 * from the immutable sequence table; bracketed paste state lives in a
 * PasteAccumulator owned by the caller.
 */
class EventParser {
public:
    explicit EventParser(SequenceTable table);

    // Decode the next unit at the front of buffer. flush is set when no
    // more bytes can arrive; incomplete units then degrade to Unknown
    // or best-effort key events instead of waiting.
    DecodeResult DecodeNext(std::string_view buffer, bool flush) const;

    // Decode units until the buffer is exhausted or one is incomplete,
    // routing bytes through paste while it is active
    DecodeResult Decode(std::string_view buffer, bool flush, PasteAccumulator& paste) const;

    // Same, with paste state that starts idle and is discarded afterwards
    DecodeResult Decode(std::string_view buffer, bool flush) const;

    const SequenceTable& GetTable() const { return m_table; }

private:
    // Parsers take the whole window and the offset of the introducer
    // (ESC or the 8-bit C1 byte). A non-zero start means an ESC prefix
    // (Alt) precedes it; consumed counts are measured from offset 0.
    DecodeResult ParseCSI(std::string_view buffer, size_t start, bool flush) const;
    DecodeResult ParseSS3(std::string_view buffer, size_t start, bool flush) const;
    DecodeResult ParseOSC(std::string_view buffer, size_t start, bool flush) const;
    DecodeResult ParseControlString(std::string_view buffer, size_t start, bool flush) const;

    DecodeResult ParseControl(std::string_view buffer, size_t start, bool alt) const;
    DecodeResult ParseRunes(std::string_view buffer, size_t start, bool alt, bool flush) const;

    // Table lookup that also tries the 7-bit form of an 8-bit CSI/SS3
    std::optional<KeyEvent> LookupKey(std::string_view seq) const;

    // Table lookup of buffer[start, end) or Unknown with buffer[0, end)
    DecodeResult LookupOrUnknown(std::string_view buffer, size_t start, size_t end) const;

    SequenceTable m_table;
};

// Add Alt to every key event in result
void ApplyAlt(DecodeResult& result);

// Unknown event for raw, logged at debug level
Event MakeUnknown(std::string_view raw);

} // namespace VTInput::Input
