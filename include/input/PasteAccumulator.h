#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include "Event.h"

namespace VTInput::Input {

// 7-bit bracketed paste end marker
constexpr std::string_view kPasteEndMarker = "\x1b[201~";

/**
 * @brief Bracketed paste state machine (Idle / Pasting).
 *
 * While pasting, every byte except the end marker is collected verbatim.
 * On the end marker the collected bytes are decoded as UTF-8 and
 * PasteEnd followed by Paste(text) is emitted.
 */
class PasteAccumulator {
public:
    bool IsPasting() const { return m_pasting; }
    size_t Size() const { return m_buffer.size(); }

    // Enter the Pasting state with an empty buffer
    void Begin();

    // Return to Idle and drop anything collected
    void Reset();

    /**
     * @brief Consume paste bytes from the front of buffer.
     * @param buffer Input window, only valid while pasting.
     * @param flush When set, a trailing partial end marker is collected
     *              too instead of waiting for the rest of it.
     * @param events Receives PasteEnd and Paste when the marker is seen.
     * @return Bytes consumed. Zero means buffer is a partial end marker.
     */
    size_t Feed(std::string_view buffer, bool flush, EventList& events);

private:
    // Collected bytes decoded as UTF-8, invalid sequences dropped
    std::u32string DecodeText() const;

    bool m_pasting = false;
    std::string m_buffer;
};

} // namespace VTInput::Input
