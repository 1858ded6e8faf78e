#include "input/PasteAccumulator.h"
#include "input/Utf8.h"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace VTInput::Input {

void PasteAccumulator::Begin() {
    m_pasting = true;
    m_buffer.clear();
    spdlog::debug("Paste: started");
}

void PasteAccumulator::Reset() {
    m_pasting = false;
    m_buffer.clear();
}

size_t PasteAccumulator::Feed(std::string_view buffer, bool flush, EventList& events) {
    if (!m_pasting || buffer.empty()) {
        return 0;
    }

    size_t markerPos = buffer.find(kPasteEndMarker);
    if (markerPos != std::string_view::npos) {
        m_buffer.append(buffer.substr(0, markerPos));

        events.emplace_back(PasteEndEvent{});
        events.emplace_back(PasteEvent{DecodeText()});
        spdlog::debug("Paste: ended after {} bytes", m_buffer.size());

        Reset();
        return markerPos + kPasteEndMarker.size();
    }

    // Hold back a tail that could be the start of the end marker
    size_t keep = 0;
    size_t maxTail = std::min(buffer.size(), kPasteEndMarker.size() - 1);
    for (size_t len = maxTail; len > 0; --len) {
        if (buffer.substr(buffer.size() - len) == kPasteEndMarker.substr(0, len)) {
            keep = len;
            break;
        }
    }

    size_t take = buffer.size() - keep;
    if (take == 0 && flush) {
        take = buffer.size();
    }
    m_buffer.append(buffer.substr(0, take));
    return take;
}

std::u32string PasteAccumulator::DecodeText() const {
    std::u32string text;
    text.reserve(m_buffer.size());

    std::string_view data(m_buffer);
    size_t pos = 0;
    while (pos < data.size()) {
        Utf8Result r = DecodeUtf8(data.substr(pos));
        if (r.status == Utf8Status::Ok) {
            text.push_back(r.codepoint);
            pos += r.length;
        } else if (r.status == Utf8Status::Incomplete) {
            // Truncated code point at the end of the paste
            break;
        } else {
            pos += 1;
        }
    }
    return text;
}

} // namespace VTInput::Input
