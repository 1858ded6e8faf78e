#include "input/Driver.h"
#include <spdlog/spdlog.h>
#include <utility>

namespace VTInput::Input {

using Source::ReadResult;
using Source::ReadStatus;

Driver::Driver(std::unique_ptr<Source::IByteSource> source,
               const DriverOptions& options,
               const ITerminfoProvider* terminfo)
    : m_source(std::move(source))
    , m_parser(SequenceTable::Build(options.term, options.flags, terminfo))
    , m_capacity(options.bufferSize)
{
    if (m_capacity < kMinBufferSize) {
        spdlog::warn("Driver: buffer size {} too small, using {}", m_capacity, kMinBufferSize);
        m_capacity = kMinBufferSize;
    }
    m_buffer.reserve(m_capacity);

    spdlog::debug("Driver created: term='{}', buffer={} bytes", options.term, m_capacity);
}

Driver::~Driver() {
    Close();
}

ReadStatus Driver::ReadEvents(EventList& events) {
    return Fill(events, true);
}

ReadStatus Driver::PeekEvents(EventList& events) {
    return Fill(events, false);
}

bool Driver::Cancel() {
    if (!m_source) {
        return false;
    }
    return m_source->Cancel();
}

void Driver::Close() {
    if (m_source) {
        m_source->Close();
    }
}

ReadStatus Driver::Fill(EventList& events, bool consume) {
    events.clear();

    if (!m_source) {
        spdlog::error("Driver: no byte source");
        return ReadStatus::Error;
    }

    // Peeking works on a copy of the paste state
    PasteAccumulator paste = m_paste;
    size_t offset = 0;

    while (true) {
        if (offset < m_buffer.size()) {
            std::string_view pending = std::string_view(m_buffer).substr(offset);
            DecodeResult result = m_parser.Decode(pending, false, paste);

            // Flush only when nothing decodes and no more bytes can arrive
            // or fit
            bool full = m_buffer.size() >= m_capacity;
            if (result.consumed == 0 && (m_endOfStream || full)) {
                if (full && !m_endOfStream && !paste.IsPasting()) {
                    spdlog::warn("Driver: input buffer full ({} bytes), flushing incomplete sequence",
                                 m_capacity);
                }
                result = m_parser.Decode(pending, true, paste);
            }
            offset += result.consumed;
            for (auto& ev : result.events) {
                events.push_back(std::move(ev));
            }

            if (consume && offset > 0) {
                m_buffer.erase(0, offset);
                m_paste = paste;
                offset = 0;
            }

            if (!events.empty()) {
                return ReadStatus::Ok;
            }
        }

        if (m_endOfStream) {
            // Whatever is left can never complete
            return ReadStatus::EndOfStream;
        }

        if (m_buffer.size() >= m_capacity) {
            // Only reachable while peeking into a paste longer than the
            // buffer: nothing can be decoded without consuming
            return ReadStatus::Ok;
        }

        ReadStatus status = ReadMore();
        if (status == ReadStatus::EndOfStream) {
            m_endOfStream = true;
            continue;
        }
        if (status != ReadStatus::Ok) {
            return status;
        }
    }
}

ReadStatus Driver::ReadMore() {
    size_t used = m_buffer.size();
    m_buffer.resize(m_capacity);

    ReadResult result = m_source->Read(&m_buffer[used], m_capacity - used);
    m_buffer.resize(used + (result.status == ReadStatus::Ok ? result.bytesRead : 0));

    switch (result.status) {
        case ReadStatus::Ok:
            break;
        case ReadStatus::EndOfStream:
            spdlog::debug("Driver: end of stream ({} bytes pending)", used);
            break;
        case ReadStatus::Cancelled:
            spdlog::debug("Driver: read cancelled");
            break;
        case ReadStatus::Error:
            spdlog::error("Driver: read from byte source failed");
            break;
    }
    return result.status;
}

} // namespace VTInput::Input
