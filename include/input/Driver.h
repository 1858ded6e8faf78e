#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "Event.h"
#include "EventParser.h"
#include "PasteAccumulator.h"
#include "SequenceTable.h"
#include "source/IByteSource.h"

namespace VTInput::Input {

class ITerminfoProvider;

constexpr size_t kDefaultBufferSize = 256;

// Large enough for the longest fixed-size unit (X10 report, paste marker)
constexpr size_t kMinBufferSize = 16;

// Driver construction parameters
struct DriverOptions {
    std::string term;
    SequenceFlags flags = SequenceFlags::None;
    size_t bufferSize = kDefaultBufferSize;
};

/**
 * @brief Reads terminal input and turns it into events.
 *
 * Owns the byte source, a bounded read buffer, the parser with its
 * sequence table and the bracketed paste state. Meant to be used from a
 * single thread; only Cancel() may be called from another one.
 */
class Driver {
public:
    Driver(std::unique_ptr<Source::IByteSource> source,
           const DriverOptions& options,
           const ITerminfoProvider* terminfo = nullptr);
    ~Driver();

    Driver(const Driver&) = delete;
    Driver& operator=(const Driver&) = delete;

    // Block until at least one event is decoded, then consume the bytes
    // it came from. events is replaced with the decoded batch.
    Source::ReadStatus ReadEvents(EventList& events);

    // Same as ReadEvents but leaves the bytes and paste state untouched,
    // so the next ReadEvents returns the same events
    Source::ReadStatus PeekEvents(EventList& events);

    // Unblock a pending read from another thread
    bool Cancel();

    void Close();

    const EventParser& GetParser() const { return m_parser; }
    size_t GetBufferSize() const { return m_capacity; }
    size_t GetBuffered() const { return m_buffer.size(); }
    bool IsPasting() const { return m_paste.IsPasting(); }

private:
    // Decode the buffer, reading from the source until at least one
    // event is produced. With consume set, decoded bytes are dropped from
    // the buffer and the paste state is committed.
    Source::ReadStatus Fill(EventList& events, bool consume);

    // Read once from the source into the free part of the buffer
    Source::ReadStatus ReadMore();

    std::unique_ptr<Source::IByteSource> m_source;
    EventParser m_parser;
    PasteAccumulator m_paste;

    std::string m_buffer;
    size_t m_capacity;
    bool m_endOfStream = false;
};

} // namespace VTInput::Input
