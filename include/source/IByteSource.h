#pragma once

#include <cstddef>

namespace VTInput::Source {

enum class ReadStatus {
    Ok,
    EndOfStream,
    Cancelled,
    Error,
};

struct ReadResult {
    ReadStatus status = ReadStatus::Ok;
    size_t bytesRead = 0;
};

/**
 * @brief Abstract blocking, cancellable byte source
 */
class IByteSource {
public:
    virtual ~IByteSource() = default;

    // Block until at least one byte is available, then read up to size
    // bytes into data. Returns Cancelled once Cancel() has been called.
    virtual ReadResult Read(char* data, size_t size) = 0;

    // Unblock a pending Read from another thread. Returns false if the
    // source cannot be cancelled.
    virtual bool Cancel() = 0;

    // Release the underlying resources
    virtual void Close() = 0;
};

} // namespace VTInput::Source
