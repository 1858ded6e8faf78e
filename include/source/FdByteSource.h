#pragma once

#include <atomic>
#include <mutex>
#include "IByteSource.h"

namespace VTInput::Source {

/**
 * @brief POSIX file descriptor byte source
 *
 * Waits on the descriptor with poll(2) together with the read end of a
 * self-pipe; Cancel() writes to the pipe so a blocked Read returns
 * ReadStatus::Cancelled.
 */
class FdByteSource : public IByteSource {
public:
    // Does not take ownership of fd unless ownsFd is set
    FdByteSource(int fd, bool ownsFd = false);
    ~FdByteSource() override;

    FdByteSource(const FdByteSource&) = delete;
    FdByteSource& operator=(const FdByteSource&) = delete;

    // False if the cancellation pipe could not be created
    bool IsValid() const { return m_cancelPipe[0] >= 0 && m_fd >= 0; }

    ReadResult Read(char* data, size_t size) override;
    bool Cancel() override;
    void Close() override;

    int GetFd() const { return m_fd; }

private:
    void ClosePipe();

    int m_fd;
    bool m_ownsFd;
    int m_cancelPipe[2] = {-1, -1};
    std::mutex m_pipeMutex;  // Guards the cancel pipe between Cancel() and Close()
    std::atomic<bool> m_cancelled{false};
    std::atomic<bool> m_closed{false};
};

} // namespace VTInput::Source
