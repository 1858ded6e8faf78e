#include "source/FdByteSource.h"
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace VTInput::Source {

FdByteSource::FdByteSource(int fd, bool ownsFd)
    : m_fd(fd)
    , m_ownsFd(ownsFd)
{
    if (pipe(m_cancelPipe) != 0) {
        spdlog::error("Failed to create cancel pipe: {}", std::strerror(errno));
        m_cancelPipe[0] = -1;
        m_cancelPipe[1] = -1;
        return;
    }

    // The write end must never block Cancel()
    int flags = fcntl(m_cancelPipe[1], F_GETFL);
    if (flags == -1 || fcntl(m_cancelPipe[1], F_SETFL, flags | O_NONBLOCK) == -1) {
        spdlog::warn("Failed to make cancel pipe non-blocking: {}", std::strerror(errno));
    }
}

FdByteSource::~FdByteSource() {
    Close();
}

ReadResult FdByteSource::Read(char* data, size_t size) {
    ReadResult result;

    if (m_cancelled.load()) {
        result.status = ReadStatus::Cancelled;
        return result;
    }
    if (m_closed.load() || !IsValid()) {
        result.status = ReadStatus::Error;
        return result;
    }
    if (size == 0) {
        return result;
    }

    pollfd fds[2] = {};
    fds[0].fd = m_fd;
    fds[0].events = POLLIN;
    fds[1].fd = m_cancelPipe[0];
    fds[1].events = POLLIN;

    while (true) {
        int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll failed on fd {}: {}", m_fd, std::strerror(errno));
            result.status = ReadStatus::Error;
            return result;
        }
        break;
    }

    if ((fds[1].revents & POLLIN) || m_cancelled.load()) {
        result.status = ReadStatus::Cancelled;
        return result;
    }

    if (fds[0].revents & POLLNVAL) {
        spdlog::error("fd {} is not open", m_fd);
        result.status = ReadStatus::Error;
        return result;
    }

    ssize_t n;
    do {
        n = read(m_fd, data, size);
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        spdlog::error("read failed on fd {}: {}", m_fd, std::strerror(errno));
        result.status = ReadStatus::Error;
        return result;
    }
    if (n == 0) {
        result.status = ReadStatus::EndOfStream;
        return result;
    }

    result.bytesRead = static_cast<size_t>(n);
    return result;
}

bool FdByteSource::Cancel() {
    std::lock_guard<std::mutex> lock(m_pipeMutex);
    if (m_cancelPipe[1] < 0) {
        return false;
    }

    m_cancelled.store(true);

    const char wake = 1;
    ssize_t n = write(m_cancelPipe[1], &wake, 1);
    if (n < 0 && errno != EAGAIN) {
        spdlog::error("Failed to signal cancel pipe: {}", std::strerror(errno));
        return false;
    }

    spdlog::debug("FdByteSource: read on fd {} cancelled", m_fd);
    return true;
}

void FdByteSource::Close() {
    if (m_closed.exchange(true)) {
        return;
    }

    ClosePipe();

    if (m_ownsFd && m_fd >= 0) {
        close(m_fd);
    }
}

void FdByteSource::ClosePipe() {
    std::lock_guard<std::mutex> lock(m_pipeMutex);
    for (int& end : m_cancelPipe) {
        if (end >= 0) {
            close(end);
            end = -1;
        }
    }
}

} // namespace VTInput::Source
