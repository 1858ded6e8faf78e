// test_fd_byte_source.cpp - Unit tests for the poll based descriptor source
// Exercises FdByteSource over pipes, including cross-thread cancellation

#include <gtest/gtest.h>
#include "source/FdByteSource.h"
#include "input/Driver.h"
#include <chrono>
#include <fcntl.h>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

namespace VTInput::Source {
namespace Tests {

using namespace std::chrono_literals;

// ============================================================================
// Test Fixture
// ============================================================================

class FdByteSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(pipe(fds), 0);
    }

    void TearDown() override {
        CloseWriter();
        if (fds[0] >= 0) {
            close(fds[0]);
        }
    }

    void Write(const std::string& data) {
        ASSERT_EQ(write(fds[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    void CloseWriter() {
        if (fds[1] >= 0) {
            close(fds[1]);
            fds[1] = -1;
        }
    }

    int fds[2] = {-1, -1};
    char buf[64] = {};
};

// ============================================================================
// Reads
// ============================================================================

TEST_F(FdByteSourceTest, ReadsAvailableData) {
    FdByteSource source(fds[0]);
    ASSERT_TRUE(source.IsValid());
    Write("hello");

    ReadResult result = source.Read(buf, sizeof(buf));
    EXPECT_EQ(result.status, ReadStatus::Ok);
    ASSERT_EQ(result.bytesRead, 5u);
    EXPECT_EQ(std::string(buf, result.bytesRead), "hello");
}

TEST_F(FdByteSourceTest, ReadRespectsSize) {
    FdByteSource source(fds[0]);
    Write("abcdef");

    ReadResult first = source.Read(buf, 4);
    ASSERT_EQ(first.bytesRead, 4u);
    EXPECT_EQ(std::string(buf, 4), "abcd");

    ReadResult second = source.Read(buf, sizeof(buf));
    ASSERT_EQ(second.bytesRead, 2u);
    EXPECT_EQ(std::string(buf, 2), "ef");
}

TEST_F(FdByteSourceTest, EndOfStreamWhenWriterCloses) {
    FdByteSource source(fds[0]);
    Write("x");
    CloseWriter();

    EXPECT_EQ(source.Read(buf, sizeof(buf)).status, ReadStatus::Ok);
    EXPECT_EQ(source.Read(buf, sizeof(buf)).status, ReadStatus::EndOfStream);
}

TEST_F(FdByteSourceTest, InvalidDescriptor) {
    FdByteSource source(-1);
    EXPECT_FALSE(source.IsValid());
    EXPECT_EQ(source.Read(buf, sizeof(buf)).status, ReadStatus::Error);
}

// ============================================================================
// Cancellation and lifetime
// ============================================================================

TEST_F(FdByteSourceTest, CancelUnblocksPendingRead) {
    FdByteSource source(fds[0]);

    auto pending = std::async(std::launch::async, [&] {
        char local[16];
        return source.Read(local, sizeof(local)).status;
    });

    // Nothing is written, so the read can only return through Cancel
    std::this_thread::sleep_for(50ms);
    EXPECT_TRUE(source.Cancel());

    ASSERT_EQ(pending.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(pending.get(), ReadStatus::Cancelled);
}

TEST_F(FdByteSourceTest, CancelBeforeReadWinsOverData) {
    FdByteSource source(fds[0]);
    Write("data");

    EXPECT_TRUE(source.Cancel());
    EXPECT_EQ(source.Read(buf, sizeof(buf)).status, ReadStatus::Cancelled);
}

TEST_F(FdByteSourceTest, ReadAfterCloseFails) {
    FdByteSource source(fds[0]);
    source.Close();
    source.Close();

    EXPECT_EQ(source.Read(buf, sizeof(buf)).status, ReadStatus::Error);
    EXPECT_FALSE(source.Cancel());
}

TEST_F(FdByteSourceTest, CancelRacesClose) {
    // Shutdown path: one thread cancels while the owner closes the source
    for (int i = 0; i < 50; ++i) {
        FdByteSource source(fds[0]);

        std::thread canceller([&source] { source.Cancel(); });
        source.Close();
        canceller.join();

        EXPECT_FALSE(source.Cancel());
        EXPECT_NE(source.Read(buf, sizeof(buf)).status, ReadStatus::Ok);
    }
}

TEST_F(FdByteSourceTest, OwnedDescriptorIsClosed) {
    {
        FdByteSource source(fds[0], true);
    }
    // fcntl fails on a closed descriptor
    EXPECT_EQ(fcntl(fds[0], F_GETFD), -1);
    fds[0] = -1;
}

TEST_F(FdByteSourceTest, BorrowedDescriptorStaysOpen) {
    {
        FdByteSource source(fds[0]);
    }
    EXPECT_NE(fcntl(fds[0], F_GETFD), -1);
}

// ============================================================================
// End to end
// ============================================================================

TEST_F(FdByteSourceTest, DriverOverPipe) {
    Input::DriverOptions options;
    options.term = "xterm";
    Input::Driver driver(std::make_unique<FdByteSource>(fds[0]), options);

    Write("\x1b[<0;3;4M");
    Write("q");
    CloseWriter();

    Input::EventList events;
    std::vector<std::string> seen;
    ReadStatus status;
    while ((status = driver.ReadEvents(events)) == ReadStatus::Ok) {
        for (const auto& ev : events) {
            seen.push_back(Input::EventToString(ev));
        }
    }

    EXPECT_EQ(status, ReadStatus::EndOfStream);
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "mouse: left press (2,3)");
    EXPECT_EQ(seen[1], "key: q");
}

} // namespace Tests
} // namespace VTInput::Source
