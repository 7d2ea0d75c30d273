// SPDX-License-Identifier: MIT

// tests/fd_io_test.cpp
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <memory_resource>
#include <string>
#include <vector>

#include "lib/stream/error.hpp"
#include "lib/stream/fd_io.hpp"
#include "lib/stream/memory.hpp"
#include "lib/stream/pipes.hpp"
#include "test_util.hpp"

using namespace byte_pipe;
using namespace byte_pipe::test;
using ::testing::ElementsAre;

namespace {

void WriteAll(int fd, std::string_view text) {
    ASSERT_EQ(::write(fd, text.data(), text.size()), static_cast<ssize_t>(text.size()));
}

// Forwards to the default resource and records the largest request.
class LargestRequestResource : public std::pmr::memory_resource {
public:
    size_t largest = 0;

private:
    void* do_allocate(size_t bytes, size_t alignment) override {
        largest = std::max(largest, bytes);
        return std::pmr::new_delete_resource()->allocate(bytes, alignment);
    }

    void do_deallocate(void* p, size_t bytes, size_t alignment) override {
        std::pmr::new_delete_resource()->deallocate(p, bytes, alignment);
    }

    bool do_is_equal(const std::pmr::memory_resource& other) const noexcept override {
        return this == &other;
    }
};

}  // namespace

class FdPipeTest : public ::testing::Test {
protected:
    void SetUp() override {
        int fds[2];
        ASSERT_EQ(::pipe(fds), 0);
        read_fd_ = fds[0];
        write_fd_ = fds[1];
    }

    void TearDown() override {
        if (read_fd_ >= 0) ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }

    void CloseWriteEnd() {
        ::close(write_fd_);
        write_fd_ = -1;
    }

    int read_fd_ = -1;
    int write_fd_ = -1;
};

TEST_F(FdPipeTest, SomeModeReturnsWhatArrived) {
    FdChunkSource source(read_fd_);
    WriteAll(write_fd_, "ab");
    ASSERT_FALSE(source.IsAtEnd());

    WriteAll(write_fd_, "cdef");
    CloseWriteEnd();

    // Lookahead bytes are served on their own, never merged with a later read
    EXPECT_EQ(source.ReadChunk(4).ToString(), "ab");
    ASSERT_FALSE(source.IsAtEnd());
    EXPECT_EQ(source.ReadChunk(4).ToString(), "cdef");
    EXPECT_TRUE(source.IsAtEnd());
}

TEST_F(FdPipeTest, ExactModeTopsUpLookahead) {
    FdChunkSource source(read_fd_, ReadMode::Exact);
    WriteAll(write_fd_, "ab");
    ASSERT_FALSE(source.IsAtEnd());

    WriteAll(write_fd_, "cdef");
    CloseWriteEnd();

    EXPECT_EQ(source.ReadChunk(4).ToString(), "abcd");
    EXPECT_EQ(source.ReadChunk(4).ToString(), "ef");
    EXPECT_TRUE(source.IsAtEnd());
}

TEST_F(FdPipeTest, LookaheadSplitToHint) {
    WriteAll(write_fd_, "Hello, world");
    CloseWriteEnd();

    auto source = std::make_shared<FdChunkSource>(read_fd_);
    EXPECT_THAT(Strings(FromSource(source, 5)), ElementsAre("Hello", ", wor", "ld"));
}

TEST_F(FdPipeTest, EmptyInputIsAtEnd) {
    CloseWriteEnd();
    FdChunkSource source(read_fd_);
    EXPECT_TRUE(source.IsAtEnd());
    EXPECT_TRUE(source.ReadChunk(8).Empty());
}

TEST_F(FdPipeTest, ZeroHintReadsNothing) {
    WriteAll(write_fd_, "x");
    FdChunkSource source(read_fd_);
    EXPECT_TRUE(source.ReadChunk(0).Empty());
}

TEST_F(FdPipeTest, BorrowedDescriptorStaysOpen) {
    {
        FdChunkSource source(read_fd_);
        FdChunkSink sink(write_fd_);
    }
    EXPECT_NE(::fcntl(read_fd_, F_GETFD), -1);
    EXPECT_NE(::fcntl(write_fd_, F_GETFD), -1);
}

TEST_F(FdPipeTest, ReadFromWriteEndFails) {
    FdChunkSource source(write_fd_);
    try {
        source.IsAtEnd();
        FAIL() << "expected StreamError";
    } catch (const StreamError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ReadFailed);
        EXPECT_EQ(e.error().os_errno, EBADF);
    }
}

TEST_F(FdPipeTest, WriteToClosedPipeFails) {
    std::signal(SIGPIPE, SIG_IGN);
    ::close(read_fd_);
    read_fd_ = -1;

    FdChunkSink sink(write_fd_);
    try {
        sink.WriteChunk(Chunk::FromString("lost"));
        FAIL() << "expected StreamError";
    } catch (const StreamError& e) {
        EXPECT_EQ(e.code(), ErrorCode::WriteFailed);
        EXPECT_EQ(e.error().os_errno, EPIPE);
    }
}

TEST_F(FdPipeTest, SinkRoundTripThroughPipe) {
    {
        FdChunkSink sink(write_fd_);
        ToSink(Chunks({"He", "llo, ", "world"}) | Take(5), sink);
    }
    CloseWriteEnd();

    auto source = std::make_shared<FdChunkSource>(read_fd_);
    EXPECT_EQ(CollectString(FromSource(source)), "Hello");
}

TEST_F(FdPipeTest, InjectedAllocatorIsUsed) {
    auto resource = std::make_shared<std::pmr::unsynchronized_pool_resource>();
    BufferAllocator alloc(resource);

    auto source = std::make_shared<FdChunkSource>(read_fd_);
    source->SetAllocator(&alloc);
    EXPECT_EQ(&source->GetAllocator(), &alloc);

    WriteAll(write_fd_, "pooled");
    CloseWriteEnd();

    auto chunks = CollectChunks(FromSource(source, 3));
    ASSERT_EQ(chunks.size(), 2);
    EXPECT_EQ(chunks[0].ToString(), "poo");
    EXPECT_EQ(chunks[1].ToString(), "led");

    // Chunks keep the pool alive after the allocator is gone
    std::weak_ptr<std::pmr::memory_resource> weak = resource;
    resource.reset();
    alloc = BufferAllocator{};
    EXPECT_FALSE(weak.expired());
    chunks.clear();
    EXPECT_TRUE(weak.expired());
}

TEST_F(FdPipeTest, LookaheadSizedFromLastHint) {
    auto resource = std::make_shared<LargestRequestResource>();
    BufferAllocator alloc(resource);
    FdChunkSource source(read_fd_);
    source.SetAllocator(&alloc);

    WriteAll(write_fd_, "a");
    ASSERT_FALSE(source.IsAtEnd());
    EXPECT_GE(resource->largest, kDefaultChunkSize);
    EXPECT_EQ(source.ReadChunk(4).ToString(), "a");

    resource->largest = 0;
    WriteAll(write_fd_, "bcdefg");
    ASSERT_FALSE(source.IsAtEnd());
    EXPECT_LT(resource->largest, 1024u);
    EXPECT_EQ(source.ReadChunk(4).ToString(), "bcde");
    EXPECT_EQ(source.ReadChunk(4).ToString(), "fg");
}

// ============================================================================
// Files
// ============================================================================

class FdFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = ::testing::TempDir() + "byte_pipe_fd_io_XXXXXX";
        int fd = ::mkstemp(path_.data());
        ASSERT_GE(fd, 0);
        ::close(fd);
    }

    void TearDown() override { ::unlink(path_.c_str()); }

    std::string path_;
};

TEST_F(FdFileTest, WriteThenReadBack) {
    {
        auto sink = FdChunkSink::Open(path_);
        ToSink(Chunks({"line one\n", "", "line two\n"}), *sink);
        sink->Close();
    }
    EXPECT_EQ(CollectString(FromFile(path_)), "line one\nline two\n");
}

TEST_F(FdFileTest, OpenTruncates) {
    {
        auto sink = FdChunkSink::Open(path_);
        sink->WriteChunk(Chunk::FromString("a much longer first version"));
    }
    {
        auto sink = FdChunkSink::Open(path_);
        sink->WriteChunk(Chunk::FromString("short"));
    }
    EXPECT_EQ(CollectString(FromFile(path_)), "short");
}

TEST_F(FdFileTest, FixedSizeChunks) {
    {
        auto sink = FdChunkSink::Open(path_);
        sink->WriteChunk(Chunk::FromString("0123456789"));
    }
    EXPECT_THAT(Strings(FromFile(path_, SourceConfig::Exact(4))),
                ElementsAre("0123", "4567", "89"));
}

TEST_F(FdFileTest, OwnedDescriptorClosedOnDestruction) {
    int fd = -1;
    {
        auto source = FdChunkSource::Open(path_);
        fd = source->fd();
        EXPECT_NE(::fcntl(fd, F_GETFD), -1);
    }
    errno = 0;
    EXPECT_EQ(::fcntl(fd, F_GETFD), -1);
    EXPECT_EQ(errno, EBADF);
}

TEST_F(FdFileTest, WriteAfterCloseFails) {
    auto sink = FdChunkSink::Open(path_);
    sink->Close();
    try {
        sink->WriteChunk(Chunk::FromString("late"));
        FAIL() << "expected StreamError";
    } catch (const StreamError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidState);
    }
}

TEST(FdOpenTest, MissingFileThrows) {
    try {
        FromFile("/nonexistent/byte_pipe/input.bin");
        FAIL() << "expected StreamError";
    } catch (const StreamError& e) {
        EXPECT_EQ(e.code(), ErrorCode::OpenFailed);
        EXPECT_EQ(e.error().os_errno, ENOENT);
        EXPECT_EQ(error_category(e.code()), "io");
    }
}
