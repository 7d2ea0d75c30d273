// SPDX-License-Identifier: MIT

// lib/stream/fd_io.cpp
#include "lib/stream/fd_io.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "lib/stream/error.hpp"

namespace byte_pipe {

namespace {

[[noreturn]] void ThrowErrno(ErrorCode code, std::string what, int err) {
    throw StreamError(Error{code, fmt::format("{}: {}", what, std::strerror(err)), err});
}

}  // namespace

// ============================================================================
// FdChunkSource
// ============================================================================

std::shared_ptr<FdChunkSource> FdChunkSource::Open(const std::string& path, ReadMode mode) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        ThrowErrno(ErrorCode::OpenFailed, fmt::format("open({}) failed", path), errno);
    }
    spdlog::debug("opened {} for reading (fd {})", path, fd);

    struct MakeSharedEnabler : public FdChunkSource {
        MakeSharedEnabler(int f, ReadMode m) : FdChunkSource(f, m, /*owned=*/true) {}
    };
    return std::make_shared<MakeSharedEnabler>(fd, mode);
}

FdChunkSource::~FdChunkSource() {
    if (owned_ && fd_ >= 0) {
        if (::close(fd_) < 0) {
            spdlog::warn("close() failed on fd {}: {}", fd_, std::strerror(errno));
        } else {
            spdlog::debug("closed fd {}", fd_);
        }
    }
}

bool FdChunkSource::IsAtEnd() {
    if (!pending_.Empty()) return false;
    if (eof_) return true;

    auto buffer = GetAllocator().Allocate(lookahead_size_);
    size_t n = ReadOnce(buffer->bytes.data(), lookahead_size_);
    if (n == 0) return true;
    pending_ = BufferAllocator::Freeze(std::move(buffer), n);
    return false;
}

Chunk FdChunkSource::ReadChunk(size_t size_hint) {
    if (size_hint == 0) return Chunk{};
    lookahead_size_ = size_hint;

    if (!pending_.Empty()) {
        if (pending_.Size() >= size_hint || mode_ == ReadMode::Some) {
            auto [head, rest] = pending_.SplitAt(size_hint);
            pending_ = std::move(rest);
            return head;
        }
        // Exact read with a short lookahead: top it up to the hint
        auto buffer = GetAllocator().Allocate(size_hint);
        std::memcpy(buffer->bytes.data(), pending_.Data(), pending_.Size());
        size_t filled = pending_.Size();
        pending_ = Chunk{};
        filled += ReadFull(buffer->bytes.data() + filled, size_hint - filled);
        return BufferAllocator::Freeze(std::move(buffer), filled);
    }

    if (eof_) return Chunk{};

    auto buffer = GetAllocator().Allocate(size_hint);
    size_t filled = mode_ == ReadMode::Exact
        ? ReadFull(buffer->bytes.data(), size_hint)
        : ReadOnce(buffer->bytes.data(), size_hint);
    return BufferAllocator::Freeze(std::move(buffer), filled);
}

size_t FdChunkSource::ReadOnce(std::byte* dest, size_t len) {
    for (;;) {
        ssize_t n = ::read(fd_, dest, len);
        if (n > 0) return static_cast<size_t>(n);
        if (n == 0) {
            if (!eof_) spdlog::debug("fd {} reached end of input", fd_);
            eof_ = true;
            return 0;
        }
        if (errno == EINTR) continue;
        ThrowErrno(ErrorCode::ReadFailed, fmt::format("read() failed on fd {}", fd_), errno);
    }
}

size_t FdChunkSource::ReadFull(std::byte* dest, size_t len) {
    size_t filled = 0;
    while (filled < len) {
        size_t n = ReadOnce(dest + filled, len - filled);
        if (n == 0) break;
        filled += n;
    }
    return filled;
}

// ============================================================================
// FdChunkSink
// ============================================================================

std::shared_ptr<FdChunkSink> FdChunkSink::Open(const std::string& path) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        ThrowErrno(ErrorCode::OpenFailed, fmt::format("open({}) failed", path), errno);
    }
    spdlog::debug("opened {} for writing (fd {})", path, fd);

    struct MakeSharedEnabler : public FdChunkSink {
        explicit MakeSharedEnabler(int f) : FdChunkSink(f, /*owned=*/true) {}
    };
    return std::make_shared<MakeSharedEnabler>(fd);
}

FdChunkSink::~FdChunkSink() {
    if (owned_ && fd_ >= 0 && ::close(fd_) < 0) {
        spdlog::warn("close() failed on fd {}: {}", fd_, std::strerror(errno));
    }
}

void FdChunkSink::WriteChunk(const Chunk& chunk) {
    if (fd_ < 0) {
        throw StreamError(Error{ErrorCode::InvalidState, "WriteChunk() on a closed sink"});
    }
    const std::byte* data = chunk.Data();
    size_t remaining = chunk.Size();
    while (remaining > 0) {
        ssize_t n = ::write(fd_, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            ThrowErrno(ErrorCode::WriteFailed, fmt::format("write() failed on fd {}", fd_), errno);
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }
}

void FdChunkSink::Close() {
    if (!owned_ || fd_ < 0) return;
    int fd = std::exchange(fd_, -1);
    if (::close(fd) < 0) {
        ThrowErrno(ErrorCode::CloseFailed, fmt::format("close() failed on fd {}", fd), errno);
    }
    spdlog::debug("closed fd {}", fd);
}

// ============================================================================
// Standard streams and files
// ============================================================================

Producer<Chunk> Stdin(SourceConfig config) {
    return FromSource(std::make_shared<FdChunkSource>(STDIN_FILENO, config.read_mode),
                      config.chunk_size);
}

Producer<Chunk> FromFile(const std::string& path, SourceConfig config) {
    return FromSource(FdChunkSource::Open(path, config.read_mode), config.chunk_size);
}

std::shared_ptr<FdChunkSink> StdoutSink() {
    return std::make_shared<FdChunkSink>(STDOUT_FILENO);
}

}  // namespace byte_pipe
