// SPDX-License-Identifier: MIT

// lib/stream/fd_io.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "lib/stream/buffer_allocator.hpp"
#include "lib/stream/channel.hpp"
#include "lib/stream/chunk.hpp"
#include "lib/stream/source.hpp"

namespace byte_pipe {

// FdChunkSource - IChunkSource over a POSIX file descriptor.
//
// Reads are blocking. IsAtEnd() has to read ahead to detect end of input on
// pipes and terminals; the bytes it reads are served by the next ReadChunk()
// (split to the hint, never merged with a later read in ReadMode::Some).
// The lookahead reads at most the last size hint, or kDefaultChunkSize before
// the first ReadChunk().
//
// Descriptors passed to the public constructor are borrowed. Descriptors
// opened through Open() are owned and closed on destruction, so wrapping the
// whole running composition in the source's lifetime scopes the file.
//
// Thread safety: Not thread-safe.
class FdChunkSource : public IChunkSource {
public:
    explicit FdChunkSource(int fd, ReadMode mode = ReadMode::Some)
        : FdChunkSource(fd, mode, /*owned=*/false) {}

    /// Open `path` read-only.
    /// @throws StreamError (OpenFailed) if the file cannot be opened.
    static std::shared_ptr<FdChunkSource> Open(const std::string& path,
                                               ReadMode mode = ReadMode::Some);

    ~FdChunkSource() override;

    FdChunkSource(const FdChunkSource&) = delete;
    FdChunkSource& operator=(const FdChunkSource&) = delete;

    bool IsAtEnd() override;
    Chunk ReadChunk(size_t size_hint) override;

    /// Inject an external allocator (e.g. shared between several sources).
    void SetAllocator(BufferAllocator* alloc) { allocator_ = alloc; }

    /// Return the active allocator (injected or default).
    BufferAllocator& GetAllocator() { return allocator_ ? *allocator_ : default_allocator_; }

    int fd() const noexcept { return fd_; }

private:
    FdChunkSource(int fd, ReadMode mode, bool owned)
        : fd_(fd), mode_(mode), owned_(owned) {}

    // One read(2), retried on EINTR. Returns 0 at end of input.
    size_t ReadOnce(std::byte* dest, size_t len);

    // Read until `len` bytes arrived or input ended.
    size_t ReadFull(std::byte* dest, size_t len);

    int fd_;
    ReadMode mode_;
    bool owned_;
    bool eof_ = false;
    size_t lookahead_size_ = kDefaultChunkSize;  // Last non-zero size hint
    Chunk pending_;  // Bytes read ahead by IsAtEnd()

    BufferAllocator* allocator_ = nullptr;
    BufferAllocator default_allocator_;
};

// FdChunkSink - IChunkSink over a POSIX file descriptor.
//
// WriteChunk() blocks until the whole chunk is written.
class FdChunkSink : public IChunkSink {
public:
    explicit FdChunkSink(int fd) : FdChunkSink(fd, /*owned=*/false) {}

    /// Create or truncate `path` for writing.
    /// @throws StreamError (OpenFailed) if the file cannot be opened.
    static std::shared_ptr<FdChunkSink> Open(const std::string& path);

    ~FdChunkSink() override;

    FdChunkSink(const FdChunkSink&) = delete;
    FdChunkSink& operator=(const FdChunkSink&) = delete;

    /// @throws StreamError (WriteFailed) on write failure, (InvalidState)
    /// after Close().
    void WriteChunk(const Chunk& chunk) override;

    /// Close an owned descriptor now, reporting failure.
    /// @throws StreamError (CloseFailed) if close(2) fails.
    void Close();

    int fd() const noexcept { return fd_; }

private:
    FdChunkSink(int fd, bool owned) : fd_(fd), owned_(owned) {}

    int fd_;
    bool owned_;
};

/// Stream standard input with the given chunk size and read mode.
Producer<Chunk> Stdin(SourceConfig config = SourceConfig::Defaults());

/// Stream the file at `path`; the file is closed when the stream is dropped.
/// @throws StreamError (OpenFailed) if the file cannot be opened.
Producer<Chunk> FromFile(const std::string& path,
                         SourceConfig config = SourceConfig::Defaults());

/// Sink writing to standard output (borrowed descriptor).
std::shared_ptr<FdChunkSink> StdoutSink();

}  // namespace byte_pipe
