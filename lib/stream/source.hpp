// SPDX-License-Identifier: MIT

// lib/stream/source.hpp
#pragma once

#include <cstddef>
#include <memory>

#include "lib/stream/channel.hpp"
#include "lib/stream/chunk.hpp"

namespace byte_pipe {

/// Default chunk size for reading: 32 KiB minus allocator overhead.
inline constexpr size_t kDefaultChunkSize = 32 * 1024 - 16;

/// How a source satisfies a size hint.
enum class ReadMode {
    Some,   ///< Return whatever one read delivers, at most the hint
    Exact,  ///< Keep reading until the hint is filled or input ends
};

/// Configuration for byte sources.
struct SourceConfig {
    size_t chunk_size = kDefaultChunkSize;   ///< Size hint for every read
    ReadMode read_mode = ReadMode::Some;     ///< Short reads allowed?

    /// Preset: default chunk size, short reads allowed.
    static SourceConfig Defaults() { return SourceConfig{}; }

    /// Preset: fixed-size chunks of `n` bytes (the last may be shorter).
    static SourceConfig Exact(size_t n) {
        return SourceConfig{
            .chunk_size = n,
            .read_mode = ReadMode::Exact,
        };
    }
};

/// Capability interface of a byte source (file, pipe, socket, ...).
///
/// ReadChunk() may block on the medium. Failures are reported by throwing
/// (StreamError for the adapters in this library) and are never caught by
/// the stream core.
class IChunkSource {
public:
    virtual ~IChunkSource() = default;

    /// True once no further bytes can be read. May block to find out.
    virtual bool IsAtEnd() = 0;

    /// Read the next chunk using `size_hint` as the size budget. The hint
    /// may differ from call to call.
    virtual Chunk ReadChunk(size_t size_hint) = 0;
};

/// Capability interface of a byte sink.
class IChunkSink {
public:
    virtual ~IChunkSink() = default;

    virtual void WriteChunk(const Chunk& chunk) = 0;
};

/// Stream reading `source` with a fixed size hint until it reports the end.
Producer<Chunk> FromSource(std::shared_ptr<IChunkSource> source,
                           size_t chunk_size = kDefaultChunkSize);

/// Size-negotiated stream: every demand passes the hint for that read.
Server<size_t, Chunk> ServeSource(std::shared_ptr<IChunkSource> source);

// Consumer adapter writing every chunk to a sink
class SinkConsumer {
public:
    explicit SinkConsumer(IChunkSink& sink) : sink_(sink) {}

    void Accept(Chunk chunk) { sink_.WriteChunk(chunk); }

private:
    IChunkSink& sink_;
};

static_assert(Consumer<SinkConsumer, Chunk>, "SinkConsumer must satisfy Consumer");

/// Write every chunk of `producer` to `sink`; returns the producer's
/// terminal value. Sink failures propagate.
template <typename R>
R ToSink(Producer<Chunk, R> producer, IChunkSink& sink) {
    SinkConsumer consumer(sink);
    return Run(std::move(producer), consumer);
}

}  // namespace byte_pipe
