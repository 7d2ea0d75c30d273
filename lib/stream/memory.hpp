// SPDX-License-Identifier: MIT

// lib/stream/memory.hpp
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lib/stream/channel.hpp"
#include "lib/stream/chunk.hpp"

// Bridging between in-memory buffers and byte streams.
//
// Collect() is the one place where chunks are concatenated: it is an explicit
// end-of-stream boundary, not a transformation in flight.

namespace byte_pipe {

/// Stream of the given chunks, in order.
inline Producer<Chunk> FromChunks(std::vector<Chunk> chunks) {
    return Each(std::move(chunks));
}

/// Single-chunk stream holding a copy of `text`. Empty text yields no chunk.
inline Producer<Chunk> FromString(std::string_view text) {
    std::vector<Chunk> chunks;
    if (!text.empty()) chunks.push_back(Chunk::FromString(text));
    return FromChunks(std::move(chunks));
}

/// Zero-copy stream over `buffer`, cut into slices of `slice_size` bytes
/// (the last one may be shorter).
/// @throws std::invalid_argument if slice_size == 0.
inline Producer<Chunk> FromBuffer(Chunk buffer, size_t slice_size) {
    if (slice_size == 0) {
        throw std::invalid_argument("FromBuffer: slice size must be positive");
    }
    return Producer<Chunk>::FromFunction(
        [buffer = std::move(buffer), slice_size, offset = size_t{0}]() mutable {
            if (offset >= buffer.Size()) return Step<Chunk, Done>::Return(Done{});
            Chunk slice = buffer.Slice(offset, slice_size);
            offset += slice.Size();
            return Step<Chunk, Done>::Yield(std::move(slice));
        });
}

/// Restartable in-memory source: every Stream() call replays the same chunks
/// from the start. Chunks are shared, not copied.
class MemorySource {
public:
    MemorySource() = default;
    explicit MemorySource(std::vector<Chunk> chunks) : chunks_(std::move(chunks)) {}

    /// One chunk per string, kept verbatim (empty strings become empty chunks).
    static MemorySource FromStrings(const std::vector<std::string>& parts) {
        std::vector<Chunk> chunks;
        chunks.reserve(parts.size());
        for (const auto& part : parts) chunks.push_back(Chunk::FromString(part));
        return MemorySource(std::move(chunks));
    }

    Producer<Chunk> Stream() const { return FromChunks(chunks_); }

    const std::vector<Chunk>& Chunks() const noexcept { return chunks_; }

    size_t Size() const noexcept {
        size_t total = 0;
        for (const auto& chunk : chunks_) total += chunk.Size();
        return total;
    }

private:
    std::vector<Chunk> chunks_;
};

/// Concatenate every byte of the stream into one buffer.
template <typename R>
std::vector<std::byte> Collect(Producer<Chunk, R> producer) {
    std::vector<std::byte> out;
    ForEach(std::move(producer), [&out](const Chunk& chunk) {
        out.insert(out.end(), chunk.begin(), chunk.end());
    });
    return out;
}

/// Collect() as a string, for text streams.
template <typename R>
std::string CollectString(Producer<Chunk, R> producer) {
    std::string out;
    ForEach(std::move(producer), [&out](const Chunk& chunk) {
        out.append(reinterpret_cast<const char*>(chunk.Data()), chunk.Size());
    });
    return out;
}

/// The chunks of the stream, boundaries preserved.
template <typename R>
std::vector<Chunk> CollectChunks(Producer<Chunk, R> producer) {
    std::vector<Chunk> out;
    ForEach(std::move(producer), [&out](Chunk chunk) { out.push_back(std::move(chunk)); });
    return out;
}

}  // namespace byte_pipe
