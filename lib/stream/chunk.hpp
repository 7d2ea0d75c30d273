// SPDX-License-Identifier: MIT

// lib/stream/chunk.hpp
#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace byte_pipe {

// Immutable view of a contiguous run of bytes.
//
// A Chunk shares ownership of the memory it views, so copies and slices are
// O(1) and never copy bytes. Chunks have no append operation:
// chunks may be split into smaller chunks but never merged.
//
// Thread safety: Chunks are immutable; distinct Chunk objects viewing the
// same storage may be used from different threads.
class Chunk {
public:
    // Empty chunk
    Chunk() = default;

    // Take ownership of a byte vector.
    explicit Chunk(std::vector<std::byte> bytes) {
        auto storage = std::make_shared<const std::vector<std::byte>>(std::move(bytes));
        data_ = storage->data();
        size_ = storage->size();
        owner_ = std::move(storage);
    }

    // View bytes kept alive by owner (zero-copy).
    Chunk(std::shared_ptr<const void> owner, std::span<const std::byte> bytes)
        : owner_(std::move(owner)), data_(bytes.data()), size_(bytes.size()) {}

    // Copy bytes into a new chunk.
    static Chunk Copy(std::span<const std::byte> bytes) {
        return Chunk(std::vector<std::byte>(bytes.begin(), bytes.end()));
    }

    // Copy the characters of a string into a new chunk.
    static Chunk FromString(std::string_view text) {
        return Copy(std::as_bytes(std::span{text.data(), text.size()}));
    }

    std::span<const std::byte> Span() const noexcept { return {data_, size_}; }
    const std::byte* Data() const noexcept { return data_; }
    size_t Size() const noexcept { return size_; }
    bool Empty() const noexcept { return size_ == 0; }

    std::byte operator[](size_t i) const noexcept {
        assert(i < size_ && "Chunk index out of range");
        return data_[i];
    }

    const std::byte* begin() const noexcept { return data_; }
    const std::byte* end() const noexcept { return data_ + size_; }

    // Sub-view [offset, offset + len), clamped to the chunk bounds. An empty
    // result does not keep the storage alive.
    Chunk Slice(size_t offset, size_t len) const {
        offset = std::min(offset, size_);
        len = std::min(len, size_ - offset);
        if (len == 0) return Chunk{};
        Chunk out;
        out.owner_ = owner_;
        out.data_ = data_ + offset;
        out.size_ = len;
        return out;
    }

    // First n bytes (whole chunk if n >= Size()).
    Chunk Take(size_t n) const { return Slice(0, n); }

    // Everything after the first n bytes (empty if n >= Size()).
    Chunk Drop(size_t n) const { return Slice(n, size_); }

    // {Take(n), Drop(n)}
    std::pair<Chunk, Chunk> SplitAt(size_t n) const { return {Take(n), Drop(n)}; }

    // Copy the viewed bytes out, e.g. for comparisons in tests or logging.
    std::string ToString() const {
        return std::string(reinterpret_cast<const char*>(data_), size_);
    }

    // Byte-wise equality; storage identity is irrelevant.
    friend bool operator==(const Chunk& a, const Chunk& b) noexcept {
        return std::ranges::equal(a.Span(), b.Span());
    }

private:
    std::shared_ptr<const void> owner_;
    const std::byte* data_ = nullptr;
    size_t size_ = 0;
};

}  // namespace byte_pipe
