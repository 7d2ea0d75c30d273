// SPDX-License-Identifier: MIT

// lib/stream/buffer_allocator.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <memory_resource>
#include <span>
#include <vector>

#include "lib/stream/chunk.hpp"

namespace byte_pipe {

/// Writable byte buffer handed out by BufferAllocator.
///
/// Adapters fill `bytes`, then publish the filled prefix as a Chunk via
/// Freeze(). The Chunk co-owns the buffer, so the memory stays valid for as
/// long as any chunk (or slice of one) refers to it.
struct Buffer {
    explicit Buffer(size_t capacity, std::pmr::memory_resource* resource)
        : bytes(capacity, resource) {}

    std::pmr::vector<std::byte> bytes;
};

/// Allocator for read buffers backed by a PMR memory resource.
///
/// Wraps a shared_ptr<memory_resource> so that outstanding buffers keep
/// the resource alive (the allocator stored in shared_ptr's control block
/// holds a copy of the shared_ptr).
///
/// Thread safety: Allocate() is as thread-safe as the underlying resource.
/// The default synchronized_pool_resource is safe for cross-thread
/// deallocation via the shared_ptr destructor.
class BufferAllocator {
public:
    /// Construct with default synchronized_pool_resource.
    BufferAllocator()
        : resource_(std::make_shared<std::pmr::synchronized_pool_resource>()) {}

    /// Construct with caller-provided resource.
    explicit BufferAllocator(std::shared_ptr<std::pmr::memory_resource> resource)
        : resource_(std::move(resource)) {}

    /// Allocate a zero-initialized buffer of `capacity` bytes.
    std::shared_ptr<Buffer> Allocate(size_t capacity) {
        return std::allocate_shared<Buffer>(PmrAllocator{resource_}, capacity,
                                            resource_.get());
    }

    /// Publish the first `size` bytes of a buffer as an immutable chunk.
    /// The buffer must not be written to afterwards.
    static Chunk Freeze(std::shared_ptr<Buffer> buffer, size_t size) {
        std::span<const std::byte> view{buffer->bytes.data(), size};
        return Chunk(std::shared_ptr<const void>(std::move(buffer)), view);
    }

    /// Get shared pointer to the underlying memory resource.
    std::shared_ptr<std::pmr::memory_resource> GetResourcePtr() const {
        return resource_;
    }

private:
    /// Custom allocator that captures shared ownership of the memory resource.
    /// Stored in shared_ptr's control block, extending resource lifetime.
    /// Templated to satisfy std::allocator_traits rebind requirements.
    template <typename T>
    struct PmrAllocatorImpl {
        using value_type = T;

        std::shared_ptr<std::pmr::memory_resource> resource;

        explicit PmrAllocatorImpl(std::shared_ptr<std::pmr::memory_resource> r)
            : resource(std::move(r)) {}

        template <typename U>
        PmrAllocatorImpl(const PmrAllocatorImpl<U>& other) noexcept
            : resource(other.resource) {}

        T* allocate(size_t n) {
            return static_cast<T*>(
                resource->allocate(n * sizeof(T), alignof(T)));
        }

        void deallocate(T* p, size_t n) noexcept {
            resource->deallocate(p, n * sizeof(T), alignof(T));
        }

        template <typename U>
        bool operator==(const PmrAllocatorImpl<U>& other) const noexcept {
            return resource == other.resource;
        }
    };

    using PmrAllocator = PmrAllocatorImpl<Buffer>;

    std::shared_ptr<std::pmr::memory_resource> resource_;
};

}  // namespace byte_pipe
