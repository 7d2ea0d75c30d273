// SPDX-License-Identifier: MIT

// lib/stream/fold.hpp
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "lib/stream/channel.hpp"
#include "lib/stream/chunk.hpp"
#include "lib/stream/pipes.hpp"

// Terminal folds over byte streams.
//
// Every fold consumes its producer. Folds that can decide early (Any, All,
// Null, Elem, NotElem, Head, Find, Index, ElemIndex, FindIndex, First) stop
// demanding as soon as the answer is known and drop the rest of the stream
// undrained; closing whatever sits behind it is the owning adapter's job.
// The stream's own terminal value is discarded.

namespace byte_pipe {

/// Strict left fold over every byte, in stream order, followed by `done`.
template <typename R, typename X, typename StepFn, typename DoneFn>
    requires std::is_invocable_r_v<X, StepFn&, X, std::byte> &&
             std::invocable<DoneFn&, X>
auto Fold(Producer<Chunk, R> producer, StepFn step, X seed, DoneFn done) {
    X acc = std::move(seed);
    for (;;) {
        auto next = producer.Next();
        if (next.IsDone()) break;
        for (std::byte b : next.Value()) {
            acc = step(std::move(acc), b);
        }
    }
    return std::invoke(done, std::move(acc));
}

/// First value of any stream, abandoning the rest.
template <typename T, typename R>
std::optional<T> First(Producer<T, R> producer) {
    auto step = producer.Next();
    if (step.IsDone()) return std::nullopt;
    return std::move(step.Value());
}

/// Every value of a stream.
template <typename T, typename R>
std::vector<T> ToVector(Producer<T, R> producer) {
    std::vector<T> out;
    ForEach(std::move(producer), [&out](T value) { out.push_back(std::move(value)); });
    return out;
}

/// First byte; empty chunks are skipped.
template <typename R>
std::optional<std::byte> Head(Producer<Chunk, R> producer) {
    for (;;) {
        auto step = producer.Next();
        if (step.IsDone()) return std::nullopt;
        if (!step.Value().Empty()) return step.Value()[0];
    }
}

/// Last byte; empty chunks are skipped.
template <typename R>
std::optional<std::byte> Last(Producer<Chunk, R> producer) {
    std::optional<std::byte> last;
    for (;;) {
        auto step = producer.Next();
        if (step.IsDone()) return last;
        const Chunk& chunk = step.Value();
        if (!chunk.Empty()) last = chunk[chunk.Size() - 1];
    }
}

/// True if the stream holds no bytes at all.
template <typename R>
bool Null(Producer<Chunk, R> producer) {
    for (;;) {
        auto step = producer.Next();
        if (step.IsDone()) return true;
        if (!step.Value().Empty()) return false;
    }
}

/// Total number of bytes.
template <typename R>
size_t Length(Producer<Chunk, R> producer) {
    size_t total = 0;
    ForEach(std::move(producer), [&total](const Chunk& chunk) { total += chunk.Size(); });
    return total;
}

/// True if some byte satisfies `pred`.
template <typename R, BytePredicate P>
bool Any(Producer<Chunk, R> producer, P pred) {
    for (;;) {
        auto step = producer.Next();
        if (step.IsDone()) return false;
        if (std::ranges::any_of(step.Value(), std::ref(pred))) return true;
    }
}

/// True if every byte satisfies `pred` (vacuously true when empty).
template <typename R, BytePredicate P>
bool All(Producer<Chunk, R> producer, P pred) {
    for (;;) {
        auto step = producer.Next();
        if (step.IsDone()) return true;
        if (!std::ranges::all_of(step.Value(), std::ref(pred))) return false;
    }
}

/// Largest byte, or nullopt for a stream without bytes.
template <typename R>
std::optional<std::byte> Maximum(Producer<Chunk, R> producer) {
    return Fold(std::move(producer),
        [](std::optional<std::byte> acc, std::byte b) -> std::optional<std::byte> {
            return acc ? std::max(*acc, b) : b;
        },
        std::optional<std::byte>{}, std::identity{});
}

/// Smallest byte, or nullopt for a stream without bytes.
template <typename R>
std::optional<std::byte> Minimum(Producer<Chunk, R> producer) {
    return Fold(std::move(producer),
        [](std::optional<std::byte> acc, std::byte b) -> std::optional<std::byte> {
            return acc ? std::min(*acc, b) : b;
        },
        std::optional<std::byte>{}, std::identity{});
}

template <typename R>
bool Elem(Producer<Chunk, R> producer, std::byte value) {
    return Any(std::move(producer), [value](std::byte b) { return b == value; });
}

template <typename R>
bool NotElem(Producer<Chunk, R> producer, std::byte value) {
    return All(std::move(producer), [value](std::byte b) { return b != value; });
}

/// First byte satisfying `pred`.
template <typename R, BytePredicate P>
std::optional<std::byte> Find(Producer<Chunk, R> producer, P pred) {
    return Head(std::move(producer) | Filter(std::move(pred)));
}

/// Byte at offset `n` (the first byte for n <= 0).
template <typename R>
std::optional<std::byte> Index(Producer<Chunk, R> producer, int64_t n) {
    return Head(std::move(producer) | Drop(n));
}

/// Offset of the first byte satisfying `pred`.
template <typename R, BytePredicate P>
std::optional<size_t> FindIndex(Producer<Chunk, R> producer, P pred) {
    return First(std::move(producer) | FindIndices(std::move(pred)));
}

/// Offset of the first byte equal to `value`.
template <typename R>
std::optional<size_t> ElemIndex(Producer<Chunk, R> producer, std::byte value) {
    return First(std::move(producer) | ElemIndices(value));
}

/// Number of bytes equal to `value`.
template <typename R>
size_t Count(Producer<Chunk, R> producer, std::byte value) {
    size_t total = 0;
    ForEach(std::move(producer), [&total, value](const Chunk& chunk) {
        total += static_cast<size_t>(std::ranges::count(chunk, value));
    });
    return total;
}

}  // namespace byte_pipe
