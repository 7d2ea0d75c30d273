// SPDX-License-Identifier: MIT

// lib/stream/cursor.hpp
#pragma once

#include <concepts>
#include <optional>
#include <stdexcept>
#include <utility>

#include "lib/stream/channel.hpp"
#include "lib/stream/chunk.hpp"

namespace byte_pipe {

// Cursor - one-chunk lookahead over a byte stream.
//
// Owns the stream together with a single leftover slot. Draw() hands out the
// next non-empty chunk, Peek() draws and pushes the chunk back, so repeated
// peeks return the same chunk until it is drawn.
//
// Once the stream has completed, every further Draw()/Peek() returns the same
// terminal value again, which is why R must be copyable.
//
// Thread safety: Not thread-safe.
template <std::copy_constructible R>
class Cursor {
public:
    using StepType = Step<Chunk, R>;

    explicit Cursor(Producer<Chunk, R> underlying) : underlying_(std::move(underlying)) {}

    // Next non-empty chunk, or the terminal value. Empty chunks from the
    // underlying stream are skipped.
    StepType Draw() {
        if (leftover_) {
            Chunk chunk = std::move(*leftover_);
            leftover_.reset();
            return StepType::Yield(std::move(chunk));
        }
        if (result_) return StepType::Return(*result_);

        for (;;) {
            auto step = underlying_.Next();
            if (step.IsDone()) {
                result_.emplace(std::move(step.Result()));
                return StepType::Return(*result_);
            }
            if (!step.Value().Empty()) return step;
        }
    }

    // Draw without consuming.
    StepType Peek() {
        auto step = Draw();
        if (!step.IsDone()) UnDraw(step.Value());
        return step;
    }

    // True iff the next Draw() would return the terminal value.
    bool IsEndOfInput() { return Peek().IsDone(); }

    // Push a chunk back in front of the stream. Empty chunks are discarded.
    // @throws std::logic_error if a leftover chunk is already buffered.
    void UnDraw(Chunk chunk) {
        if (chunk.Empty()) return;
        if (leftover_) {
            throw std::logic_error("Cursor::UnDraw() with a leftover chunk already buffered");
        }
        leftover_ = std::move(chunk);
    }

    // True if a pushed-back chunk is waiting to be drawn.
    bool HasLeftover() const noexcept { return leftover_.has_value(); }

    // Give up the cursor and get the remaining stream back, starting with the
    // buffered chunk if there is one.
    Producer<Chunk, R> Release() && {
        Producer<Chunk, R> rest = result_ ? Producer<Chunk, R>::Return(std::move(*result_))
                                          : std::move(underlying_);
        if (leftover_) return Prepend(std::move(*leftover_), std::move(rest));
        return rest;
    }

private:
    Producer<Chunk, R> underlying_;
    std::optional<Chunk> leftover_;  // Never holds an empty chunk
    std::optional<R> result_;        // Set once underlying_ completed
};

}  // namespace byte_pipe
