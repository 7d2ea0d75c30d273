// SPDX-License-Identifier: MIT

// lib/stream/split.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <variant>

#include "lib/stream/channel.hpp"
#include "lib/stream/chunk.hpp"

namespace byte_pipe {

/// Terminal value of a split prefix.
///
/// Either the stream ran out before the split point (Exhausted, carrying the
/// stream's own terminal value) or it did not (Remaining, carrying a
/// continuation that yields exactly the bytes after the split point).
template <typename R>
class SplitOutcome {
public:
    static SplitOutcome Exhausted(R result) {
        return SplitOutcome(std::in_place_index<0>, std::move(result));
    }

    static SplitOutcome Remaining(Producer<Chunk, R> rest) {
        return SplitOutcome(std::in_place_index<1>, std::move(rest));
    }

    bool IsExhausted() const noexcept { return state_.index() == 0; }

    R& Result() { return std::get<0>(state_); }
    Producer<Chunk, R>& Rest() { return std::get<1>(state_); }

private:
    template <size_t I, typename V>
    SplitOutcome(std::in_place_index_t<I> tag, V&& v) : state_(tag, std::forward<V>(v)) {}

    std::variant<R, Producer<Chunk, R>> state_;
};

namespace detail {

template <typename R>
class SplitStage final : public IProducer<Chunk, SplitOutcome<R>> {
public:
    using Outcome = SplitOutcome<R>;

    SplitStage(Producer<Chunk, R> upstream, int64_t n)
        : upstream_(std::move(upstream)), remaining_(n) {}

    Step<Chunk, Outcome> Next() override {
        if (remaining_ <= 0) {
            // Budget spent: hand back the untouched remainder
            if (suffix_) {
                auto rest = Prepend(std::move(*suffix_), std::move(upstream_));
                return Step<Chunk, Outcome>::Return(Outcome::Remaining(std::move(rest)));
            }
            return Step<Chunk, Outcome>::Return(Outcome::Remaining(std::move(upstream_)));
        }

        auto step = upstream_.Next();
        if (step.IsDone()) {
            return Step<Chunk, Outcome>::Return(Outcome::Exhausted(std::move(step.Result())));
        }

        Chunk& chunk = step.Value();
        auto len = static_cast<int64_t>(chunk.Size());
        if (len <= remaining_) {
            remaining_ -= len;
            return Step<Chunk, Outcome>::Yield(std::move(chunk));
        }

        auto [prefix, suffix] = chunk.SplitAt(static_cast<size_t>(remaining_));
        suffix_ = std::move(suffix);
        remaining_ = 0;
        return Step<Chunk, Outcome>::Yield(std::move(prefix));
    }

private:
    Producer<Chunk, R> upstream_;
    int64_t remaining_;
    std::optional<Chunk> suffix_;  // Part of the straddling chunk past the split
};

}  // namespace detail

/// Split `upstream` after `n` bytes.
///
/// The returned producer re-emits chunks verbatim up to the split point,
/// splitting the one chunk that straddles it. `n <= 0` pulls nothing and
/// returns the untouched stream as the continuation.
template <typename R>
Producer<Chunk, SplitOutcome<R>> SplitAt(Producer<Chunk, R> upstream, int64_t n) {
    return Producer<Chunk, SplitOutcome<R>>::template Make<detail::SplitStage<R>>(
        std::move(upstream), n);
}

}  // namespace byte_pipe
