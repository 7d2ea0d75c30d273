// SPDX-License-Identifier: MIT

// lib/stream/grouped.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "lib/stream/channel.hpp"
#include "lib/stream/chunk.hpp"
#include "lib/stream/split.hpp"

namespace byte_pipe {

/// Lazy, forward-only sequence of sub-streams sharing one terminal value R.
///
/// Next() yields either R (no more groups) or the next group: a producer of
/// chunks whose own terminal value is the rest of the sequence. A group must
/// be drained before the sequence can advance, so nothing is preloaded.
/// Single-pass; replaying needs a replayable source underneath.
template <typename R>
class GroupedStream {
public:
    using Group = Producer<Chunk, GroupedStream>;
    using StepType = Step<Group, R>;
    using Unfold = std::move_only_function<StepType()>;

    explicit GroupedStream(Unfold unfold) : unfold_(std::move(unfold)) {}

    GroupedStream(GroupedStream&&) noexcept = default;
    GroupedStream& operator=(GroupedStream&&) noexcept = default;

    /// Sequence with no groups, ending in `result`.
    static GroupedStream Return(R result) {
        return GroupedStream([result = std::move(result)]() mutable {
            return StepType::Return(std::move(result));
        });
    }

    /// Advance to the next group or the terminal value.
    /// @throws std::logic_error if called twice on the same sequence.
    StepType Next() {
        if (!unfold_) {
            throw std::logic_error("GroupedStream::Next() called twice");
        }
        Unfold unfold = std::move(unfold_);
        unfold_ = nullptr;
        return unfold();
    }

private:
    Unfold unfold_;
};

namespace detail {

template <typename R>
GroupedStream<R> LaterGroups(Producer<Chunk, R> rest, int64_t n);

// One group of at most n bytes; its continuation holds the groups after it.
template <typename R>
typename GroupedStream<R>::Group BoundedGroup(Producer<Chunk, R> upstream, int64_t n) {
    return MapResult(SplitAt(std::move(upstream), n), [n](SplitOutcome<R> outcome) {
        if (outcome.IsExhausted()) {
            return GroupedStream<R>::Return(std::move(outcome.Result()));
        }
        return LaterGroups(std::move(outcome.Rest()), n);
    });
}

// Groups after a full one. A group is only started once a non-empty chunk
// is pulled, so a stream ending on a group boundary completes with R.
template <typename R>
GroupedStream<R> LaterGroups(Producer<Chunk, R> rest, int64_t n) {
    using StepType = typename GroupedStream<R>::StepType;
    return GroupedStream<R>([rest = std::move(rest), n]() mutable {
        for (;;) {
            auto step = rest.Next();
            if (step.IsDone()) return StepType::Return(std::move(step.Result()));
            if (step.Value().Empty()) continue;
            return StepType::Yield(
                BoundedGroup(Prepend(std::move(step.Value()), std::move(rest)), n));
        }
    });
}

}  // namespace detail

/// Split `upstream` into groups of at most `n` bytes each.
///
/// Always yields at least one group, so an empty stream gives one empty
/// group. Later groups are never empty: a stream whose length is a multiple
/// of `n` ends with a full group. The continuation of the last group ends in
/// upstream's R.
/// @throws std::invalid_argument if n <= 0.
template <typename R>
GroupedStream<R> ChunksOf(Producer<Chunk, R> upstream, int64_t n) {
    if (n <= 0) {
        throw std::invalid_argument(
            fmt::format("ChunksOf: group size must be positive, got {}", n));
    }
    return GroupedStream<R>([upstream = std::move(upstream), n]() mutable {
        return GroupedStream<R>::StepType::Yield(
            detail::BoundedGroup(std::move(upstream), n));
    });
}

/// Factory for a replayable separator stream; called once per gap.
using SeparatorFactory = std::function<Producer<Chunk, Done>()>;

namespace detail {

template <typename R>
class IntercalateStage final : public IProducer<Chunk, R> {
public:
    using Group = typename GroupedStream<R>::Group;

    IntercalateStage(GroupedStream<R> groups, SeparatorFactory separator)
        : pending_(std::move(groups)), make_separator_(std::move(separator)) {}

    Step<Chunk, R> Next() override {
        for (;;) {
            if (separator_) {
                auto step = separator_->Next();
                if (!step.IsDone()) return Step<Chunk, R>::Yield(std::move(step.Value()));
                separator_.reset();
                continue;
            }

            if (group_) {
                auto step = group_->Next();
                if (!step.IsDone()) return Step<Chunk, R>::Yield(std::move(step.Value()));
                pending_.emplace(std::move(step.Result()));
                group_.reset();
                continue;
            }

            auto step = pending_->Next();
            pending_.reset();
            if (step.IsDone()) return Step<Chunk, R>::Return(std::move(step.Result()));

            // Separator only once another group is known to exist
            group_.emplace(std::move(step.Value()));
            if (!first_group_ && make_separator_) separator_.emplace(make_separator_());
            first_group_ = false;
        }
    }

private:
    std::optional<GroupedStream<R>> pending_;  // Rest of the sequence
    std::optional<Group> group_;               // Group being drained
    std::optional<Producer<Chunk, Done>> separator_;
    SeparatorFactory make_separator_;
    bool first_group_ = true;
};

}  // namespace detail

/// Flatten `groups` into one stream, replaying the separator between every
/// pair of adjacent groups (never before the first or after the last).
template <typename R>
Producer<Chunk, R> Intercalate(GroupedStream<R> groups, SeparatorFactory separator) {
    return Producer<Chunk, R>::template Make<detail::IntercalateStage<R>>(
        std::move(groups), std::move(separator));
}

/// Intercalate with a fixed separator chunk.
template <typename R>
Producer<Chunk, R> Intercalate(GroupedStream<R> groups, Chunk separator) {
    return Intercalate(std::move(groups), SeparatorFactory([separator] {
        return Each(std::vector<Chunk>{separator});
    }));
}

/// Flatten `groups` with nothing in between.
template <typename R>
Producer<Chunk, R> Concat(GroupedStream<R> groups) {
    return Intercalate(std::move(groups), SeparatorFactory{});
}

}  // namespace byte_pipe
