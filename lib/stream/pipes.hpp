// SPDX-License-Identifier: MIT

// lib/stream/pipes.hpp
#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <type_traits>
#include <utility>
#include <vector>

#include "lib/stream/channel.hpp"
#include "lib/stream/chunk.hpp"

namespace byte_pipe {

// Byte predicate - e.g. [](std::byte b) { return b == std::byte{'\n'}; }
template <typename P>
concept BytePredicate = std::predicate<P&, std::byte>;

// Byte-to-byte transformation
template <typename F>
concept ByteTransform = std::is_invocable_r_v<std::byte, F&, std::byte>;

namespace detail {

// Result type of the producer a generic pipe lambda is applied to.
template <typename P>
using ResultOf = typename std::remove_cvref_t<P>::ResultType;

template <typename R, typename F>
class MapStage final : public IProducer<Chunk, R> {
public:
    MapStage(Producer<Chunk, R> upstream, F fn)
        : upstream_(std::move(upstream)), fn_(std::move(fn)) {}

    Step<Chunk, R> Next() override {
        auto step = upstream_.Next();
        if (step.IsDone()) return step;
        const Chunk& in = step.Value();
        std::vector<std::byte> out(in.Size());
        std::transform(in.begin(), in.end(), out.begin(),
                       [this](std::byte b) { return static_cast<std::byte>(fn_(b)); });
        return Step<Chunk, R>::Yield(Chunk(std::move(out)));
    }

private:
    Producer<Chunk, R> upstream_;
    F fn_;
};

template <typename R, typename F>
class ConcatMapStage final : public IProducer<Chunk, R> {
public:
    ConcatMapStage(Producer<Chunk, R> upstream, F fn)
        : upstream_(std::move(upstream)), fn_(std::move(fn)) {}

    Step<Chunk, R> Next() override {
        auto step = upstream_.Next();
        if (step.IsDone()) return step;
        std::vector<std::byte> out;
        out.reserve(step.Value().Size());
        for (std::byte b : step.Value()) {
            for (std::byte expanded : fn_(b)) {
                out.push_back(expanded);
            }
        }
        return Step<Chunk, R>::Yield(Chunk(std::move(out)));
    }

private:
    Producer<Chunk, R> upstream_;
    F fn_;
};

template <typename R>
class TakeStage final : public IProducer<Chunk, Done> {
public:
    TakeStage(Producer<Chunk, R> upstream, int64_t n)
        : upstream_(std::move(upstream)), remaining_(n) {}

    Step<Chunk, Done> Next() override {
        // Satisfied: stop demanding, even if upstream has more.
        if (remaining_ <= 0) return Step<Chunk, Done>::Return(Done{});

        auto step = upstream_.Next();
        if (step.IsDone()) return Step<Chunk, Done>::Return(Done{});

        Chunk& chunk = step.Value();
        auto len = static_cast<int64_t>(chunk.Size());
        if (len > remaining_) {
            Chunk prefix = chunk.Take(static_cast<size_t>(remaining_));
            remaining_ = 0;
            return Step<Chunk, Done>::Yield(std::move(prefix));
        }
        remaining_ -= len;
        return Step<Chunk, Done>::Yield(std::move(chunk));
    }

private:
    Producer<Chunk, R> upstream_;
    int64_t remaining_;
};

template <typename R>
class DropStage final : public IProducer<Chunk, R> {
public:
    DropStage(Producer<Chunk, R> upstream, int64_t n)
        : upstream_(std::move(upstream)), remaining_(n) {}

    Step<Chunk, R> Next() override {
        for (;;) {
            auto step = upstream_.Next();
            if (step.IsDone() || remaining_ <= 0) return step;

            const Chunk& chunk = step.Value();
            auto len = static_cast<int64_t>(chunk.Size());
            if (len >= remaining_) {
                // Straddling chunk: emit its suffix (empty on an exact fit)
                Chunk suffix = chunk.Drop(static_cast<size_t>(remaining_));
                remaining_ = 0;
                return Step<Chunk, R>::Yield(std::move(suffix));
            }
            remaining_ -= len;
        }
    }

private:
    Producer<Chunk, R> upstream_;
    int64_t remaining_;
};

template <typename R, typename P>
class TakeWhileStage final : public IProducer<Chunk, Done> {
public:
    TakeWhileStage(Producer<Chunk, R> upstream, P pred)
        : upstream_(std::move(upstream)), pred_(std::move(pred)) {}

    Step<Chunk, Done> Next() override {
        if (stopped_) return Step<Chunk, Done>::Return(Done{});

        auto step = upstream_.Next();
        if (step.IsDone()) return Step<Chunk, Done>::Return(Done{});

        Chunk& chunk = step.Value();
        auto it = std::find_if_not(chunk.begin(), chunk.end(), std::ref(pred_));
        if (it == chunk.end()) {
            return Step<Chunk, Done>::Yield(std::move(chunk));
        }
        stopped_ = true;
        return Step<Chunk, Done>::Yield(
            chunk.Take(static_cast<size_t>(it - chunk.begin())));
    }

private:
    Producer<Chunk, R> upstream_;
    P pred_;
    bool stopped_ = false;
};

template <typename R, typename P>
class DropWhileStage final : public IProducer<Chunk, R> {
public:
    DropWhileStage(Producer<Chunk, R> upstream, P pred)
        : upstream_(std::move(upstream)), pred_(std::move(pred)) {}

    Step<Chunk, R> Next() override {
        for (;;) {
            auto step = upstream_.Next();
            if (step.IsDone() || !dropping_) return step;

            const Chunk& chunk = step.Value();
            auto it = std::find_if_not(chunk.begin(), chunk.end(), std::ref(pred_));
            if (it == chunk.end()) continue;  // Whole chunk dropped

            dropping_ = false;
            return Step<Chunk, R>::Yield(
                chunk.Drop(static_cast<size_t>(it - chunk.begin())));
        }
    }

private:
    Producer<Chunk, R> upstream_;
    P pred_;
    bool dropping_ = true;
};

template <typename R, typename P>
class FilterStage final : public IProducer<Chunk, R> {
public:
    FilterStage(Producer<Chunk, R> upstream, P pred)
        : upstream_(std::move(upstream)), pred_(std::move(pred)) {}

    Step<Chunk, R> Next() override {
        auto step = upstream_.Next();
        if (step.IsDone()) return step;
        const Chunk& in = step.Value();
        std::vector<std::byte> out;
        out.reserve(in.Size());
        std::copy_if(in.begin(), in.end(), std::back_inserter(out), std::ref(pred_));
        // May be empty; empty chunks are passed on as-is.
        return Step<Chunk, R>::Yield(Chunk(std::move(out)));
    }

private:
    Producer<Chunk, R> upstream_;
    P pred_;
};

template <typename R, typename P>
class FindIndicesStage final : public IProducer<size_t, R> {
public:
    FindIndicesStage(Producer<Chunk, R> upstream, P pred)
        : upstream_(std::move(upstream)), pred_(std::move(pred)) {}

    Step<size_t, R> Next() override {
        for (;;) {
            if (next_ < pending_.size()) {
                return Step<size_t, R>::Yield(pending_[next_++]);
            }
            pending_.clear();
            next_ = 0;

            auto step = upstream_.Next();
            if (step.IsDone()) return Step<size_t, R>::Return(std::move(step.Result()));

            const Chunk& chunk = step.Value();
            for (size_t i = 0; i < chunk.Size(); ++i) {
                if (pred_(chunk[i])) pending_.push_back(offset_ + i);
            }
            offset_ += chunk.Size();
        }
    }

private:
    Producer<Chunk, R> upstream_;
    P pred_;
    size_t offset_ = 0;            // Absolute offset of the next chunk
    std::vector<size_t> pending_;  // Matches of the current chunk
    size_t next_ = 0;
};

template <typename R, typename F>
class ScanStage final : public IProducer<Chunk, R> {
public:
    ScanStage(Producer<Chunk, R> upstream, F fn, std::byte seed)
        : upstream_(std::move(upstream)), fn_(std::move(fn)), acc_(seed) {}

    Step<Chunk, R> Next() override {
        auto step = upstream_.Next();
        if (step.IsDone()) return step;
        const Chunk& in = step.Value();
        std::vector<std::byte> out;
        out.reserve(in.Size() + 1);
        out.push_back(acc_);
        for (std::byte b : in) {
            acc_ = static_cast<std::byte>(fn_(acc_, b));
            out.push_back(acc_);
        }
        return Step<Chunk, R>::Yield(Chunk(std::move(out)));
    }

private:
    Producer<Chunk, R> upstream_;
    F fn_;
    std::byte acc_;  // Last value of the previous chunk's scan
};

template <typename R>
class IntersperseStage final : public IProducer<Chunk, R> {
public:
    IntersperseStage(Producer<Chunk, R> upstream, std::byte separator)
        : upstream_(std::move(upstream)), separator_(separator) {}

    Step<Chunk, R> Next() override {
        auto step = upstream_.Next();
        if (step.IsDone() || step.Value().Empty()) return step;
        const Chunk& in = step.Value();
        std::vector<std::byte> out;
        out.reserve(in.Size() * 2);
        for (std::byte b : in) {
            if (seen_byte_) out.push_back(separator_);
            out.push_back(b);
            seen_byte_ = true;
        }
        return Step<Chunk, R>::Yield(Chunk(std::move(out)));
    }

private:
    Producer<Chunk, R> upstream_;
    std::byte separator_;
    bool seen_byte_ = false;
};

}  // namespace detail

/// Apply `fn` to every byte; chunk boundaries are unchanged.
template <ByteTransform F>
auto Map(F fn) {
    return PipeClosure([fn = std::move(fn)](auto upstream) {
        using R = detail::ResultOf<decltype(upstream)>;
        return Producer<Chunk, R>::template Make<detail::MapStage<R, F>>(
            std::move(upstream), fn);
    });
}

/// Replace every byte with the bytes of `fn(byte)` (any range of std::byte).
/// Each input chunk yields exactly one output chunk.
template <typename F>
auto ConcatMap(F fn) {
    return PipeClosure([fn = std::move(fn)](auto upstream) {
        using R = detail::ResultOf<decltype(upstream)>;
        return Producer<Chunk, R>::template Make<detail::ConcatMapStage<R, F>>(
            std::move(upstream), fn);
    });
}

/// Pass the first `n` bytes, then complete without demanding more.
/// `n <= 0` completes immediately.
inline auto Take(int64_t n) {
    return PipeClosure([n](auto upstream) {
        using R = detail::ResultOf<decltype(upstream)>;
        return Producer<Chunk, Done>::template Make<detail::TakeStage<R>>(
            std::move(upstream), n);
    });
}

/// Discard the first `n` bytes, pass everything after.
inline auto Drop(int64_t n) {
    return PipeClosure([n](auto upstream) {
        using R = detail::ResultOf<decltype(upstream)>;
        return Producer<Chunk, R>::template Make<detail::DropStage<R>>(
            std::move(upstream), n);
    });
}

/// Pass bytes until the first one failing `pred`, then complete.
template <BytePredicate P>
auto TakeWhile(P pred) {
    return PipeClosure([pred = std::move(pred)](auto upstream) {
        using R = detail::ResultOf<decltype(upstream)>;
        return Producer<Chunk, Done>::template Make<detail::TakeWhileStage<R, P>>(
            std::move(upstream), pred);
    });
}

/// Discard bytes while they satisfy `pred`, pass everything from the first
/// failing byte on.
template <BytePredicate P>
auto DropWhile(P pred) {
    return PipeClosure([pred = std::move(pred)](auto upstream) {
        using R = detail::ResultOf<decltype(upstream)>;
        return Producer<Chunk, R>::template Make<detail::DropWhileStage<R, P>>(
            std::move(upstream), pred);
    });
}

/// Keep only the bytes satisfying `pred`. Chunks with no surviving byte are
/// still emitted, as empty chunks.
template <BytePredicate P>
auto Filter(P pred) {
    return PipeClosure([pred = std::move(pred)](auto upstream) {
        using R = detail::ResultOf<decltype(upstream)>;
        return Producer<Chunk, R>::template Make<detail::FilterStage<R, P>>(
            std::move(upstream), pred);
    });
}

/// Stream of absolute offsets of the bytes satisfying `pred`.
template <BytePredicate P>
auto FindIndices(P pred) {
    return PipeClosure([pred = std::move(pred)](auto upstream) {
        using R = detail::ResultOf<decltype(upstream)>;
        return Producer<size_t, R>::template Make<detail::FindIndicesStage<R, P>>(
            std::move(upstream), pred);
    });
}

/// Stream of absolute offsets of the bytes equal to `value`.
inline auto ElemIndices(std::byte value) {
    return FindIndices([value](std::byte b) { return b == value; });
}

/// Left scan over the bytes. Each input chunk yields one output chunk that
/// starts with the running value and then holds one accumulated value per
/// input byte. The running value carries over from chunk to chunk.
template <typename F>
    requires std::is_invocable_r_v<std::byte, F&, std::byte, std::byte>
auto Scan(F fn, std::byte seed) {
    return PipeClosure([fn = std::move(fn), seed](auto upstream) {
        using R = detail::ResultOf<decltype(upstream)>;
        return Producer<Chunk, R>::template Make<detail::ScanStage<R, F>>(
            std::move(upstream), fn, seed);
    });
}

/// Insert `separator` between every pair of adjacent bytes of the flattened
/// stream, including pairs that straddle a chunk boundary.
inline auto Intersperse(std::byte separator) {
    return PipeClosure([separator](auto upstream) {
        using R = detail::ResultOf<decltype(upstream)>;
        return Producer<Chunk, R>::template Make<detail::IntersperseStage<R>>(
            std::move(upstream), separator);
    });
}

}  // namespace byte_pipe
