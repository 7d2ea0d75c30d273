// SPDX-License-Identifier: MIT

// lib/stream/channel.hpp
#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace byte_pipe {

/// Terminal value of a stream that completes without a result.
struct Done {
    friend bool operator==(Done, Done) noexcept { return true; }
};

/// Outcome of a single pull from a stream: a yielded value, or the terminal
/// value the stream completed with.
///
/// Index-based storage, so T and R may be the same type.
template <typename T, typename R>
class Step {
public:
    static Step Yield(T value) {
        return Step(std::in_place_index<0>, std::move(value));
    }

    static Step Return(R result) {
        return Step(std::in_place_index<1>, std::move(result));
    }

    bool IsDone() const noexcept { return state_.index() == 1; }

    T& Value() { return std::get<0>(state_); }
    const T& Value() const { return std::get<0>(state_); }

    R& Result() { return std::get<1>(state_); }
    const R& Result() const { return std::get<1>(state_); }

private:
    template <size_t I, typename V>
    Step(std::in_place_index_t<I> tag, V&& v) : state_(tag, std::forward<V>(v)) {}

    std::variant<T, R> state_;
};

/// Emitting side of a stream channel.
///
/// Each Next() call is one demand from downstream: the implementation runs
/// until it can hand over one value, or until it completes. Between calls the
/// producer is suspended, so at most one value is ever in flight.
template <typename T, typename R>
class IProducer {
public:
    virtual ~IProducer() = default;

    /// Produce the next value or the terminal value. Never called again after
    /// a terminal step has been returned.
    virtual Step<T, R> Next() = 0;
};

/// Emitting side of a size-negotiated channel: every demand carries a
/// request (e.g. a chunk size hint) that the server uses for that step.
template <typename Req, typename T, typename R>
class IServer {
public:
    virtual ~IServer() = default;

    virtual Step<T, R> Serve(Req request) = 0;
};

namespace detail {

template <typename T, typename R>
class FunctionProducer final : public IProducer<T, R> {
public:
    explicit FunctionProducer(std::move_only_function<Step<T, R>()> fn)
        : fn_(std::move(fn)) {}

    Step<T, R> Next() override { return fn_(); }

private:
    std::move_only_function<Step<T, R>()> fn_;
};

template <typename T, typename R>
class ReturnProducer final : public IProducer<T, R> {
public:
    explicit ReturnProducer(R result) : result_(std::move(result)) {}

    Step<T, R> Next() override { return Step<T, R>::Return(std::move(result_)); }

private:
    R result_;
};

template <typename Req, typename T, typename R>
class FunctionServer final : public IServer<Req, T, R> {
public:
    explicit FunctionServer(std::move_only_function<Step<T, R>(Req)> fn)
        : fn_(std::move(fn)) {}

    Step<T, R> Serve(Req request) override { return fn_(std::move(request)); }

private:
    std::move_only_function<Step<T, R>(Req)> fn_;
};

}  // namespace detail

/// Single-use, move-only handle to a running stream of T ending in R.
///
/// A Producer is constructed once and driven to completion or abandonment.
/// Dropping it abandons the remainder: the stages it owns are destroyed
/// without being drained.
template <typename T, typename R = Done>
class Producer {
public:
    using ValueType = T;
    using ResultType = R;
    using StepType = Step<T, R>;

    explicit Producer(std::unique_ptr<IProducer<T, R>> impl) : impl_(std::move(impl)) {}

    Producer(Producer&&) noexcept = default;
    Producer& operator=(Producer&&) noexcept = default;
    Producer(const Producer&) = delete;
    Producer& operator=(const Producer&) = delete;

    template <typename Impl, typename... Args>
    static Producer Make(Args&&... args) {
        return Producer(std::make_unique<Impl>(std::forward<Args>(args)...));
    }

    /// Producer driven by a callable; each call is one step.
    static Producer FromFunction(std::move_only_function<Step<T, R>()> fn) {
        return Make<detail::FunctionProducer<T, R>>(std::move(fn));
    }

    /// Producer that completes immediately with `result`.
    static Producer Return(R result) {
        return Make<detail::ReturnProducer<T, R>>(std::move(result));
    }

    /// Demand the next value.
    /// @throws std::logic_error if the stream already completed.
    Step<T, R> Next() {
        if (!impl_) {
            throw std::logic_error("Producer::Next() called on a completed stream");
        }
        auto step = impl_->Next();
        if (step.IsDone()) impl_.reset();
        return step;
    }

    /// True once the terminal value has been handed out (or after move).
    bool IsComplete() const noexcept { return impl_ == nullptr; }

private:
    std::unique_ptr<IProducer<T, R>> impl_;
};

/// Single-use handle to a size-negotiated stream.
template <typename Req, typename T, typename R = Done>
class Server {
public:
    using RequestType = Req;
    using ValueType = T;
    using ResultType = R;

    explicit Server(std::unique_ptr<IServer<Req, T, R>> impl) : impl_(std::move(impl)) {}

    Server(Server&&) noexcept = default;
    Server& operator=(Server&&) noexcept = default;
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    template <typename Impl, typename... Args>
    static Server Make(Args&&... args) {
        return Server(std::make_unique<Impl>(std::forward<Args>(args)...));
    }

    static Server FromFunction(std::move_only_function<Step<T, R>(Req)> fn) {
        return Make<detail::FunctionServer<Req, T, R>>(std::move(fn));
    }

    /// Demand the next value, renegotiating the request for this step.
    /// @throws std::logic_error if the stream already completed.
    Step<T, R> Serve(Req request) {
        if (!impl_) {
            throw std::logic_error("Server::Serve() called on a completed stream");
        }
        auto step = impl_->Serve(std::move(request));
        if (step.IsDone()) impl_.reset();
        return step;
    }

    bool IsComplete() const noexcept { return impl_ == nullptr; }

private:
    std::unique_ptr<IServer<Req, T, R>> impl_;
};

namespace detail {

template <typename T, typename R>
class EachProducer final : public IProducer<T, R> {
public:
    EachProducer(std::vector<T> values, R result)
        : values_(std::move(values)), result_(std::move(result)) {}

    Step<T, R> Next() override {
        if (next_ < values_.size()) {
            return Step<T, R>::Yield(std::move(values_[next_++]));
        }
        return Step<T, R>::Return(std::move(result_));
    }

private:
    std::vector<T> values_;
    size_t next_ = 0;
    R result_;
};

template <typename T, typename R>
class PrependProducer final : public IProducer<T, R> {
public:
    PrependProducer(T head, Producer<T, R> rest)
        : head_(std::move(head)), rest_(std::move(rest)) {}

    Step<T, R> Next() override {
        if (head_) {
            auto step = Step<T, R>::Yield(std::move(*head_));
            head_.reset();
            return step;
        }
        return rest_.Next();
    }

private:
    std::optional<T> head_;
    Producer<T, R> rest_;
};

template <typename T, typename R, typename R2, typename F>
class MapResultProducer final : public IProducer<T, R2> {
public:
    MapResultProducer(Producer<T, R> upstream, F fn)
        : upstream_(std::move(upstream)), fn_(std::move(fn)) {}

    Step<T, R2> Next() override {
        auto step = upstream_.Next();
        if (step.IsDone()) {
            return Step<T, R2>::Return(std::invoke(fn_, std::move(step.Result())));
        }
        return Step<T, R2>::Yield(std::move(step.Value()));
    }

private:
    Producer<T, R> upstream_;
    F fn_;
};

template <typename Req, typename T, typename R>
class FixedRequestProducer final : public IProducer<T, R> {
public:
    FixedRequestProducer(Server<Req, T, R> server, Req request)
        : server_(std::move(server)), request_(std::move(request)) {}

    Step<T, R> Next() override { return server_.Serve(request_); }

private:
    Server<Req, T, R> server_;
    Req request_;
};

// Drives a server with a request recomputed from each value it produced.
template <typename Req, typename T, typename R>
class NegotiatingProducer final : public IProducer<T, R> {
public:
    using NextRequest = std::move_only_function<Req(const T&)>;

    NegotiatingProducer(Server<Req, T, R> server, Req first, NextRequest next)
        : server_(std::move(server)), request_(std::move(first)), next_(std::move(next)) {}

    Step<T, R> Next() override {
        auto step = server_.Serve(request_);
        if (!step.IsDone()) request_ = next_(step.Value());
        return step;
    }

private:
    Server<Req, T, R> server_;
    Req request_;
    NextRequest next_;
};

}  // namespace detail

/// Stream that yields every element of `values`, then completes with `result`.
template <typename T, typename R = Done>
Producer<T, R> Each(std::vector<T> values, R result = R{}) {
    return Producer<T, R>::template Make<detail::EachProducer<T, R>>(
        std::move(values), std::move(result));
}

/// Stream that yields `head` and then everything `rest` yields.
template <typename T, typename R>
Producer<T, R> Prepend(T head, Producer<T, R> rest) {
    return Producer<T, R>::template Make<detail::PrependProducer<T, R>>(
        std::move(head), std::move(rest));
}

/// Same values as `upstream`; the terminal value is passed through `fn`.
template <typename T, typename R, typename F>
    requires std::invocable<F&, R&&>
auto MapResult(Producer<T, R> upstream, F fn) {
    using R2 = std::invoke_result_t<F&, R&&>;
    return Producer<T, R2>::template Make<detail::MapResultProducer<T, R, R2, F>>(
        std::move(upstream), std::move(fn));
}

/// Serve every demand with the same request.
template <typename Req, typename T, typename R>
Producer<T, R> Request(Server<Req, T, R> server, Req request) {
    return Producer<T, R>::template Make<detail::FixedRequestProducer<Req, T, R>>(
        std::move(server), std::move(request));
}

/// Serve the first demand with `first`, and every later demand with the
/// request `next` derives from the previously produced value.
template <typename Req, typename T, typename R>
Producer<T, R> Negotiate(Server<Req, T, R> server, Req first,
                         std::type_identity_t<std::move_only_function<Req(const T&)>> next) {
    return Producer<T, R>::template Make<detail::NegotiatingProducer<Req, T, R>>(
        std::move(server), std::move(first), std::move(next));
}

// Consumer interface - demanding end of a composition
template <typename C, typename T>
concept Consumer = requires(C& c, T value) {
    { c.Accept(std::move(value)) } -> std::same_as<void>;
};

/// Pull every value from `producer` into `consumer`; returns the producer's
/// terminal value.
template <typename T, typename R, Consumer<T> C>
R Run(Producer<T, R> producer, C& consumer) {
    for (;;) {
        auto step = producer.Next();
        if (step.IsDone()) return std::move(step.Result());
        consumer.Accept(std::move(step.Value()));
    }
}

/// Run with a callable as the consumer.
template <typename T, typename R, typename F>
    requires std::invocable<F&, T&&>
R ForEach(Producer<T, R> producer, F fn) {
    for (;;) {
        auto step = producer.Next();
        if (step.IsDone()) return std::move(step.Result());
        std::invoke(fn, std::move(step.Value()));
    }
}

/// Pipe stage: a transformation from one producer into another, composed
/// with operator|.
template <typename Fn>
class PipeClosure {
public:
    explicit PipeClosure(Fn fn) : fn_(std::move(fn)) {}

    template <typename T, typename R>
    auto operator()(Producer<T, R> upstream) const {
        return fn_(std::move(upstream));
    }

private:
    Fn fn_;
};

// producer | pipe
template <typename T, typename R, typename Fn>
auto operator|(Producer<T, R> upstream, const PipeClosure<Fn>& pipe) {
    return pipe(std::move(upstream));
}

// pipe | pipe - associative: (p | a) | b and p | (a | b) build the same chain
template <typename F, typename G>
auto operator|(PipeClosure<F> first, PipeClosure<G> second) {
    return PipeClosure([first = std::move(first), second = std::move(second)](auto upstream) {
        return second(first(std::move(upstream)));
    });
}

/// Identity stage.
inline auto Cat() {
    return PipeClosure([](auto upstream) { return upstream; });
}

}  // namespace byte_pipe
