// SPDX-License-Identifier: MIT

// lib/stream/source.cpp
#include "lib/stream/source.hpp"

#include <utility>

namespace byte_pipe {

namespace {

class SourceProducer final : public IProducer<Chunk, Done> {
public:
    SourceProducer(std::shared_ptr<IChunkSource> source, size_t chunk_size)
        : source_(std::move(source)), chunk_size_(chunk_size) {}

    Step<Chunk, Done> Next() override {
        if (source_->IsAtEnd()) return Step<Chunk, Done>::Return(Done{});
        return Step<Chunk, Done>::Yield(source_->ReadChunk(chunk_size_));
    }

private:
    std::shared_ptr<IChunkSource> source_;
    size_t chunk_size_;
};

class SourceServer final : public IServer<size_t, Chunk, Done> {
public:
    explicit SourceServer(std::shared_ptr<IChunkSource> source)
        : source_(std::move(source)) {}

    Step<Chunk, Done> Serve(size_t size_hint) override {
        if (source_->IsAtEnd()) return Step<Chunk, Done>::Return(Done{});
        return Step<Chunk, Done>::Yield(source_->ReadChunk(size_hint));
    }

private:
    std::shared_ptr<IChunkSource> source_;
};

}  // namespace

Producer<Chunk> FromSource(std::shared_ptr<IChunkSource> source, size_t chunk_size) {
    return Producer<Chunk>::Make<SourceProducer>(std::move(source), chunk_size);
}

Server<size_t, Chunk> ServeSource(std::shared_ptr<IChunkSource> source) {
    return Server<size_t, Chunk>::Make<SourceServer>(std::move(source));
}

}  // namespace byte_pipe
