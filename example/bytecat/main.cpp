// SPDX-License-Identifier: MIT

// example/bytecat/main.cpp
//
// Copy a file (or standard input) to standard output through an optional
// byte pipeline:
//
//   bytecat [--drop N] [--take N] [--group N --sep STR]
//           [--chunk-size N] [--exact] [--verbose] [FILE]
//
// Stages run in the order drop, take, group; --sep is inserted between
// groups of N bytes.
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "lib/stream/error.hpp"
#include "lib/stream/fd_io.hpp"
#include "lib/stream/grouped.hpp"
#include "lib/stream/pipes.hpp"
#include "lib/stream/source.hpp"

using namespace byte_pipe;

namespace {

struct Options {
    std::optional<int64_t> drop;
    std::optional<int64_t> take;
    std::optional<int64_t> group;
    std::string separator;
    SourceConfig source = SourceConfig::Defaults();
    bool verbose = false;
    std::string path;  // Empty for standard input
};

[[noreturn]] void Usage(std::string_view message) {
    throw StreamError(Error{ErrorCode::InvalidArgument, std::string(message)});
}

int64_t ParseCount(std::string_view flag, std::string_view text) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value < 0) {
        Usage(fmt::format("{} expects a non-negative integer, got '{}'", flag, text));
    }
    return value;
}

Options ParseArgs(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto value = [&]() -> std::string_view {
            if (i + 1 >= argc) Usage(fmt::format("{} requires a value", arg));
            return argv[++i];
        };

        if (arg == "--drop") {
            opts.drop = ParseCount(arg, value());
        } else if (arg == "--take") {
            opts.take = ParseCount(arg, value());
        } else if (arg == "--group") {
            opts.group = ParseCount(arg, value());
            if (*opts.group == 0) Usage("--group expects a positive size");
        } else if (arg == "--sep") {
            opts.separator = value();
        } else if (arg == "--chunk-size") {
            opts.source.chunk_size = static_cast<size_t>(ParseCount(arg, value()));
            if (opts.source.chunk_size == 0) Usage("--chunk-size expects a positive size");
        } else if (arg == "--exact") {
            opts.source.read_mode = ReadMode::Exact;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (!arg.empty() && arg.front() == '-' && arg != "-") {
            Usage(fmt::format("unknown option '{}'", arg));
        } else if (opts.path.empty()) {
            opts.path = arg == "-" ? "" : std::string(arg);
        } else {
            Usage("at most one input file");
        }
    }
    if (!opts.separator.empty() && !opts.group) {
        Usage("--sep requires --group");
    }
    return opts;
}

Producer<Chunk> BuildPipeline(const Options& opts) {
    Producer<Chunk> stream = opts.path.empty() ? Stdin(opts.source)
                                               : FromFile(opts.path, opts.source);
    if (opts.drop) stream = std::move(stream) | Drop(*opts.drop);
    if (opts.take) stream = std::move(stream) | Take(*opts.take);
    if (opts.group) {
        stream = Intercalate(ChunksOf(std::move(stream), *opts.group),
                             Chunk::FromString(opts.separator));
    }
    return stream;
}

}  // namespace

int main(int argc, char** argv) {
    // Standard output carries the data
    spdlog::set_default_logger(spdlog::stderr_color_mt("bytecat"));

    try {
        Options opts = ParseArgs(argc, argv);
        spdlog::set_level(opts.verbose ? spdlog::level::debug : spdlog::level::warn);
        spdlog::debug("bytecat: input={} chunk_size={}",
                      opts.path.empty() ? "<stdin>" : opts.path, opts.source.chunk_size);

        auto out = StdoutSink();
        ToSink(BuildPipeline(opts), *out);
        return 0;
    } catch (const StreamError& e) {
        spdlog::error("bytecat: {} ({})", e.what(), error_category(e.code()));
        if (e.code() == ErrorCode::InvalidArgument) {
            std::fputs("usage: bytecat [--drop N] [--take N] [--group N --sep STR]\n"
                       "               [--chunk-size N] [--exact] [--verbose] [FILE]\n",
                       stderr);
            return 2;
        }
        return 1;
    }
}
