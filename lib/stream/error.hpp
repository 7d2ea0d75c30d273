// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace byte_pipe {

/// Error codes raised by source and sink adapters.
///
/// The stream core has no failure outcome of its own: a stream either yields
/// a chunk or completes. These codes classify failures of the medium behind
/// an adapter and misuse of adapter APIs.
enum class ErrorCode {
    // I/O
    OpenFailed,        ///< open() on a path failed
    ReadFailed,        ///< read() on the underlying descriptor failed
    WriteFailed,       ///< write() on the underlying descriptor failed
    CloseFailed,       ///< close() on an owned descriptor failed

    // Usage
    InvalidArgument,   ///< Argument outside the accepted domain
    InvalidState,      ///< Method called in wrong adapter state
};

/// Error payload carried by StreamError.
struct Error {
    ErrorCode code;                ///< Classified error code
    std::string message;           ///< Human-readable description
    int os_errno = 0;              ///< OS errno if applicable, 0 otherwise
};

/// Return a short category string for an error code (e.g. "io", "usage").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::OpenFailed:
        case ErrorCode::ReadFailed:
        case ErrorCode::WriteFailed:
        case ErrorCode::CloseFailed:
            return "io";
        case ErrorCode::InvalidArgument:
        case ErrorCode::InvalidState:
            return "usage";
    }
    return "unknown";
}

/// Exception thrown by adapters when the underlying medium fails.
///
/// Nothing in the stream core catches it: a failing source or sink aborts
/// the whole running composition.
class StreamError : public std::runtime_error {
public:
    explicit StreamError(Error error)
        : std::runtime_error(error.message), error_(std::move(error)) {}

    const Error& error() const noexcept { return error_; }
    ErrorCode code() const noexcept { return error_.code; }

private:
    Error error_;
};

}  // namespace byte_pipe
