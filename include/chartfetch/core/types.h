#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace chartfetch {

// Type aliases
using ChartId = std::string;
using HexDigest = std::string;
using TimePoint = std::chrono::system_clock::time_point;

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    NetworkError,
    Timeout,
    ServerError,
    HttpError,
    StorageFull,
    SizeMismatch,
    HashMismatch,
    IoError,
    FileNotFound,
    CorruptedData,
    InvalidData,
    InvalidState,
    NotFound,
    OperationCancelled,
    OperationInProgress,
    NotInitialized,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::ServerError: return "Server error";
        case ErrorCode::HttpError: return "HTTP error";
        case ErrorCode::StorageFull: return "Insufficient disk space";
        case ErrorCode::SizeMismatch: return "Size mismatch";
        case ErrorCode::HashMismatch: return "Checksum mismatch";
        case ErrorCode::IoError: return "I/O error";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::CorruptedData: return "Corrupted data";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::OperationInProgress: return "Operation in progress";
        case ErrorCode::NotInitialized: return "Not initialized";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

/**
 * Telemetry category for a terminal failure. These strings are the keys of
 * MetricsSnapshot::failureByCategory.
 */
constexpr const char* failureCategory(ErrorCode error) {
    switch (error) {
        case ErrorCode::NetworkError: return "network";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::ServerError: return "server";
        case ErrorCode::HttpError: return "http";
        case ErrorCode::StorageFull: return "disk";
        case ErrorCode::SizeMismatch: return "size";
        case ErrorCode::HashMismatch: return "checksum";
        case ErrorCode::OperationCancelled: return "cancelled";
        case ErrorCode::IoError:
        case ErrorCode::FileNotFound: return "io";
        default: return "unknown";
    }
}

// Transient failures are absorbed by the retry loop; everything else is terminal.
constexpr bool isRetryable(ErrorCode error) {
    return error == ErrorCode::NetworkError || error == ErrorCode::Timeout ||
           error == ErrorCode::ServerError;
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace chartfetch

// fmt library support for ErrorCode (for spdlog)
#if defined(SPDLOG_FMT_EXTERNAL) || defined(FMT_VERSION)
#include <fmt/format.h>
template <> struct fmt::formatter<chartfetch::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(chartfetch::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", chartfetch::errorToString(error));
    }
};
#endif

namespace chartfetch {

// Common constants
inline constexpr std::size_t SHA256_HEX_SIZE = 64;
inline constexpr std::size_t DEFAULT_BUFFER_SIZE = 64 * 1024; // 64KB

} // namespace chartfetch
