#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>

namespace procd {

// Type aliases
using ProcessId = std::string;
using TimePoint = std::chrono::system_clock::time_point;

// Error types
enum class ErrorCode {
    Success = 0,
    NotFound,
    AlreadyRunning,
    NotRunning,
    KillFailed,
    Truncated,
    StillRunning,
    SpawnFailed,
    InvalidArgument,
    InvalidState,
    IOError,
    Timeout,
    OperationCancelled,
    ResourceExhausted,
    SubscriptionClosed,
    Unauthorized,
    Forbidden,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::NotFound: return "Process not found";
        case ErrorCode::AlreadyRunning: return "Process is already running";
        case ErrorCode::NotRunning: return "Process is not running";
        case ErrorCode::KillFailed: return "Signal delivery failed";
        case ErrorCode::Truncated: return "Requested output was evicted";
        case ErrorCode::StillRunning: return "Process is still running";
        case ErrorCode::SpawnFailed: return "Process spawn failed";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::IOError: return "I/O error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::ResourceExhausted: return "Resource exhausted";
        case ErrorCode::SubscriptionClosed: return "Subscription closed";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::Forbidden: return "Forbidden";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Stable identifier used on the wire ("NotFound", "Truncated", ...)
constexpr const char* errorName(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyRunning: return "AlreadyRunning";
        case ErrorCode::NotRunning: return "NotRunning";
        case ErrorCode::KillFailed: return "KillError";
        case ErrorCode::Truncated: return "Truncated";
        case ErrorCode::StillRunning: return "StillRunning";
        case ErrorCode::SpawnFailed: return "SpawnError";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::OperationCancelled: return "Cancelled";
        case ErrorCode::ResourceExhausted: return "ResourceExhausted";
        case ErrorCode::SubscriptionClosed: return "SubscriptionClosed";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::Forbidden: return "Forbidden";
        case ErrorCode::InternalError: return "InternalError";
        case ErrorCode::Unknown: return "Unknown";
    }
    return "Unknown";
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
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
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
            throw std::runtime_error("Result contains error: " + error_.message);
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

} // namespace procd

// fmt library support for ErrorCode (for spdlog)
#include <fmt/format.h>
template <> struct fmt::formatter<procd::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(procd::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", procd::errorToString(error));
    }
};
