#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace dlkit {

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    NotFound,
    PermissionDenied,
    IoError,
    NetworkError,
    Timeout,
    OperationCancelled,
    ContentLengthMismatch,
    ChecksumMismatch,
    SystemShutdown,
    InvalidState,
    InternalError,
    NotSupported,
    MultipleErrors,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::IoError: return "I/O error";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::ContentLengthMismatch: return "Content length mismatch";
        case ErrorCode::ChecksumMismatch: return "Checksum mismatch";
        case ErrorCode::SystemShutdown: return "System shutdown";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::MultipleErrors: return "Multiple errors";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Error struct for detailed error information.
// `causes` holds wrapped or joined errors; see errorIs().
struct Error {
    ErrorCode code;
    std::string message;
    std::vector<Error> causes;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}
    Error(ErrorCode c, std::string msg, std::vector<Error> inner)
        : code(c), message(std::move(msg)), causes(std::move(inner)) {}

    bool operator==(ErrorCode c) const { return code == c; }

    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }

    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Returns a copy of `err` whose message is prefixed with `context`. The code is kept and the
// original error becomes the single cause.
inline Error wrapError(std::string_view context, const Error& err) {
    return Error{err.code, std::string(context) + ": " + err.message, {err}};
}

// True if `err` or any of its causes carries `code`.
inline bool errorIs(const Error& err, ErrorCode code) {
    if (err.code == code) {
        return true;
    }
    for (const auto& cause : err.causes) {
        if (errorIs(cause, code)) {
            return true;
        }
    }
    return false;
}

// True if `err` or any of its causes has the same code and message as `target`.
inline bool errorIs(const Error& err, const Error& target) {
    if (err.code == target.code && err.message == target.message) {
        return true;
    }
    for (const auto& cause : err.causes) {
        if (errorIs(cause, target)) {
            return true;
        }
    }
    return false;
}

// Joins errors into one. Empty input yields Success, a single error is returned as is.
inline Error joinErrors(std::vector<Error> errors) {
    if (errors.empty()) {
        return Error{};
    }
    if (errors.size() == 1) {
        return std::move(errors.front());
    }
    std::string message;
    for (const auto& e : errors) {
        if (!message.empty()) {
            message.push_back('\n');
        }
        message += e.message;
    }
    return Error{ErrorCode::MultipleErrors, std::move(message), std::move(errors)};
}

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

// Common constants
inline constexpr std::size_t DEFAULT_BUFFER_SIZE = 64 * 1024; // 64KB

} // namespace dlkit

// fmt library support for ErrorCode (for spdlog)
#include <fmt/format.h>
template <> struct fmt::formatter<dlkit::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(dlkit::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", dlkit::errorToString(error));
    }
};
