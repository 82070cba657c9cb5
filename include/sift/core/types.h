#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace sift {

// Error types
enum class ErrorCode {
    Success = 0,
    MissingParameter,
    InvalidPattern,
    PathNotFound,
    PermissionDenied,
    InvalidArgument,
    UnsupportedAction,
    InvalidRequest,
    IoError,
    DecodeError,
    NotFound,
    InternalError
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::MissingParameter: return "Missing parameter";
        case ErrorCode::InvalidPattern: return "Invalid pattern";
        case ErrorCode::PathNotFound: return "Path not found";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::UnsupportedAction: return "Unsupported action";
        case ErrorCode::InvalidRequest: return "Invalid request";
        case ErrorCode::IoError: return "I/O error";
        case ErrorCode::DecodeError: return "Decode error";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::InternalError: return "Internal error";
    }
    return "Unknown error";
}

// Stable kind name carried in the "error_code" field of a response
constexpr const char* errorKindName(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::MissingParameter: return "MissingParameter";
        case ErrorCode::InvalidPattern: return "InvalidPattern";
        case ErrorCode::PathNotFound: return "PathNotFound";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::UnsupportedAction: return "UnsupportedAction";
        case ErrorCode::InvalidRequest: return "InvalidRequest";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::DecodeError: return "DecodeError";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InternalError: return "InternalError";
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

} // namespace sift

// fmt library support for ErrorCode (for spdlog)
#include <fmt/format.h>
template <> struct fmt::formatter<sift::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(sift::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", sift::errorToString(error));
    }
};
