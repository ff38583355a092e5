#pragma once

#include <optional>
#include <string>
#include <variant>

namespace wg {

enum class ErrorCode {
    Generic,
    InvalidTopology,
    UnknownWaypoint,
    NoPathExists,
    SameAsOrigin,
    UnexpectedEvent,
    ScriptError,
    Io,
};

struct Error {
    ErrorCode code = ErrorCode::Generic;
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
};

/// Simple Result type: holds either a value of type T or an Error.
/// For void results, use Result<void>.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error err) : data_(std::move(err)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }

    const Error& error() const { return std::get<Error>(data_); }

    /// Error code, or Generic when the result holds a value.
    ErrorCode code() const {
        return ok() ? ErrorCode::Generic : error().code;
    }

private:
    std::variant<T, Error> data_;
};

/// Specialization for void results.
template <>
class Result<void> {
public:
    Result() : err_(std::nullopt) {}
    Result(Error err) : err_(std::move(err)) {}

    bool ok() const { return !err_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return err_.value(); }

    ErrorCode code() const {
        return ok() ? ErrorCode::Generic : err_->code;
    }

private:
    std::optional<Error> err_;
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Generic:         return "Generic";
        case ErrorCode::InvalidTopology: return "InvalidTopology";
        case ErrorCode::UnknownWaypoint: return "UnknownWaypoint";
        case ErrorCode::NoPathExists:    return "NoPathExists";
        case ErrorCode::SameAsOrigin:    return "SameAsOrigin";
        case ErrorCode::UnexpectedEvent: return "UnexpectedEvent";
        case ErrorCode::ScriptError:     return "ScriptError";
        case ErrorCode::Io:              return "Io";
    }
    return "Unknown";
}

} // namespace wg
