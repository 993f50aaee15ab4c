#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace castlink {

enum class ErrorKind {
    EncodingError,
    DecodingError,
    IoError,
    Closed,
    Timeout,
    Cancelled,
    NotRunning,
    NoActiveSession,
    SessionExpired,
    CommandRejected,
    LaunchFailed
};

const char* to_string(ErrorKind kind);

// Every failure surfaced by the library is a CastError; kind() tells the
// caller which one without parsing what().
class CastError : public std::runtime_error {
public:
    CastError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Value-or-error return used where input comes straight off the wire and
// throwing is not wanted (the envelope codec).
template <typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(CastError error) : value_(std::move(error)) {}

    static Result<T> fail(ErrorKind kind, const std::string& message) {
        return Result<T>(CastError(kind, message));
    }

    bool ok() const { return std::holds_alternative<T>(value_); }
    explicit operator bool() const { return ok(); }

    // Throws the stored error when there is no value.
    const T& value() const {
        if (!ok()) throw std::get<CastError>(value_);
        return std::get<T>(value_);
    }

    T take() {
        if (!ok()) throw std::get<CastError>(value_);
        return std::move(std::get<T>(value_));
    }

    const CastError& error() const {
        if (ok()) throw std::logic_error("Result::error called on a value");
        return std::get<CastError>(value_);
    }

private:
    std::variant<T, CastError> value_;
};

} // namespace castlink
