/**
 * @file Result.hpp
 * @brief Value-or-error return type used by every fallible operation.
 *
 * Result<T> holds either a T or an Error. Result<void> carries only the
 * success flag or an Error. Errors are tagged with an ErrorCode so callers
 * can tell malformed input apart from invariant violations and bad indices.
 *
 * @section Patterns
 * - Railway: errors are returned, never thrown across the library boundary.
 */

#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace pa {

enum class ErrorCode {
    Unknown,
    Io,         // file could not be opened, read or written
    Format,     // malformed content or unsupported file extension
    Validation, // contiguity / monotonicity / non-empty invariant violated
    Range,      // index, slice or time outside the valid range
    Lookup,     // label missing from a caller-supplied mapping
    Empty       // operation undefined on an empty alignment
};

constexpr std::string_view toString(ErrorCode code) {
    switch (code) {
    case ErrorCode::Io:
        return "io";
    case ErrorCode::Format:
        return "format";
    case ErrorCode::Validation:
        return "validation";
    case ErrorCode::Range:
        return "range";
    case ErrorCode::Lookup:
        return "lookup";
    case ErrorCode::Empty:
        return "empty";
    case ErrorCode::Unknown:
        break;
    }
    return "unknown";
}

struct Error {
    std::string message;
    ErrorCode code{ErrorCode::Unknown};
};

template <typename T>
class Result {
public:
    static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }
    static Result err(std::string message) {
        return err(ErrorCode::Unknown, std::move(message));
    }
    static Result err(ErrorCode code, std::string message) {
        return Result(std::in_place_index<1>,
                      Error{std::move(message), code});
    }
    static Result err(Error error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    bool isOk() const {
        return data_.index() == 0;
    }
    bool isErr() const {
        return data_.index() == 1;
    }
    explicit operator bool() const {
        return isOk();
    }

    T& value() & {
        return std::get<0>(data_);
    }
    const T& value() const& {
        return std::get<0>(data_);
    }
    T&& value() && {
        return std::get<0>(std::move(data_));
    }

    T valueOr(T fallback) const {
        return isOk() ? std::get<0>(data_) : std::move(fallback);
    }

    T& operator*() & {
        return value();
    }
    const T& operator*() const& {
        return value();
    }
    T&& operator*() && {
        return std::move(*this).value();
    }
    T* operator->() {
        return &value();
    }
    const T* operator->() const {
        return &value();
    }

    const Error& error() const {
        return std::get<1>(data_);
    }
    ErrorCode code() const {
        return isOk() ? ErrorCode::Unknown : error().code;
    }

private:
    template <std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> tag, Args&&... args)
        : data_(tag, std::forward<Args>(args)...) {
    }

    std::variant<T, Error> data_;
};

template <>
class Result<void> {
public:
    static Result ok() {
        return Result();
    }
    static Result err(std::string message) {
        return err(ErrorCode::Unknown, std::move(message));
    }
    static Result err(ErrorCode code, std::string message) {
        Result r;
        r.error_ = Error{std::move(message), code};
        r.ok_ = false;
        return r;
    }
    static Result err(Error error) {
        Result r;
        r.error_ = std::move(error);
        r.ok_ = false;
        return r;
    }

    bool isOk() const {
        return ok_;
    }
    bool isErr() const {
        return !ok_;
    }
    explicit operator bool() const {
        return ok_;
    }

    const Error& error() const {
        return error_;
    }
    ErrorCode code() const {
        return ok_ ? ErrorCode::Unknown : error_.code;
    }

private:
    Result() = default;

    bool ok_{true};
    Error error_;
};

} // namespace pa
