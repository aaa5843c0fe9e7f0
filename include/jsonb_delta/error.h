// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file error.h
/// @brief Typed error kinds and the Result<T> return type used by every operation.
///
/// Operations never throw for domain failures. They return a Result<T>
/// holding either the produced value or an Error with a stable ErrorCode.
/// Only Result::value() throws (ResultError) when called on a failed result.
///
/// ```cpp
/// auto merged = shallow_merge(doc, patch);
/// if (!merged) {
///     handle(merged.error_code(), merged.error().message);
/// } else {
///     use(merged.value());
/// }
/// ```

#pragma once

#include <jsonb_delta/api.h>
#include <jsonb_delta/config.h>

#include <cstddef>
#include <cstdint>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace jsonb_delta {

enum class ErrorCode : std::uint8_t {
    Success = 0,
    ParseError,         // Path string violates the path grammar
    TypeMismatch,       // Wrong container kind, or incomparable kinds ordered
    IndexOutOfRange,    // Write-mode index >= array length
    DepthExceeded,      // Traversal deeper than Options::max_depth
    InvalidSortKey,     // insert_where sort values of incompatible kinds
};

/// Stable name of an error kind ("ParseError", "TypeMismatch", ...)
[[nodiscard]] JSONB_DELTA_API std::string_view error_code_name(ErrorCode code) noexcept;

struct Error {
    ErrorCode code = ErrorCode::Success;
    std::string message;
    std::size_t offset = 0;     ///< Byte offset into the path text (ParseError only)
};

/// Thrown by Result<T>::value() when the result holds an error
class JSONB_DELTA_API ResultError : public std::runtime_error {
public:
    explicit ResultError(const Error& error);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }

private:
    ErrorCode code_;
    std::size_t offset_;
};

template <typename T>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : data_(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool ok() const noexcept { return data_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] const T& value() const& {
        if (!ok()) {
            throw ResultError(std::get<1>(data_));
        }
        return std::get<0>(data_);
    }

    [[nodiscard]] T&& value() && {
        if (!ok()) {
            throw ResultError(std::get<1>(data_));
        }
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] T value_or(T default_val) const& {
        return ok() ? std::get<0>(data_) : std::move(default_val);
    }

    /// @pre !ok()
    [[nodiscard]] const Error& error() const& { return std::get<1>(data_); }

    [[nodiscard]] ErrorCode error_code() const noexcept {
        return ok() ? ErrorCode::Success : std::get<1>(data_).code;
    }

private:
    std::variant<T, Error> data_;
};

namespace detail {

/// Report an error to stderr when JSONB_DELTA_VERBOSE_LOG is enabled
JSONB_DELTA_API void log_error(
    std::string_view func,
    const Error& error,
    std::source_location loc = std::source_location::current()) noexcept;

/// Build an Error and report it through log_error()
[[nodiscard]] JSONB_DELTA_API Error make_error(
    std::string_view func,
    ErrorCode code,
    std::string message,
    std::size_t offset = 0,
    std::source_location loc = std::source_location::current());

} // namespace detail

} // namespace jsonb_delta
