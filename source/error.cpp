// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file error.cpp
/// @brief Error naming and verbose diagnostics.

#include <jsonb_delta/error.h>

#include <iostream>

namespace jsonb_delta {

namespace {

std::string describe(const Error& error)
{
    std::string text{error_code_name(error.code)};
    text += ": ";
    text += error.message;
    if (error.code == ErrorCode::ParseError) {
        text += " (offset " + std::to_string(error.offset) + ")";
    }
    return text;
}

} // anonymous namespace

std::string_view error_code_name(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::Success:         return "Success";
        case ErrorCode::ParseError:      return "ParseError";
        case ErrorCode::TypeMismatch:    return "TypeMismatch";
        case ErrorCode::IndexOutOfRange: return "IndexOutOfRange";
        case ErrorCode::DepthExceeded:   return "DepthExceeded";
        case ErrorCode::InvalidSortKey:  return "InvalidSortKey";
    }
    return "Unknown";
}

ResultError::ResultError(const Error& error)
    : std::runtime_error(describe(error))
    , code_(error.code)
    , offset_(error.offset)
{}

namespace detail {

void log_error(std::string_view func, const Error& error, std::source_location loc) noexcept
{
#if JSONB_DELTA_VERBOSE_LOG
    std::cerr << "[" << func << "] " << error_code_name(error.code) << ": " << error.message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)error;
    (void)loc;
#endif
}

Error make_error(std::string_view func,
                 ErrorCode code,
                 std::string message,
                 std::size_t offset,
                 std::source_location loc)
{
    Error error{code, std::move(message), offset};
    log_error(func, error, loc);
    return error;
}

} // namespace detail

} // namespace jsonb_delta
