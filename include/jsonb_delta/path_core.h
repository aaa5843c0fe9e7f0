// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_core.h
/// @brief Core path traversal engine for Value trees.
///
/// This file provides the read and write traversals shared by the merge
/// engine and the array engine.
///
/// ## Modes
///
/// - **Read** (get_at_path): absence is an ordinary outcome and comes back
///   as std::nullopt, never as an error.
/// - **Write** (set_at_path): missing Object keys along the way are created
///   as empty Objects; Array slots are never created. A wrong container kind
///   is TypeMismatch, an index at or past the end is IndexOutOfRange.
///
/// ## Depth
///
/// Every descent into a child counts one level. The level reached is checked
/// against Options::max_depth before each further descent, so an over-long
/// path fails with DepthExceeded instead of recursing without bound.
///
/// ## Sharing
///
/// Writes rebuild only the containers along the path; every other child box
/// is shared with the input.
///
/// ## Usage Examples
///
/// ```cpp
/// auto status = get_at_path(doc, "orders[0].status");
/// if (status && status.value()) {
///     use(*status.value());
/// }
///
/// auto updated = set_at_path(doc, "profile.address.city", Value{"Paris"});
/// ```

#pragma once

#include <jsonb_delta/api.h>
#include <jsonb_delta/path_parser.h>
#include <jsonb_delta/path_types.h>
#include <jsonb_delta/value.h>

#include <functional>
#include <optional>
#include <string_view>

namespace jsonb_delta {

// ============================================================
// Detail namespace - Internal helpers (not part of public API)
// ============================================================

namespace detail {

/// Transformer applied at the end of a write walk.
/// @param current The value found at the path, or std::nullopt when the
///                final Object key does not exist yet
/// @param depth   Number of levels descended from the document root
using PathTransform = std::function<Result<Value>(const std::optional<Value>& current, std::size_t depth)>;

/// Read walk starting at an already-descended depth
[[nodiscard]] JSONB_DELTA_API Result<std::optional<Value>> read_at_path(
    const Value& root,
    const Path& path,
    std::size_t start_depth,
    const Options& opts,
    std::string_view func);

/// Write walk that replaces the value at @p path with the transformer's result.
/// Only the containers on the path are rebuilt.
[[nodiscard]] JSONB_DELTA_API Result<Value> update_at_path(
    const Value& root,
    const Path& path,
    std::size_t start_depth,
    const Options& opts,
    const PathTransform& fn,
    std::string_view func);

} // namespace detail

// ============================================================
// Public API - Core Path Operations
// ============================================================

/// @brief Get the value at a path (read mode)
/// @return The located value, std::nullopt when any step is missing or of
///         the wrong kind, or ErrorCode::DepthExceeded
[[nodiscard]] JSONB_DELTA_API Result<std::optional<Value>> get_at_path(
    const Value& root, const Path& path, const Options& opts = {});

/// @brief Get the value at a dotted path string (see parse_path())
[[nodiscard]] JSONB_DELTA_API Result<std::optional<Value>> get_at_path(
    const Value& root, std::string_view path, const Options& opts = {});

/// @brief Set the value at a path (write mode)
/// Creates empty Objects for missing keys; never creates Array slots.
/// An empty path replaces the root.
/// @return New root, or TypeMismatch / IndexOutOfRange / DepthExceeded
/// @example
///   set_at_path(Value::object({}), "a.b.c", Value{100});
///   // {"a": {"b": {"c": 100}}}
[[nodiscard]] JSONB_DELTA_API Result<Value> set_at_path(
    const Value& root, const Path& path, Value new_val, const Options& opts = {});

[[nodiscard]] JSONB_DELTA_API Result<Value> set_at_path(
    const Value& root, std::string_view path, Value new_val, const Options& opts = {});

/// @brief Remove the value at a path
/// Objects lose the key; Arrays lose the element (later elements shift down).
/// A missing target returns @p root unchanged. An empty path yields Null.
[[nodiscard]] JSONB_DELTA_API Result<Value> erase_at_path(
    const Value& root, const Path& path, const Options& opts = {});

[[nodiscard]] JSONB_DELTA_API Result<Value> erase_at_path(
    const Value& root, std::string_view path, const Options& opts = {});

} // namespace jsonb_delta
