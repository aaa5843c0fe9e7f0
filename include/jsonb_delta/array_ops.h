// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file array_ops.h
/// @brief Find/update/insert/delete of record-like Array elements by key match.
///
/// A match spec is a (match_key, match_value) pair: an element matches when
/// it is an Object whose member @c match_key equals @c match_value (Value
/// equality, so 1 matches 1.0). Elements of any other kind are skipped.
///
/// ## Null safety
///
/// Every operation first reads the Array at @c path. When nothing is there,
/// or the value there is not an Array, the input document is returned
/// unchanged. A missing match is not an error either. The single exception
/// is insert_where(), which creates the Array.
///
/// ## Depth
///
/// The Array sits @c path.size() levels below the root and its elements one
/// level further down, so every operation needs @c path.size() < max_depth.
/// update_where_path() adds the length of its relative update path.
///
/// ## Path strings
///
/// The std::string_view overloads parse @c path with PathRequirement::NonRoot:
/// "" is a ParseError there. Use the Path overloads to address a root Array.

#pragma once

#include <jsonb_delta/api.h>
#include <jsonb_delta/path_types.h>
#include <jsonb_delta/value.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsonb_delta {

/// Sort direction for insert_where()
enum class SortOrder {
    Ascending,
    Descending,
};

// ============================================================
// Find
// ============================================================

/// @brief Index of the first Object element whose @p match_key equals @p match_value
///
/// Integer match values on Arrays of 32 or more elements take an unrolled
/// integer-only scan; the result is the same as the generic scan.
/// A container @p match_value nesting deeper than opts.max_depth matches
/// nothing.
[[nodiscard]] JSONB_DELTA_API std::optional<std::size_t> find_where(
    const ValueArray& array,
    const std::string& match_key,
    const Value& match_value,
    const Options& opts = {});

/// @brief find_where() on the Array at @p path
/// @return std::nullopt when the Array is missing or nothing matches
[[nodiscard]] JSONB_DELTA_API Result<std::optional<std::size_t>> find_where(
    const Value& target,
    const Path& path,
    const std::string& match_key,
    const Value& match_value,
    const Options& opts = {});

[[nodiscard]] JSONB_DELTA_API Result<std::optional<std::size_t>> find_where(
    const Value& target,
    std::string_view path,
    const std::string& match_key,
    const Value& match_value,
    const Options& opts = {});

/// @brief Whether the Array at @p path has an element matching (@p key, @p value)
[[nodiscard]] JSONB_DELTA_API Result<bool> contains_id(
    const Value& target,
    const Path& path,
    const std::string& key,
    const Value& value,
    const Options& opts = {});

[[nodiscard]] JSONB_DELTA_API Result<bool> contains_id(
    const Value& target,
    std::string_view path,
    const std::string& key,
    const Value& value,
    const Options& opts = {});

/// @brief Read an identifier field of an Object as text
/// Strings come back as-is, Numbers in canonical form ("42", "1.5").
/// @return std::nullopt when @p data is not an Object, the key is missing,
///         or the field is neither a String nor a Number
[[nodiscard]] JSONB_DELTA_API std::optional<std::string> extract_id(
    const Value& data, const std::string& key = "id");

// ============================================================
// Update
// ============================================================

/// @brief Shallow-merge @p updates into the first matching element
///
/// Only the matched element, its Array and the Array's ancestors are rebuilt.
/// @return New root (or @p target when nothing matched or the Array is
///         missing); TypeMismatch when the Array exists and @p updates is not
///         an Object; DepthExceeded when a container @p match_value nests
///         deeper than opts.max_depth
/// @example
///   update_where(doc, "orders", "id", 1, Value::object({{"status", "shipped"}}));
[[nodiscard]] JSONB_DELTA_API Result<Value> update_where(
    const Value& target,
    const Path& path,
    const std::string& match_key,
    const Value& match_value,
    const Value& updates,
    const Options& opts = {});

[[nodiscard]] JSONB_DELTA_API Result<Value> update_where(
    const Value& target,
    std::string_view path,
    const std::string& match_key,
    const Value& match_value,
    const Value& updates,
    const Options& opts = {});

/// @brief Set @p update_value at @p update_path inside the first matching element
/// Missing Object keys along @p update_path are created; an empty
/// @p update_path replaces the element.
[[nodiscard]] JSONB_DELTA_API Result<Value> update_where_path(
    const Value& target,
    const Path& path,
    const std::string& match_key,
    const Value& match_value,
    const Path& update_path,
    const Value& update_value,
    const Options& opts = {});

[[nodiscard]] JSONB_DELTA_API Result<Value> update_where_path(
    const Value& target,
    std::string_view path,
    const std::string& match_key,
    const Value& match_value,
    std::string_view update_path,
    const Value& update_value,
    const Options& opts = {});

/// @brief Apply many updates to one Array in two passes
///
/// @p updates_array holds Objects, each carrying @p match_key with the value
/// to match plus the fields to merge. Entries that are not Objects or lack
/// @p match_key are ignored; entries sharing a match value are combined,
/// later fields overriding earlier ones. Every element whose match value has
/// an entry receives the combined fields. Elements whose match field nests
/// deeper than opts.max_depth are left alone.
///
/// @return New root (or @p target when no element was touched or the Array
///         is missing); TypeMismatch when the Array exists and
///         @p updates_array is not an Array; DepthExceeded when an entry's
///         match value nests deeper than opts.max_depth
[[nodiscard]] JSONB_DELTA_API Result<Value> update_where_batch(
    const Value& target,
    const Path& path,
    const std::string& match_key,
    const Value& updates_array,
    const Options& opts = {});

[[nodiscard]] JSONB_DELTA_API Result<Value> update_where_batch(
    const Value& target,
    std::string_view path,
    const std::string& match_key,
    const Value& updates_array,
    const Options& opts = {});

/// @brief update_where() on each document independently
/// @return One result document per input, in order; the first error fails
///         the whole call
[[nodiscard]] JSONB_DELTA_API Result<std::vector<Value>> update_multi_row(
    const std::vector<Value>& targets,
    const Path& path,
    const std::string& match_key,
    const Value& match_value,
    const Value& updates,
    const Options& opts = {});

[[nodiscard]] JSONB_DELTA_API Result<std::vector<Value>> update_multi_row(
    const std::vector<Value>& targets,
    std::string_view path,
    const std::string& match_key,
    const Value& match_value,
    const Value& updates,
    const Options& opts = {});

// ============================================================
// Insert / Delete
// ============================================================

/// @brief Insert @p element keeping the Array ordered by @p sort_key
///
/// @p element goes before the first existing element whose sort value is
/// strictly greater (Ascending) or strictly smaller (Descending) than its
/// own, otherwise at the end. Existing elements that are not Objects or lack
/// @p sort_key are passed over. An @p element without @p sort_key is
/// appended.
///
/// When no Array exists at @p path, [@p element] is written there.
///
/// @return New root; InvalidSortKey when two sort values cannot be ordered
///         (different kinds, or kinds other than Number and String)
[[nodiscard]] JSONB_DELTA_API Result<Value> insert_where(
    const Value& target,
    const Path& path,
    const Value& element,
    const std::string& sort_key,
    SortOrder order = SortOrder::Ascending,
    const Options& opts = {});

[[nodiscard]] JSONB_DELTA_API Result<Value> insert_where(
    const Value& target,
    std::string_view path,
    const Value& element,
    const std::string& sort_key,
    SortOrder order = SortOrder::Ascending,
    const Options& opts = {});

/// @brief Remove every matching element, keeping the others in order
/// @return New root, or @p target when nothing matched
[[nodiscard]] JSONB_DELTA_API Result<Value> delete_where(
    const Value& target,
    const Path& path,
    const std::string& match_key,
    const Value& match_value,
    const Options& opts = {});

[[nodiscard]] JSONB_DELTA_API Result<Value> delete_where(
    const Value& target,
    std::string_view path,
    const std::string& match_key,
    const Value& match_value,
    const Options& opts = {});

} // namespace jsonb_delta
