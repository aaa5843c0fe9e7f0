// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file merge.h
/// @brief Object merge operations: shallow, deep, at-path and smart-patch.
///
/// | Operation          | Nested Objects      | Arrays     | Non-Object input      |
/// |--------------------|---------------------|------------|-----------------------|
/// | shallow_merge      | replaced wholesale  | replaced   | TypeMismatch          |
/// | deep_merge         | merged recursively  | replaced   | source wins           |
/// | merge_at_path      | replaced wholesale  | replaced   | TypeMismatch          |
/// | smart_patch_*      | replaced wholesale  | replaced   | source replaces target|
///
/// Every merge rebuilds only the Objects it writes into; all other children
/// are shared with @p target and @p source.

#pragma once

#include <jsonb_delta/api.h>
#include <jsonb_delta/path_types.h>
#include <jsonb_delta/value.h>

#include <string>
#include <string_view>

namespace jsonb_delta {

// ============================================================
// Strict merges
// ============================================================

/// @brief Insert or replace every top-level key of @p source in @p target
/// @return The merged Object (@p target itself when @p source is empty), or
///         TypeMismatch when either side is not an Object
/// @example
///   shallow_merge({"a": {"x": 1}}, {"a": {"y": 2}})  // {"a": {"y": 2}}
[[nodiscard]] JSONB_DELTA_API Result<Value> shallow_merge(const Value& target, const Value& source);

/// @brief Recursively merge @p source into @p target
///
/// Keys holding Objects on both sides are merged recursively; every other
/// pairing (Arrays included) takes the value from @p source. If either
/// argument is not an Object the result is @p source.
///
/// Deep merge is not associative: with a = {"k": {"x": 1}}, b = {"k": 5},
/// c = {"k": {"y": 2}}, (a+b)+c yields {"k": {"y": 2}} while a+(b+c) yields
/// {"k": {"x": 1, "y": 2}}.
///
/// @return The merged value, or DepthExceeded
[[nodiscard]] JSONB_DELTA_API Result<Value> deep_merge(
    const Value& target, const Value& source, const Options& opts = {});

/// @brief Shallow-merge @p source into the Object at @p path
/// A missing subtree is treated as an empty Object and created.
/// @return New root; TypeMismatch if the subtree or @p source is not an
///         Object; navigator errors propagate
[[nodiscard]] JSONB_DELTA_API Result<Value> merge_at_path(
    const Value& target, const Value& source, const Path& path, const Options& opts = {});

[[nodiscard]] JSONB_DELTA_API Result<Value> merge_at_path(
    const Value& target, const Value& source, std::string_view path, const Options& opts = {});

// ============================================================
// Smart-patch family
//
// Same as the strict merges when both sides are Objects. Otherwise the
// source value replaces the target (or the subtree, or the element)
// wholesale instead of failing.
// ============================================================

[[nodiscard]] JSONB_DELTA_API Value smart_patch_scalar(const Value& target, const Value& source);

[[nodiscard]] JSONB_DELTA_API Result<Value> smart_patch_nested(
    const Value& target, const Value& source, const Path& path, const Options& opts = {});

[[nodiscard]] JSONB_DELTA_API Result<Value> smart_patch_nested(
    const Value& target, const Value& source, std::string_view path, const Options& opts = {});

/// @brief Patch the first element of the Array at @p path whose
///        @p match_key equals @p match_value
/// An Object @p source is shallow-merged into the element (update_where());
/// any other @p source replaces the element.
[[nodiscard]] JSONB_DELTA_API Result<Value> smart_patch_array(
    const Value& target,
    const Value& source,
    const Path& path,
    const std::string& match_key,
    const Value& match_value,
    const Options& opts = {});

[[nodiscard]] JSONB_DELTA_API Result<Value> smart_patch_array(
    const Value& target,
    const Value& source,
    std::string_view path,
    const std::string& match_key,
    const Value& match_value,
    const Options& opts = {});

} // namespace jsonb_delta
