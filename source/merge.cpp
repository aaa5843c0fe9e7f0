// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file merge.cpp
/// @brief Implementation of the merge engine.

#include <jsonb_delta/merge.h>

#include <jsonb_delta/array_ops.h>
#include <jsonb_delta/builders.h>
#include <jsonb_delta/path_core.h>
#include <jsonb_delta/path_parser.h>

namespace jsonb_delta {

namespace {

Error not_an_object(std::string_view func, const char* role, const Value& found)
{
    return detail::make_error(func, ErrorCode::TypeMismatch,
                              std::string{role} + " must be an object, found " + std::string{value_type_name(found)});
}

// Both arguments are Objects
Value merge_maps(const ValueMap& target, const ValueMap& source)
{
    ObjectBuilder builder(target);
    for (const auto& [key, box] : source) {
        builder.set_box(key, box);
    }
    return builder.finish();
}

Result<Value> deep_merge_recursive(const Value& target, const Value& source, std::size_t depth, const Options& opts)
{
    auto* target_map = target.get_if<ValueMap>();
    auto* source_map = source.get_if<ValueMap>();
    if (!target_map || !source_map) {
        return source;  // Any non-Object pairing: source wins
    }
    if (source_map->empty()) {
        return target;
    }
    if (depth >= opts.max_depth) {
        return detail::make_error("deep_merge", ErrorCode::DepthExceeded,
                                  "merge descends deeper than " + std::to_string(opts.max_depth) + " levels");
    }

    ObjectBuilder builder(*target_map);
    for (const auto& [key, box] : *source_map) {
        auto* existing = target_map->find(key);
        if (existing && existing->get().is_object() && box.get().is_object()) {
            auto merged = deep_merge_recursive(existing->get(), box.get(), depth + 1, opts);
            if (!merged) {
                return merged;
            }
            builder.set(key, std::move(merged).value());
        } else {
            builder.set_box(key, box);
        }
    }
    return builder.finish();
}

} // anonymous namespace

// ============================================================
// Strict merges
// ============================================================

Result<Value> shallow_merge(const Value& target, const Value& source)
{
    auto* target_map = target.get_if<ValueMap>();
    if (!target_map) {
        return not_an_object("shallow_merge", "target", target);
    }
    auto* source_map = source.get_if<ValueMap>();
    if (!source_map) {
        return not_an_object("shallow_merge", "source", source);
    }
    if (source_map->empty()) {
        return target;
    }
    return merge_maps(*target_map, *source_map);
}

Result<Value> deep_merge(const Value& target, const Value& source, const Options& opts)
{
    return deep_merge_recursive(target, source, 0, opts);
}

Result<Value> merge_at_path(const Value& target, const Value& source, const Path& path, const Options& opts)
{
    if (!source.is_object()) {
        return not_an_object("merge_at_path", "source", source);
    }
    return detail::update_at_path(
        target, path, 0, opts,
        [&source](const std::optional<Value>& current, std::size_t) -> Result<Value> {
            if (!current) {
                return source;  // Absent subtree behaves as {}
            }
            if (!current->is_object()) {
                return not_an_object("merge_at_path", "subtree", *current);
            }
            return shallow_merge(*current, source);
        },
        "merge_at_path");
}

Result<Value> merge_at_path(const Value& target, const Value& source, std::string_view path, const Options& opts)
{
    auto parsed = parse_path(path);
    if (!parsed) {
        return parsed.error();
    }
    return merge_at_path(target, source, parsed.value(), opts);
}

// ============================================================
// Smart-patch family
// ============================================================

Value smart_patch_scalar(const Value& target, const Value& source)
{
    auto* target_map = target.get_if<ValueMap>();
    auto* source_map = source.get_if<ValueMap>();
    if (!target_map || !source_map) {
        return source;
    }
    if (source_map->empty()) {
        return target;
    }
    return merge_maps(*target_map, *source_map);
}

Result<Value> smart_patch_nested(const Value& target, const Value& source, const Path& path, const Options& opts)
{
    return detail::update_at_path(
        target, path, 0, opts,
        [&source](const std::optional<Value>& current, std::size_t) -> Result<Value> {
            return current ? smart_patch_scalar(*current, source) : source;
        },
        "smart_patch_nested");
}

Result<Value> smart_patch_nested(const Value& target, const Value& source, std::string_view path, const Options& opts)
{
    auto parsed = parse_path(path);
    if (!parsed) {
        return parsed.error();
    }
    return smart_patch_nested(target, source, parsed.value(), opts);
}

Result<Value> smart_patch_array(
    const Value& target,
    const Value& source,
    const Path& path,
    const std::string& match_key,
    const Value& match_value,
    const Options& opts)
{
    if (source.is_object()) {
        return update_where(target, path, match_key, match_value, source, opts);
    }

    auto found = find_where(target, path, match_key, match_value, opts);
    if (!found) {
        return found.error();
    }
    if (!found.value()) {
        return target;
    }
    return detail::update_at_path(
        target, join_paths(path, Path{PathSegment{*found.value()}}), 0, opts,
        [&source](const std::optional<Value>&, std::size_t) -> Result<Value> { return source; },
        "smart_patch_array");
}

Result<Value> smart_patch_array(
    const Value& target,
    const Value& source,
    std::string_view path,
    const std::string& match_key,
    const Value& match_value,
    const Options& opts)
{
    auto parsed = parse_path(path, PathRequirement::NonRoot);
    if (!parsed) {
        return parsed.error();
    }
    return smart_patch_array(target, source, parsed.value(), match_key, match_value, opts);
}

} // namespace jsonb_delta
