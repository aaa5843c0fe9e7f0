// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_core.cpp
/// @brief Implementation of core path traversal engine.

#include <jsonb_delta/path_core.h>

namespace jsonb_delta {

// ============================================================
// Anonymous namespace - Internal implementation details
// ============================================================

namespace {

std::string prefix_string(const Path& path, std::size_t count)
{
    Path prefix(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(count));
    auto text = path_to_string(prefix);
    return text.empty() ? std::string{"(root)"} : text;
}

Error depth_error(std::string_view func, const Options& opts)
{
    return detail::make_error(func, ErrorCode::DepthExceeded,
                              "path descends deeper than " + std::to_string(opts.max_depth) + " levels");
}

Error kind_error(std::string_view func, const Path& path, std::size_t index, const Value& found)
{
    const char* expected = is_key(path[index]) ? "object" : "array";
    return detail::make_error(func, ErrorCode::TypeMismatch,
                              std::string{"expected "} + expected + " at " + prefix_string(path, index) +
                                  ", found " + std::string{value_type_name(found)});
}

/// Recursive helper for update_at_path
Result<Value> update_recursive(
    const Value& current,
    const Path& path,
    std::size_t path_index,
    std::size_t depth,
    const Options& opts,
    const detail::PathTransform& fn,
    std::string_view func)
{
    if (path_index >= path.size()) {
        return fn(current, depth);  // Base case: replace current node
    }

    if (depth >= opts.max_depth) {
        return depth_error(func, opts);
    }

    const auto& seg = path[path_index];
    const bool is_last = path_index + 1 == path.size();

    if (auto* key = std::get_if<std::string>(&seg)) {
        auto* map = current.get_if<ValueMap>();
        if (!map) {
            return kind_error(func, path, path_index, current);
        }

        auto* found = map->find(*key);
        Result<Value> new_child = Value{};
        if (is_last) {
            new_child = found ? fn(found->get(), depth + 1) : fn(std::nullopt, depth + 1);
        } else {
            // Missing intermediate key: continue inside a fresh empty Object
            const Value child = found ? found->get() : Value{ValueMap{}};
            new_child = update_recursive(child, path, path_index + 1, depth + 1, opts, fn, func);
        }
        if (!new_child) {
            return new_child;
        }
        return Value{map->set(*key, ValueBox{std::move(new_child).value()})};
    }

    const auto idx = std::get<std::size_t>(seg);
    auto* arr = current.get_if<ValueArray>();
    if (!arr) {
        return kind_error(func, path, path_index, current);
    }
    if (idx >= arr->size()) {
        return detail::make_error(func, ErrorCode::IndexOutOfRange,
                                  "index " + std::to_string(idx) + " at " + prefix_string(path, path_index) +
                                      " is past the end of an array of size " + std::to_string(arr->size()));
    }

    const Value& child = (*arr)[idx].get();
    Result<Value> new_child = is_last
        ? fn(child, depth + 1)
        : update_recursive(child, path, path_index + 1, depth + 1, opts, fn, func);
    if (!new_child) {
        return new_child;
    }
    return Value{arr->set(idx, ValueBox{std::move(new_child).value()})};
}

} // anonymous namespace

// ============================================================
// Detail Implementation
// ============================================================

namespace detail {

Result<std::optional<Value>> read_at_path(
    const Value& root,
    const Path& path,
    std::size_t start_depth,
    const Options& opts,
    std::string_view func)
{
    const Value* current = &root;
    std::size_t depth = start_depth;

    for (const auto& seg : path) {
        if (depth >= opts.max_depth) {
            return depth_error(func, opts);
        }
        if (auto* key = std::get_if<std::string>(&seg)) {
            current = current->find(*key);
        } else {
            current = current->find(std::get<std::size_t>(seg));
        }
        if (!current) {
            return std::optional<Value>{};
        }
        ++depth;
    }
    return std::optional<Value>{*current};
}

Result<Value> update_at_path(
    const Value& root,
    const Path& path,
    std::size_t start_depth,
    const Options& opts,
    const PathTransform& fn,
    std::string_view func)
{
    return update_recursive(root, path, 0, start_depth, opts, fn, func);
}

} // namespace detail

// ============================================================
// Public API Implementation
// ============================================================

Result<std::optional<Value>> get_at_path(const Value& root, const Path& path, const Options& opts)
{
    return detail::read_at_path(root, path, 0, opts, "get_at_path");
}

Result<std::optional<Value>> get_at_path(const Value& root, std::string_view path, const Options& opts)
{
    auto parsed = parse_path(path);
    if (!parsed) {
        return parsed.error();
    }
    return get_at_path(root, parsed.value(), opts);
}

Result<Value> set_at_path(const Value& root, const Path& path, Value new_val, const Options& opts)
{
    return detail::update_at_path(
        root, path, 0, opts,
        [&new_val](const std::optional<Value>&, std::size_t) -> Result<Value> { return new_val; },
        "set_at_path");
}

Result<Value> set_at_path(const Value& root, std::string_view path, Value new_val, const Options& opts)
{
    auto parsed = parse_path(path);
    if (!parsed) {
        return parsed.error();
    }
    return set_at_path(root, parsed.value(), std::move(new_val), opts);
}

// ============================================================
// Path Erasure Implementation
// ============================================================

Result<Value> erase_at_path(const Value& root, const Path& path, const Options& opts)
{
    if (path.empty()) {
        return Value{};  // Erase entire root
    }

    auto existing = detail::read_at_path(root, path, 0, opts, "erase_at_path");
    if (!existing) {
        return existing.error();
    }
    if (!existing.value()) {
        return root;  // Nothing to erase
    }

    // The target exists, so its parent exists and has the matching kind
    const Path parent_path(path.begin(), path.end() - 1);
    const auto& last = path.back();

    return detail::update_at_path(
        root, parent_path, 0, opts,
        [&last](const std::optional<Value>& parent, std::size_t) -> Result<Value> {
            if (auto* key = std::get_if<std::string>(&last)) {
                return Value{parent->get_if<ValueMap>()->erase(*key)};
            }
            return Value{parent->get_if<ValueArray>()->erase(std::get<std::size_t>(last))};
        },
        "erase_at_path");
}

Result<Value> erase_at_path(const Value& root, std::string_view path, const Options& opts)
{
    auto parsed = parse_path(path);
    if (!parsed) {
        return parsed.error();
    }
    return erase_at_path(root, parsed.value(), opts);
}

} // namespace jsonb_delta
