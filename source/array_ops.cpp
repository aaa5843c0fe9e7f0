// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file array_ops.cpp
/// @brief Implementation of the Array matcher and its CRUD operations.

#include <jsonb_delta/array_ops.h>

#include <jsonb_delta/builders.h>
#include <jsonb_delta/merge.h>
#include <jsonb_delta/path_core.h>
#include <jsonb_delta/path_parser.h>

#include <unordered_map>
#include <utility>

namespace jsonb_delta {

// ============================================================
// Anonymous namespace - Internal implementation details
// ============================================================

namespace {

/// Arrays shorter than this use the plain scan
constexpr std::size_t kUnrolledScanThreshold = 32;
constexpr std::size_t kUnroll = 8;

bool element_matches(const ValueBox& elem, const std::string& key, const Value& value)
{
    auto* field = elem.get().find(key);
    return field && *field == value;
}

bool element_has_int(const ValueBox& elem, const std::string& key, std::int64_t id)
{
    auto* field = elem.get().find(key);
    if (!field) {
        return false;
    }
    auto* num = field->get_if<Number>();
    if (!num) {
        return false;
    }
    auto as_int = num->as_int64();
    return as_int && *as_int == id;
}

std::optional<std::size_t> find_int_unrolled(const ValueArray& array, const std::string& key, std::int64_t id)
{
    const std::size_t n = array.size();
    const std::size_t chunks = n / kUnroll;

    for (std::size_t chunk = 0; chunk < chunks; ++chunk) {
        const std::size_t base = chunk * kUnroll;
        for (std::size_t i = 0; i < kUnroll; ++i) {
            if (element_has_int(array[base + i], key, id)) {
                return base + i;
            }
        }
    }

    // Remainder
    for (std::size_t i = chunks * kUnroll; i < n; ++i) {
        if (element_has_int(array[i], key, id)) {
            return i;
        }
    }
    return std::nullopt;
}

/// Read the Array at @p path.
/// std::nullopt when the path is absent or holds another kind. Elements sit
/// one level below the Array, so that level must still be within the limit.
Result<std::optional<ValueArray>> locate_array(
    const Value& target, const Path& path, const Options& opts, std::string_view func)
{
    auto found = detail::read_at_path(target, path, 0, opts, func);
    if (!found) {
        return found.error();
    }
    const auto& current = found.value();
    if (!current || !current->is_array()) {
        return std::optional<ValueArray>{};
    }
    if (path.size() >= opts.max_depth) {
        return detail::make_error(func, ErrorCode::DepthExceeded,
                                  "array elements at " + path_to_string(path) + " lie deeper than " +
                                      std::to_string(opts.max_depth) + " levels");
    }
    return std::optional<ValueArray>{*current->get_if<ValueArray>()};
}

/// Equality recurses no deeper than the shallower operand, so a match value
/// within the limit bounds every comparison against element fields.
std::optional<Error> check_match_value(const Value& match_value, const Options& opts, std::string_view func)
{
    if (!match_value.is_array() && !match_value.is_object()) {
        return std::nullopt;
    }
    if (!validate_depth(match_value, opts)) {
        return detail::make_error(func, ErrorCode::DepthExceeded,
                                  "match value nests deeper than " + std::to_string(opts.max_depth) + " levels");
    }
    return std::nullopt;
}

/// Write @p array back at @p path. Only the ancestors of the Array are rebuilt.
Result<Value> store_array(
    const Value& target, const Path& path, ValueArray array, const Options& opts, std::string_view func)
{
    return detail::update_at_path(
        target, path, 0, opts,
        [&array](const std::optional<Value>&, std::size_t) -> Result<Value> { return Value{array}; },
        func);
}

/// Lookup key for a match value. value_to_string() is canonical (sorted
/// keys, normalized numbers), so equal values share a key.
/// std::nullopt for values nesting deeper than opts.max_depth.
std::optional<std::string> match_key_text(const Value& v, const Options& opts)
{
    if ((v.is_array() || v.is_object()) && !validate_depth(v, opts)) {
        return std::nullopt;
    }
    return value_to_string(v);
}

template <typename Fn>
auto with_parsed_path(std::string_view path, Fn&& fn) -> decltype(fn(std::declval<const Path&>()))
{
    auto parsed = parse_path(path, PathRequirement::NonRoot);
    if (!parsed) {
        return parsed.error();
    }
    return fn(parsed.value());
}

/// Generic scan with the integer fast path. Callers bound match_value first.
std::optional<std::size_t> find_index(
    const ValueArray& array, const std::string& match_key, const Value& match_value)
{
    if (auto* num = match_value.get_if<Number>()) {
        if (auto id = num->as_int64(); id && array.size() >= kUnrolledScanThreshold) {
            return find_int_unrolled(array, match_key, *id);
        }
    }

    for (std::size_t i = 0; i < array.size(); ++i) {
        if (element_matches(array[i], match_key, match_value)) {
            return i;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

// ============================================================
// Find
// ============================================================

std::optional<std::size_t> find_where(
    const ValueArray& array, const std::string& match_key, const Value& match_value, const Options& opts)
{
    if ((match_value.is_array() || match_value.is_object()) && !validate_depth(match_value, opts)) {
        return std::nullopt;
    }
    return find_index(array, match_key, match_value);
}

Result<std::optional<std::size_t>> find_where(
    const Value& target,
    const Path& path,
    const std::string& match_key,
    const Value& match_value,
    const Options& opts)
{
    if (auto err = check_match_value(match_value, opts, "find_where")) {
        return *err;
    }
    auto located = locate_array(target, path, opts, "find_where");
    if (!located) {
        return located.error();
    }
    if (!located.value()) {
        return std::optional<std::size_t>{};
    }
    return find_index(*located.value(), match_key, match_value);
}

Result<std::optional<std::size_t>> find_where(
    const Value& target,
    std::string_view path,
    const std::string& match_key,
    const Value& match_value,
    const Options& opts)
{
    return with_parsed_path(path, [&](const Path& p) {
        return find_where(target, p, match_key, match_value, opts);
    });
}

Result<bool> contains_id(
    const Value& target,
    const Path& path,
    const std::string& key,
    const Value& value,
    const Options& opts)
{
    auto found = find_where(target, path, key, value, opts);
    if (!found) {
        return found.error();
    }
    return found.value().has_value();
}

Result<bool> contains_id(
    const Value& target,
    std::string_view path,
    const std::string& key,
    const Value& value,
    const Options& opts)
{
    return with_parsed_path(path, [&](const Path& p) {
        return contains_id(target, p, key, value, opts);
    });
}

std::optional<std::string> extract_id(const Value& data, const std::string& key)
{
    auto* field = data.find(key);
    if (!field) {
        return std::nullopt;
    }
    if (auto* s = field->get_if<std::string>()) {
        return *s;
    }
    if (auto* n = field->get_if<Number>()) {
        return n->to_string();
    }
    return std::nullopt;
}

// ============================================================
// Update
// ============================================================

Result<Value> update_where(
    const Value& target,
    const Path& path,
    const std::string& match_key,
    const Value& match_value,
    const Value& updates,
    const Options& opts)
{
    if (auto err = check_match_value(match_value, opts, "update_where")) {
        return *err;
    }
    auto located = locate_array(target, path, opts, "update_where");
    if (!located) {
        return located.error();
    }
    if (!located.value()) {
        return target;
    }
    if (!updates.is_object()) {
        return detail::make_error("update_where", ErrorCode::TypeMismatch,
                                  "updates must be an object, found " + std::string{value_type_name(updates)});
    }
    const auto& array = *located.value();

    auto idx = find_index(array, match_key, match_value);
    if (!idx) {
        return target;
    }

    auto merged = shallow_merge(array[*idx].get(), updates);
    if (!merged) {
        return merged;
    }
    return store_array(target, path, array.set(*idx, ValueBox{std::move(merged).value()}), opts, "update_where");
}

Result<Value> update_where(
    const Value& target,
    std::string_view path,
    const std::string& match_key,
    const Value& match_value,
    const Value& updates,
    const Options& opts)
{
    return with_parsed_path(path, [&](const Path& p) {
        return update_where(target, p, match_key, match_value, updates, opts);
    });
}

Result<Value> update_where_path(
    const Value& target,
    const Path& path,
    const std::string& match_key,
    const Value& match_value,
    const Path& update_path,
    const Value& update_value,
    const Options& opts)
{
    if (auto err = check_match_value(match_value, opts, "update_where_path")) {
        return *err;
    }
    auto located = locate_array(target, path, opts, "update_where_path");
    if (!located) {
        return located.error();
    }
    if (!located.value()) {
        return target;
    }
    const auto& array = *located.value();

    auto idx = find_index(array, match_key, match_value);
    if (!idx) {
        return target;
    }

    // The element sits one level below the Array
    auto updated = detail::update_at_path(
        array[*idx].get(), update_path, path.size() + 1, opts,
        [&update_value](const std::optional<Value>&, std::size_t) -> Result<Value> { return update_value; },
        "update_where_path");
    if (!updated) {
        return updated;
    }
    return store_array(target, path, array.set(*idx, ValueBox{std::move(updated).value()}), opts,
                       "update_where_path");
}

Result<Value> update_where_path(
    const Value& target,
    std::string_view path,
    const std::string& match_key,
    const Value& match_value,
    std::string_view update_path,
    const Value& update_value,
    const Options& opts)
{
    auto relative = parse_path(update_path);
    if (!relative) {
        return relative.error();
    }
    return with_parsed_path(path, [&](const Path& p) {
        return update_where_path(target, p, match_key, match_value, relative.value(), update_value, opts);
    });
}

Result<Value> update_where_batch(
    const Value& target,
    const Path& path,
    const std::string& match_key,
    const Value& updates_array,
    const Options& opts)
{
    auto located = locate_array(target, path, opts, "update_where_batch");
    if (!located) {
        return located.error();
    }
    if (!located.value()) {
        return target;
    }
    auto* updates = updates_array.get_if<ValueArray>();
    if (!updates) {
        return detail::make_error("update_where_batch", ErrorCode::TypeMismatch,
                                  "updates must be an array, found " + std::string{value_type_name(updates_array)});
    }
    const auto& array = *located.value();

    // Pass 1: match value -> combined payload
    std::unordered_map<std::string, Value> lookup;
    lookup.reserve(updates->size());
    for (const auto& box : *updates) {
        const Value& entry = box.get();
        auto* id = entry.find(match_key);
        if (!id) {
            continue;  // Non-Objects have no members either
        }
        auto text = match_key_text(*id, opts);
        if (!text) {
            return detail::make_error("update_where_batch", ErrorCode::DepthExceeded,
                                      "match value nests deeper than " + std::to_string(opts.max_depth) + " levels");
        }
        auto [it, inserted] = lookup.try_emplace(std::move(*text), entry);
        if (!inserted) {
            it->second = smart_patch_scalar(it->second, entry);
        }
    }
    if (lookup.empty()) {
        return target;
    }

    // Pass 2: touch each element at most once
    auto transient = array.transient();
    bool touched = false;
    for (std::size_t i = 0; i < array.size(); ++i) {
        auto* id = array[i].get().find(match_key);
        if (!id) {
            continue;
        }
        // Ids nesting past the limit cannot equal any lookup entry
        auto text = match_key_text(*id, opts);
        if (!text) {
            continue;
        }
        auto it = lookup.find(*text);
        if (it == lookup.end()) {
            continue;
        }
        auto merged = shallow_merge(array[i].get(), it->second);
        if (!merged) {
            return merged;
        }
        transient.set(i, ValueBox{std::move(merged).value()});
        touched = true;
    }
    if (!touched) {
        return target;
    }
    return store_array(target, path, transient.persistent(), opts, "update_where_batch");
}

Result<Value> update_where_batch(
    const Value& target,
    std::string_view path,
    const std::string& match_key,
    const Value& updates_array,
    const Options& opts)
{
    return with_parsed_path(path, [&](const Path& p) {
        return update_where_batch(target, p, match_key, updates_array, opts);
    });
}

Result<std::vector<Value>> update_multi_row(
    const std::vector<Value>& targets,
    const Path& path,
    const std::string& match_key,
    const Value& match_value,
    const Value& updates,
    const Options& opts)
{
    std::vector<Value> results;
    results.reserve(targets.size());
    for (const auto& target : targets) {
        auto updated = update_where(target, path, match_key, match_value, updates, opts);
        if (!updated) {
            return updated.error();
        }
        results.push_back(std::move(updated).value());
    }
    return results;
}

Result<std::vector<Value>> update_multi_row(
    const std::vector<Value>& targets,
    std::string_view path,
    const std::string& match_key,
    const Value& match_value,
    const Value& updates,
    const Options& opts)
{
    return with_parsed_path(path, [&](const Path& p) {
        return update_multi_row(targets, p, match_key, match_value, updates, opts);
    });
}

// ============================================================
// Insert / Delete
// ============================================================

Result<Value> insert_where(
    const Value& target,
    const Path& path,
    const Value& element,
    const std::string& sort_key,
    SortOrder order,
    const Options& opts)
{
    auto located = locate_array(target, path, opts, "insert_where");
    if (!located) {
        return located.error();
    }
    if (!located.value()) {
        return store_array(target, path, ValueArray{}.push_back(ValueBox{element}), opts, "insert_where");
    }
    const auto& array = *located.value();

    std::size_t pos = array.size();
    if (auto* new_key = sort_key.empty() ? nullptr : element.find(sort_key)) {
        for (std::size_t i = 0; i < array.size(); ++i) {
            auto* existing = array[i].get().find(sort_key);
            if (!existing) {
                continue;
            }
            auto cmp = compare_values(*existing, *new_key);
            if (!cmp) {
                return detail::make_error("insert_where", ErrorCode::InvalidSortKey,
                                          "cannot order " + std::string{value_type_name(*existing)} + " against " +
                                              std::string{value_type_name(*new_key)} + " for sort key \"" +
                                              sort_key + "\"");
            }
            const bool past = order == SortOrder::Ascending ? cmp.value() > 0 : cmp.value() < 0;
            if (past) {
                pos = i;
                break;
            }
        }
    }

    return store_array(target, path, array.insert(pos, ValueBox{element}), opts, "insert_where");
}

Result<Value> insert_where(
    const Value& target,
    std::string_view path,
    const Value& element,
    const std::string& sort_key,
    SortOrder order,
    const Options& opts)
{
    return with_parsed_path(path, [&](const Path& p) {
        return insert_where(target, p, element, sort_key, order, opts);
    });
}

Result<Value> delete_where(
    const Value& target,
    const Path& path,
    const std::string& match_key,
    const Value& match_value,
    const Options& opts)
{
    if (auto err = check_match_value(match_value, opts, "delete_where")) {
        return *err;
    }
    auto located = locate_array(target, path, opts, "delete_where");
    if (!located) {
        return located.error();
    }
    if (!located.value()) {
        return target;
    }
    const auto& array = *located.value();

    ArrayBuilder survivors;
    for (const auto& box : array) {
        if (!element_matches(box, match_key, match_value)) {
            survivors.push_back_box(box);
        }
    }
    if (survivors.size() == array.size()) {
        return target;
    }
    return store_array(target, path, survivors.finish_array(), opts, "delete_where");
}

Result<Value> delete_where(
    const Value& target,
    std::string_view path,
    const std::string& match_key,
    const Value& match_value,
    const Options& opts)
{
    return with_parsed_path(path, [&](const Path& p) {
        return delete_where(target, p, match_key, match_value, opts);
    });
}

} // namespace jsonb_delta
