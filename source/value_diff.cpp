// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_diff.cpp
/// @brief Delta computation, application, wire form and difference checks.

#include <jsonb_delta/value_diff.h>

#include <jsonb_delta/builders.h>

#include <immer/algorithm.hpp>

#include <algorithm>

namespace jsonb_delta {

namespace diff_keys {
    inline constexpr const char* REPLACE = "replace";
    inline constexpr const char* ADDED   = "added";
    inline constexpr const char* REMOVED = "removed";
    inline constexpr const char* CHANGED = "changed";
}

namespace {

using KeyValue = std::pair<const std::string, ValueBox>;

Delta diff_values(const Value& old_val, const Value& new_val);

Delta diff_maps(const ValueMap& old_map, const ValueMap& new_map)
{
    auto added = ValueMap{}.transient();
    std::vector<std::string> removed;
    auto changed = Delta::ChangedMap{}.transient();

    auto map_differ = immer::make_differ(
        // added
        [&](const KeyValue& added_kv) {
            added.set(added_kv.first, added_kv.second);
        },
        // removed
        [&](const KeyValue& removed_kv) {
            removed.push_back(removed_kv.first);
        },
        // changed (retained key)
        [&](const KeyValue& old_kv, const KeyValue& new_kv) {
            // Same box: unchanged, O(1)
            if (&old_kv.second.get() == &new_kv.second.get()) [[likely]] {
                return;
            }
            const Value& old_child = old_kv.second.get();
            const Value& new_child = new_kv.second.get();
            if (old_child == new_child) {
                return;
            }
            if (old_child.is_object() && new_child.is_object()) {
                changed.set(old_kv.first, immer::box<Delta>{diff_values(old_child, new_child)});
            } else {
                // Arrays and scalars are atomic
                changed.set(old_kv.first, immer::box<Delta>{Delta::replace(new_child)});
            }
        }
    );

    immer::diff(old_map, new_map, map_differ);
    return Delta::patch(added.persistent(), std::move(removed), changed.persistent());
}

Delta diff_values(const Value& old_val, const Value& new_val)
{
    auto* old_map = old_val.get_if<ValueMap>();
    auto* new_map = new_val.get_if<ValueMap>();
    if (old_map && new_map) {
        if (old_map->impl().root == new_map->impl().root &&
            old_map->size() == new_map->size()) [[likely]] {
            return Delta{};
        }
        return diff_maps(*old_map, *new_map);
    }
    if (old_val == new_val) {
        return Delta{};
    }
    return Delta::replace(new_val);
}

Result<Value> apply_recursive(const Value& original, const Delta& delta, std::size_t depth, const Options& opts)
{
    if (auto* literal = delta.replacement()) {
        return *literal;
    }
    if (delta.is_empty()) {
        return original;
    }

    auto* map = original.get_if<ValueMap>();
    if (!map) {
        return detail::make_error("apply_delta", ErrorCode::TypeMismatch,
                                  "object patch applied to " + std::string{value_type_name(original)});
    }
    if (depth >= opts.max_depth) {
        return detail::make_error("apply_delta", ErrorCode::DepthExceeded,
                                  "patch descends deeper than " + std::to_string(opts.max_depth) + " levels");
    }

    ObjectBuilder builder(*map);
    for (const auto& key : delta.removed()) {
        builder.erase(key);
    }
    for (const auto& [key, box] : delta.added()) {
        builder.set_box(key, box);
    }
    for (const auto& [key, child] : delta.changed()) {
        if (auto* literal = child->replacement()) {
            builder.set(key, *literal);
            continue;
        }
        // Nested patch on a missing key starts from {}
        auto* existing = map->find(key);
        const Value base = existing ? existing->get() : Value{ValueMap{}};
        auto patched = apply_recursive(base, *child, depth + 1, opts);
        if (!patched) {
            return patched;
        }
        builder.set(key, std::move(patched).value());
    }
    return builder.finish();
}

Error wire_error(const std::string& what)
{
    return detail::make_error("Delta::from_value", ErrorCode::TypeMismatch, what);
}

Result<Delta> decode_recursive(const Value& wire, std::size_t depth, const Options& opts)
{
    auto* map = wire.get_if<ValueMap>();
    if (!map) {
        return wire_error("delta must be an object, found " + std::string{value_type_name(wire)});
    }
    if (depth >= opts.max_depth) {
        return detail::make_error("Delta::from_value", ErrorCode::DepthExceeded,
                                  "delta nests deeper than " + std::to_string(opts.max_depth) + " levels");
    }

    if (auto* literal = map->find(diff_keys::REPLACE)) {
        if (map->size() != 1) {
            return wire_error("\"replace\" cannot be combined with other parts");
        }
        return Delta::replace(literal->get());
    }

    ValueMap added;
    std::vector<std::string> removed;
    auto changed = Delta::ChangedMap{}.transient();

    for (const auto& [part, box] : *map) {
        const Value& body = box.get();
        if (part == diff_keys::ADDED) {
            auto* added_map = body.get_if<ValueMap>();
            if (!added_map) {
                return wire_error("\"added\" must be an object");
            }
            added = *added_map;
        } else if (part == diff_keys::REMOVED) {
            auto* names = body.get_if<ValueArray>();
            if (!names) {
                return wire_error("\"removed\" must be an array");
            }
            removed.reserve(names->size());
            for (const auto& name : *names) {
                auto* s = name.get().get_if<std::string>();
                if (!s) {
                    return wire_error("\"removed\" entries must be strings");
                }
                removed.push_back(*s);
            }
        } else if (part == diff_keys::CHANGED) {
            auto* changed_map = body.get_if<ValueMap>();
            if (!changed_map) {
                return wire_error("\"changed\" must be an object");
            }
            for (const auto& [key, child_wire] : *changed_map) {
                auto child = decode_recursive(child_wire.get(), depth + 1, opts);
                if (!child) {
                    return child;
                }
                changed.set(key, immer::box<Delta>{std::move(child).value()});
            }
        } else {
            return wire_error("unknown delta part \"" + part + "\"");
        }
    }
    return Delta::patch(std::move(added), std::move(removed), changed.persistent());
}

} // anonymous namespace

// ============================================================
// Delta
// ============================================================

Delta Delta::replace(Value value)
{
    Delta d;
    d.replacement_ = std::move(value);
    return d;
}

Delta Delta::patch(ValueMap added, std::vector<std::string> removed, ChangedMap changed)
{
    std::sort(removed.begin(), removed.end());
    removed.erase(std::unique(removed.begin(), removed.end()), removed.end());

    Delta d;
    d.added_ = std::move(added);
    d.removed_ = std::move(removed);
    d.changed_ = std::move(changed);
    return d;
}

Value Delta::to_value() const
{
    if (replacement_) {
        return ObjectBuilder().set(diff_keys::REPLACE, *replacement_).finish();
    }

    ObjectBuilder builder;
    if (!added_.empty()) {
        builder.set(diff_keys::ADDED, Value{added_});
    }
    if (!removed_.empty()) {
        ArrayBuilder names;
        for (const auto& key : removed_) {
            names.push_back(key);
        }
        builder.set(diff_keys::REMOVED, names.finish());
    }
    if (!changed_.empty()) {
        ObjectBuilder children;
        for (const auto& [key, child] : changed_) {
            children.set(key, child->to_value());
        }
        builder.set(diff_keys::CHANGED, children.finish());
    }
    return builder.finish();
}

Result<Delta> Delta::from_value(const Value& wire, const Options& opts)
{
    return decode_recursive(wire, 0, opts);
}

// ============================================================
// compute / apply
// ============================================================

Result<Delta> compute_delta(const Value& original, const Value& modified, const Options& opts)
{
    // Bounds the recursion below
    if (auto depth = validate_depth(original, opts); !depth) {
        return depth.error();
    }
    if (auto depth = validate_depth(modified, opts); !depth) {
        return depth.error();
    }
    return diff_values(original, modified);
}

Result<Value> apply_delta(const Value& original, const Delta& delta, const Options& opts)
{
    return apply_recursive(original, delta, 0, opts);
}

// ============================================================
// has_any_difference
// ============================================================

namespace {

Result<bool> differ_recursive(const Value& old_val, const Value& new_val, std::size_t depth, const Options& opts)
{
    if (old_val.kind() != new_val.kind()) {
        return true;
    }

    if (auto* old_map = old_val.get_if<ValueMap>()) {
        const auto& new_map = *new_val.get_if<ValueMap>();
        if (old_map->size() != new_map.size()) {
            return true;
        }
        if (old_map->impl().root == new_map.impl().root) {
            return false;
        }
        if (depth >= opts.max_depth) {
            return detail::make_error("has_any_difference", ErrorCode::DepthExceeded,
                                      "comparison descends deeper than " + std::to_string(opts.max_depth) +
                                          " levels");
        }
        for (const auto& [key, box] : *old_map) {
            auto* other = new_map.find(key);
            if (!other) {
                return true;
            }
            if (&box.get() == &other->get()) {
                continue;
            }
            auto child = differ_recursive(box.get(), other->get(), depth + 1, opts);
            if (!child || child.value()) {
                return child;
            }
        }
        return false;
    }

    if (auto* old_arr = old_val.get_if<ValueArray>()) {
        const auto& new_arr = *new_val.get_if<ValueArray>();
        if (old_arr->size() != new_arr.size()) {
            return true;
        }
        if (depth >= opts.max_depth) {
            return detail::make_error("has_any_difference", ErrorCode::DepthExceeded,
                                      "comparison descends deeper than " + std::to_string(opts.max_depth) +
                                          " levels");
        }
        for (std::size_t i = 0; i < old_arr->size(); ++i) {
            const auto& old_box = (*old_arr)[i];
            const auto& new_box = new_arr[i];
            if (&old_box.get() == &new_box.get()) {
                continue;
            }
            auto child = differ_recursive(old_box.get(), new_box.get(), depth + 1, opts);
            if (!child || child.value()) {
                return child;
            }
        }
        return false;
    }

    // Scalars: equality does not recurse
    return !(old_val == new_val);
}

} // anonymous namespace

Result<bool> has_any_difference(const Value& old_val, const Value& new_val, const Options& opts)
{
    if (&old_val == &new_val) {
        return false;
    }
    return differ_recursive(old_val, new_val, 0, opts);
}

} // namespace jsonb_delta
