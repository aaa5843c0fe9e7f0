// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.cpp
/// @brief Value equality, ordering and text utilities.

#include <jsonb_delta/value.h>

#include <algorithm>
#include <cstdio>
#include <optional>
#include <ostream>

namespace jsonb_delta {

namespace {

bool boxes_equal(const ValueBox& a, const ValueBox& b)
{
    // Shared subtree: O(1)
    if (&a.get() == &b.get()) [[likely]] {
        return true;
    }
    return a.get() == b.get();
}

bool maps_equal(const ValueMap& a, const ValueMap& b)
{
    if (a.size() != b.size()) {
        return false;
    }
    if (a.impl().root == b.impl().root) {
        return true;
    }
    for (const auto& [key, box] : a) {
        auto* other = b.find(key);
        if (!other || !boxes_equal(box, *other)) {
            return false;
        }
    }
    return true;
}

bool arrays_equal(const ValueArray& a, const ValueArray& b)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (!boxes_equal(a[i], b[i])) {
            return false;
        }
    }
    return true;
}

void append_escaped(std::string& out, std::string_view s)
{
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

void append_value(std::string& out, const Value& val)
{
    std::visit([&out](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, Number>) {
            out += arg.to_string();
        } else if constexpr (std::is_same_v<T, std::string>) {
            append_escaped(out, arg);
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            out += '[';
            bool first = true;
            for (const auto& box : arg) {
                if (!first) out += ',';
                first = false;
                append_value(out, *box);
            }
            out += ']';
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            out += '{';
            bool first = true;
            for (const auto& key : sorted_keys(arg)) {
                if (!first) out += ',';
                first = false;
                append_escaped(out, key);
                out += ':';
                append_value(out, arg.find(key)->get());
            }
            out += '}';
        }
    }, val.data);
}

/// @return the depth of @p val, or std::nullopt once depth + 1 would pass the limit
std::optional<std::size_t> bounded_depth(const Value& val, std::size_t depth, std::size_t limit)
{
    std::size_t deepest = depth;

    auto visit_child = [&](const Value& child) -> bool {
        auto child_depth = bounded_depth(child, depth + 1, limit);
        if (!child_depth) return false;
        deepest = std::max(deepest, *child_depth);
        return true;
    };

    if (auto* m = val.get_if<ValueMap>()) {
        if (depth >= limit) return std::nullopt;
        deepest = depth + 1;
        for (const auto& [key, box] : *m) {
            if (!visit_child(*box)) return std::nullopt;
        }
    } else if (auto* a = val.get_if<ValueArray>()) {
        if (depth >= limit) return std::nullopt;
        deepest = depth + 1;
        for (const auto& box : *a) {
            if (!visit_child(*box)) return std::nullopt;
        }
    }
    return deepest;
}

} // anonymous namespace

bool operator==(const Value& a, const Value& b)
{
    if (a.data.index() != b.data.index()) {
        return false;
    }

    return std::visit([&b](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.data);

        if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return maps_equal(lhs, rhs);
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            return arrays_equal(lhs, rhs);
        } else {
            return lhs == rhs;
        }
    }, a.data);
}

Result<std::strong_ordering> compare_values(const Value& a, const Value& b)
{
    if (auto* lhs = a.get_if<Number>()) {
        if (auto* rhs = b.get_if<Number>()) {
            return lhs->compare(*rhs);
        }
    } else if (auto* lhs = a.get_if<std::string>()) {
        if (auto* rhs = b.get_if<std::string>()) {
            const int cmp = lhs->compare(*rhs);
            if (cmp < 0) return std::strong_ordering::less;
            if (cmp > 0) return std::strong_ordering::greater;
            return std::strong_ordering::equal;
        }
    }

    return detail::make_error("compare_values", ErrorCode::TypeMismatch,
                              std::string{"cannot order "} + std::string{value_type_name(a)} +
                                  " against " + std::string{value_type_name(b)});
}

std::string_view value_type_name(const Value& val) noexcept
{
    switch (val.kind()) {
        case ValueKind::Null:   return "null";
        case ValueKind::Bool:   return "boolean";
        case ValueKind::Number: return "number";
        case ValueKind::String: return "string";
        case ValueKind::Array:  return "array";
        case ValueKind::Object: return "object";
    }
    return "unknown";
}

std::vector<std::string> sorted_keys(const ValueMap& map)
{
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& [key, box] : map) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::string value_to_string(const Value& val)
{
    std::string out;
    append_value(out, val);
    return out;
}

std::ostream& operator<<(std::ostream& os, const Value& val)
{
    return os << value_to_string(val);
}

Result<std::size_t> validate_depth(const Value& val, const Options& opts)
{
    if (auto depth = bounded_depth(val, 0, opts.max_depth)) {
        return *depth;
    }
    return detail::make_error("validate_depth", ErrorCode::DepthExceeded,
                              "value nests deeper than " + std::to_string(opts.max_depth) + " levels");
}

} // namespace jsonb_delta
