// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Value type definition and utilities for JSON-like documents.
///
/// Value is a closed tagged union of exactly six kinds:
/// - Null (std::monostate)
/// - Bool
/// - Number (precision preserving, see number.h)
/// - String
/// - Array  (immer::flex_vector of boxed Values)
/// - Object (immer::map from string keys to boxed Values)
///
/// Containers are persistent: "modifying" one returns a new container that
/// shares every untouched child box with the original. A Value is therefore
/// cheap to copy (reference count bumps only) and never changes after
/// construction.

#pragma once

#include <jsonb_delta/config.h>

#include <jsonb_delta/api.h>
#include <jsonb_delta/error.h>
#include <jsonb_delta/number.h>

#include <immer/box.hpp>
#include <immer/flex_vector.hpp>
#include <immer/flex_vector_transient.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace jsonb_delta {

/// The six value kinds, in variant index order
enum class ValueKind : std::uint8_t {
    Null = 0,
    Bool,
    Number,
    String,
    Array,
    Object,
};

struct Value;

using ValueBox   = immer::box<Value>;
using ValueMap   = immer::map<std::string, ValueBox>;
using ValueArray = immer::flex_vector<ValueBox>;

struct JSONB_DELTA_API Value
{
    std::variant<std::monostate,
                 bool,
                 Number,
                 std::string,
                 ValueArray,
                 ValueMap>
        data;

    Value() noexcept : data(std::monostate{}) {}
    Value(std::nullptr_t) noexcept : data(std::monostate{}) {}
    Value(bool v) noexcept : data(v) {}

    template <std::integral T>
        requires (!std::same_as<T, bool>)
    Value(T v) : data(Number{v}) {}

    /// @throws std::invalid_argument for NaN or infinity
    Value(double v) : data(Number{v}) {}
    Value(Number v) : data(std::move(v)) {}
    Value(const std::string& v) : data(v) {}
    Value(std::string&& v) noexcept : data(std::move(v)) {}
    Value(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    Value(const char* v) : data(std::in_place_type<std::string>, v) {}
    Value(ValueArray v) : data(std::move(v)) {}
    Value(ValueMap v) : data(std::move(v)) {}

    // Factory functions for container types
    static Value object(std::initializer_list<std::pair<std::string, Value>> init) {
        auto t = ValueMap{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, ValueBox{val});
        }
        return Value{t.persistent()};
    }

    static Value array(std::initializer_list<Value> init) {
        auto t = ValueArray{}.transient();
        for (const auto& val : init) {
            t.push_back(ValueBox{val});
        }
        return Value{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(data); }

    [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(data.index()); }
    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_number() const noexcept { return is<Number>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_array() const noexcept { return is<ValueArray>(); }
    [[nodiscard]] bool is_object() const noexcept { return is<ValueMap>(); }

    /// Look up an Object member without copying
    /// @return nullptr if this is not an Object or the key is absent
    [[nodiscard]] const Value* find(const std::string& key) const {
        if (auto* m = get_if<ValueMap>()) {
            if (auto* found = m->find(key)) return &found->get();
        }
        return nullptr;
    }

    /// Look up an Array element without copying
    /// @return nullptr if this is not an Array or the index is out of range
    [[nodiscard]] const Value* find(std::size_t index) const {
        if (auto* a = get_if<ValueArray>()) {
            if (index < a->size()) return &(*a)[index].get();
        }
        return nullptr;
    }

    [[nodiscard]] bool contains(const std::string& key) const { return find(key) != nullptr; }

    [[nodiscard]] bool as_bool(bool default_val = false) const noexcept {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    [[nodiscard]] std::size_t size() const noexcept {
        if (auto* m = get_if<ValueMap>()) return m->size();
        if (auto* a = get_if<ValueArray>()) return a->size();
        return 0;
    }
};

// ============================================================
// Equality and ordering
// ============================================================

/// Structural, type-aware equality.
/// - Number: numeric (1 == 1.0)
/// - Object: same key set, recursively equal members, order irrelevant
/// - Array: same length, positionally equal elements
/// Shared subtrees are recognized by identity before any recursion.
[[nodiscard]] JSONB_DELTA_API bool operator==(const Value& a, const Value& b);

/// Order two values of the same orderable kind.
/// Only Number/Number (numeric) and String/String (lexicographic by code
/// unit) are ordered; every other pairing is ErrorCode::TypeMismatch.
[[nodiscard]] JSONB_DELTA_API Result<std::strong_ordering> compare_values(const Value& a, const Value& b);

// ============================================================
// Utility functions
// ============================================================

/// "null", "boolean", "number", "string", "array" or "object"
[[nodiscard]] JSONB_DELTA_API std::string_view value_type_name(const Value& val) noexcept;

/// Keys of an Object in canonical (ascending code unit) order
[[nodiscard]] JSONB_DELTA_API std::vector<std::string> sorted_keys(const ValueMap& map);

/// Compact JSON text with canonical key order (diagnostics and tests)
[[nodiscard]] JSONB_DELTA_API std::string value_to_string(const Value& val);

JSONB_DELTA_API std::ostream& operator<<(std::ostream& os, const Value& val);

/// Check that a value nests no deeper than opts.max_depth container levels.
/// Scalars have depth 0, {"a": 1} has depth 1, {"a": [1]} has depth 2.
/// The walk itself stops one level past the limit, so hostile input cannot
/// exhaust the stack.
/// @return the depth of @p val, or ErrorCode::DepthExceeded
[[nodiscard]] JSONB_DELTA_API Result<std::size_t> validate_depth(const Value& val, const Options& opts = {});

} // namespace jsonb_delta
