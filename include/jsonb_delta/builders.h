// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Builder classes for efficient O(n) construction of immutable containers.
///
/// - ObjectBuilder: build a ValueMap through immer's transient API
/// - ArrayBuilder:  build a ValueArray through immer's transient API
///
/// Usage:
/// @code
///   Value order = ObjectBuilder()
///       .set("id", 42)
///       .set("status", "new")
///       .finish();
///
///   Value ids = ArrayBuilder()
///       .push_back(1)
///       .push_back(2)
///       .finish();
/// @endcode
///
/// Both builders also accept existing ValueBox instances, which is how the
/// engines rebuild a container while sharing every untouched child.

#pragma once

#include "value.h"

namespace jsonb_delta {

class ObjectBuilder {
public:
    using transient_type = ValueMap::transient_type;

    ObjectBuilder() : transient_(ValueMap{}.transient()) {}
    explicit ObjectBuilder(const ValueMap& existing) : transient_(existing.transient()) {}

    ObjectBuilder(ObjectBuilder&&) noexcept = default;
    ObjectBuilder& operator=(ObjectBuilder&&) noexcept = default;

    // Transients must not be shared
    ObjectBuilder(const ObjectBuilder&) = delete;
    ObjectBuilder& operator=(const ObjectBuilder&) = delete;

    ObjectBuilder& set(const std::string& key, Value val) {
        transient_.set(key, ValueBox{std::move(val)});
        return *this;
    }

    /// Set a key to an existing box (shares the subtree)
    ObjectBuilder& set_box(const std::string& key, ValueBox box) {
        transient_.set(key, std::move(box));
        return *this;
    }

    ObjectBuilder& erase(const std::string& key) {
        transient_.erase(key);
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return transient_.count(key) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    /// Note: After calling finish(), the builder is in an undefined state
    [[nodiscard]] Value finish() {
        return Value{transient_.persistent()};
    }

    [[nodiscard]] ValueMap finish_map() {
        return transient_.persistent();
    }

private:
    transient_type transient_;
};

class ArrayBuilder {
public:
    using transient_type = ValueArray::transient_type;

    ArrayBuilder() : transient_(ValueArray{}.transient()) {}
    explicit ArrayBuilder(const ValueArray& existing) : transient_(existing.transient()) {}

    ArrayBuilder(ArrayBuilder&&) noexcept = default;
    ArrayBuilder& operator=(ArrayBuilder&&) noexcept = default;

    ArrayBuilder(const ArrayBuilder&) = delete;
    ArrayBuilder& operator=(const ArrayBuilder&) = delete;

    ArrayBuilder& push_back(Value val) {
        transient_.push_back(ValueBox{std::move(val)});
        return *this;
    }

    /// Append an existing box (shares the subtree)
    ArrayBuilder& push_back_box(ValueBox box) {
        transient_.push_back(std::move(box));
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] Value finish() {
        return Value{transient_.persistent()};
    }

    [[nodiscard]] ValueArray finish_array() {
        return transient_.persistent();
    }

private:
    transient_type transient_;
};

} // namespace jsonb_delta
