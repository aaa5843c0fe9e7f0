// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_diff.h
/// @brief Structural diff (Delta) between two Values and its inverse.
///
/// A Delta is one of:
/// - a **replacement**: "the new value is X", used whenever the two sides are
///   not both Objects (Arrays are always replaced whole);
/// - a **patch** over an Object: keys added, keys removed, and keys whose
///   values changed. A changed key holds a nested Delta, which is itself a
///   patch when both old and new values are Objects and a replacement
///   otherwise.
///
/// The empty patch means "no change".
///
/// Guarantees:
/// @code
///   apply_delta(a, compute_delta(a, b).value()).value() == b
///   compute_delta(a, a).value().is_empty()
/// @endcode
///
/// Wire form (Delta::to_value / Delta::from_value):
/// @code
///   {"replace": <value>}
///   {"added": {...}, "removed": ["k", ...], "changed": {"k": <delta>, ...}}
/// @endcode
/// Empty parts of a patch are omitted, so the empty patch is {}.

#pragma once

#include <jsonb_delta/api.h>
#include <jsonb_delta/value.h>

#include <immer/box.hpp>
#include <immer/map.hpp>

#include <optional>
#include <string>
#include <vector>

namespace jsonb_delta {

class JSONB_DELTA_API Delta {
public:
    using ChangedMap = immer::map<std::string, immer::box<Delta>>;

    /// The empty patch
    Delta() = default;

    [[nodiscard]] static Delta replace(Value value);

    /// @param removed Key names; stored sorted and without duplicates
    [[nodiscard]] static Delta patch(ValueMap added, std::vector<std::string> removed, ChangedMap changed);

    [[nodiscard]] bool is_replace() const noexcept { return replacement_.has_value(); }
    [[nodiscard]] bool is_empty() const noexcept {
        return !replacement_ && added_.empty() && removed_.empty() && changed_.empty();
    }

    /// @return The literal new value, or nullptr for a patch
    [[nodiscard]] const Value* replacement() const noexcept {
        return replacement_ ? &*replacement_ : nullptr;
    }

    [[nodiscard]] const ValueMap& added() const noexcept { return added_; }
    [[nodiscard]] const std::vector<std::string>& removed() const noexcept { return removed_; }
    [[nodiscard]] const ChangedMap& changed() const noexcept { return changed_; }

    /// Encode as a Value (see the wire form above)
    [[nodiscard]] Value to_value() const;

    /// Decode the wire form
    /// @return TypeMismatch for anything that is not a well-formed Delta,
    ///         DepthExceeded for nesting beyond opts.max_depth
    [[nodiscard]] static Result<Delta> from_value(const Value& wire, const Options& opts = {});

private:
    std::optional<Value> replacement_;
    ValueMap added_;
    std::vector<std::string> removed_;
    ChangedMap changed_;
};

/// @brief Compute the Delta that turns @p original into @p modified
///
/// Both inputs are depth-checked first. Object pairs are compared key-wise
/// with immer::diff, so subtrees shared between the two sides cost O(1).
///
/// @return The Delta, or DepthExceeded
[[nodiscard]] JSONB_DELTA_API Result<Delta> compute_delta(
    const Value& original, const Value& modified, const Options& opts = {});

/// @brief Apply @p delta to @p original
/// @return The patched value (@p original itself for the empty patch);
///         TypeMismatch when a non-empty patch meets a non-Object;
///         DepthExceeded when the patch nests beyond opts.max_depth
[[nodiscard]] JSONB_DELTA_API Result<Value> apply_delta(
    const Value& original, const Delta& delta, const Options& opts = {});

/// @brief Check whether two values differ, stopping at the first difference
///
/// Cheaper than compute_delta() when only a yes/no answer is needed. Shared
/// containers are recognized by identity and never walked.
///
/// @return true if the values differ, or DepthExceeded when the walk would
///         descend past opts.max_depth
[[nodiscard]] JSONB_DELTA_API Result<bool> has_any_difference(
    const Value& old_val, const Value& new_val, const Options& opts = {});

} // namespace jsonb_delta
