// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file number.h
/// @brief Precision-preserving numeric type for Value.
///
/// A Number is either
/// - an integer that fits in int64_t, stored inline, or
/// - an exact decimal significand * 10^exponent, with an arbitrary-size
///   boost::multiprecision::cpp_int significand, boxed to keep the Value
///   variant small (same trick as the boxed matrices in value.h).
///
/// No digit is ever rounded away. The decimal form is normalized (no
/// trailing zeros in the significand), and integral values that fit int64_t
/// always use the inline form, so numerically equal Numbers share one
/// representation and one canonical text (to_string()).
///
/// Equality and ordering are numeric: Number{1} == Number::parse("1.0").

#pragma once

#include <jsonb_delta/api.h>
#include <jsonb_delta/config.h>

#include <immer/box.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <compare>
#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace jsonb_delta {

class JSONB_DELTA_API Number {
public:
    /// significand * 10^exponent; significand is never zero and never a
    /// multiple of 10
    struct Decimal {
        boost::multiprecision::cpp_int significand;
        std::int64_t exponent = 0;
    };
    using boxed_decimal = immer::box<Decimal>;

    Number() noexcept : rep_(std::int64_t{0}) {}

    template <std::signed_integral T>
    Number(T v) noexcept : rep_(static_cast<std::int64_t>(v)) {}

    template <std::unsigned_integral T>
        requires (!std::same_as<T, bool>)
    Number(T v) : rep_(std::int64_t{0}) {
        if (static_cast<std::uint64_t>(v) <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            rep_ = static_cast<std::int64_t>(v);
        } else {
            assign_normalized(boost::multiprecision::cpp_int{static_cast<std::uint64_t>(v)}, 0);
        }
    }

    /// Exact value of the shortest text that round-trips @p v
    /// @throws std::invalid_argument for NaN or infinity
    explicit Number(double v);

    Number(boost::multiprecision::cpp_int significand, std::int64_t exponent);

    /// Parse strict JSON number text ("-12", "3.25", "1e400", ...)
    /// @return std::nullopt if the text is not a JSON number, or its
    ///         exponent is beyond +/-2^62
    [[nodiscard]] static std::optional<Number> parse(std::string_view text);

    /// True for the inline int64 form
    [[nodiscard]] bool is_integer() const noexcept { return rep_.index() == 0; }

    /// @return the integer value, or std::nullopt for non-int64 numbers
    [[nodiscard]] std::optional<std::int64_t> as_int64() const noexcept {
        if (auto* i = std::get_if<std::int64_t>(&rep_)) return *i;
        return std::nullopt;
    }

    /// Nearest double (lossy for large or long decimals)
    [[nodiscard]] double as_double() const;

    /// The value as significand * 10^exponent (an int64 0 gives {0, 0})
    [[nodiscard]] Decimal as_decimal() const;

    /// Canonical text. Integers print plainly. Decimals print positionally
    /// ("0.001", "12.5") unless that needs more than 20 padding zeros; then
    /// the significand is followed by an exponent ("15e-30", "1e400").
    /// parse() reads either form back exactly.
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] std::strong_ordering compare(const Number& other) const;

    friend bool operator==(const Number& a, const Number& b) { return a.compare(b) == 0; }
    friend std::strong_ordering operator<=>(const Number& a, const Number& b) { return a.compare(b); }

private:
    void assign_normalized(boost::multiprecision::cpp_int significand, std::int64_t exponent);

    std::variant<std::int64_t, boxed_decimal> rep_;
};

} // namespace jsonb_delta
