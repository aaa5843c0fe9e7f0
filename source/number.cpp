// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file number.cpp
/// @brief Number parsing, normalization and comparison.

#include <jsonb_delta/number.h>

#include <charconv>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <system_error>

namespace jsonb_delta {

namespace mp = boost::multiprecision;

namespace {

/// Exponents beyond this are rejected by parse() so that exponent
/// arithmetic can never overflow int64_t
constexpr std::int64_t kMaxExponent = std::int64_t{1} << 62;

/// Longest run of padding zeros to_string() writes before switching to
/// the exponent form
constexpr std::int64_t kMaxPaddingZeros = 20;

bool is_digit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

/// Validate JSON number syntax: -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
/// @param is_plain_integer set to true when there is no fraction or exponent
bool is_json_number(std::string_view text, bool& is_plain_integer) noexcept
{
    std::size_t i = 0;
    const std::size_t n = text.size();
    is_plain_integer = true;

    if (i < n && text[i] == '-') ++i;
    if (i >= n) return false;

    if (text[i] == '0') {
        ++i;
    } else if (is_digit(text[i])) {
        while (i < n && is_digit(text[i])) ++i;
    } else {
        return false;
    }

    if (i < n && text[i] == '.') {
        is_plain_integer = false;
        ++i;
        if (i >= n || !is_digit(text[i])) return false;
        while (i < n && is_digit(text[i])) ++i;
    }

    if (i < n && (text[i] == 'e' || text[i] == 'E')) {
        is_plain_integer = false;
        ++i;
        if (i < n && (text[i] == '+' || text[i] == '-')) ++i;
        if (i >= n || !is_digit(text[i])) return false;
        while (i < n && is_digit(text[i])) ++i;
    }

    return i == n;
}

/// Sign, significant digits (no leading or trailing zeros) and the power of
/// ten applied to them
struct Magnitude {
    int sign = 0;
    std::string digits;
    std::int64_t exponent = 0;
};

Magnitude magnitude_of(const Number::Decimal& d)
{
    Magnitude m;
    m.sign = d.significand.sign();
    if (m.sign == 0) {
        return m;
    }
    m.digits = mp::cpp_int{mp::abs(d.significand)}.str();
    m.exponent = d.exponent;
    while (m.digits.size() > 1 && m.digits.back() == '0') {
        m.digits.pop_back();
        ++m.exponent;
    }
    return m;
}

std::strong_ordering compare_magnitudes(const Magnitude& a, const Magnitude& b)
{
    if (a.sign != b.sign) {
        return a.sign <=> b.sign;
    }
    if (a.sign == 0) {
        return std::strong_ordering::equal;
    }

    // Position of the leading digit decides first
    const std::int64_t a_lead = a.exponent + static_cast<std::int64_t>(a.digits.size());
    const std::int64_t b_lead = b.exponent + static_cast<std::int64_t>(b.digits.size());
    std::strong_ordering abs_order = a_lead <=> b_lead;
    if (abs_order == 0) {
        // Same leading position: digit strings compare like the values
        const int cmp = a.digits.compare(b.digits);
        abs_order = cmp < 0 ? std::strong_ordering::less
                  : cmp > 0 ? std::strong_ordering::greater
                            : std::strong_ordering::equal;
    }
    return a.sign > 0 ? abs_order : 0 <=> abs_order;
}

} // anonymous namespace

Number::Number(double v) : rep_(std::int64_t{0})
{
    if (!std::isfinite(v)) {
        throw std::invalid_argument("Number: NaN and infinity are not representable");
    }

    // [-2^63, 2^63) is exactly representable as double bounds
    if (std::trunc(v) == v && v >= -9223372036854775808.0 && v < 9223372036854775808.0) {
        rep_ = static_cast<std::int64_t>(v);
        return;
    }

    // Shortest round-trip text, so Number{0.1} equals Number::parse("0.1")
    char buffer[64];
    auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), v);
    std::optional<Number> parsed;
    if (ec == std::errc{}) {
        parsed = parse(std::string_view{buffer, static_cast<std::size_t>(ptr - buffer)});
    }
    if (!parsed) {
        throw std::invalid_argument("Number: cannot represent double " + std::to_string(v));
    }
    rep_ = std::move(parsed->rep_);
}

Number::Number(mp::cpp_int significand, std::int64_t exponent) : rep_(std::int64_t{0})
{
    assign_normalized(std::move(significand), exponent);
}

std::optional<Number> Number::parse(std::string_view text)
{
    bool is_plain_integer = false;
    if (!is_json_number(text, is_plain_integer)) {
        return std::nullopt;
    }

    if (is_plain_integer) {
        std::int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc{} && ptr == text.data() + text.size()) {
            return Number{value};
        }
        // Out of int64 range: fall through to the decimal form
    }

    std::size_t i = 0;
    const std::size_t n = text.size();
    const bool negative = text[0] == '-';
    if (negative) ++i;

    std::string digits;
    std::int64_t exponent = 0;
    while (i < n && is_digit(text[i])) {
        digits += text[i++];
    }
    if (i < n && text[i] == '.') {
        ++i;
        while (i < n && is_digit(text[i])) {
            digits += text[i++];
            --exponent;
        }
    }
    if (i < n && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        bool exp_negative = false;
        if (text[i] == '+' || text[i] == '-') {
            exp_negative = text[i] == '-';
            ++i;
        }
        std::int64_t written = 0;
        auto [ptr, ec] = std::from_chars(text.data() + i, text.data() + n, written);
        if (ec != std::errc{} || written > kMaxExponent) {
            return std::nullopt;
        }
        exponent += exp_negative ? -written : written;
    }

    // cpp_int reads a leading '0' as an octal prefix
    const auto first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
        return Number{};
    }
    mp::cpp_int significand{digits.substr(first)};
    if (negative) {
        significand = -significand;
    }
    return Number{std::move(significand), exponent};
}

void Number::assign_normalized(mp::cpp_int significand, std::int64_t exponent)
{
    if (significand.is_zero()) {
        rep_ = std::int64_t{0};
        return;
    }
    while (significand % 10 == 0) {
        significand /= 10;
        ++exponent;
    }

    // 10^19 already exceeds int64, so only small exponents can fit inline
    if (exponent >= 0 && exponent <= 18) {
        const mp::cpp_int scaled = significand * mp::pow(mp::cpp_int{10}, static_cast<unsigned>(exponent));
        if (scaled >= std::numeric_limits<std::int64_t>::min() &&
            scaled <= std::numeric_limits<std::int64_t>::max()) {
            rep_ = scaled.convert_to<std::int64_t>();
            return;
        }
    }
    rep_ = boxed_decimal{Decimal{std::move(significand), exponent}};
}

double Number::as_double() const
{
    if (auto* i = std::get_if<std::int64_t>(&rep_)) {
        return static_cast<double>(*i);
    }

    const std::string text = to_string();
    double result = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
    if (ec == std::errc::result_out_of_range) {
        const auto m = magnitude_of(as_decimal());
        const double magnitude = m.exponent > 0 ? HUGE_VAL : 0.0;
        return m.sign < 0 ? -magnitude : magnitude;
    }
    return result;
}

Number::Decimal Number::as_decimal() const
{
    if (auto* i = std::get_if<std::int64_t>(&rep_)) {
        return Decimal{mp::cpp_int{*i}, 0};
    }
    return std::get<boxed_decimal>(rep_).get();
}

std::string Number::to_string() const
{
    if (auto* i = std::get_if<std::int64_t>(&rep_)) {
        return std::to_string(*i);
    }

    const auto& d = std::get<boxed_decimal>(rep_).get();
    std::string digits = mp::cpp_int{mp::abs(d.significand)}.str();
    std::string text = d.significand.sign() < 0 ? "-" : "";
    const auto count = static_cast<std::int64_t>(digits.size());

    if (d.exponent >= 0) {
        if (d.exponent <= kMaxPaddingZeros) {
            text += digits;
            text.append(static_cast<std::size_t>(d.exponent), '0');
            return text;
        }
    } else {
        const std::int64_t fraction = -d.exponent;
        if (fraction < count) {
            const auto split = static_cast<std::size_t>(count - fraction);
            text += digits.substr(0, split);
            text += '.';
            text += digits.substr(split);
            return text;
        }
        if (fraction - count <= kMaxPaddingZeros) {
            text += "0.";
            text.append(static_cast<std::size_t>(fraction - count), '0');
            text += digits;
            return text;
        }
    }

    text += digits;
    text += 'e';
    text += std::to_string(d.exponent);
    return text;
}

std::strong_ordering Number::compare(const Number& other) const
{
    const auto* lhs = std::get_if<std::int64_t>(&rep_);
    const auto* rhs = std::get_if<std::int64_t>(&other.rep_);
    if (lhs && rhs) [[likely]] {
        return *lhs <=> *rhs;
    }
    return compare_magnitudes(magnitude_of(as_decimal()), magnitude_of(other.as_decimal()));
}

} // namespace jsonb_delta
