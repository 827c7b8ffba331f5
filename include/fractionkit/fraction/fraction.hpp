/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include "detail/fraction_literal.hpp"
#include "detail/fraction_normalizer.hpp"
#include "fraction_error.hpp"
#include "fractionkit/core/constants.hpp"
#include "fractionkit/core/expected.hpp"
#include "fractionkit/core/log.hpp"
#include "fractionkit/core/math/safe_math.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/format.h>
#include <fmt/ostream.h>

namespace frac {

namespace detail {

    /**
     * Compares n1/d1 with n2/d2 exactly without forming the cross products, by expanding both into continued
     * fractions until the terms differ.
     * @return -1, 0 or 1.
     */
    template<class T>
    int compare_continued_fraction(T n1, T d1, T n2, T d2) noexcept {
        int sign = 1;  // Flips each time both fractions are inverted.
        while (true) {
            // Floor division, the remainders end up in [0, d).
            T q1 = static_cast<T>(n1 / d1);
            T r1 = static_cast<T>(n1 % d1);
            if (r1 < 0) {
                --q1;
                r1 = static_cast<T>(r1 + d1);
            }
            T q2 = static_cast<T>(n2 / d2);
            T r2 = static_cast<T>(n2 % d2);
            if (r2 < 0) {
                --q2;
                r2 = static_cast<T>(r2 + d2);
            }

            if (q1 != q2) {
                return q1 < q2 ? -sign : sign;
            }
            if (r1 == 0 || r2 == 0) {
                if (r1 == r2) {
                    return 0;
                }
                return r1 == 0 ? -sign : sign;
            }

            // r1/d1 < r2/d2 if and only if d1/r1 > d2/r2.
            n1 = d1;
            d1 = r1;
            n2 = d2;
            d2 = r2;
            sign = -sign;
        }
    }

}  // namespace detail

/**
 * An exact rational number numerator/denominator.
 *
 * Every instance is kept in canonical form: the denominator is positive, the sign lives in the numerator, numerator and
 * denominator have no common divisor other than 1, and zero is 0/1. Instances are immutable; every operation returns a
 * new fraction.
 *
 * Fallible operations return a tl::expected. Intermediate values are computed in detail::wide_int_t<T> with checked
 * arithmetic, so a result either is exact or fails with FractionError::overflow.
 *
 * @tparam T The signed integer type of the numerator and denominator.
 */
template<class T>
class Fraction {
  public:
    static_assert(std::is_integral_v<T> && std::is_signed_v<T>, "T must be a signed integral type");
    static_assert(sizeof(T) <= sizeof(int64_t), "T must not be wider than 64 bits");

    using value_type = T;
    using wide_type = detail::wide_int_t<T>;
    using result = tl::expected<Fraction, FractionError>;

    /**
     * Constructs a fraction with value 0 (0/1).
     */
    Fraction() = default;

    /**
     * Creates a fraction from a numerator and denominator, reducing it to lowest terms.
     * @param numerator The numerator.
     * @param denominator The denominator, must not be zero.
     * @return The fraction, FractionError::invalid_fraction if the denominator is zero or FractionError::overflow if
     * the reduced fraction can't be represented (for example -128/-1 as 8-bit fraction).
     */
    static result create(const T numerator, const T denominator) {
        return from_raw<wide_type>(numerator, denominator);
    }

    /**
     * @param value The integer value.
     * @return The fraction value/1.
     */
    static Fraction from_integer(const T value) {
        return Fraction(value, T {1});
    }

    /**
     * Parses a fraction literal like "3/4", "-10/4" or "7".
     * The integers are read as 64-bit values and reduced before being narrowed to T, so "200/2" is a valid 8-bit
     * fraction.
     * @param str The text to parse. Whitespace is not accepted.
     * @return The fraction, FractionError::parse_error if the text is malformed, FractionError::invalid_fraction if the
     * denominator is zero or FractionError::overflow if the reduced value doesn't fit T.
     */
    static result from_string(const std::string_view str) {
        const auto parts = detail::parse_fraction_literal(str);
        if (!parts) {
            return tl::unexpected(parts.error());
        }
        return from_raw<int64_t>(parts->numerator, parts->denominator);
    }

    /**
     * Finds the fraction closest to a floating-point value whose denominator is at most max_denominator, using the
     * continued fraction expansion of the value. The result is an approximation of the binary value, not of the decimal
     * text it may have been written as.
     * @param value The value to approximate.
     * @param max_denominator The largest denominator allowed, at least 1.
     * @return The approximation, FractionError::invalid_fraction if value is not finite or max_denominator is smaller
     * than 1, or FractionError::overflow if the numerator doesn't fit T.
     */
    static result from_double_approx(const double value, const T max_denominator = std::numeric_limits<T>::max()) {
        if (!std::isfinite(value) || max_denominator < 1) {
            return tl::unexpected(FractionError::invalid_fraction);
        }

        const double limit = std::ldexp(1.0, std::numeric_limits<int64_t>::digits);
        const double magnitude = std::fabs(value);
        if (magnitude >= limit) {
            return overflow("from_double_approx");
        }

        // Convergents h/k, starting from h(-2)/k(-2) = 0/1 and h(-1)/k(-1) = 1/0.
        int64_t h0 = 0, h1 = 1;
        int64_t k0 = 1, k1 = 0;
        double x = magnitude;

        for (int i = 0; i < std::numeric_limits<double>::digits + 2; ++i) {
            const double whole = std::floor(x);
            const auto a = whole < limit ? static_cast<int64_t>(whole) : std::numeric_limits<int64_t>::max();

            const auto ka = whole < limit ? safe_math::mul<int64_t>(a, k1) : std::nullopt;
            const auto k2 = ka ? safe_math::add<int64_t>(*ka, k0) : std::nullopt;
            if (!k2 || *k2 > max_denominator) {
                // The best approximation is either the last convergent or the largest semiconvergent in bounds.
                const int64_t m = (max_denominator - k0) / k1;
                const int64_t semi_k = k0 + m * k1;
                const auto hm = safe_math::mul<int64_t>(m, h1);
                const auto semi_h = hm ? safe_math::add<int64_t>(*hm, h0) : std::nullopt;
                if (semi_h) {
                    const double semi_error = std::fabs(magnitude - static_cast<double>(*semi_h) / semi_k);
                    const double last_error = std::fabs(magnitude - static_cast<double>(h1) / k1);
                    if (semi_error < last_error) {
                        h1 = *semi_h;
                        k1 = semi_k;
                    }
                }
                break;
            }

            const auto ha = safe_math::mul<int64_t>(a, h1);
            const auto h2 = ha ? safe_math::add<int64_t>(*ha, h0) : std::nullopt;
            if (!h2) {
                if (k1 == 0) {
                    return overflow("from_double_approx");
                }
                break;  // Keep the last convergent which was representable.
            }

            h0 = h1;
            h1 = *h2;
            k0 = k1;
            k1 = *k2;

            const double remainder = x - whole;
            if (remainder == 0.0) {
                break;
            }
            x = 1.0 / remainder;
        }

        return from_raw<int64_t>(value < 0 ? -h1 : h1, k1);
    }

    /**
     * @return The numerator, carrying the sign of the fraction.
     */
    [[nodiscard]] T numerator() const {
        return numerator_;
    }

    /**
     * @return The denominator, always greater than zero.
     */
    [[nodiscard]] T denominator() const {
        return denominator_;
    }

    /**
     * @return The pair (numerator, denominator).
     */
    [[nodiscard]] std::pair<T, T> as_pair() const {
        return {numerator_, denominator_};
    }

    [[nodiscard]] bool is_zero() const {
        return numerator_ == 0;
    }

    [[nodiscard]] bool is_negative() const {
        return numerator_ < 0;
    }

    /**
     * @return True if the denominator is 1.
     */
    [[nodiscard]] bool is_integer() const {
        return denominator_ == 1;
    }

    /**
     * @return True if the absolute value of the numerator is smaller than the denominator.
     */
    [[nodiscard]] bool is_proper() const {
        return numerator_ < denominator_ && numerator_ > -denominator_;
    }

    /**
     * @return -1, 0 or 1.
     */
    [[nodiscard]] int sign() const {
        return (numerator_ > 0) - (numerator_ < 0);
    }

    /**
     * @return this + other, or FractionError::overflow.
     */
    [[nodiscard]] result add(const Fraction& other) const {
        const auto lhs = safe_math::mul<wide_type>(numerator_, other.denominator_);
        const auto rhs = safe_math::mul<wide_type>(other.numerator_, denominator_);
        const auto den = safe_math::mul<wide_type>(denominator_, other.denominator_);
        if (!lhs || !rhs || !den) {
            return overflow("add");
        }
        const auto num = safe_math::add(*lhs, *rhs);
        if (!num) {
            return overflow("add");
        }
        return from_raw(*num, *den);
    }

    /**
     * @return this - other, or FractionError::overflow.
     */
    [[nodiscard]] result sub(const Fraction& other) const {
        const auto lhs = safe_math::mul<wide_type>(numerator_, other.denominator_);
        const auto rhs = safe_math::mul<wide_type>(other.numerator_, denominator_);
        const auto den = safe_math::mul<wide_type>(denominator_, other.denominator_);
        if (!lhs || !rhs || !den) {
            return overflow("sub");
        }
        const auto num = safe_math::sub(*lhs, *rhs);
        if (!num) {
            return overflow("sub");
        }
        return from_raw(*num, *den);
    }

    /**
     * @return this * other, or FractionError::overflow.
     */
    [[nodiscard]] result mul(const Fraction& other) const {
        const auto num = safe_math::mul<wide_type>(numerator_, other.numerator_);
        const auto den = safe_math::mul<wide_type>(denominator_, other.denominator_);
        if (!num || !den) {
            return overflow("mul");
        }
        return from_raw(*num, *den);
    }

    /**
     * @return this / other, FractionError::division_by_zero if other is zero, or FractionError::overflow.
     */
    [[nodiscard]] result div(const Fraction& other) const {
        if (other.numerator_ == 0) {
            return tl::unexpected(FractionError::division_by_zero);
        }
        const auto num = safe_math::mul<wide_type>(numerator_, other.denominator_);
        const auto den = safe_math::mul<wide_type>(denominator_, other.numerator_);
        if (!num || !den) {
            return overflow("div");
        }
        // A negative divisor leaves the sign in the denominator, the normalizer moves it.
        return from_raw(*num, *den);
    }

    /**
     * @return -this, or FractionError::overflow if the numerator is the smallest value of T.
     */
    [[nodiscard]] result negate() const {
        const auto num = safe_math::neg<wide_type>(numerator_);
        if (!num) {
            return overflow("negate");
        }
        return from_raw<wide_type>(*num, denominator_);
    }

    /**
     * @return |this|, or FractionError::overflow if the numerator is the smallest value of T.
     */
    [[nodiscard]] result abs() const {
        if (numerator_ < 0) {
            return negate();
        }
        return *this;
    }

    /**
     * @return 1 / this, FractionError::division_by_zero if this is zero, or FractionError::overflow.
     */
    [[nodiscard]] result reciprocal() const {
        if (numerator_ == 0) {
            return tl::unexpected(FractionError::division_by_zero);
        }
        return from_raw<wide_type>(denominator_, numerator_);
    }

    /**
     * Compares this fraction with another one. The comparison is exact and cannot overflow.
     * @return A negative value if this < other, zero if equal, a positive value if this > other.
     */
    [[nodiscard]] int compare(const Fraction& other) const noexcept {
        if constexpr (sizeof(T) < sizeof(wide_type)) {
            const auto lhs = static_cast<wide_type>(numerator_) * other.denominator_;
            const auto rhs = static_cast<wide_type>(other.numerator_) * denominator_;
            return (lhs > rhs) - (lhs < rhs);
        } else {
            return detail::compare_continued_fraction(
                numerator_, denominator_, other.numerator_, other.denominator_
            );
        }
    }

    /**
     * @return The value as integer, or FractionError::not_integral if the denominator isn't 1.
     */
    [[nodiscard]] tl::expected<T, FractionError> to_integer_exact() const {
        if (denominator_ != 1) {
            return tl::unexpected(FractionError::not_integral);
        }
        return numerator_;
    }

    /**
     * @return The integer part of the value, rounded toward zero (-7/2 gives -3).
     */
    [[nodiscard]] T to_integer_truncated() const {
        return static_cast<T>(numerator_ / denominator_);
    }

    /**
     * @return An approximation of the value as double. Not exact for most fractions.
     */
    [[nodiscard]] double to_double() const {
        return static_cast<double>(numerator_) / static_cast<double>(denominator_);
    }

    /**
     * @return An approximation of the value as float. Not exact for most fractions.
     */
    [[nodiscard]] float to_float() const {
        return static_cast<float>(to_double());
    }

    /**
     * @param bare_integers When true, a fraction with denominator 1 is rendered without "/1".
     * @return The fraction as "numerator/denominator".
     */
    [[nodiscard]] std::string to_string(const bool bare_integers = false) const {
        if (bare_integers && denominator_ == 1) {
            return fmt::format("{}", numerator_);
        }
        return fmt::format("{}/{}", numerator_, denominator_);
    }

    friend bool operator==(const Fraction& lhs, const Fraction& rhs) {
        return lhs.numerator_ == rhs.numerator_ && lhs.denominator_ == rhs.denominator_;
    }

    friend bool operator!=(const Fraction& lhs, const Fraction& rhs) {
        return !(lhs == rhs);
    }

    friend bool operator<(const Fraction& lhs, const Fraction& rhs) {
        return lhs.compare(rhs) < 0;
    }

    friend bool operator<=(const Fraction& lhs, const Fraction& rhs) {
        return lhs.compare(rhs) <= 0;
    }

    friend bool operator>(const Fraction& lhs, const Fraction& rhs) {
        return lhs.compare(rhs) > 0;
    }

    friend bool operator>=(const Fraction& lhs, const Fraction& rhs) {
        return lhs.compare(rhs) >= 0;
    }

    // The operators throw FractionException where the named functions return an error.

    friend Fraction operator+(const Fraction& lhs, const Fraction& rhs) {
        return value_or_throw(lhs.add(rhs));
    }

    friend Fraction operator-(const Fraction& lhs, const Fraction& rhs) {
        return value_or_throw(lhs.sub(rhs));
    }

    friend Fraction operator*(const Fraction& lhs, const Fraction& rhs) {
        return value_or_throw(lhs.mul(rhs));
    }

    friend Fraction operator/(const Fraction& lhs, const Fraction& rhs) {
        return value_or_throw(lhs.div(rhs));
    }

    friend Fraction operator-(const Fraction& fraction) {
        return value_or_throw(fraction.negate());
    }

    friend std::ostream& operator<<(std::ostream& os, const Fraction& fraction) {
        return os << fraction.to_string();
    }

  private:
    T numerator_ {0};
    T denominator_ {1};

    // Only used with values which are already in canonical form.
    Fraction(const T numerator, const T denominator) : numerator_(numerator), denominator_(denominator) {}

    /**
     * Normalizes a raw result and narrows it to T. Every fraction handed out, except by from_integer, passes through
     * here.
     */
    template<class W>
    static result from_raw(const W numerator, const W denominator) {
        const auto reduced = detail::normalize(numerator, denominator);
        if (!reduced) {
            if (reduced.error() == FractionError::overflow) {
                FRAC_TRACE("Fraction overflow while normalizing {}/{}", numerator, denominator);
            }
            return tl::unexpected(reduced.error());
        }

        const auto num = safe_math::narrow<T>(reduced->numerator);
        const auto den = safe_math::narrow<T>(reduced->denominator);
        if (!num || !den) {
            FRAC_TRACE("Fraction {}/{} doesn't fit the numerator type", reduced->numerator, reduced->denominator);
            return tl::unexpected(FractionError::overflow);
        }

        return Fraction(*num, *den);
    }

    static tl::unexpected<FractionError> overflow(const char* operation) {
        FRAC_TRACE("Fraction overflow in {}", operation);
        return tl::unexpected(FractionError::overflow);
    }

    static Fraction value_or_throw(const result& r) {
        if (!r) {
            FRAC_DEBUG("Fraction operator failed: {}", r.error());
            FRAC_THROW_FRACTION_ERROR(r.error());
        }
        return *r;
    }
};

using Fraction8 = Fraction<int8_t>;
using Fraction16 = Fraction<int16_t>;
using Fraction32 = Fraction<int32_t>;
using Fraction64 = Fraction<int64_t>;

}  // namespace frac

/// Make Fraction printable with fmt
template<class T>
struct fmt::formatter<frac::Fraction<T>>: ostream_formatter {};
