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

#include "fractionkit/core/expected.hpp"
#include "fractionkit/core/math/safe_math.hpp"
#include "fractionkit/fraction/fraction_error.hpp"

#include <cstdint>
#include <type_traits>

namespace frac::detail {

/**
 * The integer type used for intermediate results. Products of two values of a type narrower than 64 bits always fit,
 * 64-bit values are not widened further.
 */
template<class T>
using wide_int_t = std::conditional_t<(sizeof(T) < sizeof(int64_t)), int64_t, T>;

/**
 * A numerator/denominator pair which has not been narrowed to the type of the fraction yet.
 */
template<class W>
struct RawFraction {
    W numerator {};
    W denominator {1};
};

namespace normalizer_detail {

    /**
     * Euclid's algorithm. Works on the signed values directly so that the magnitude of the minimum representable
     * integer never has to be formed.
     * @param a Any value.
     * @param b A value greater than zero.
     * @return The greatest common divisor of |a| and b, which is at least 1.
     */
    template<class W>
    W gcd(W a, W b) {
        while (b != 0) {
            const W remainder = static_cast<W>(a % b);
            a = b;
            b = remainder;
        }
        return a < 0 ? static_cast<W>(-a) : a;
    }

}  // namespace normalizer_detail

/**
 * Reduces a numerator/denominator pair to lowest terms with a positive denominator. Zero becomes 0/1.
 * @param numerator The numerator, any value.
 * @param denominator The denominator, any non-zero value.
 * @return The canonical pair, FractionError::invalid_fraction if the denominator is zero, or FractionError::overflow if
 * moving the sign to the numerator overflows.
 */
template<class W>
tl::expected<RawFraction<W>, FractionError> normalize(W numerator, W denominator) {
    static_assert(std::is_integral_v<W> && std::is_signed_v<W>, "W must be a signed integral type");

    if (denominator == 0) {
        return tl::unexpected(FractionError::invalid_fraction);
    }

    if (denominator < 0) {
        const auto n = safe_math::neg(numerator);
        const auto d = safe_math::neg(denominator);
        if (!n || !d) {
            return tl::unexpected(FractionError::overflow);
        }
        numerator = *n;
        denominator = *d;
    }

    if (numerator == 0) {
        return RawFraction<W> {0, 1};
    }

    const W divisor = normalizer_detail::gcd(numerator, denominator);
    return RawFraction<W> {static_cast<W>(numerator / divisor), static_cast<W>(denominator / divisor)};
}

}  // namespace frac::detail
