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

#include "fractionkit/core/exception.hpp"

#include <ostream>
#include <fmt/ostream.h>

#define FRAC_THROW_FRACTION_ERROR(fraction_error) \
    throw frac::FractionException(fraction_error, __FILE__, __LINE__, FRAC_FUNCTION)

namespace frac {

/**
 * Errors reported by fraction construction, arithmetic, conversion and parsing.
 */
enum class FractionError {
    /// The denominator is zero, or a floating-point input is not finite.
    invalid_fraction,
    /// Division by (or reciprocal of) a zero fraction.
    division_by_zero,
    /// An intermediate or final integer value doesn't fit the integer type.
    overflow,
    /// Exact conversion to integer of a fraction whose denominator isn't 1.
    not_integral,
    /// The text is not a fraction literal.
    parse_error,
};

/**
 * @param error The error to convert.
 * @return A string representation of the error.
 */
const char* to_string(FractionError error);

/// Overload the output stream operator for the FractionError enum class
std::ostream& operator<<(std::ostream& os, FractionError error);

/**
 * Exception thrown by the operator overloads of Fraction, which can't report errors by value.
 */
class FractionException final: public Exception {
  public:
    explicit FractionException(
        FractionError error, const char* file = nullptr, int line = -1, const char* function_name = nullptr
    );

    /**
     * @return The error which caused this exception.
     */
    [[nodiscard]] FractionError error() const noexcept {
        return error_;
    }

  private:
    FractionError error_;
};

}  // namespace frac

/// Make FractionError printable with fmt
template<>
struct fmt::formatter<frac::FractionError>: ostream_formatter {};
