/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "fractionkit/fraction/fraction_error.hpp"

#include <fmt/format.h>

const char* frac::to_string(const FractionError error) {
    switch (error) {
        case FractionError::invalid_fraction:
            return "invalid_fraction";
        case FractionError::division_by_zero:
            return "division_by_zero";
        case FractionError::overflow:
            return "overflow";
        case FractionError::not_integral:
            return "not_integral";
        case FractionError::parse_error:
            return "parse_error";
    }
    return "unknown";
}

std::ostream& frac::operator<<(std::ostream& os, const FractionError error) {
    os << to_string(error);
    return os;
}

frac::FractionException::FractionException(
    const FractionError error, const char* file, const int line, const char* function_name
) :
    Exception(fmt::format("Fraction error: {}", to_string(error)), file, line, function_name), error_(error) {}
