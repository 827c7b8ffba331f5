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

#include "fraction_normalizer.hpp"

#include <cstdint>
#include <string_view>

namespace frac::detail {

/**
 * Splits a fraction literal of the form "<int>/<int>" or "<int>" into its parts. Both integers may carry a leading
 * minus sign, whitespace is not allowed anywhere. The parts are returned as written, without normalization.
 * @param literal The text to parse.
 * @return The numerator and denominator (1 for a bare integer), or FractionError::parse_error.
 */
[[nodiscard]] tl::expected<RawFraction<int64_t>, FractionError> parse_fraction_literal(std::string_view literal);

}  // namespace frac::detail
