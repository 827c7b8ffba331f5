/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "fractionkit/fraction/detail/fraction_literal.hpp"

#include "fractionkit/core/log.hpp"
#include "fractionkit/core/string.hpp"
#include "fractionkit/core/string_parser.hpp"

namespace {

/**
 * Reads an optionally negative integer. The integer must start right at the current position, StringParser::read_int
 * would skip leading spaces otherwise.
 */
std::optional<int64_t> read_part(frac::StringParser& parser) {
    const auto rest = parser.remaining();
    if (rest.empty()) {
        return std::nullopt;
    }
    if (!frac::is_digit(rest.front()) && rest.front() != '-') {
        return std::nullopt;
    }
    return parser.read_int<int64_t>();
}

}  // namespace

tl::expected<frac::detail::RawFraction<int64_t>, frac::FractionError>
frac::detail::parse_fraction_literal(const std::string_view literal) {
    StringParser parser(literal);

    const auto numerator = read_part(parser);
    if (!numerator) {
        FRAC_TRACE("Invalid numerator in fraction literal \"{}\"", literal);
        return tl::unexpected(FractionError::parse_error);
    }

    if (parser.exhausted()) {
        return RawFraction<int64_t> {*numerator, 1};
    }

    if (!parser.skip('/')) {
        FRAC_TRACE("Expected '/' in fraction literal \"{}\"", literal);
        return tl::unexpected(FractionError::parse_error);
    }

    const auto denominator = read_part(parser);
    if (!denominator) {
        FRAC_TRACE("Invalid denominator in fraction literal \"{}\"", literal);
        return tl::unexpected(FractionError::parse_error);
    }

    if (!parser.exhausted()) {
        FRAC_TRACE("Trailing characters in fraction literal \"{}\"", literal);
        return tl::unexpected(FractionError::parse_error);
    }

    return RawFraction<int64_t> {*numerator, *denominator};
}
