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

#include <catch2/catch_all.hpp>

#include <sstream>

TEST_CASE("frac::FractionError") {
    SECTION("to_string") {
        CHECK(std::string(frac::to_string(frac::FractionError::invalid_fraction)) == "invalid_fraction");
        CHECK(std::string(frac::to_string(frac::FractionError::division_by_zero)) == "division_by_zero");
        CHECK(std::string(frac::to_string(frac::FractionError::overflow)) == "overflow");
        CHECK(std::string(frac::to_string(frac::FractionError::not_integral)) == "not_integral");
        CHECK(std::string(frac::to_string(frac::FractionError::parse_error)) == "parse_error");
    }

    SECTION("Stream and fmt") {
        std::ostringstream os;
        os << frac::FractionError::overflow;
        CHECK(os.str() == "overflow");
        CHECK(fmt::format("{}", frac::FractionError::not_integral) == "not_integral");
    }

    SECTION("Exception") {
        try {
            FRAC_THROW_FRACTION_ERROR(frac::FractionError::parse_error);
        } catch (const frac::Exception& e) {
            CHECK(std::string(e.what()) == "Fraction error: parse_error");
            CHECK(e.line() > 0);
            CHECK(e.file() != nullptr);
            const auto* fraction_exception = dynamic_cast<const frac::FractionException*>(&e);
            REQUIRE(fraction_exception != nullptr);
            CHECK(fraction_exception->error() == frac::FractionError::parse_error);
        }
    }
}
