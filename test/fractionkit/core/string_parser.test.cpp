/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "fractionkit/core/string_parser.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("StringParser | read_int") {
    SECTION("Read a sequence of integers") {
        frac::StringParser parser("12/-34");
        REQUIRE(parser.read_int<int64_t>() == 12);
        REQUIRE(parser.skip('/'));
        REQUIRE(parser.read_int<int64_t>() == -34);
        REQUIRE(parser.exhausted());
    }

    SECTION("Leading spaces are skipped") {
        frac::StringParser parser("   42");
        REQUIRE(parser.read_int<int32_t>() == 42);
        REQUIRE(parser.exhausted());
    }

    SECTION("Not a number") {
        frac::StringParser parser("eight");
        REQUIRE_FALSE(parser.read_int<int32_t>().has_value());
        REQUIRE(parser.remaining() == "eight");
    }

    SECTION("Value out of range for the type") {
        frac::StringParser parser("128");
        REQUIRE_FALSE(parser.read_int<int8_t>().has_value());
        REQUIRE(parser.read_int<int16_t>() == 128);
    }

    SECTION("Plus sign is not accepted") {
        frac::StringParser parser("+1");
        REQUIRE_FALSE(parser.read_int<int32_t>().has_value());
    }
}

TEST_CASE("StringParser | skip") {
    frac::StringParser parser("//x");
    REQUIRE(parser.skip('/'));
    REQUIRE_FALSE(parser.skip('x'));
    REQUIRE(parser.skip_n('/', 10) == 1);
    REQUIRE(parser.skip('x'));
    REQUIRE(parser.exhausted());
    REQUIRE_FALSE(parser.skip('x'));
}
