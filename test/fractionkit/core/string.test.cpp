/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "fractionkit/core/string.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("string | string_compare_case_insensitive") {
    REQUIRE(frac::string_compare_case_insensitive("TRACE", "trace"));
    REQUIRE(frac::string_compare_case_insensitive("Warn", "wARN"));
    REQUIRE(frac::string_compare_case_insensitive("", ""));
    REQUIRE_FALSE(frac::string_compare_case_insensitive("info", "infos"));
    REQUIRE_FALSE(frac::string_compare_case_insensitive("debug", "debuk"));
}

TEST_CASE("string | is_digit") {
    for (char c = '0'; c <= '9'; ++c) {
        REQUIRE(frac::is_digit(c));
    }
    REQUIRE_FALSE(frac::is_digit('-'));
    REQUIRE_FALSE(frac::is_digit('/'));
    REQUIRE_FALSE(frac::is_digit(' '));
    REQUIRE_FALSE(frac::is_digit('a'));
}
