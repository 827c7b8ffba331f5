/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "fractionkit/fraction/fraction.hpp"

#include <catch2/catch_all.hpp>
#include <nanobench.h>

TEST_CASE("Fraction Benchmark") {
    ankerl::nanobench::Bench b;
    b.title("Fraction Benchmark").warmup(100).relative(true).minEpochIterations(100'000);

    const auto a32 = *frac::Fraction32::create(1'234, 4'567);
    const auto b32 = *frac::Fraction32::create(-89, 1'001);
    const auto a64 = *frac::Fraction64::create(1'234, 4'567);
    const auto b64 = *frac::Fraction64::create(-89, 1'001);

    b.run("Fraction32 add", [&] {
        ankerl::nanobench::doNotOptimizeAway(a32.add(b32));
    });

    b.run("Fraction64 add", [&] {
        ankerl::nanobench::doNotOptimizeAway(a64.add(b64));
    });

    b.run("Fraction32 compare", [&] {
        ankerl::nanobench::doNotOptimizeAway(a32 < b32);
    });

    b.run("Fraction64 compare", [&] {
        ankerl::nanobench::doNotOptimizeAway(a64 < b64);
    });

    b.run("Fraction64 from_string", [&] {
        ankerl::nanobench::doNotOptimizeAway(frac::Fraction64::from_string("-123456/7890"));
    });
}
