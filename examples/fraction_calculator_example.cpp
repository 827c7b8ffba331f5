/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "fractionkit/core/log.hpp"
#include "fractionkit/fraction/fraction.hpp"

#include <CLI/App.hpp>
#include <fmt/format.h>

/**
 * This example evaluates a single binary operation on two fractions, for example: 1/2 + -3/4
 */

int main(int const argc, char* argv[]) {
    frac::set_log_level_from_env();

    CLI::App app {"Fraction calculator example"};
    argv = app.ensure_utf8(argv);

    std::string lhs_text;
    app.add_option("lhs", lhs_text, "The left hand side (3/4 or 5)")->required();

    std::string op;
    app.add_option("op", op, "The operation")->required()->check(CLI::IsMember({"+", "-", "x", "/", "cmp"}));

    std::string rhs_text;
    app.add_option("rhs", rhs_text, "The right hand side (3/4 or 5)")->required();

    bool bare_integers = false;
    app.add_flag("--bare-integers", bare_integers, "Print integers without /1");

    bool approx = false;
    app.add_flag("--approx", approx, "Also print the result as floating point");

    CLI11_PARSE(app, argc, argv);

    const auto lhs = frac::Fraction64::from_string(lhs_text);
    if (!lhs) {
        FRAC_ERROR("Invalid left hand side \"{}\": {}", lhs_text, lhs.error());
        return 1;
    }

    const auto rhs = frac::Fraction64::from_string(rhs_text);
    if (!rhs) {
        FRAC_ERROR("Invalid right hand side \"{}\": {}", rhs_text, rhs.error());
        return 1;
    }

    FRAC_DEBUG("Evaluating {} {} {}", *lhs, op, *rhs);

    if (op == "cmp") {
        const auto order = lhs->compare(*rhs);
        fmt::print("{}\n", order < 0 ? "<" : order > 0 ? ">" : "==");
        return 0;
    }

    frac::Fraction64::result result;
    if (op == "+") {
        result = lhs->add(*rhs);
    } else if (op == "-") {
        result = lhs->sub(*rhs);
    } else if (op == "x") {
        result = lhs->mul(*rhs);
    } else {
        result = lhs->div(*rhs);
    }

    if (!result) {
        FRAC_ERROR("Failed to evaluate {} {} {}: {}", *lhs, op, *rhs, result.error());
        return 1;
    }

    fmt::print("{}\n", result->to_string(bare_integers));
    if (approx) {
        fmt::print("~ {}\n", result->to_double());
    }

    return 0;
}
