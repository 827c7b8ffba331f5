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

#include <cctype>
#include <string_view>

namespace frac {

/**
 * Compares two strings case-insensitively.
 * @param lhs The left hand side string.
 * @param rhs The right hand side string.
 * @return True if the strings are equal ignoring case, false otherwise.
 */
inline bool string_compare_case_insensitive(const std::string_view lhs, const std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }

    for (size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }

    return true;
}

/**
 * @param chr The character to test.
 * @return True if the character is an ASCII decimal digit.
 */
inline bool is_digit(const char chr) {
    return chr >= '0' && chr <= '9';
}

}  // namespace frac
