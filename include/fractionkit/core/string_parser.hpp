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

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>

#include "assert.hpp"
#include "constants.hpp"

namespace frac {

/**
 * A handy utility class for parsing strings. It works like a stream, where it maintains a position in the string and
 * subsequent calls will read from that position.
 */
class StringParser {
  public:
    /**
     * Constructs a parser from given string view. Doesn't take ownership of the string, so make sure for the original
     * string to outlive this parser instance.
     * @param str The string to parse.
     */
    explicit StringParser(const std::string_view str) : str_(str) {}

    /**
     * Tries to read an integer from the string. If successful, the integer is returned, otherwise an empty optional is
     * returned. If the string starts with spaces, they are skipped before parsing the number. A value which doesn't fit
     * in T is not read.
     * @tparam T The type of the integer to read.
     * @return The read integer or an empty optional.
     */
    template<class T>
    std::optional<T> read_int() {
        T value {};
        if (skip_n(' ', FRAC_LOOP_UPPER_BOUND) == FRAC_LOOP_UPPER_BOUND) {
            FRAC_ASSERT_FALSE("Loop upper bound reached while skipping spaces");
        }
        const auto result = std::from_chars(str_.data(), str_.data() + str_.size(), value);
        if (result.ec == std::errc()) {
            str_.remove_prefix(static_cast<size_t>(result.ptr - str_.data()));
            return value;
        }
        return std::nullopt;
    }

    /**
     * Skips the given character from the beginning of the string.
     * @param chr The character to skip.
     * @return True if the character was skipped, or false otherwise.
     */
    bool skip(const char chr) {
        if (!str_.empty() && str_.front() == chr) {
            str_.remove_prefix(1);
            return true;
        }

        return false;
    }

    /**
     * Skips up to n occurrences of a character from the beginning of the string.
     * @param chr The character to skip.
     * @param count The maximum number of characters to skip.
     * @return The number of characters skipped.
     */
    uint64_t skip_n(const char chr, const size_t count) {
        uint64_t i = 0;
        for (; i < std::min(count, str_.size()); ++i) {
            if (str_[i] != chr) {
                break;
            }
        }
        str_.remove_prefix(i);
        return i;
    }

    /**
     * @return The part of the string which has not been consumed yet.
     */
    [[nodiscard]] std::string_view remaining() const {
        return str_;
    }

    /**
     * @return True if the string is exhausted, or false otherwise.
     */
    [[nodiscard]] bool exhausted() const {
        return str_.empty();
    }

  private:
    std::string_view str_;
};

}  // namespace frac
