/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * Static helpers shared by the prompt loop (input sanitising) and the
 * enumerators (fixed-width decimal fields such as `MM`, `DD` and `SSS`).
 */

#pragma once

#include <cstddef>
#include <string>

namespace idforge::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string The trimmed content, or an empty string if the input
     * consists solely of whitespace.
     *
     * @code
     * std::string clean = idforge::infra::String::trim("  11010119900101000-\r\n");
     * @endcode
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Formats a non-negative integer as a zero-padded decimal field.
     *
     * Values wider than `width` are returned unpadded.
     *
     * @param value The number to format (e.g. a month or a sequence counter).
     * @param width The minimum number of digits.
     * @return std::string E.g. `zero_pad(7, 3)` yields `"007"`.
     */
    static std::string zero_pad(int value, std::size_t width);

    /// @brief Returns true if `s` is non-empty and consists only of ASCII digits.
    static bool is_digits(const std::string& s);
};

} // namespace idforge::infra
