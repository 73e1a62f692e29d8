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
 * @file checksum.hpp
 * @brief ISO 7064 MOD 11-2 check character as specified by GB 11643-1999.
 *
 * @details
 * For the first 17 digits `d[0..16]` the weighted sum is
 * `S = sum(w[i] * d[i]) mod 11` with `w[i] = 2^(17-i) mod 11`. The check
 * character is `kCheckTable[S]`.
 */

#pragma once

#include <array>
#include <cstddef>
#include <string_view>

namespace idforge::core {

/// @brief Positional weights for positions 1 to 17.
constexpr std::array<int, 17> kCheckWeights = {7, 9, 10, 5, 8, 4, 2, 1, 6,
                                               3, 7, 9, 10, 5, 8, 4, 2};

/// @brief Check character for `S = 0 .. 10`.
constexpr std::array<char, 11> kCheckTable = {'1', '0', 'X', '9', '8', '7',
                                              '6', '5', '4', '3', '2'};

/**
 * @class Checksum
 * @brief Static helpers for computing and verifying the check character.
 */
class Checksum {
  public:
    /**
     * @brief Weighted sum of a run of digits placed at `first_position`.
     *
     * Lets callers precompute the contribution of a field once (e.g. a region
     * code at position 0) and add the three field sums per candidate.
     *
     * @param digits ASCII digits.
     * @param first_position Zero-based position of `digits[0]` in the full number.
     * @return int The unreduced weighted sum.
     */
    static int partial_sum(std::string_view digits, std::size_t first_position);

    /// @brief Maps an unreduced weighted sum to its check character.
    static char from_sum(int sum) { return kCheckTable[static_cast<std::size_t>(sum % 11)]; }

    /**
     * @brief Computes the check character for the first 17 digits.
     *
     * @param first17 Exactly 17 ASCII digits.
     * @return char `'0'` to `'9'` or `'X'`.
     *
     * @code
     * Checksum::compute("11010119900101000"); // '7'
     * @endcode
     */
    static char compute(std::string_view first17);

    /**
     * @brief Verifies a complete 18-character number.
     *
     * @return true If `id` is 17 digits followed by the matching check
     * character. Malformed input yields false.
     */
    static bool verify(std::string_view id);
};

} // namespace idforge::core
