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
 * @file pattern.hpp
 * @brief Parsed form of an 18-character identity-number template.
 *
 * @details
 * A template mixes fixed digits with the wildcard marker `-`. The layout
 * follows GB 11643-1999:
 *
 * | Positions (1-based) | Field    | Width |
 * |---------------------|----------|-------|
 * | 1 - 6               | Region   | 6     |
 * | 7 - 14              | Birthday | 8     |
 * | 15 - 17             | Sequence | 3     |
 * | 18                  | Check    | 1     |
 *
 * Only position 18 may hold `X`.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace idforge::core {

constexpr char kWildcard = '-';
constexpr char kCheckTen = 'X';

constexpr std::size_t kIdLength = 18;
constexpr std::size_t kRegionOffset = 0;
constexpr std::size_t kRegionLength = 6;
constexpr std::size_t kDateOffset = 6;
constexpr std::size_t kDateLength = 8;
constexpr std::size_t kSequenceOffset = 14;
constexpr std::size_t kSequenceLength = 3;
constexpr std::size_t kCheckOffset = 17;

/**
 * @class InvalidFormat
 * @brief Raised when raw input cannot be parsed into a `Pattern`.
 */
class InvalidFormat : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @class Pattern
 * @brief Immutable, validated identity-number template.
 *
 * @details
 * Instances can only be obtained through `Pattern::parse`, so every `Pattern`
 * in the program is known to be exactly 18 symbols of `0-9`, `-`, or a
 * trailing `X`.
 */
class Pattern {
  public:
    /**
     * @brief Validates and decomposes raw input.
     *
     * A lowercase `x` in the check position is normalised to `X`.
     *
     * @param raw The user-supplied template, e.g. `"44----1998-------X"`.
     * @return Pattern The parsed template.
     * @throws InvalidFormat If the length is not 18, a character is neither a
     * digit nor `-`, or `X` appears before the check position.
     */
    static Pattern parse(const std::string& raw);

    /// @brief The normalised 18-character text.
    const std::string& text() const { return text_; }

    /// @brief Symbol at zero-based position `pos`.
    char at(std::size_t pos) const { return text_.at(pos); }

    /// @brief True if zero-based position `pos` is the wildcard marker.
    bool is_wildcard(std::size_t pos) const { return text_.at(pos) == kWildcard; }

    std::string_view region() const;
    std::string_view date() const;
    std::string_view year() const;
    std::string_view month() const;
    std::string_view day() const;
    std::string_view sequence() const;

    /// @brief Constraint on the check character: a digit, `X`, or `-`.
    char check() const { return text_[kCheckOffset]; }

    /**
     * @brief Tests a computed check character against position 18.
     * @return true If position 18 is a wildcard or equals `computed`.
     */
    bool accepts_check(char computed) const;

    /// @brief Number of wildcard positions across the whole template.
    std::size_t wildcard_count() const;

  private:
    explicit Pattern(std::string text) : text_(std::move(text)) {}

    std::string text_;
};

/**
 * @brief Position-by-position comparison of a template slice and a candidate.
 *
 * @param slice A run of pattern symbols (digits and `-`).
 * @param candidate A digit string of the same width.
 * @return true If the widths agree and every fixed digit of `slice` equals the
 * digit at the same offset in `candidate`.
 */
bool matches(std::string_view slice, std::string_view candidate);

/**
 * @brief Lists the integers in `[low, high]` whose zero-padded form matches `slice`.
 *
 * The scan is narrowed to the interval spanned by filling every wildcard with
 * `0` and with `9`, so a fully fixed slice costs a single comparison.
 *
 * @param slice Template symbols; its width is the padding width.
 * @param low Smallest admissible value.
 * @param high Largest admissible value.
 * @return std::vector<int> Matching values in ascending order (possibly empty).
 */
std::vector<int> matching_values(std::string_view slice, int low, int high);

} // namespace idforge::core
