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
 * @file date_enumerator.hpp
 * @brief Expansion of the `YYYYMMDD` birthday field into real calendar dates.
 *
 * @details
 * The year window is a policy, not part of the numbering standard: by default
 * 1900 up to the current year, with nothing after today. A window without the
 * today cap must be requested through `DateBounds::open`.
 */

#pragma once

#include "idforge/core/pattern.hpp"
#include "idforge/infra/clock.hpp"

#include <string>
#include <vector>

namespace idforge::core {

/**
 * @struct DateBounds
 * @brief Admissible birth-date window.
 *
 * A default-constructed window runs from 1900 to today's local date.
 */
struct DateBounds {
    int min_year = 1900;
    int max_year = infra::Clock::current_year();

    /// @brief Latest admissible date as `YYYYMMDD`; 0 disables the cap.
    int latest = infra::Clock::today();

    /**
     * @brief Window `[min_year, max_year]` capped at today's local date.
     */
    static DateBounds until_today(int min_year, int max_year);

    /**
     * @brief Window `[min_year, max_year]` with no cap, future dates included.
     */
    static DateBounds open(int min_year, int max_year);
};

/**
 * @class DateEnumerator
 * @brief Gregorian calendar rules and enumeration of matching dates.
 */
class DateEnumerator {
  public:
    /// @brief Divisible by 4, and not by 100 unless also by 400.
    static bool is_leap_year(int year);

    /**
     * @brief Number of days in a month.
     * @param year Gregorian year, used only for February.
     * @param month 1 to 12.
     * @return int 28 to 31, or 0 if `month` is out of range.
     */
    static int days_in_month(int year, int month);

    /**
     * @brief Enumerates every valid date matching positions 7 to 14.
     *
     * Years, then months, then days are each narrowed by the fixed digits of
     * their slice before the next level is expanded, so an impossible fixed
     * date such as `0230` yields an empty result without error.
     *
     * @param pattern The parsed template.
     * @param bounds The admissible window.
     * @return std::vector<std::string> `YYYYMMDD` strings in chronological order.
     */
    static std::vector<std::string> resolve(const Pattern& pattern, const DateBounds& bounds);
};

} // namespace idforge::core
