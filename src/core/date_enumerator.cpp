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
 * @file date_enumerator.cpp
 * @brief Calendar arithmetic and birthday-field enumeration.
 */

#include "idforge/core/date_enumerator.hpp"

#include "idforge/infra/string.hpp"

namespace idforge::core {

DateBounds DateBounds::until_today(int min_year, int max_year)
{
    DateBounds bounds;
    bounds.min_year = min_year;
    bounds.max_year = max_year;
    bounds.latest = infra::Clock::today();
    return bounds;
}

DateBounds DateBounds::open(int min_year, int max_year)
{
    DateBounds bounds;
    bounds.min_year = min_year;
    bounds.max_year = max_year;
    bounds.latest = 0;
    return bounds;
}

bool DateEnumerator::is_leap_year(int year)
{
    return year % 4 == 0 && (year % 100 != 0 || year % 400 == 0);
}

int DateEnumerator::days_in_month(int year, int month)
{
    switch (month) {
    case 1:
    case 3:
    case 5:
    case 7:
    case 8:
    case 10:
    case 12:
        return 31;
    case 4:
    case 6:
    case 9:
    case 11:
        return 30;
    case 2:
        return is_leap_year(year) ? 29 : 28;
    default:
        return 0;
    }
}

std::vector<std::string> DateEnumerator::resolve(const Pattern& pattern, const DateBounds& bounds)
{
    std::vector<std::string> dates;

    const std::vector<int> years = matching_values(pattern.year(), bounds.min_year, bounds.max_year);
    const std::vector<int> months = matching_values(pattern.month(), 1, 12);
    if (years.empty() || months.empty()) {
        return dates;
    }

    for (int year : years) {
        for (int month : months) {
            for (int day : matching_values(pattern.day(), 1, days_in_month(year, month))) {
                const int encoded = year * 10000 + month * 100 + day;
                if (bounds.latest != 0 && encoded > bounds.latest) {
                    // Days ascend, so the rest of this month is later still.
                    break;
                }
                dates.push_back(infra::String::zero_pad(encoded, kDateLength));
            }
        }
    }
    return dates;
}

} // namespace idforge::core
