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
 * @file date_test.cpp
 * @brief Calendar rules and birthday-field enumeration.
 */

#include "fixtures.hpp"
#include "framework.hpp"
#include "idforge/core/date_enumerator.hpp"
#include "idforge/infra/clock.hpp"

#include <string>
#include <vector>

using idforge::core::DateBounds;
using idforge::core::DateEnumerator;
using idforge::core::Pattern;

void test_leap_year_rule()
{
    ASSERT_TRUE(DateEnumerator::is_leap_year(2000));
    ASSERT_TRUE(DateEnumerator::is_leap_year(1996));
    ASSERT_TRUE(DateEnumerator::is_leap_year(2024));
    ASSERT_FALSE(DateEnumerator::is_leap_year(1900));
    ASSERT_FALSE(DateEnumerator::is_leap_year(1998));
    ASSERT_FALSE(DateEnumerator::is_leap_year(2100));
}

void test_days_in_month()
{
    ASSERT_EQ(DateEnumerator::days_in_month(1998, 1), 31);
    ASSERT_EQ(DateEnumerator::days_in_month(1998, 4), 30);
    ASSERT_EQ(DateEnumerator::days_in_month(1998, 2), 28);
    ASSERT_EQ(DateEnumerator::days_in_month(2000, 2), 29);
    ASSERT_EQ(DateEnumerator::days_in_month(1900, 2), 28);
    ASSERT_EQ(DateEnumerator::days_in_month(1998, 13), 0);
}

/**
 * @brief A fixed year with wildcard month and day expands to the whole year.
 */
void test_dates_full_year()
{
    std::vector<std::string> dates =
        DateEnumerator::resolve(Pattern::parse("44----1998-------X"), idforge::test::fixed_bounds());

    ASSERT_EQ(dates.size(), static_cast<size_t>(365));
    ASSERT_EQ(dates.front(), std::string("19980101"));
    ASSERT_EQ(dates.back(), std::string("19981231"));

    std::vector<std::string> leap =
        DateEnumerator::resolve(Pattern::parse("1101012000--------"), idforge::test::fixed_bounds());
    ASSERT_EQ(leap.size(), static_cast<size_t>(366));
}

void test_dates_february_bounds()
{
    std::vector<std::string> leap =
        DateEnumerator::resolve(Pattern::parse("11010120000229----"), idforge::test::fixed_bounds());
    ASSERT_EQ(leap.size(), static_cast<size_t>(1));

    std::vector<std::string> century =
        DateEnumerator::resolve(Pattern::parse("11010119000229----"), idforge::test::fixed_bounds());
    ASSERT_TRUE(century.empty());
}

/**
 * @brief February 30 does not exist in any year.
 */
void test_dates_impossible_day()
{
    std::vector<std::string> dates =
        DateEnumerator::resolve(Pattern::parse("110101----0230----"), idforge::test::fixed_bounds());
    ASSERT_TRUE(dates.empty());

    std::vector<std::string> april =
        DateEnumerator::resolve(Pattern::parse("110101----0431----"), idforge::test::fixed_bounds());
    ASSERT_TRUE(april.empty());
}

/**
 * @brief Wildcard years span exactly the configured window; leap days only
 * appear in leap years.
 */
void test_dates_year_window()
{
    DateBounds bounds;
    bounds.min_year = 1990;
    bounds.max_year = 1999;
    bounds.latest = 0;

    std::vector<std::string> dates =
        DateEnumerator::resolve(Pattern::parse("110101----0229----"), bounds);
    ASSERT_EQ(dates.size(), static_cast<size_t>(2));
    ASSERT_EQ(dates[0], std::string("19920229"));
    ASSERT_EQ(dates[1], std::string("19960229"));

    std::vector<std::string> none =
        DateEnumerator::resolve(Pattern::parse("1101011850--------"), bounds);
    ASSERT_TRUE(none.empty());
}

void test_dates_latest_cap()
{
    DateBounds bounds;
    bounds.min_year = 1998;
    bounds.max_year = 1998;
    bounds.latest = 19980615;

    std::vector<std::string> dates =
        DateEnumerator::resolve(Pattern::parse("110101199806------"), bounds);
    ASSERT_EQ(dates.size(), static_cast<size_t>(15));
    ASSERT_EQ(dates.back(), std::string("19980615"));

    std::vector<std::string> later =
        DateEnumerator::resolve(Pattern::parse("110101199807------"), bounds);
    ASSERT_TRUE(later.empty());
}

/**
 * @brief `until_today` never admits a future date.
 */
void test_dates_until_today()
{
    DateBounds bounds = DateBounds::until_today(1900, 9999);
    ASSERT_TRUE(bounds.latest > 20000101);

    std::vector<std::string> dates =
        DateEnumerator::resolve(Pattern::parse("110101--------001-"), bounds);
    ASSERT_FALSE(dates.empty());
    ASSERT_TRUE(std::stoi(dates.back()) <= bounds.latest);
}

/**
 * @brief A default window ends today; only `open` lifts the cap.
 */
void test_dates_default_window()
{
    const DateBounds bounds;
    ASSERT_EQ(bounds.min_year, 1900);
    ASSERT_EQ(bounds.max_year, idforge::infra::Clock::current_year());
    ASSERT_EQ(bounds.latest, idforge::infra::Clock::today());

    std::vector<std::string> dates =
        DateEnumerator::resolve(Pattern::parse("110101--------001-"), bounds);
    ASSERT_FALSE(dates.empty());
    for (const auto& date : dates) {
        ASSERT_TRUE(std::stoi(date) <= bounds.latest);
    }

    const DateBounds open = DateBounds::open(2090, 2099);
    ASSERT_EQ(open.latest, 0);
    std::vector<std::string> future =
        DateEnumerator::resolve(Pattern::parse("1101012099--------"), open);
    ASSERT_EQ(future.size(), static_cast<size_t>(365));
}
