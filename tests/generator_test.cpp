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
 * @file generator_test.cpp
 * @brief End-to-end scenarios through the request facade.
 *
 * @details
 * Every scenario checks the three structural properties of each generated
 * number: whitelisted region, real calendar date, consistent check character.
 */

#include "fixtures.hpp"
#include "framework.hpp"
#include "idforge/core/checksum.hpp"
#include "idforge/core/date_enumerator.hpp"
#include "idforge/core/generator.hpp"
#include "idforge/infra/clock.hpp"

#include <cstdint>
#include <set>
#include <string>

using idforge::core::GenerationReport;
using idforge::core::Generator;
using idforge::core::GeneratorOptions;
using idforge::core::InvalidFormat;
using idforge::core::Pattern;

namespace {

Generator make_generator(std::size_t workers)
{
    GeneratorOptions options;
    options.workers = workers;
    options.bounds = idforge::test::fixed_bounds();
    return Generator(idforge::test::sample_regions(), options);
}

/// @brief Asserts the structural invariants of one generated number against its template.
void check_structure(const std::string& id, const Pattern& pattern,
                     const idforge::core::RegionTable& table)
{
    using idforge::core::DateEnumerator;

    ASSERT_EQ(id.size(), static_cast<size_t>(18));
    ASSERT_TRUE(idforge::core::Checksum::verify(id));

    for (std::size_t i = 0; i < id.size(); ++i) {
        if (!pattern.is_wildcard(i)) {
            ASSERT_EQ(id[i], pattern.at(i));
        }
    }

    ASSERT_TRUE(table.count(id.substr(0, 6)) == 1);

    const int year = std::stoi(id.substr(6, 4));
    const int month = std::stoi(id.substr(10, 2));
    const int day = std::stoi(id.substr(12, 2));
    ASSERT_TRUE(month >= 1 && month <= 12);
    ASSERT_TRUE(day >= 1 && day <= DateEnumerator::days_in_month(year, month));
}

} // namespace

/**
 * @brief A fully fixed, valid number generates exactly itself.
 */
void test_generate_fully_fixed()
{
    Generator generator = make_generator(4);
    GenerationReport report = generator.generate("110101199001010007");

    ASSERT_EQ(report.count(), static_cast<size_t>(1));
    ASSERT_EQ(report.ids[0], std::string("110101199001010007"));
    ASSERT_EQ(report.sample, std::string("110101199001010007"));
    ASSERT_EQ(report.sample_region, std::string("北京市东城区"));
    ASSERT_EQ(report.estimated, static_cast<uint64_t>(1));
}

void test_generate_rejects_malformed()
{
    Generator generator = make_generator(2);
    ASSERT_THROWS(generator.generate("1101011999------X"), InvalidFormat);
    ASSERT_THROWS(generator.generate("X10101199001010007"), InvalidFormat);
}

/**
 * @brief An unknown region code is a legitimate input with no results.
 */
void test_generate_unknown_region()
{
    Generator generator = make_generator(4);
    GenerationReport report = generator.generate("9999991990----001-");
    ASSERT_TRUE(report.empty());
    ASSERT_EQ(report.estimated, static_cast<uint64_t>(0));
    ASSERT_EQ(report.sample, std::string(""));
}

void test_generate_february_thirtieth()
{
    Generator generator = make_generator(4);
    GenerationReport report = generator.generate("110101----0230----");
    ASSERT_TRUE(report.empty());
}

/**
 * @brief `44----1998-------X`: every Guangdong code of the table, every day of
 * 1998, check character X.
 */
void test_generate_region_year_scenario()
{
    Generator generator = make_generator(8);
    const Pattern pattern = Pattern::parse("44----1998-------X");
    GenerationReport report = generator.generate(pattern);

    ASSERT_EQ(report.estimated, static_cast<uint64_t>(4 * 365 * 1000));
    ASSERT_EQ(report.examined, report.estimated);
    ASSERT_FALSE(report.empty());

    const idforge::core::RegionTable table = idforge::test::sample_regions();
    std::set<std::string> regions;
    std::set<std::string> dates;
    for (const auto& id : report.ids) {
        check_structure(id, pattern, table);
        ASSERT_EQ(id.back(), 'X');
        regions.insert(id.substr(0, 6));
        dates.insert(id.substr(6, 8));
    }
    ASSERT_EQ(regions.size(), static_cast<size_t>(4));
    ASSERT_EQ(dates.size(), static_cast<size_t>(365));

    const std::set<std::string> unique(report.ids.begin(), report.ids.end());
    ASSERT_EQ(unique.size(), report.count());
}

/**
 * @brief Two runs, and runs with different worker counts, agree as sets.
 */
void test_generate_idempotent()
{
    const std::string raw = "4-01--2000-2-1---2";
    GenerationReport first = make_generator(1).generate(raw);
    GenerationReport second = make_generator(1).generate(raw);
    GenerationReport wide = make_generator(6).generate(raw);

    const std::set<std::string> a(first.ids.begin(), first.ids.end());
    const std::set<std::string> b(second.ids.begin(), second.ids.end());
    const std::set<std::string> c(wide.ids.begin(), wide.ids.end());
    ASSERT_FALSE(a.empty());
    ASSERT_TRUE(a == b);
    ASSERT_TRUE(a == c);

    const Pattern pattern = Pattern::parse(raw);
    const idforge::core::RegionTable table = idforge::test::sample_regions();
    for (const auto& id : first.ids) {
        check_structure(id, pattern, table);
    }
}

void test_estimate_and_region_name()
{
    Generator generator = make_generator(2);
    ASSERT_EQ(generator.estimate_total(Pattern::parse("11010-19980101----")),
              static_cast<uint64_t>(2 * 1 * 1000));
    ASSERT_EQ(generator.region_name("441900"), std::string("广东省东莞市"));
    ASSERT_EQ(generator.region_name("000000"), std::string(Generator::kUnknownRegion));
}

/**
 * @brief Default options never produce a birth date after today.
 */
void test_generate_default_window()
{
    GeneratorOptions options;
    options.workers = 4;
    Generator generator(idforge::test::sample_regions(), options);

    GenerationReport report = generator.generate("110101----0101001-");

    // January 1 of every year from 1900 to this one, sequence 001.
    const int years = idforge::infra::Clock::current_year() - 1900 + 1;
    ASSERT_EQ(report.count(), static_cast<size_t>(years));

    const int today = idforge::infra::Clock::today();
    for (const auto& id : report.ids) {
        ASSERT_TRUE(std::stoi(id.substr(6, 8)) <= today);
    }
}
