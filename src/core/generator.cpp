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
 * @file generator.cpp
 * @brief Request orchestration: parse, resolve, dispatch, report.
 */

#include "idforge/core/generator.hpp"

#include "idforge/core/dispatcher.hpp"
#include "idforge/core/sequence_enumerator.hpp"
#include "idforge/infra/logger.hpp"

#include <utility>

namespace idforge::core {

Generator::Generator(RegionTable regions, GeneratorOptions options)
    : regions_(std::move(regions)), options_(std::move(options))
{
}

CandidateAssembler Generator::build_assembler(const Pattern& pattern) const
{
    std::vector<Region> regions = RegionFilter::resolve(pattern, regions_);
    std::vector<std::string> dates = DateEnumerator::resolve(pattern, options_.bounds);
    std::vector<std::string> sequences = SequenceEnumerator::resolve(pattern);

    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Core: Resolved " + std::to_string(regions.size()) + " regions, " +
                           std::to_string(dates.size()) + " dates, " +
                           std::to_string(sequences.size()) + " sequences for " +
                           pattern.text());

    if (regions.empty()) {
        infra::Logger::log(infra::LogLevel::INFO,
                           "Core: No whitelisted region code matches '" +
                               std::string(pattern.region()) + "'.");
    }
    if (dates.empty()) {
        infra::Logger::log(infra::LogLevel::INFO,
                           "Core: No valid birth date matches '" + std::string(pattern.date()) +
                               "' within " + std::to_string(options_.bounds.min_year) + "-" +
                               std::to_string(options_.bounds.max_year) + ".");
    }

    return CandidateAssembler(pattern, std::move(regions), std::move(dates), std::move(sequences));
}

std::uint64_t Generator::estimate_total(const Pattern& pattern) const
{
    const std::uint64_t regions = RegionFilter::resolve(pattern, regions_).size();
    const std::uint64_t dates = DateEnumerator::resolve(pattern, options_.bounds).size();
    const std::uint64_t sequences = SequenceEnumerator::resolve(pattern).size();
    return regions * dates * sequences;
}

GenerationReport Generator::generate(const std::string& raw, const std::atomic<bool>* cancel) const
{
    return generate(Pattern::parse(raw), cancel);
}

GenerationReport Generator::generate(const Pattern& pattern, const std::atomic<bool>* cancel) const
{
    const CandidateAssembler assembler = build_assembler(pattern);

    GenerationReport report;
    report.estimated = assembler.total_combinations();
    infra::Logger::log(infra::LogLevel::INFO, "Core: Search space for " + pattern.text() + " is " +
                                                  std::to_string(report.estimated) +
                                                  " combinations.");

    ParallelDispatcher dispatcher(options_.workers);
    GenerationResult result = dispatcher.run(assembler, cancel);

    report.examined = result.examined;
    report.ids = std::move(result.ids);
    if (!report.ids.empty()) {
        report.sample = report.ids.front();
        report.sample_region = region_name(report.sample.substr(kRegionOffset, kRegionLength));
    }

    infra::Logger::log(infra::LogLevel::INFO,
                       "Core: " + std::to_string(report.count()) + " valid numbers generated.");
    return report;
}

std::string Generator::region_name(const std::string& code) const
{
    auto it = regions_.find(code);
    return it != regions_.end() ? it->second : kUnknownRegion;
}

} // namespace idforge::core
