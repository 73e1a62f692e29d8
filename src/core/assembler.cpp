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
 * @file assembler.cpp
 * @brief Cross-product walk for one generation job.
 */

#include "idforge/core/assembler.hpp"

#include "idforge/core/checksum.hpp"

#include <algorithm>
#include <utility>

namespace idforge::core {

const char* to_string(Axis axis)
{
    switch (axis) {
    case Axis::REGION:
        return "region";
    case Axis::DATE:
        return "date";
    case Axis::SEQUENCE:
        return "sequence";
    }
    return "unknown";
}

CandidateAssembler::CandidateAssembler(const Pattern& pattern, std::vector<Region> regions,
                                       std::vector<std::string> dates,
                                       std::vector<std::string> sequences)
    : pattern_(pattern), regions_(std::move(regions)), dates_(std::move(dates)),
      sequences_(std::move(sequences))
{
    region_sums_.reserve(regions_.size());
    for (const auto& region : regions_) {
        region_sums_.push_back(Checksum::partial_sum(region.code, kRegionOffset));
    }

    date_sums_.reserve(dates_.size());
    for (const auto& date : dates_) {
        date_sums_.push_back(Checksum::partial_sum(date, kDateOffset));
    }

    sequence_sums_.reserve(sequences_.size());
    for (const auto& sequence : sequences_) {
        sequence_sums_.push_back(Checksum::partial_sum(sequence, kSequenceOffset));
    }
}

std::size_t CandidateAssembler::extent(Axis axis) const
{
    switch (axis) {
    case Axis::REGION:
        return regions_.size();
    case Axis::DATE:
        return dates_.size();
    case Axis::SEQUENCE:
        return sequences_.size();
    }
    return 0;
}

std::uint64_t CandidateAssembler::total_combinations() const
{
    return static_cast<std::uint64_t>(regions_.size()) * dates_.size() * sequences_.size();
}

GenerationResult CandidateAssembler::assemble(const GenerationJob& job, const StopToken& stop) const
{
    GenerationResult result;

    // Full ranges everywhere except along the job's axis.
    std::size_t region_begin = 0, region_end = regions_.size();
    std::size_t date_begin = 0, date_end = dates_.size();
    std::size_t sequence_begin = 0, sequence_end = sequences_.size();

    const std::size_t end = std::min(job.end, extent(job.axis));
    const std::size_t begin = std::min(job.begin, end);
    switch (job.axis) {
    case Axis::REGION:
        region_begin = begin;
        region_end = end;
        break;
    case Axis::DATE:
        date_begin = begin;
        date_end = end;
        break;
    case Axis::SEQUENCE:
        sequence_begin = begin;
        sequence_end = end;
        break;
    }

    std::string prefix;
    prefix.reserve(kIdLength);

    for (std::size_t r = region_begin; r < region_end; ++r) {
        for (std::size_t d = date_begin; d < date_end; ++d) {
            if (stop.stop_requested()) {
                result.aborted = true;
                return result;
            }

            prefix = regions_[r].code;
            prefix += dates_[d];
            const int row_sum = region_sums_[r] + date_sums_[d];

            for (std::size_t s = sequence_begin; s < sequence_end; ++s) {
                const char check = Checksum::from_sum(row_sum + sequence_sums_[s]);
                ++result.examined;
                if (!pattern_.accepts_check(check)) {
                    continue;
                }

                std::string id;
                id.reserve(kIdLength);
                id += prefix;
                id += sequences_[s];
                id += check;
                result.ids.push_back(std::move(id));
            }
        }
    }
    return result;
}

} // namespace idforge::core
