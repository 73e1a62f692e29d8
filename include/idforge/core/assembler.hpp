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
 * @file assembler.hpp
 * @brief Streaming cross product of resolved fields with check-character filtering.
 *
 * @details
 * The assembler owns the three resolved field sets of one request and turns a
 * `GenerationJob` (a slice of one axis) into the complete identity numbers of
 * that slice. The cross product is walked in place; no intermediate list of
 * combinations is built.
 *
 * Each field's contribution to the weighted checksum sum is computed once when
 * the assembler is built, so the inner loop reduces to three additions and a
 * table lookup per candidate.
 */

#pragma once

#include "idforge/core/pattern.hpp"
#include "idforge/core/region_filter.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace idforge::core {

/// @brief The dimension of the cross product a job is sliced along.
enum class Axis { REGION, DATE, SEQUENCE };

/// @brief Short lowercase label for logs ("region", "date", "sequence").
const char* to_string(Axis axis);

/**
 * @struct GenerationJob
 * @brief A half-open range `[begin, end)` of one axis; the other two axes are covered fully.
 */
struct GenerationJob {
    std::size_t index = 0;
    Axis axis = Axis::SEQUENCE;
    std::size_t begin = 0;
    std::size_t end = 0;
};

/**
 * @struct GenerationResult
 * @brief Output of one job, or of a whole request after merging.
 */
struct GenerationResult {
    /// @brief Accepted numbers, ordered by region, then date, then sequence.
    std::vector<std::string> ids;

    /// @brief Combinations whose check character was computed.
    std::uint64_t examined = 0;

    /// @brief True if the job stopped early on a stop request.
    bool aborted = false;

    std::size_t count() const { return ids.size(); }
};

/**
 * @struct StopToken
 * @brief Read-only view of the flags a running job polls between rows.
 *
 * `user` is the caller's cancellation flag (e.g. set from SIGINT); `peer` is
 * raised by the dispatcher when a sibling job has failed.
 */
struct StopToken {
    const std::atomic<bool>* user = nullptr;
    const std::atomic<bool>* peer = nullptr;

    bool stop_requested() const
    {
        return (user && user->load(std::memory_order_relaxed)) ||
               (peer && peer->load(std::memory_order_relaxed));
    }
};

/**
 * @class CandidateAssembler
 * @brief Produces the accepted identity numbers for any slice of the search space.
 *
 * @details
 * Instances are immutable after construction and may be shared by reference
 * across worker threads.
 */
class CandidateAssembler {
  public:
    /**
     * @param pattern The parsed template; only position 18 is consulted here.
     * @param regions Resolved region set.
     * @param dates Resolved `YYYYMMDD` set.
     * @param sequences Resolved 3-digit set.
     */
    CandidateAssembler(const Pattern& pattern, std::vector<Region> regions,
                       std::vector<std::string> dates, std::vector<std::string> sequences);

    /**
     * @brief Walks the job's slice of region x date x sequence.
     *
     * For every triple the first 17 characters are formed, the check character
     * is computed from them, and the number is kept iff position 18 of the
     * pattern accepts that character.
     *
     * @param job The slice to cover; `end` is clamped to the axis extent.
     * @param stop Polled once per (region, date) row.
     * @return GenerationResult The accepted numbers in stable order.
     */
    GenerationResult assemble(const GenerationJob& job, const StopToken& stop = {}) const;

    /// @brief Number of entries along `axis`.
    std::size_t extent(Axis axis) const;

    /// @brief Size of the full cross product.
    std::uint64_t total_combinations() const;

    const Pattern& pattern() const { return pattern_; }
    const std::vector<Region>& regions() const { return regions_; }
    const std::vector<std::string>& dates() const { return dates_; }
    const std::vector<std::string>& sequences() const { return sequences_; }

  private:
    Pattern pattern_;
    std::vector<Region> regions_;
    std::vector<std::string> dates_;
    std::vector<std::string> sequences_;

    /// @brief Weighted-sum contribution of each entry, index-aligned with its set.
    std::vector<int> region_sums_;
    std::vector<int> date_sums_;
    std::vector<int> sequence_sums_;
};

} // namespace idforge::core
