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
 * @file dispatcher.hpp
 * @brief Parallel execution of a generation request across a worker pool.
 *
 * @details
 * The dispatcher slices the widest axis of the search space into contiguous,
 * disjoint ranges, one per worker, and hands each range to an
 * `infra::Scheduler` created for the duration of the request.
 *
 * **Guarantees:**
 * - The merged output equals the single-threaded output for any worker count.
 * - Jobs share only read-only state; each fills its own `GenerationResult`.
 * - A failure in any job fails the whole request once every job has stopped.
 */

#pragma once

#include "idforge/core/assembler.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <vector>

namespace idforge::core {

/**
 * @class GenerationAborted
 * @brief Raised when a request is cancelled; no partial result is returned.
 */
class GenerationAborted : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @class ParallelDispatcher
 * @brief Partitions, runs and merges generation jobs.
 */
class ParallelDispatcher {
  public:
    /// @param workers Pool size per request; 0 is treated as 1.
    explicit ParallelDispatcher(std::size_t workers);

    /**
     * @brief Runs the whole search space of `assembler`.
     *
     * Blocks until every job has finished. Job outputs are concatenated in job
     * order.
     *
     * @param assembler Shared, read-only producer of candidates.
     * @param cancel Optional flag; when it becomes true, jobs stop early.
     * @return GenerationResult The merged result.
     * @throws GenerationAborted If `cancel` was raised before completion.
     * @throws Any exception raised inside a job, rethrown after all jobs stop.
     */
    GenerationResult run(const CandidateAssembler& assembler,
                         const std::atomic<bool>* cancel = nullptr) const;

    /// @brief Produces the result of one job; must poll `stop` and return early when raised.
    using JobRunner = std::function<GenerationResult(const GenerationJob&, const StopToken&)>;

    /**
     * @brief Runs `jobs` on a pool sized to the job count and merges them.
     *
     * When a job throws, the remaining jobs see their stop token raised. Every
     * job is joined before the first exception is rethrown, so no partial
     * result escapes.
     *
     * @throws GenerationAborted If `cancel` was raised before completion.
     * @throws Any exception raised by `runner`.
     */
    GenerationResult run_jobs(const std::vector<GenerationJob>& jobs, const JobRunner& runner,
                              const std::atomic<bool>* cancel = nullptr) const;

    /**
     * @brief Picks the axis to slice: the largest extent, sequence on ties.
     */
    static Axis choose_axis(const CandidateAssembler& assembler);

    /**
     * @brief Splits `[0, extent)` into at most `parts` contiguous non-empty ranges.
     *
     * Range sizes differ by at most one. Returns no jobs when `extent` is 0.
     */
    static std::vector<GenerationJob> partition(Axis axis, std::size_t extent, std::size_t parts);

    std::size_t workers() const { return workers_; }

  private:
    std::size_t workers_;
};

} // namespace idforge::core
