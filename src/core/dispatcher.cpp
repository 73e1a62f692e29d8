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
 * @file dispatcher.cpp
 * @brief Partitioning, pool execution and merge of generation jobs.
 */

#include "idforge/core/dispatcher.hpp"

#include "idforge/infra/logger.hpp"
#include "idforge/infra/scheduler.hpp"

#include <exception>
#include <future>
#include <iterator>
#include <string>

namespace idforge::core {

ParallelDispatcher::ParallelDispatcher(std::size_t workers) : workers_(workers == 0 ? 1 : workers)
{
}

Axis ParallelDispatcher::choose_axis(const CandidateAssembler& assembler)
{
    Axis axis = Axis::SEQUENCE;
    if (assembler.extent(Axis::DATE) > assembler.extent(axis)) {
        axis = Axis::DATE;
    }
    if (assembler.extent(Axis::REGION) > assembler.extent(axis)) {
        axis = Axis::REGION;
    }
    return axis;
}

std::vector<GenerationJob> ParallelDispatcher::partition(Axis axis, std::size_t extent,
                                                         std::size_t parts)
{
    std::vector<GenerationJob> jobs;
    if (extent == 0) {
        return jobs;
    }
    if (parts == 0) {
        parts = 1;
    }
    if (parts > extent) {
        parts = extent;
    }

    // The first `extent % parts` ranges take one extra entry.
    const std::size_t base = extent / parts;
    const std::size_t extra = extent % parts;

    std::size_t cursor = 0;
    for (std::size_t i = 0; i < parts; ++i) {
        const std::size_t width = base + (i < extra ? 1 : 0);
        jobs.push_back({i, axis, cursor, cursor + width});
        cursor += width;
    }
    return jobs;
}

GenerationResult ParallelDispatcher::run(const CandidateAssembler& assembler,
                                         const std::atomic<bool>* cancel) const
{
    if (assembler.total_combinations() == 0) {
        infra::Logger::log(infra::LogLevel::DEBUG, "Dispatch: Empty search space, nothing to run.");
        return GenerationResult{};
    }

    const Axis axis = choose_axis(assembler);
    const std::vector<GenerationJob> jobs = partition(axis, assembler.extent(axis), workers_);

    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Dispatch: " + std::to_string(jobs.size()) + " jobs along the " +
                           to_string(axis) + " axis (extent " +
                           std::to_string(assembler.extent(axis)) + ").");

    return run_jobs(
        jobs,
        [&assembler](const GenerationJob& job, const StopToken& stop) {
            return assembler.assemble(job, stop);
        },
        cancel);
}

GenerationResult ParallelDispatcher::run_jobs(const std::vector<GenerationJob>& jobs,
                                              const JobRunner& runner,
                                              const std::atomic<bool>* cancel) const
{
    GenerationResult merged;
    if (jobs.empty()) {
        return merged;
    }

    std::atomic<bool> peer_failed{false};
    const StopToken stop{cancel, &peer_failed};

    std::vector<GenerationResult> partials(jobs.size());
    std::exception_ptr failure;

    {
        infra::Scheduler pool(jobs.size());

        std::vector<std::future<GenerationResult>> futures;
        futures.reserve(jobs.size());
        for (const GenerationJob& job : jobs) {
            futures.push_back(pool.submit([&runner, &peer_failed, stop, job]() {
                try {
                    GenerationResult result = runner(job, stop);
                    infra::Logger::log(infra::LogLevel::TRACE,
                                       "Dispatch: Job " + std::to_string(job.index) + " [" +
                                           std::to_string(job.begin) + ", " +
                                           std::to_string(job.end) + ") accepted " +
                                           std::to_string(result.count()) + " of " +
                                           std::to_string(result.examined) + ".");
                    return result;
                } catch (...) {
                    peer_failed.store(true);
                    throw;
                }
            }));
        }

        // Join every job before reporting, so nothing still reads shared inputs.
        for (std::size_t i = 0; i < futures.size(); ++i) {
            try {
                partials[i] = futures[i].get();
            } catch (...) {
                if (!failure) {
                    failure = std::current_exception();
                }
            }
        }
    }

    if (failure) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Dispatch: A job failed; discarding the incomplete result.");
        std::rethrow_exception(failure);
    }

    if (cancel && cancel->load()) {
        throw GenerationAborted("generation cancelled");
    }

    std::size_t total = 0;
    for (const auto& partial : partials) {
        total += partial.count();
    }
    merged.ids.reserve(total);

    for (auto& partial : partials) {
        merged.examined += partial.examined;
        merged.ids.insert(merged.ids.end(), std::make_move_iterator(partial.ids.begin()),
                          std::make_move_iterator(partial.ids.end()));
    }
    return merged;
}

} // namespace idforge::core
