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
 * @file scheduler.cpp
 * @brief Implementation of the worker pool.
 *
 * @details
 * Fixed worker cohort, producer-consumer queue guarded by a mutex and a
 * condition variable, and a draining shutdown in the destructor.
 */

#include "idforge/infra/scheduler.hpp"

namespace idforge::infra {

/**
 * @brief Constructs the scheduler and initializes the worker cohort.
 *
 * Each thread waits on the condition variable until a task is enqueued or
 * shutdown is signalled.
 */
Scheduler::Scheduler(size_t threads) : stop_(false)
{
    if (threads == 0) {
        threads = 1;
    }

    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] {
            while (true) {
                std::function<void()> task;

                {
                    std::unique_lock<std::mutex> lock(this->queue_mutex_);

                    this->condition_.wait(lock,
                                          [this] { return this->stop_ || !this->tasks_.empty(); });

                    /* Exit only once stopping AND drained, so every job submitted
                     * by the dispatcher gets to report its result. */
                    if (this->stop_ && this->tasks_.empty()) {
                        return;
                    }

                    task = std::move(this->tasks_.front());
                    this->tasks_.pop();
                }

                // Run outside the lock so other workers can pick up the next job.
                if (task) {
                    task();
                }
            }
        });
    }
}

Scheduler::~Scheduler()
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }

    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

/**
 * @brief Dispatches a new task to the worker pool and wakes one worker.
 */
void Scheduler::enqueue(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        tasks_.emplace(std::move(task));
    }

    condition_.notify_one();
}

} // namespace idforge::infra
