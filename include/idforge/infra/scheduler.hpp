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
 * @file scheduler.hpp
 * @brief Thread pool used to run generation jobs concurrently.
 *
 * @details
 * This header defines the `Scheduler` class, a fixed-size implementation of the
 * Producer-Consumer pattern. The dispatcher creates one Scheduler per generation
 * request, submits one task per job, and tears the pool down once every job has
 * reported back.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace idforge::infra {

/**
 * @class Scheduler
 * @brief A thread-safe worker pool for executing tasks asynchronously.
 *
 * @details
 * The Scheduler maintains a fixed cohort of worker threads and a FIFO task queue.
 *
 * **Concurrency Model:**
 * - **Producers:** Any thread can `enqueue()` or `submit()` a task.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 */
class Scheduler {
  public:
    /**
     * @brief Initializes the thread pool and spawns worker threads.
     *
     * @param threads The number of worker threads to spawn. A value of 0 (which
     * `std::thread::hardware_concurrency()` may report) is treated as 1.
     */
    explicit Scheduler(size_t threads = std::thread::hardware_concurrency());

    /**
     * @brief Destructor. Drains the queue, then joins every worker.
     *
     * @note This is a **blocking** operation.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Submits a fire-and-forget task.
     *
     * @param task The operation to execute. It must not throw: an exception
     * escaping a worker terminates the process. Use `submit()` for work that can fail.
     */
    void enqueue(std::function<void()> task);

    /**
     * @brief Submits a task and returns a future for its result.
     *
     * Any exception thrown by `fn` is stored in the future and rethrown by
     * `get()` on the caller's thread.
     *
     * @code
     * auto fut = scheduler.submit([&] { return assembler.assemble(job); });
     * GenerationResult r = fut.get();
     * @endcode
     */
    template <typename F> auto submit(F fn) -> std::future<std::invoke_result_t<F>>
    {
        using R = std::invoke_result_t<F>;
        // std::function requires a copyable target; packaged_task is move-only.
        auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
        std::future<R> result = task->get_future();
        enqueue([task]() { (*task)(); });
        return result;
    }

    /// @brief Number of worker threads owned by this pool.
    size_t size() const { return workers_.size(); }

  private:
    /// @brief The container of active worker threads managed by this pool.
    std::vector<std::thread> workers_;

    /// @brief A FIFO queue storing pending tasks waiting for a worker.
    std::queue<std::function<void()>> tasks_;

    /// @brief Synchronization primitive protecting access to the `tasks_` queue.
    std::mutex queue_mutex_;

    /// @brief Signaling mechanism used to wake up workers or notify shutdown.
    std::condition_variable condition_;

    /// @brief Atomic flag controlling the lifecycle of the event loops.
    std::atomic<bool> stop_;
};

} // namespace idforge::infra
