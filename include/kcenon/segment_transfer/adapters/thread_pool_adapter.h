// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool abstraction for block execution
 *
 * Block chains of every running call share one pool. The pool must never
 * make a block wait for another block: a call waits on all of its blocks,
 * so a bounded pool could deadlock when calls outnumber workers.
 *
 * Features:
 * - Labelled jobs for logging and diagnostics
 * - Elastic growth with no worker ceiling
 * - Idle workers are reclaimed after a timeout
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "../core/config.h"

namespace kcenon::segment_transfer::adapters {

/**
 * @brief Unit of work submitted to a pool
 */
struct pool_job {
    std::string label;            ///< Shown in logs, e.g. "segment_transfer block 42#1"
    std::function<void()> work;
};

/**
 * @brief Interface for thread pool operations in segment_transfer
 */
class transfer_thread_pool_interface {
public:
    virtual ~transfer_thread_pool_interface() = default;

    /**
     * @brief Submit a job for execution
     * @param job The job to execute
     * @return Future for the job completion; exceptions thrown by the job
     *         are rethrown from get()
     * @throws std::runtime_error if the pool no longer accepts jobs
     */
    virtual std::future<void> submit(pool_job job) = 0;

    /**
     * @brief Get the number of worker threads
     * @return Worker thread count
     */
    [[nodiscard]] virtual size_t worker_count() const = 0;

    /**
     * @brief Check if the pool is running
     * @return true if the pool is active
     */
    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Get total pending task count
     * @return Number of jobs submitted but not yet picked by a worker
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;
};

/**
 * @brief Pool that hands every job to a worker immediately
 *
 * A job goes to an idle worker when one exists; otherwise a new worker
 * thread is started. Workers that stay idle for pool_config::idle_timeout
 * exit, and their threads are joined on the next submit() or at shutdown.
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class elastic_transfer_pool : public transfer_thread_pool_interface {
public:
    elastic_transfer_pool();
    explicit elastic_transfer_pool(const pool_config& config);

    /**
     * @brief Destructor, equivalent to shutdown()
     */
    ~elastic_transfer_pool() override;

    elastic_transfer_pool(const elastic_transfer_pool&) = delete;
    elastic_transfer_pool& operator=(const elastic_transfer_pool&) = delete;

    std::future<void> submit(pool_job job) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

    /**
     * @brief Number of workers currently waiting for a job
     */
    [[nodiscard]] size_t idle_worker_count() const;

    /**
     * @brief Stop accepting jobs, finish queued ones and join every worker
     *
     * Safe to call more than once.
     */
    void shutdown();

    /**
     * @brief Get the pool name
     * @return Pool name string
     */
    [[nodiscard]] std::string pool_name() const;

protected:
    /**
     * @brief Start the thread of a new worker
     * @param body Worker loop to run
     * @return The started thread
     * @throws std::system_error if the thread cannot be started; the job
     *         being submitted is then not queued
     */
    virtual std::thread create_worker(std::function<void()> body);

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

}  // namespace kcenon::segment_transfer::adapters
