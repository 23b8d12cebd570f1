// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Elastic worker pool implementation for segment_transfer
 */

#include "kcenon/segment_transfer/adapters/thread_pool_adapter.h"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <vector>

#include "kcenon/segment_transfer/core/logging.h"

namespace kcenon::segment_transfer::adapters {

// ============================================================================
// elastic_transfer_pool implementation
// ============================================================================

struct elastic_transfer_pool::impl {
    struct queued_job {
        std::string label;
        std::function<void()> work;
        std::shared_ptr<std::promise<void>> promise;
    };

    elastic_transfer_pool* owner{nullptr};
    pool_config config;

    mutable std::mutex mutex;
    std::condition_variable job_available;
    std::deque<queued_job> queue;
    std::unordered_map<std::thread::id, std::thread> workers;
    std::vector<std::thread> retired;
    size_t idle{0};
    bool running{true};

    // Caller holds the lock.
    void spawn_worker() {
        std::thread thread = owner->create_worker([this] { worker_loop(); });
        auto id = thread.get_id();
        workers.emplace(id, std::move(thread));
        ST_LOG_DEBUG(log_category::pool,
            config.name + ": started worker, " + std::to_string(workers.size()) + " total");
    }

    // Caller holds the lock.
    auto take_retired() -> std::vector<std::thread> {
        std::vector<std::thread> threads;
        threads.swap(retired);
        return threads;
    }

    void worker_loop() {
        std::unique_lock<std::mutex> lock(mutex);
        while (true) {
            if (!queue.empty()) {
                auto job = std::move(queue.front());
                queue.pop_front();
                lock.unlock();
                run(job);
                lock.lock();
                continue;
            }

            if (!running) {
                return;
            }

            ++idle;
            bool woken = job_available.wait_for(lock, config.idle_timeout, [this] {
                return !queue.empty() || !running;
            });
            --idle;

            if (!woken) {
                auto it = workers.find(std::this_thread::get_id());
                if (it != workers.end()) {
                    retired.push_back(std::move(it->second));
                    workers.erase(it);
                }
                ST_LOG_DEBUG(log_category::pool,
                    config.name + ": idle worker retired, " +
                    std::to_string(workers.size()) + " remaining");
                return;
            }
        }
    }

    void run(queued_job& job) {
        ST_LOG_TRACE(log_category::pool, "Running " + job.label);
        try {
            if (job.work) {
                job.work();
            }
            job.promise->set_value();
        } catch (...) {
            job.promise->set_exception(std::current_exception());
        }
    }
};

elastic_transfer_pool::elastic_transfer_pool()
    : elastic_transfer_pool(pool_config{}) {}

elastic_transfer_pool::elastic_transfer_pool(const pool_config& config)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->owner = this;
    pimpl_->config = config;
}

elastic_transfer_pool::~elastic_transfer_pool() {
    shutdown();
}

std::future<void> elastic_transfer_pool::submit(pool_job job) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        if (!pimpl_->running) {
            throw std::runtime_error(pimpl_->config.name + " is shut down, rejected " + job.label);
        }

        // every queued job is owned by one idle worker or a fresh one;
        // the worker is started first so a failed start leaves nothing queued
        const bool has_idle_owner = pimpl_->idle > pimpl_->queue.size();
        if (!has_idle_owner) {
            pimpl_->spawn_worker();
        }

        finished = pimpl_->take_retired();
        pimpl_->queue.push_back({std::move(job.label), std::move(job.work), promise});
        if (has_idle_owner) {
            pimpl_->job_available.notify_one();
        }
    }

    for (auto& thread : finished) {
        thread.join();
    }

    return future;
}

size_t elastic_transfer_pool::worker_count() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return pimpl_->workers.size();
}

bool elastic_transfer_pool::is_running() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return pimpl_->running;
}

size_t elastic_transfer_pool::pending_tasks() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return pimpl_->queue.size();
}

size_t elastic_transfer_pool::idle_worker_count() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return pimpl_->idle;
}

void elastic_transfer_pool::shutdown() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        if (!pimpl_->running && pimpl_->workers.empty() && pimpl_->retired.empty()) {
            return;
        }
        pimpl_->running = false;
        threads = pimpl_->take_retired();
        for (auto& [id, thread] : pimpl_->workers) {
            threads.push_back(std::move(thread));
        }
        pimpl_->workers.clear();
    }
    pimpl_->job_available.notify_all();

    ST_LOG_DEBUG(log_category::pool,
        pimpl_->config.name + ": joining " + std::to_string(threads.size()) + " workers");

    for (auto& thread : threads) {
        if (thread.get_id() == std::this_thread::get_id()) {
            // shutdown() called from one of our own jobs
            thread.detach();
        } else if (thread.joinable()) {
            thread.join();
        }
    }
}

std::thread elastic_transfer_pool::create_worker(std::function<void()> body) {
    return std::thread(std::move(body));
}

std::string elastic_transfer_pool::pool_name() const {
    return pimpl_->config.name;
}

}  // namespace kcenon::segment_transfer::adapters
