/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/pool.hpp"
#include "openshaz/logger.hpp"

namespace openshaz {

Pool::Pool(int workers) noexcept : workers_(workers > 0 ? workers : 1) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start() {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    running_.store(true);
    shutdown_.store(false);

    try {
        workerThreads_.reserve(static_cast<std::size_t>(workers_));
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }

        LOG_DEBUG("Pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping pool...");

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    jobAvailable_.notify_all();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();

    LOG_DEBUG("Pool stopped");
}

void Pool::enqueue(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!running_.load() || shutdown_.load()) {
            throw Error("Cannot submit task to stopped pool");
        }
        jobQueue_.push(std::move(job));
    }
    jobAvailable_.notify_one();
}

std::size_t Pool::queueSize() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return jobQueue_.size();
}

void Pool::workerLoop(int workerId) {
    setThreadName("Pool-" + std::to_string(workerId));
    LOG_TRACE("Pool-" + std::to_string(workerId) + " thread started");

    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            jobAvailable_.wait(lock, [this] {
                return !jobQueue_.empty() || shutdown_.load();
            });

            if (jobQueue_.empty()) {
                break;
            }
            job = std::move(jobQueue_.front());
            jobQueue_.pop();
        }

        // packaged_task stores the task's exception in its future.
        job();
    }

    LOG_TRACE("Pool-" + std::to_string(workerId) + " stopped");
}

}
