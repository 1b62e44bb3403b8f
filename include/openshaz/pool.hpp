/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
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

#include "openshaz/errors.hpp"

namespace openshaz {

// Fixed set of worker threads. Tasks run in submission order; exceptions
// thrown by a task are delivered through its future.
class Pool {
public:
    explicit Pool(int workers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start();
    // Runs the tasks already queued, then joins the workers.
    void stop() noexcept;

    // Throws Error when the pool is not running.
    template <typename F>
    [[nodiscard]] std::future<std::invoke_result_t<std::decay_t<F>>> submit(F&& task);

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

private:
    void enqueue(std::function<void()> job);
    void workerLoop(int workerId);

    int workers_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex queueMutex_;
    std::condition_variable jobAvailable_;
    std::queue<std::function<void()>> jobQueue_;

    std::vector<std::thread> workerThreads_;
};

template <typename F>
std::future<std::invoke_result_t<std::decay_t<F>>> Pool::submit(F&& task) {
    using R = std::invoke_result_t<std::decay_t<F>>;
    auto packaged = std::make_shared<std::packaged_task<R()>>(std::forward<F>(task));
    std::future<R> future = packaged->get_future();
    enqueue([packaged]() { (*packaged)(); });
    return future;
}

}
