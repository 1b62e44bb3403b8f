/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "openshaz/broker.hpp"
#include "openshaz/processor.hpp"
#include "openshaz/retry.hpp"
#include "openshaz/similarity.hpp"

namespace openshaz {

struct DispatcherOptions {
    // Consume the single music_tasks queue and route by the "type" field.
    bool fanout = false;
    int connectAttempts = 3;
    std::chrono::milliseconds connectBackoff{5000};
    // Longest a consumer waits for events before rechecking for shutdown.
    std::chrono::milliseconds pollInterval{200};
    Metric metric = Metric::Cosine;
    bool normalize = true;
    RetryPolicy retry;
};

// Worker side. One consumer thread and broker connection per queue, each with
// prefetch 1, so a slow extraction does not hold up similarity requests.
class Dispatcher final {
public:
    Dispatcher(BrokerFactory factory, FeatureStore& store, ObjectStore& storage,
               FeatureExtractor& extractor, DispatcherOptions options = {});
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;
    Dispatcher(Dispatcher&&) = delete;
    Dispatcher& operator=(Dispatcher&&) = delete;

    // Connects with bounded retry and starts the consumers. Returns false when
    // the broker stays unreachable.
    [[nodiscard]] bool start();
    // Stops taking deliveries, lets in-flight handlers finish and closes the connections.
    void shutdown() noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    // True once a consumer lost the broker and could not reconnect.
    [[nodiscard]] bool failed() const noexcept { return failed_.load(); }

    [[nodiscard]] FeatureCache& cache() noexcept { return cache_; }
    [[nodiscard]] ProcessorStats stats() const noexcept { return processor_.stats(); }
    [[nodiscard]] std::vector<std::string> queues() const;

private:
    [[nodiscard]] std::unique_ptr<Broker> openConsumer(const std::string& queue);
    void consumeLoop(std::string queue, std::unique_ptr<Broker> broker);

    BrokerFactory factory_;
    DispatcherOptions options_;
    FeatureCache cache_;
    Processor processor_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::atomic<bool> failed_{false};

    std::vector<std::thread> consumerThreads_;
};

}
