/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/dispatcher.hpp"
#include "openshaz/errors.hpp"
#include "openshaz/logger.hpp"

namespace openshaz {

// Note: Signal handling is done by the CLI (shazd.cpp), not by Dispatcher

Dispatcher::Dispatcher(BrokerFactory factory, FeatureStore& store, ObjectStore& storage,
                       FeatureExtractor& extractor, DispatcherOptions options)
    : factory_(std::move(factory)),
      options_(options),
      cache_(store, options.metric, options.normalize),
      processor_(Collaborators{store, storage, extractor, cache_}, RetryGovernor(options.retry)) {
    LOG_DEBUG(std::string("Dispatcher created - mode: ") + (options_.fanout ? "fanout" : "per-queue") +
              ", metric: " + toString(options_.metric));
}

Dispatcher::~Dispatcher() {
    shutdown();
}

std::vector<std::string> Dispatcher::queues() const {
    if (options_.fanout) {
        return {kFanoutQueue};
    }
    return {kExtractionQueue, kSimilarityQueue};
}

std::unique_ptr<Broker> Dispatcher::openConsumer(const std::string& queue) {
    auto broker = connectWithRetry(factory_, options_.connectAttempts, options_.connectBackoff);
    broker->declareQueue(queue, QueueOptions{true, false, false});

    Broker* channel = broker.get();
    broker->consume(queue, 1, [this, channel](const Delivery& delivery) {
        (void)processor_.process(*channel, delivery);
    });
    LOG_INFO("Waiting for tasks on " + queue);
    return broker;
}

bool Dispatcher::start() {
    if (running_.load()) {
        LOG_WARN("Dispatcher already running");
        return false;
    }

    LOG_INFO("Starting openshaz dispatcher...");
    setThreadName("Main");
    shutdown_.store(false);
    failed_.store(false);

    std::vector<std::pair<std::string, std::unique_ptr<Broker>>> connections;
    try {
        for (const auto& queue : queues()) {
            connections.emplace_back(queue, openConsumer(queue));
        }
    } catch (const BrokerError& e) {
        LOG_CRITICAL("Failed to start dispatcher: " + std::string(e.what()));
        return false;
    }

    running_.store(true);
    try {
        for (auto& [queue, broker] : connections) {
            consumerThreads_.emplace_back(&Dispatcher::consumeLoop, this, queue, std::move(broker));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start consumer threads: " + std::string(e.what()));
        shutdown();
        return false;
    }

    LOG_DEBUG("Dispatcher started with " + std::to_string(consumerThreads_.size()) + " consumer(s)");
    return true;
}

void Dispatcher::shutdown() noexcept {
    if (!running_.load() && consumerThreads_.empty()) {
        return;
    }

    LOG_INFO("Shutting down dispatcher...");
    shutdown_.store(true);

    for (auto& thread : consumerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    consumerThreads_.clear();
    running_.store(false);

    auto s = processor_.stats();
    LOG_INFO("Dispatcher shutdown complete (" + std::to_string(s.succeeded) + " completed, " +
             std::to_string(s.requeued) + " requeued, " + std::to_string(s.discarded) + " discarded)");
}

void Dispatcher::consumeLoop(std::string queue, std::unique_ptr<Broker> broker) {
    setThreadName("Consumer-" + queue);
    LOG_DEBUG("Consumer loop started");

    while (!shutdown_.load()) {
        try {
            broker->processEvents(options_.pollInterval);
        } catch (const BrokerError& e) {
            LOG_ERROR("Lost broker connection on " + queue + ": " + std::string(e.what()));
            broker->close();
            if (shutdown_.load()) {
                break;
            }
            try {
                broker = openConsumer(queue);
                LOG_INFO("Reconnected consumer on " + queue);
            } catch (const BrokerError& fatal) {
                LOG_CRITICAL("Consumer on " + queue + " cannot reconnect: " + std::string(fatal.what()));
                failed_.store(true);
                running_.store(false);
                break;
            }
        }
    }

    broker->close();
    LOG_DEBUG("Consumer loop stopped");
}

}
