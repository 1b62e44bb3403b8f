/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/broker.hpp"
#include "openshaz/errors.hpp"
#include "openshaz/logger.hpp"
#include <algorithm>
#include <thread>

namespace openshaz {

std::unique_ptr<Broker> connectWithRetry(const BrokerFactory& factory, int attempts,
                                         std::chrono::milliseconds backoff) {
    return connectWithRetry(factory, attempts, backoff, std::chrono::steady_clock::time_point::max());
}

std::unique_ptr<Broker> connectWithRetry(const BrokerFactory& factory, int attempts,
                                         std::chrono::milliseconds backoff,
                                         std::chrono::steady_clock::time_point deadline) {
    if (!factory) {
        throw BrokerUnavailable("No broker factory configured");
    }
    if (attempts < 1) {
        attempts = 1;
    }

    std::string lastError;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            auto broker = factory();
            if (broker && broker->isOpen()) {
                LOG_DEBUG("Connected to broker on attempt " + std::to_string(attempt));
                return broker;
            }
            lastError = "factory returned no open connection";
        } catch (const BrokerError& e) {
            lastError = e.what();
        }

        LOG_WARN("Broker connection attempt " + std::to_string(attempt) + "/" +
                 std::to_string(attempts) + " failed: " + lastError);

        if (attempt < attempts) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                throw BrokerUnavailable("Deadline passed after " + std::to_string(attempt) +
                                        " connection attempts: " + lastError);
            }
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(backoff, deadline - now));
            if (std::chrono::steady_clock::now() >= deadline) {
                throw BrokerUnavailable("Deadline passed after " + std::to_string(attempt) +
                                        " connection attempts: " + lastError);
            }
        }
    }

    LOG_CRITICAL("Failed to connect to broker after " + std::to_string(attempts) + " attempts");
    throw BrokerUnavailable("Broker unavailable after " + std::to_string(attempts) +
                            " attempts: " + lastError);
}

}
