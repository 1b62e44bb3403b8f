/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <string>

#include "openshaz/broker.hpp"
#include "openshaz/types.hpp"

namespace openshaz {

enum class FailureKind : std::uint8_t {
    Retryable,  // transient: storage, persistence, extraction, unknown
    Terminal    // malformed payload, wrong dimensionality; see terminalValidation
};

enum class RetryOutcome : std::uint8_t { Requeued, Discarded };

struct RetryPolicy {
    int maxRetries = kMaxRetries;
    std::chrono::milliseconds baseDelay{1000};
    double multiplier = 2.0;
    std::chrono::milliseconds maxDelay{30000};
    // When false, Terminal failures use the retry budget like any other.
    bool terminalValidation = false;

    // Delay before the given retry attempt (1-based).
    [[nodiscard]] std::chrono::milliseconds delayFor(int attempt) const noexcept;

    [[nodiscard]] static RetryPolicy immediate(int maxRetries = kMaxRetries) noexcept;
};

// Decides what happens to a delivery whose handler failed. Either the same
// body is republished to the same routing key with x-retry-count + 1 (and
// the original delivery acked), or the delivery is nacked without requeue.
class RetryGovernor {
public:
    explicit RetryGovernor(RetryPolicy policy = {}) noexcept;

    // Throws BrokerError when the broker rejects the republish, ack or nack;
    // the delivery is then still unacknowledged.
    RetryOutcome onFailure(Broker& broker, const Delivery& delivery, FailureKind kind,
                           const std::string& reason);

    [[nodiscard]] const RetryPolicy& policy() const noexcept { return policy_; }

    // x-retry-count header, 0 when absent or negative.
    [[nodiscard]] static int retryCount(const Properties& properties) noexcept;

private:
    RetryPolicy policy_;
};

}
