/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/retry.hpp"
#include "openshaz/logger.hpp"
#include <algorithm>
#include <cmath>

namespace openshaz {

std::chrono::milliseconds RetryPolicy::delayFor(int attempt) const noexcept {
    if (baseDelay.count() <= 0 || attempt < 1) {
        return std::chrono::milliseconds(0);
    }
    double factor = std::pow(std::max(multiplier, 1.0), attempt - 1);
    double delay = static_cast<double>(baseDelay.count()) * factor;
    double cap = static_cast<double>(std::max(maxDelay, baseDelay).count());
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::min(delay, cap)));
}

RetryPolicy RetryPolicy::immediate(int maxRetries) noexcept {
    RetryPolicy policy;
    policy.maxRetries = maxRetries;
    policy.baseDelay = std::chrono::milliseconds(0);
    return policy;
}

RetryGovernor::RetryGovernor(RetryPolicy policy) noexcept : policy_(policy) {}

int RetryGovernor::retryCount(const Properties& properties) noexcept {
    auto it = properties.headers.find(kRetryHeader);
    if (it == properties.headers.end() || it->second < 0) {
        return 0;
    }
    return static_cast<int>(std::min<std::int64_t>(it->second, 1 << 20));
}

RetryOutcome RetryGovernor::onFailure(Broker& broker, const Delivery& delivery, FailureKind kind,
                                      const std::string& reason) {
    const auto& message = delivery.message;
    const int count = retryCount(message.properties);

    if (kind == FailureKind::Terminal && policy_.terminalValidation) {
        LOG_CRITICAL("Discarding job on " + message.routingKey + " after unrecoverable error: " + reason);
        broker.nack(delivery.tag, false);
        return RetryOutcome::Discarded;
    }

    if (count >= policy_.maxRetries) {
        LOG_CRITICAL("Job exceeded maximum retries (" + std::to_string(policy_.maxRetries) +
                     ") on " + message.routingKey + ". Discarding message. Last error: " + reason);
        broker.nack(delivery.tag, false);
        return RetryOutcome::Discarded;
    }

    const int next = count + 1;
    Properties properties = message.properties;
    properties.headers[kRetryHeader] = next;
    properties.persistent = true;

    auto delay = policy_.delayFor(next);
    properties.notBefore = delay.count() > 0 ? nowMillis() + delay.count() : 0;

    LOG_WARN("Requeuing job on " + message.routingKey + " (attempt " + std::to_string(next) + "/" +
             std::to_string(policy_.maxRetries) + ", delay " + std::to_string(delay.count()) +
             "ms): " + reason);

    // Ack only after the republish succeeded, so a broker failure leaves the
    // original delivery to be redelivered instead of losing the job.
    broker.publish("", message.routingKey, message.body, properties);
    broker.ack(delivery.tag);
    return RetryOutcome::Requeued;
}

}
