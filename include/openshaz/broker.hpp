/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "openshaz/message.hpp"

namespace openshaz {

struct QueueOptions {
    bool durable = true;
    bool exclusive = false;
    bool autoDelete = false;
};

using ConsumerHandler = std::function<void(const Delivery&)>;

// One Broker instance is one connection. Every operation throws BrokerError
// (or BrokerUnavailable) on failure. Only the default exchange ("") exists:
// the routing key names the destination queue, and a message routed to a
// queue that does not exist is dropped.
class Broker {
public:
    virtual ~Broker() = default;

    Broker(const Broker&) = delete;
    Broker& operator=(const Broker&) = delete;
    Broker(Broker&&) = delete;
    Broker& operator=(Broker&&) = delete;

    // Empty name asks the broker for a generated unique name. Exclusive and
    // auto-delete queues disappear when this connection closes.
    virtual std::string declareQueue(const std::string& name, const QueueOptions& options = {}) = 0;

    virtual void publish(const std::string& exchange, const std::string& routingKey,
                         const std::string& body, const Properties& properties) = 0;

    // The consumer never holds more than prefetchCount unacknowledged deliveries.
    virtual std::string consume(const std::string& queue, int prefetchCount, ConsumerHandler handler) = 0;
    virtual void cancel(const std::string& consumerTag) = 0;

    virtual void ack(DeliveryTag tag) = 0;
    virtual void nack(DeliveryTag tag, bool requeue) = 0;

    // Waits up to timeout for deliverable messages, runs their handlers on the
    // calling thread and returns how many were dispatched.
    virtual std::size_t processEvents(std::chrono::milliseconds timeout) = 0;

    // Returns unacknowledged deliveries to their queues. Idempotent.
    virtual void close() noexcept = 0;
    [[nodiscard]] virtual bool isOpen() const noexcept = 0;

protected:
    Broker() = default;
};

using BrokerFactory = std::function<std::unique_ptr<Broker>()>;

// Bounded reconnection with a fixed backoff. Throws BrokerUnavailable once
// every attempt has failed.
[[nodiscard]] std::unique_ptr<Broker> connectWithRetry(const BrokerFactory& factory, int attempts,
                                                       std::chrono::milliseconds backoff);

// Same, but gives up early once the deadline has passed. Backoff sleeps never
// run past the deadline.
[[nodiscard]] std::unique_ptr<Broker> connectWithRetry(const BrokerFactory& factory, int attempts,
                                                       std::chrono::milliseconds backoff,
                                                       std::chrono::steady_clock::time_point deadline);

}
