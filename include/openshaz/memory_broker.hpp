/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <string>
#include <vector>

#include "openshaz/broker.hpp"

namespace openshaz {

// In-process broker. Every connection created from the same MemoryBroker sees
// the same queues, so a client and a dispatcher can talk across threads.
class MemoryBroker final {
public:
    MemoryBroker();

    MemoryBroker(const MemoryBroker&) = delete;
    MemoryBroker& operator=(const MemoryBroker&) = delete;

    // Throws BrokerUnavailable while the broker is marked unavailable.
    [[nodiscard]] std::unique_ptr<Broker> connect();
    [[nodiscard]] BrokerFactory factory();

    // Simulates an outage: connect() fails and open connections start throwing.
    void setAvailable(bool available) noexcept;

    [[nodiscard]] bool hasQueue(const std::string& name) const;
    [[nodiscard]] std::size_t depth(const std::string& queue) const;
    [[nodiscard]] std::vector<QueueMessage> deadLetters(const std::string& queue) const;

    struct State;

private:
    std::shared_ptr<State> state_;
};

}
