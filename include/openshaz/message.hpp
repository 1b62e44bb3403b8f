/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

namespace openshaz {

using Headers = std::map<std::string, std::int64_t>;
using DeliveryTag = std::uint64_t;

struct Properties {
    std::string correlationId;
    std::string replyTo;
    Headers headers;
    bool persistent = true;
    // Earliest delivery time in epoch milliseconds, 0 = deliver at once.
    std::int64_t notBefore = 0;
};

struct QueueMessage {
    std::string routingKey;
    std::string body;
    Properties properties;
};

struct Delivery {
    DeliveryTag tag = 0;
    std::string consumerTag;
    QueueMessage message;
};

[[nodiscard]] nlohmann::json toJson(const QueueMessage& message);
// Throws BrokerError on a malformed record.
[[nodiscard]] QueueMessage messageFromJson(const nlohmann::json& j);

[[nodiscard]] std::int64_t nowMillis() noexcept;

}
