/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/message.hpp"
#include "openshaz/errors.hpp"
#include <chrono>

namespace openshaz {

nlohmann::json toJson(const QueueMessage& message) {
    nlohmann::json headers = nlohmann::json::object();
    for (const auto& [key, value] : message.properties.headers) {
        headers[key] = value;
    }

    return {
        {"routing_key", message.routingKey},
        {"body", message.body},
        {"correlation_id", message.properties.correlationId},
        {"reply_to", message.properties.replyTo},
        {"headers", headers},
        {"persistent", message.properties.persistent},
        {"not_before", message.properties.notBefore}
    };
}

QueueMessage messageFromJson(const nlohmann::json& j) {
    try {
        QueueMessage message;
        message.routingKey = j.at("routing_key").get<std::string>();
        message.body = j.at("body").get<std::string>();
        message.properties.correlationId = j.value("correlation_id", std::string{});
        message.properties.replyTo = j.value("reply_to", std::string{});
        message.properties.persistent = j.value("persistent", true);
        message.properties.notBefore = j.value("not_before", std::int64_t{0});

        if (j.contains("headers") && j["headers"].is_object()) {
            for (auto it = j["headers"].begin(); it != j["headers"].end(); ++it) {
                if (it.value().is_number_integer()) {
                    message.properties.headers[it.key()] = it.value().get<std::int64_t>();
                }
            }
        }
        return message;
    } catch (const nlohmann::json::exception& e) {
        throw BrokerError(std::string("Malformed message record: ") + e.what());
    }
}

std::int64_t nowMillis() noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}
