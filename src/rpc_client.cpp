/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/rpc_client.hpp"
#include "openshaz/errors.hpp"
#include "openshaz/logger.hpp"
#include <optional>

namespace openshaz {

const char* toString(CallError error) noexcept {
    switch (error) {
        case CallError::None: return "none";
        case CallError::Timeout: return "timeout";
        case CallError::BrokerUnavailable: return "broker unavailable";
        case CallError::InvalidRequest: return "invalid request";
        case CallError::InvalidReply: return "invalid reply";
    }
    return "unknown";
}

RpcClient::RpcClient(BrokerFactory factory) : factory_(std::move(factory)) {}

CallResult RpcClient::call(const std::string& queue, const nlohmann::json& payload,
                           std::chrono::milliseconds timeout) {
    if (!payload.is_object()) {
        return {false, {}, CallError::InvalidRequest, "Payload must be a JSON object"};
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const std::string correlationId = generateUuid();
    std::optional<std::string> replyBody;

    // Closed on every path out of this function; the reply queue goes with it.
    std::unique_ptr<Broker> broker;
    try {
        broker = connectWithRetry(factory_, connectAttempts_, connectBackoff_, deadline);
    } catch (const BrokerError& e) {
        if (std::chrono::steady_clock::now() >= deadline) {
            LOG_WARN("RPC call to " + queue + " timed out while connecting: " + std::string(e.what()));
            return {false, {}, CallError::Timeout,
                    "No connection within " + std::to_string(timeout.count()) + "ms"};
        }
        LOG_ERROR("RPC call to " + queue + " failed: " + std::string(e.what()));
        return {false, {}, CallError::BrokerUnavailable, e.what()};
    }

    try {
        broker->declareQueue(queue, QueueOptions{true, false, false});
        const std::string replyQueue = broker->declareQueue("", QueueOptions{false, true, true});

        Broker& channel = *broker;
        broker->consume(replyQueue, 1, [&](const Delivery& delivery) {
            const auto& properties = delivery.message.properties;
            if (properties.correlationId == correlationId && !replyBody) {
                replyBody = delivery.message.body;
            } else {
                LOG_WARN("Discarding reply with unexpected correlation id '" + properties.correlationId +
                         "' on " + replyQueue);
            }
            channel.ack(delivery.tag);
        });

        Properties properties;
        properties.correlationId = correlationId;
        properties.replyTo = replyQueue;
        properties.persistent = true;
        broker->publish("", queue, payload.dump(), properties);
        LOG_DEBUG("RPC request " + correlationId + " published to " + queue);

        for (auto now = std::chrono::steady_clock::now(); !replyBody && now < deadline;
             now = std::chrono::steady_clock::now()) {
            broker->processEvents(std::chrono::ceil<std::chrono::milliseconds>(deadline - now));
        }
    } catch (const BrokerError& e) {
        LOG_ERROR("RPC call to " + queue + " failed: " + std::string(e.what()));
        return {false, {}, CallError::BrokerUnavailable, e.what()};
    }

    if (!replyBody) {
        LOG_WARN("RPC call to " + queue + " timed out after " + std::to_string(timeout.count()) + "ms");
        return {false, {}, CallError::Timeout,
                "No reply within " + std::to_string(timeout.count()) + "ms"};
    }

    try {
        JobResult reply = parseJobResult(*replyBody);
        LOG_DEBUG("RPC reply received for " + correlationId + " (" + toString(reply.status) + ")");
        return {true, std::move(reply), CallError::None, ""};
    } catch (const ValidationError& e) {
        LOG_ERROR("Malformed RPC reply from " + queue + ": " + std::string(e.what()));
        return {false, {}, CallError::InvalidReply, e.what()};
    }
}

std::future<CallResult> RpcClient::callAsync(const std::string& queue, nlohmann::json payload,
                                             std::chrono::milliseconds timeout) {
    return std::async(std::launch::async, [this, queue, payload = std::move(payload), timeout]() {
        return call(queue, payload, timeout);
    });
}

CallResult RpcClient::submitExtraction(const std::string& musicName, const std::string& bucketUrl,
                                       std::chrono::milliseconds timeout) {
    ExtractionTask task{generateUuid(), musicName, bucketUrl};
    LOG_INFO("Submitting extraction job " + task.jobId + " for " + musicName);
    return call(kExtractionQueue, toJson(task), timeout);
}

CallResult RpcClient::submitSimilarity(const std::string& musicName, const std::string& bucketUrl, int topK,
                                       std::chrono::milliseconds timeout) {
    SimilarityTask task{generateUuid(), musicName, bucketUrl, topK};
    LOG_INFO("Submitting similarity job " + task.jobId + " for " + musicName);
    return call(kSimilarityQueue, toJson(task), timeout);
}

}
