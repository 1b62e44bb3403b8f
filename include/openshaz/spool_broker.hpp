/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "openshaz/broker.hpp"

namespace openshaz {

// Durable broker on a shared directory. Any number of processes may open
// connections on the same spool. Layout per queue:
//
//   <spool>/queues/<name>/queue.json      declare options and owner pid
//   <spool>/queues/<name>/writing/        messages being written
//   <spool>/queues/<name>/ready/          published, waiting for a consumer
//   <spool>/queues/<name>/unacked/        claimed by a consumer, "<pid>@<file>"
//   <spool>/queues/<name>/dead/           nacked without requeue
//
// Publish and claim are single rename(2) calls, so a message is visible to
// consumers only once fully written and is claimed by exactly one consumer.
// Message file names start with the due time, so sorting them yields
// delivery order. A connection is used from one thread at a time.
class SpoolBroker final : public Broker {
public:
    // Throws BrokerUnavailable when the spool cannot be created or written.
    explicit SpoolBroker(const std::filesystem::path& spool);
    ~SpoolBroker() override;

    std::string declareQueue(const std::string& name, const QueueOptions& options = {}) override;
    void publish(const std::string& exchange, const std::string& routingKey,
                 const std::string& body, const Properties& properties) override;
    std::string consume(const std::string& queue, int prefetchCount, ConsumerHandler handler) override;
    void cancel(const std::string& consumerTag) override;
    void ack(DeliveryTag tag) override;
    void nack(DeliveryTag tag, bool requeue) override;
    std::size_t processEvents(std::chrono::milliseconds timeout) override;
    void close() noexcept override;
    [[nodiscard]] bool isOpen() const noexcept override { return open_; }

    // Moves messages claimed by dead processes back to ready and removes
    // exclusive queues whose owner is gone. Returns the number of messages recovered.
    std::size_t recoverOrphans() noexcept;

    [[nodiscard]] std::size_t depth(const std::string& queue) const noexcept;
    [[nodiscard]] std::size_t deadLetterCount(const std::string& queue) const noexcept;
    [[nodiscard]] const std::filesystem::path& spool() const noexcept { return spool_; }

    void setPollInterval(std::chrono::milliseconds interval) noexcept { pollInterval_ = interval; }

private:
    struct Consumer {
        std::string queue;
        int prefetch = 1;
        ConsumerHandler handler;
        int inflight = 0;
    };

    struct Pending {
        std::string consumerTag;
        std::string queue;
        std::string fileName;
    };

    void ensureOpen() const;
    [[nodiscard]] std::filesystem::path queuePath(const std::string& queue) const;
    [[nodiscard]] std::filesystem::path claimedPath(const Pending& pending) const;
    [[nodiscard]] std::string nextFileName(std::int64_t dueMillis);
    [[nodiscard]] bool claimNext(const std::string& consumerTag, Consumer& consumer,
                                 std::vector<std::pair<ConsumerHandler, Delivery>>& batch);
    Pending takePending(DeliveryTag tag);
    void requeueIfUnacked(DeliveryTag tag);

    std::filesystem::path spool_;
    bool open_ = false;
    std::chrono::milliseconds pollInterval_{25};

    DeliveryTag nextTag_ = 1;
    std::uint64_t nextConsumer_ = 1;
    std::map<std::string, Consumer> consumers_;
    std::map<DeliveryTag, Pending> unacked_;
    std::vector<std::string> ownedQueues_;
};

}
