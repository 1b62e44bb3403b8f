/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/memory_broker.hpp"
#include "openshaz/errors.hpp"
#include "openshaz/logger.hpp"
#include "openshaz/types.hpp"
#include <algorithm>
#include <climits>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>

namespace openshaz {

struct MemoryBroker::State {
    struct Queue {
        QueueOptions options;
        std::uint64_t owner = 0;
        std::deque<QueueMessage> ready;
        std::vector<QueueMessage> dead;
    };

    std::mutex mutex;
    std::condition_variable changed;
    bool available = true;
    std::uint64_t nextConnectionId = 1;
    std::map<std::string, Queue> queues;
};

namespace {

class MemoryConnection final : public Broker {
public:
    MemoryConnection(std::shared_ptr<MemoryBroker::State> state, std::uint64_t id)
        : state_(std::move(state)), id_(id) {}

    ~MemoryConnection() override { close(); }

    std::string declareQueue(const std::string& name, const QueueOptions& options) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        ensureOpenLocked();

        std::string queueName = name.empty() ? "amq.gen-" + generateUuid() : name;
        auto it = state_->queues.find(queueName);
        if (it != state_->queues.end()) {
            if (it->second.owner != 0 && it->second.owner != id_) {
                throw BrokerError("Queue '" + queueName + "' is locked by another connection");
            }
            return queueName;
        }

        MemoryBroker::State::Queue queue;
        queue.options = options;
        if (options.exclusive || options.autoDelete) {
            queue.owner = id_;
            ownedQueues_.push_back(queueName);
        }
        state_->queues.emplace(queueName, std::move(queue));
        LOG_TRACE("Declared queue: " + queueName);
        return queueName;
    }

    void publish(const std::string& exchange, const std::string& routingKey,
                 const std::string& body, const Properties& properties) override {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            ensureOpenLocked();
            if (!exchange.empty()) {
                throw BrokerError("Unknown exchange: " + exchange);
            }

            auto it = state_->queues.find(routingKey);
            if (it == state_->queues.end()) {
                LOG_DEBUG("Dropping message for missing queue: " + routingKey);
                return;
            }
            it->second.ready.push_back(QueueMessage{routingKey, body, properties});
        }
        state_->changed.notify_all();
    }

    std::string consume(const std::string& queue, int prefetchCount, ConsumerHandler handler) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        ensureOpenLocked();

        auto it = state_->queues.find(queue);
        if (it == state_->queues.end()) {
            throw BrokerError("No queue '" + queue + "'");
        }
        if (it->second.owner != 0 && it->second.owner != id_ && it->second.options.exclusive) {
            throw BrokerError("Queue '" + queue + "' is exclusive to another connection");
        }
        if (!handler) {
            throw BrokerError("Consumer handler is empty");
        }

        std::string tag = "ctag-" + std::to_string(id_) + "." + std::to_string(nextConsumer_++);
        consumers_[tag] = Consumer{queue, prefetchCount > 0 ? prefetchCount : INT_MAX, std::move(handler), 0};
        return tag;
    }

    void cancel(const std::string& consumerTag) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        ensureOpenLocked();
        consumers_.erase(consumerTag);
    }

    void ack(DeliveryTag tag) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        ensureOpenLocked();
        takeUnackedLocked(tag);
    }

    void nack(DeliveryTag tag, bool requeue) override {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            ensureOpenLocked();
            Pending pending = takeUnackedLocked(tag);

            auto it = state_->queues.find(pending.queue);
            if (it == state_->queues.end()) {
                return;
            }
            if (requeue) {
                it->second.ready.push_front(std::move(pending.message));
            } else {
                it->second.dead.push_back(std::move(pending.message));
            }
        }
        state_->changed.notify_all();
    }

    std::size_t processEvents(std::chrono::milliseconds timeout) override {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        std::vector<std::pair<ConsumerHandler, Delivery>> batch;

        {
            std::unique_lock<std::mutex> lock(state_->mutex);
            while (true) {
                ensureOpenLocked();
                collectLocked(batch);
                if (!batch.empty()) {
                    break;
                }

                auto now = std::chrono::steady_clock::now();
                if (now >= deadline) {
                    return 0;
                }
                state_->changed.wait_until(lock, std::min(deadline, nextDueLocked(now)));
            }
        }

        for (auto& [handler, delivery] : batch) {
            try {
                handler(delivery);
            } catch (const BrokerError&) {
                throw;
            } catch (const std::exception& e) {
                LOG_ERROR("Consumer handler failed on " + delivery.message.routingKey + ": " + e.what());
                requeueIfUnacked(delivery.tag);
            }
        }
        return batch.size();
    }

    void close() noexcept override {
        try {
            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                if (!open_) {
                    return;
                }
                open_ = false;

                // Reverse order so the oldest delivery ends up at the head again.
                for (auto it = unacked_.rbegin(); it != unacked_.rend(); ++it) {
                    auto queue = state_->queues.find(it->second.queue);
                    if (queue != state_->queues.end()) {
                        queue->second.ready.push_front(std::move(it->second.message));
                    }
                }
                unacked_.clear();
                consumers_.clear();

                for (const auto& name : ownedQueues_) {
                    state_->queues.erase(name);
                }
                ownedQueues_.clear();
            }
            state_->changed.notify_all();
        } catch (const std::exception& e) {
            LOG_ERROR("Error closing memory broker connection: " + std::string(e.what()));
        }
    }

    bool isOpen() const noexcept override {
        try {
            std::lock_guard<std::mutex> lock(state_->mutex);
            return open_ && state_->available;
        } catch (...) {
            return false;
        }
    }

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
        QueueMessage message;
    };

    void ensureOpenLocked() const {
        if (!open_) {
            throw BrokerError("Connection is closed");
        }
        if (!state_->available) {
            throw BrokerUnavailable("Broker unavailable");
        }
    }

    Pending takeUnackedLocked(DeliveryTag tag) {
        auto it = unacked_.find(tag);
        if (it == unacked_.end()) {
            throw BrokerError("Unknown delivery tag " + std::to_string(tag));
        }
        Pending pending = std::move(it->second);
        unacked_.erase(it);

        auto consumer = consumers_.find(pending.consumerTag);
        if (consumer != consumers_.end() && consumer->second.inflight > 0) {
            --consumer->second.inflight;
        }
        return pending;
    }

    void collectLocked(std::vector<std::pair<ConsumerHandler, Delivery>>& batch) {
        const std::int64_t now = nowMillis();
        for (auto& [tag, consumer] : consumers_) {
            if (consumer.inflight >= consumer.prefetch) {
                continue;
            }
            auto queue = state_->queues.find(consumer.queue);
            if (queue == state_->queues.end()) {
                continue;
            }

            auto& ready = queue->second.ready;
            auto due = std::find_if(ready.begin(), ready.end(), [now](const QueueMessage& m) {
                return m.properties.notBefore <= now;
            });
            if (due == ready.end()) {
                continue;
            }

            DeliveryTag deliveryTag = nextTag_++;
            Delivery delivery{deliveryTag, tag, std::move(*due)};
            ready.erase(due);

            unacked_[deliveryTag] = Pending{tag, consumer.queue, delivery.message};
            ++consumer.inflight;
            batch.emplace_back(consumer.handler, std::move(delivery));
        }
    }

    std::chrono::steady_clock::time_point nextDueLocked(std::chrono::steady_clock::time_point now) const {
        std::int64_t earliest = 0;
        for (const auto& entry : consumers_) {
            auto queue = state_->queues.find(entry.second.queue);
            if (queue == state_->queues.end()) {
                continue;
            }
            for (const auto& message : queue->second.ready) {
                if (earliest == 0 || message.properties.notBefore < earliest) {
                    earliest = message.properties.notBefore;
                }
            }
        }
        if (earliest == 0) {
            return std::chrono::steady_clock::time_point::max();
        }
        auto wait = std::max<std::int64_t>(earliest - nowMillis(), 1);
        return now + std::chrono::milliseconds(wait);
    }

    void requeueIfUnacked(DeliveryTag tag) {
        bool pending = false;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            pending = unacked_.count(tag) != 0;
        }
        if (pending) {
            nack(tag, true);
        }
    }

    std::shared_ptr<MemoryBroker::State> state_;
    std::uint64_t id_;
    bool open_ = true;
    DeliveryTag nextTag_ = 1;
    std::uint64_t nextConsumer_ = 1;
    std::map<std::string, Consumer> consumers_;
    std::map<DeliveryTag, Pending> unacked_;
    std::vector<std::string> ownedQueues_;
};

std::unique_ptr<Broker> openConnection(const std::shared_ptr<MemoryBroker::State>& state) {
    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (!state->available) {
            throw BrokerUnavailable("Broker unavailable");
        }
        id = state->nextConnectionId++;
    }
    return std::make_unique<MemoryConnection>(state, id);
}

}

MemoryBroker::MemoryBroker() : state_(std::make_shared<State>()) {}

std::unique_ptr<Broker> MemoryBroker::connect() {
    return openConnection(state_);
}

BrokerFactory MemoryBroker::factory() {
    auto state = state_;
    return [state]() { return openConnection(state); };
}

void MemoryBroker::setAvailable(bool available) noexcept {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->available = available;
    }
    state_->changed.notify_all();
}

bool MemoryBroker::hasQueue(const std::string& name) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->queues.count(name) != 0;
}

std::size_t MemoryBroker::depth(const std::string& queue) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->queues.find(queue);
    return it == state_->queues.end() ? 0 : it->second.ready.size();
}

std::vector<QueueMessage> MemoryBroker::deadLetters(const std::string& queue) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->queues.find(queue);
    if (it == state_->queues.end()) {
        return {};
    }
    return it->second.dead;
}

}
