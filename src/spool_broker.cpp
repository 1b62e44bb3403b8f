/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/spool_broker.hpp"
#include "openshaz/errors.hpp"
#include "openshaz/logger.hpp"
#include "openshaz/types.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <optional>
#include <thread>
#include <signal.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace openshaz {

namespace {

std::atomic<std::uint64_t> g_sequence{0};

struct QueueMeta {
    bool durable = true;
    bool exclusive = false;
    bool autoDelete = false;
    long owner = 0;
};

bool pidAlive(long pid) noexcept {
    if (pid <= 0) {
        return false;
    }
    return ::kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM;
}

bool isValidQueueName(const std::string& name) noexcept {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

std::optional<QueueMeta> readMeta(const fs::path& queueDir) noexcept {
    try {
        std::ifstream file(queueDir / "queue.json");
        if (!file) {
            return std::nullopt;
        }
        auto j = nlohmann::json::parse(file);
        QueueMeta meta;
        meta.durable = j.value("durable", true);
        meta.exclusive = j.value("exclusive", false);
        meta.autoDelete = j.value("auto_delete", false);
        meta.owner = j.value("owner", 0L);
        return meta;
    } catch (...) {
        return std::nullopt;
    }
}

void writeFileAtomically(const fs::path& tempPath, const fs::path& finalPath, const std::string& content) {
    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw BrokerError("Failed to open " + tempPath.string());
        }
        file << content;
        file.flush();
        if (!file.good()) {
            throw BrokerError("Failed to write " + tempPath.string());
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        fs::remove(tempPath, ec);
        throw BrokerError("Failed to publish " + finalPath.string());
    }
}

std::int64_t dueOf(const std::string& fileName) noexcept {
    try {
        return std::stoll(fileName.substr(0, fileName.find('_')));
    } catch (...) {
        return 0;
    }
}

long ownerOfClaim(const std::string& fileName) noexcept {
    try {
        return std::stol(fileName.substr(0, fileName.find('@')));
    } catch (...) {
        return 0;
    }
}

// "<due>_<micros>_<pid>_<seq>.msg"
long writerOf(const std::string& fileName) noexcept {
    try {
        auto first = fileName.find('_');
        auto second = fileName.find('_', first + 1);
        auto third = fileName.find('_', second + 1);
        if (first == std::string::npos || second == std::string::npos || third == std::string::npos) {
            return 0;
        }
        return std::stol(fileName.substr(second + 1, third - second - 1));
    } catch (...) {
        return 0;
    }
}

std::size_t countEntries(const fs::path& dir) noexcept {
    std::size_t count = 0;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().extension() == ".msg") {
            ++count;
        }
    }
    return count;
}

}

SpoolBroker::SpoolBroker(const fs::path& spool) : spool_(spool) {
    try {
        fs::create_directories(spool_ / "queues");

        auto marker = spool_ / (".writable_" + std::to_string(getpid()) + "_" +
                               std::to_string(g_sequence.fetch_add(1)));
        {
            std::ofstream file(marker);
            if (!file) {
                throw BrokerUnavailable("Spool is not writable: " + spool_.string());
            }
        }
        fs::remove(marker);
    } catch (const fs::filesystem_error& e) {
        throw BrokerUnavailable("Spool unavailable: " + std::string(e.what()));
    }

    open_ = true;
    recoverOrphans();
    LOG_DEBUG("Spool broker connected: " + spool_.string());
}

SpoolBroker::~SpoolBroker() {
    close();
}

std::string SpoolBroker::declareQueue(const std::string& name, const QueueOptions& options) {
    ensureOpen();

    std::string queueName = name.empty() ? "amq.gen-" + generateUuid() : name;
    if (!isValidQueueName(queueName)) {
        throw BrokerError("Invalid queue name: " + queueName);
    }

    auto dir = queuePath(queueName);
    if (auto meta = readMeta(dir)) {
        if (meta->exclusive && meta->owner != getpid() && pidAlive(meta->owner)) {
            throw BrokerError("Queue '" + queueName + "' is locked by another connection");
        }
        return queueName;
    }

    try {
        fs::create_directories(dir / "writing");
        fs::create_directories(dir / "ready");
        fs::create_directories(dir / "unacked");
        fs::create_directories(dir / "dead");

        bool owned = options.exclusive || options.autoDelete;
        nlohmann::json meta = {
            {"durable", options.durable},
            {"exclusive", options.exclusive},
            {"auto_delete", options.autoDelete},
            {"owner", owned ? static_cast<long>(getpid()) : 0L}
        };
        auto temp = dir / ("queue.json." + std::to_string(getpid()) + "_" +
                           std::to_string(g_sequence.fetch_add(1)) + ".tmp");
        writeFileAtomically(temp, dir / "queue.json", meta.dump());

        if (owned) {
            ownedQueues_.push_back(queueName);
        }
    } catch (const fs::filesystem_error& e) {
        throw BrokerUnavailable("Failed to declare queue " + queueName + ": " + e.what());
    }

    LOG_TRACE("Declared queue: " + queueName);
    return queueName;
}

void SpoolBroker::publish(const std::string& exchange, const std::string& routingKey,
                          const std::string& body, const Properties& properties) {
    ensureOpen();
    if (!exchange.empty()) {
        throw BrokerError("Unknown exchange: " + exchange);
    }

    if (!isValidQueueName(routingKey)) {
        LOG_DEBUG("Dropping message for invalid queue name: " + routingKey);
        return;
    }

    auto dir = queuePath(routingKey);
    QueueMessage message{routingKey, body, properties};
    std::int64_t due = properties.notBefore > 0 ? properties.notBefore : nowMillis();
    std::string fileName = nextFileName(due);

    // An auto-delete queue may vanish mid-write; it counts as missing only
    // once a write has failed.
    try {
        writeFileAtomically(dir / "writing" / fileName, dir / "ready" / fileName, toJson(message).dump());
    } catch (const BrokerError&) {
        std::error_code ec;
        if (!fs::exists(dir / "ready", ec)) {
            LOG_DEBUG("Dropping message for missing queue: " + routingKey);
            return;
        }
        throw;
    }
    LOG_TRACE("Published " + fileName + " to " + routingKey);
}

std::string SpoolBroker::consume(const std::string& queue, int prefetchCount, ConsumerHandler handler) {
    ensureOpen();

    auto dir = queuePath(queue);
    std::error_code ec;
    if (!isValidQueueName(queue) || !fs::exists(dir / "ready", ec)) {
        throw BrokerError("No queue '" + queue + "'");
    }
    if (auto meta = readMeta(dir)) {
        if (meta->exclusive && meta->owner != getpid() && pidAlive(meta->owner)) {
            throw BrokerError("Queue '" + queue + "' is exclusive to another connection");
        }
    }
    if (!handler) {
        throw BrokerError("Consumer handler is empty");
    }

    std::string tag = "ctag-" + std::to_string(getpid()) + "." + std::to_string(nextConsumer_++);
    consumers_[tag] = Consumer{queue, prefetchCount > 0 ? prefetchCount : INT_MAX, std::move(handler), 0};
    return tag;
}

void SpoolBroker::cancel(const std::string& consumerTag) {
    ensureOpen();
    consumers_.erase(consumerTag);
}

void SpoolBroker::ack(DeliveryTag tag) {
    ensureOpen();
    Pending pending = takePending(tag);

    std::error_code ec;
    fs::remove(claimedPath(pending), ec);
    if (ec) {
        throw BrokerError("Failed to ack " + pending.fileName + ": " + ec.message());
    }
}

void SpoolBroker::nack(DeliveryTag tag, bool requeue) {
    ensureOpen();
    Pending pending = takePending(tag);

    auto from = claimedPath(pending);
    auto to = queuePath(pending.queue) / (requeue ? "ready" : "dead") / pending.fileName;

    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        throw BrokerError("Failed to nack " + pending.fileName + ": " + ec.message());
    }
}

std::size_t SpoolBroker::processEvents(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::vector<std::pair<ConsumerHandler, Delivery>> batch;

    while (true) {
        ensureOpen();
        try {
            for (auto& [tag, consumer] : consumers_) {
                if (consumer.inflight < consumer.prefetch) {
                    (void)claimNext(tag, consumer, batch);
                }
            }
        } catch (const fs::filesystem_error& e) {
            throw BrokerUnavailable("Spool read failed: " + std::string(e.what()));
        }
        if (!batch.empty()) {
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return 0;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(pollInterval_, remaining + std::chrono::milliseconds(1)));
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

void SpoolBroker::close() noexcept {
    if (!open_) {
        return;
    }
    open_ = false;

    try {
        for (const auto& [tag, pending] : unacked_) {
            std::error_code ec;
            fs::rename(claimedPath(pending), queuePath(pending.queue) / "ready" / pending.fileName, ec);
            if (ec) {
                LOG_WARN("Failed to return " + pending.fileName + " to " + pending.queue + ": " + ec.message());
            }
        }
        unacked_.clear();
        consumers_.clear();

        for (const auto& name : ownedQueues_) {
            std::error_code ec;
            fs::remove_all(queuePath(name), ec);
            if (ec) {
                LOG_WARN("Failed to delete queue " + name + ": " + ec.message());
            }
        }
        ownedQueues_.clear();
        LOG_DEBUG("Spool broker connection closed");
    } catch (const std::exception& e) {
        LOG_ERROR("Error closing spool broker connection: " + std::string(e.what()));
    }
}

std::size_t SpoolBroker::recoverOrphans() noexcept {
    std::size_t recovered = 0;
    const long self = static_cast<long>(getpid());

    try {
        auto queuesDir = spool_ / "queues";
        std::vector<fs::path> queueDirs;
        for (const auto& entry : fs::directory_iterator(queuesDir)) {
            if (entry.is_directory()) {
                queueDirs.push_back(entry.path());
            }
        }

        for (const auto& dir : queueDirs) {
            auto meta = readMeta(dir);
            if (meta && meta->owner != 0 && meta->owner != self && !pidAlive(meta->owner)) {
                std::error_code ec;
                fs::remove_all(dir, ec);
                LOG_DEBUG("Removed stale queue: " + dir.filename().string());
                continue;
            }

            std::error_code ec;
            for (fs::directory_iterator it(dir / "unacked", ec), end; !ec && it != end; it.increment(ec)) {
                std::string name = it->path().filename().string();
                auto at = name.find('@');
                if (at == std::string::npos) {
                    continue;
                }
                long owner = ownerOfClaim(name);
                if (owner == self || pidAlive(owner)) {
                    continue;
                }

                std::error_code moveEc;
                fs::rename(it->path(), dir / "ready" / name.substr(at + 1), moveEc);
                if (moveEc) {
                    LOG_ERROR("Failed to recover " + name + ": " + moveEc.message());
                } else {
                    LOG_WARN("Recovered orphaned message: " + name.substr(at + 1));
                    ++recovered;
                }
            }

            // Half-written messages of dead publishers
            for (fs::directory_iterator it(dir / "writing", ec), end; !ec && it != end; it.increment(ec)) {
                long writer = writerOf(it->path().filename().string());
                if (writer != 0 && writer != self && !pidAlive(writer)) {
                    std::error_code rmEc;
                    fs::remove(it->path(), rmEc);
                }
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error recovering orphaned messages: " + std::string(e.what()));
    }

    if (recovered > 0) {
        LOG_INFO("Recovered " + std::to_string(recovered) + " orphaned message(s)");
    }
    return recovered;
}

std::size_t SpoolBroker::depth(const std::string& queue) const noexcept {
    return countEntries(queuePath(queue) / "ready");
}

std::size_t SpoolBroker::deadLetterCount(const std::string& queue) const noexcept {
    return countEntries(queuePath(queue) / "dead");
}

void SpoolBroker::ensureOpen() const {
    if (!open_) {
        throw BrokerError("Connection is closed");
    }
}

fs::path SpoolBroker::queuePath(const std::string& queue) const {
    return spool_ / "queues" / queue;
}

fs::path SpoolBroker::claimedPath(const Pending& pending) const {
    return queuePath(pending.queue) / "unacked" / (std::to_string(getpid()) + "@" + pending.fileName);
}

std::string SpoolBroker::nextFileName(std::int64_t dueMillis) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    char buf[96];
    std::snprintf(buf, sizeof(buf), "%016lld_%lld_%ld_%llu.msg",
                  static_cast<long long>(dueMillis),
                  static_cast<long long>(micros),
                  static_cast<long>(getpid()),
                  static_cast<unsigned long long>(g_sequence.fetch_add(1)));
    return buf;
}

bool SpoolBroker::claimNext(const std::string& consumerTag, Consumer& consumer,
                            std::vector<std::pair<ConsumerHandler, Delivery>>& batch) {
    auto dir = queuePath(consumer.queue);

    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir / "ready")) {
        if (entry.path().extension() == ".msg") {
            names.push_back(entry.path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());

    const std::int64_t now = nowMillis();
    for (const auto& name : names) {
        if (dueOf(name) > now) {
            break;
        }

        Pending pending{consumerTag, consumer.queue, name};
        auto claimed = claimedPath(pending);
        std::error_code ec;
        fs::rename(dir / "ready" / name, claimed, ec);
        if (ec) {
            // Another consumer got it first
            continue;
        }

        QueueMessage message;
        try {
            std::ifstream file(claimed, std::ios::binary);
            std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
            message = messageFromJson(nlohmann::json::parse(content));
        } catch (const std::exception& e) {
            LOG_ERROR("Unreadable message " + name + " in " + consumer.queue + ": " + e.what());
            fs::rename(claimed, dir / "dead" / name, ec);
            continue;
        }

        DeliveryTag tag = nextTag_++;
        unacked_[tag] = pending;
        ++consumer.inflight;
        batch.emplace_back(consumer.handler, Delivery{tag, consumerTag, std::move(message)});
        return true;
    }
    return false;
}

SpoolBroker::Pending SpoolBroker::takePending(DeliveryTag tag) {
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

void SpoolBroker::requeueIfUnacked(DeliveryTag tag) {
    if (unacked_.count(tag) != 0) {
        nack(tag, true);
    }
}

}
