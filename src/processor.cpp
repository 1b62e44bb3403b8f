/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/processor.hpp"
#include "openshaz/errors.hpp"
#include "openshaz/logger.hpp"
#include <chrono>

namespace openshaz {

namespace {

// Removes the downloaded copy on every path out of a handler.
class DownloadGuard {
public:
    DownloadGuard(ObjectStore& storage, std::filesystem::path path)
        : storage_(storage), path_(std::move(path)) {}
    ~DownloadGuard() {
        try {
            storage_.cleanup(path_);
        } catch (const std::exception& e) {
            LOG_WARN("Failed to cleanup " + path_.string() + ": " + e.what());
        }
    }
    DownloadGuard(const DownloadGuard&) = delete;
    DownloadGuard& operator=(const DownloadGuard&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    ObjectStore& storage_;
    std::filesystem::path path_;
};

JobType routeFor(const QueueMessage& message) {
    if (message.routingKey == kExtractionQueue) return JobType::Extraction;
    if (message.routingKey == kSimilarityQueue) return JobType::Similarity;
    return parseJobType(message.body);
}

}

Processor::Processor(Collaborators collaborators, RetryGovernor governor)
    : collab_(collaborators), governor_(governor) {
    LOG_DEBUG("Processor created with max retries " + std::to_string(governor_.policy().maxRetries));
}

std::vector<double> Processor::fetchAndExtract(const std::string& bucketUrl) {
    DownloadGuard local(collab_.storage, collab_.storage.download(bucketUrl));
    return collab_.extractor.extract(local.path());
}

ExtractionResult Processor::extract(const ExtractionTask& task) {
    LOG_INFO("Received extraction task " + task.jobId + " for " + task.musicName);

    std::vector<double> features = fetchAndExtract(task.bucketUrl);
    std::int64_t id = collab_.store.storeOne(FeatureKind::Reference, task.musicName, task.bucketUrl, features);
    LOG_INFO("Stored features for " + task.musicName + " with id " + std::to_string(id));

    return ExtractionResult{task.jobId, task.musicName, task.bucketUrl, std::move(features)};
}

SimilarityResult Processor::findSimilar(const SimilarityTask& task) {
    LOG_INFO("Received similarity task " + task.jobId + " for " + task.musicName);

    SimilarityResult result{task.jobId, task.musicName, task.bucketUrl, {}};
    if (auto existing = collab_.store.findByName(FeatureKind::Query, task.musicName)) {
        LOG_INFO("Query song " + task.musicName + " already exists, using stored features");
        result.similar = collab_.cache.findSimilar(existing->values, task.topK);
        return result;
    }

    LOG_INFO("Query song " + task.musicName + " not found, extracting features");
    std::vector<double> query = fetchAndExtract(task.bucketUrl);
    // Ranked first: a query the reference set rejects is never stored.
    result.similar = collab_.cache.findSimilar(query, task.topK);
    std::int64_t id = collab_.store.storeOne(FeatureKind::Query, task.musicName, task.bucketUrl, query);
    LOG_INFO("Stored query song " + task.musicName + " with id " + std::to_string(id));
    return result;
}

nlohmann::json Processor::handle(const QueueMessage& message) {
    switch (routeFor(message)) {
        case JobType::Extraction:
            return toJson(extract(parseExtractionTask(message.body)));
        case JobType::Similarity:
            return toJson(findSimilar(parseSimilarityTask(message.body)));
    }
    throw ValidationError("Unroutable job on " + message.routingKey);
}

ProcessResult Processor::process(Broker& broker, const Delivery& delivery) {
    const auto& message = delivery.message;
    const auto startTime = std::chrono::steady_clock::now();

    nlohmann::json reply;
    try {
        reply = handle(message);
    } catch (const BrokerError&) {
        throw;
    } catch (const ValidationError& e) {
        return fail(broker, delivery, FailureKind::Terminal, e.what());
    } catch (const std::exception& e) {
        return fail(broker, delivery, FailureKind::Retryable, e.what());
    }

    // Reply before ack: a crash in between redelivers the job instead of losing it.
    if (!message.properties.replyTo.empty()) {
        Properties properties;
        properties.correlationId = message.properties.correlationId;
        properties.persistent = true;
        broker.publish("", message.properties.replyTo, reply.dump(), properties);
    }
    broker.ack(delivery.tag);
    ++succeeded_;

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
    LOG_INFO("JOB COMPLETED: " + reply.value("job_id", std::string{}) + " on " + message.routingKey +
             " in " + std::to_string(elapsed) + "s");
    return ProcessResult::Success;
}

ProcessResult Processor::fail(Broker& broker, const Delivery& delivery, FailureKind kind,
                              const std::string& reason) {
    LOG_ERROR("Error processing task on " + delivery.message.routingKey + ": " + reason);
    if (governor_.onFailure(broker, delivery, kind, reason) == RetryOutcome::Requeued) {
        ++requeued_;
        return ProcessResult::Requeued;
    }
    ++discarded_;
    return ProcessResult::Discarded;
}

ProcessorStats Processor::stats() const noexcept {
    return {succeeded_.load(), requeued_.load(), discarded_.load()};
}

}
