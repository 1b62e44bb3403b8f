/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>

#include "openshaz/broker.hpp"
#include "openshaz/extractor.hpp"
#include "openshaz/feature_cache.hpp"
#include "openshaz/feature_store.hpp"
#include "openshaz/job.hpp"
#include "openshaz/retry.hpp"
#include "openshaz/storage.hpp"

namespace openshaz {

enum class ProcessResult : uint8_t {
    Success,
    Requeued,
    Discarded
};

struct Collaborators {
    FeatureStore& store;
    ObjectStore& storage;
    FeatureExtractor& extractor;
    FeatureCache& cache;
};

struct ProcessorStats {
    std::uint64_t succeeded = 0;
    std::uint64_t requeued = 0;
    std::uint64_t discarded = 0;
};

// Runs one delivery to completion and settles it: ack (plus a reply for RPC
// jobs), requeue or discard. Safe to share between consumer threads.
class Processor {
public:
    Processor(Collaborators collaborators, RetryGovernor governor);

    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;
    Processor(Processor&&) = delete;
    Processor& operator=(Processor&&) = delete;

    // Only BrokerError escapes; the delivery is then left unsettled and goes
    // back to its queue when the connection closes.
    ProcessResult process(Broker& broker, const Delivery& delivery);

    [[nodiscard]] ExtractionResult extract(const ExtractionTask& task);
    [[nodiscard]] SimilarityResult findSimilar(const SimilarityTask& task);

    [[nodiscard]] ProcessorStats stats() const noexcept;

private:
    Collaborators collab_;
    RetryGovernor governor_;

    std::atomic<std::uint64_t> succeeded_{0};
    std::atomic<std::uint64_t> requeued_{0};
    std::atomic<std::uint64_t> discarded_{0};

    [[nodiscard]] nlohmann::json handle(const QueueMessage& message);
    [[nodiscard]] std::vector<double> fetchAndExtract(const std::string& bucketUrl);
    ProcessResult fail(Broker& broker, const Delivery& delivery, FailureKind kind, const std::string& reason);
};

}
