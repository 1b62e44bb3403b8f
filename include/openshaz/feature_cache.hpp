/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <mutex>
#include <vector>

#include "openshaz/feature_store.hpp"
#include "openshaz/similarity.hpp"

namespace openshaz {

// Reference set fitted into a SimilarityEngine on first use and then reused.
// References inserted later are not seen until invalidate() or refit().
class FeatureCache {
public:
    FeatureCache(FeatureStore& store, Metric metric = Metric::Cosine, bool normalize = true);

    FeatureCache(const FeatureCache&) = delete;
    FeatureCache& operator=(const FeatureCache&) = delete;

    // Loads and fits on first call. An empty reference set gives an empty
    // ranking and is not cached. Throws PersistenceError when the store fails
    // or holds inconsistent vectors, ValidationError on a query of the wrong length.
    [[nodiscard]] std::vector<Match> findSimilar(const std::vector<double>& query, int topK);

    void invalidate() noexcept;
    // Reloads immediately; returns the number of references fitted.
    std::size_t refit();

    [[nodiscard]] bool isLoaded() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

private:
    FeatureStore& store_;
    mutable std::mutex mutex_;
    SimilarityEngine engine_;
    bool loaded_ = false;

    std::size_t loadLocked();
};

}
