/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/feature_cache.hpp"
#include "openshaz/errors.hpp"
#include "openshaz/logger.hpp"

namespace openshaz {

FeatureCache::FeatureCache(FeatureStore& store, Metric metric, bool normalize)
    : store_(store), engine_(metric, normalize) {}

std::size_t FeatureCache::loadLocked() {
    auto references = store_.fetchAll(FeatureKind::Reference);
    if (references.empty()) {
        LOG_WARN("No reference songs in the feature store");
        loaded_ = false;
        return 0;
    }

    LOG_INFO("Loading " + std::to_string(references.size()) + " reference songs into similarity engine");
    try {
        engine_.fit(references);
    } catch (const ValidationError& e) {
        loaded_ = false;
        throw PersistenceError(std::string("Stored reference features are inconsistent: ") + e.what());
    }
    loaded_ = true;
    return references.size();
}

std::vector<Match> FeatureCache::findSimilar(const std::vector<double>& query, int topK) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!loaded_ && loadLocked() == 0) {
        return {};
    }
    return engine_.findSimilar(query, topK);
}

void FeatureCache::invalidate() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (loaded_) {
        LOG_INFO("Feature cache invalidated");
    }
    loaded_ = false;
}

std::size_t FeatureCache::refit() {
    std::lock_guard<std::mutex> lock(mutex_);
    loaded_ = false;
    return loadLocked();
}

bool FeatureCache::isLoaded() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return loaded_;
}

std::size_t FeatureCache::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return loaded_ ? engine_.size() : 0;
}

}
