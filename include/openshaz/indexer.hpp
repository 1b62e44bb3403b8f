/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "openshaz/extractor.hpp"
#include "openshaz/feature_store.hpp"
#include "openshaz/pool.hpp"
#include "openshaz/storage.hpp"

namespace openshaz {

struct IndexReport {
    std::size_t scanned = 0;
    std::size_t indexed = 0;
    std::vector<std::string> failures;

    [[nodiscard]] std::size_t failed() const noexcept { return failures.size(); }
};

// Batch loader for the reference set: upload, extract and store each audio file.
class Indexer {
public:
    Indexer(FeatureStore& store, ObjectStore& storage, FeatureExtractor& extractor, std::string bucket);

    // Per-file failures are logged and reported, never thrown.
    [[nodiscard]] IndexReport indexDirectory(const std::filesystem::path& dir, Pool& pool);

    // Throws the collaborator's error on failure.
    FeatureVector indexFile(const std::filesystem::path& file);

private:
    FeatureStore& store_;
    ObjectStore& storage_;
    FeatureExtractor& extractor_;
    std::string bucket_;
};

}
