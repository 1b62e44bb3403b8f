/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/indexer.hpp"
#include "openshaz/logger.hpp"
#include "openshaz/scanner.hpp"
#include <future>

namespace openshaz {

Indexer::Indexer(FeatureStore& store, ObjectStore& storage, FeatureExtractor& extractor, std::string bucket)
    : store_(store), storage_(storage), extractor_(extractor), bucket_(std::move(bucket)) {}

FeatureVector Indexer::indexFile(const std::filesystem::path& file) {
    const std::string name = file.filename().string();
    std::string url = storage_.upload(file, name, bucket_);

    FeatureVector row;
    row.name = name;
    row.values = extractor_.extract(file);
    row.id = store_.storeOne(FeatureKind::Reference, name, url, row.values);
    return row;
}

IndexReport Indexer::indexDirectory(const std::filesystem::path& dir, Pool& pool) {
    IndexReport report;
    auto files = Scanner(dir).scan();
    report.scanned = files.size();

    std::vector<std::pair<std::string, std::future<FeatureVector>>> pending;
    pending.reserve(files.size());
    for (const auto& file : files) {
        pending.emplace_back(file.filename().string(), pool.submit([this, file]() { return indexFile(file); }));
    }

    for (auto& [name, future] : pending) {
        try {
            auto row = future.get();
            ++report.indexed;
            LOG_DEBUG("Indexed " + name + " (id=" + std::to_string(row.id) + ", " +
                      std::to_string(row.values.size()) + " features)");
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to index " + name + ": " + e.what());
            report.failures.push_back(name);
        }
    }

    LOG_INFO("Indexed " + std::to_string(report.indexed) + "/" + std::to_string(report.scanned) +
             " files from " + dir.string());
    return report;
}

}
