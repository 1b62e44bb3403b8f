/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "openshaz/types.hpp"

struct sqlite3;

namespace openshaz {

// Persistence of feature vectors. Implementations throw PersistenceError.
class FeatureStore {
public:
    virtual ~FeatureStore() = default;

    [[nodiscard]] virtual std::vector<FeatureVector> fetchAll(FeatureKind kind) = 0;
    // Inserts or replaces the row with the same name and returns its id.
    virtual std::int64_t storeOne(FeatureKind kind, const std::string& name, const std::string& bucketUrl,
                                  const std::vector<double>& values) = 0;
    [[nodiscard]] virtual std::optional<FeatureVector> findByName(FeatureKind kind, const std::string& name) = 0;
};

class SqliteFeatureStore final : public FeatureStore {
public:
    // ":memory:" opens a private in-memory database. Throws PersistenceError.
    explicit SqliteFeatureStore(const std::filesystem::path& database);
    ~SqliteFeatureStore() override;

    SqliteFeatureStore(const SqliteFeatureStore&) = delete;
    SqliteFeatureStore& operator=(const SqliteFeatureStore&) = delete;

    [[nodiscard]] std::vector<FeatureVector> fetchAll(FeatureKind kind) override;
    std::int64_t storeOne(FeatureKind kind, const std::string& name, const std::string& bucketUrl,
                          const std::vector<double>& values) override;
    [[nodiscard]] std::optional<FeatureVector> findByName(FeatureKind kind, const std::string& name) override;

    [[nodiscard]] std::size_t count(FeatureKind kind);

private:
    sqlite3* db_ = nullptr;
    std::mutex mutex_;

    void exec(const char* sql);
};

}
