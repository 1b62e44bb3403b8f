/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/feature_store.hpp"
#include "openshaz/errors.hpp"
#include "openshaz/logger.hpp"
#include <memory>

#include <nlohmann/json.hpp>
#include <sqlite3.h>

using json = nlohmann::json;

namespace openshaz {

namespace {

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

const char* tableFor(FeatureKind kind) noexcept {
    return kind == FeatureKind::Reference ? "reference_songs" : "query_songs";
}

Statement prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db);
        sqlite3_finalize(raw);
        throw PersistenceError("Failed to prepare statement: " + error);
    }
    return Statement(raw);
}

std::vector<double> decodeFeatures(const unsigned char* text, const std::string& name) {
    if (!text) {
        return {};
    }
    try {
        return json::parse(reinterpret_cast<const char*>(text)).get<std::vector<double>>();
    } catch (const json::exception& e) {
        throw PersistenceError("Corrupt features for '" + name + "': " + e.what());
    }
}

FeatureVector readRow(sqlite3_stmt* stmt) {
    FeatureVector row;
    row.id = sqlite3_column_int64(stmt, 0);
    const unsigned char* name = sqlite3_column_text(stmt, 1);
    row.name = name ? reinterpret_cast<const char*>(name) : "";
    row.values = decodeFeatures(sqlite3_column_text(stmt, 2), row.name);
    return row;
}

}

SqliteFeatureStore::SqliteFeatureStore(const std::filesystem::path& database) {
    if (database != ":memory:" && database.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(database.parent_path(), ec);
    }
    if (sqlite3_open(database.c_str(), &db_) != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw PersistenceError("Failed to open database " + database.string() + ": " + error);
    }
    sqlite3_busy_timeout(db_, 5000);

    try {
        for (FeatureKind kind : {FeatureKind::Reference, FeatureKind::Query}) {
            std::string sql = std::string("CREATE TABLE IF NOT EXISTS ") + tableFor(kind) +
                " (id INTEGER PRIMARY KEY AUTOINCREMENT,"
                " name TEXT NOT NULL UNIQUE,"
                " bucket_url TEXT NOT NULL,"
                " features TEXT NOT NULL)";
            exec(sql.c_str());
        }
    } catch (const PersistenceError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    LOG_INFO("Feature store ready: " + database.string());
}

SqliteFeatureStore::~SqliteFeatureStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqliteFeatureStore::exec(const char* sql) {
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "unknown error";
        sqlite3_free(errMsg);
        throw PersistenceError("SQL failed: " + error);
    }
}

std::vector<FeatureVector> SqliteFeatureStore::fetchAll(FeatureKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(db_, std::string("SELECT id, name, features FROM ") + tableFor(kind) + " ORDER BY id");

    std::vector<FeatureVector> rows;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        rows.push_back(readRow(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        throw PersistenceError(std::string("Failed to read ") + tableFor(kind) + ": " + sqlite3_errmsg(db_));
    }
    LOG_DEBUG("Fetched " + std::to_string(rows.size()) + " rows from " + tableFor(kind));
    return rows;
}

std::int64_t SqliteFeatureStore::storeOne(FeatureKind kind, const std::string& name, const std::string& bucketUrl,
                                          const std::vector<double>& values) {
    std::string features = json(values).dump();

    std::lock_guard<std::mutex> lock(mutex_);
    auto insert = prepare(db_, std::string("INSERT INTO ") + tableFor(kind) +
        " (name, bucket_url, features) VALUES (?1, ?2, ?3)"
        " ON CONFLICT(name) DO UPDATE SET bucket_url = excluded.bucket_url, features = excluded.features");
    sqlite3_bind_text(insert.get(), 1, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert.get(), 2, bucketUrl.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert.get(), 3, features.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(insert.get()) != SQLITE_DONE) {
        throw PersistenceError("Failed to store '" + name + "': " + sqlite3_errmsg(db_));
    }

    // last_insert_rowid is not updated by the upsert branch.
    auto select = prepare(db_, std::string("SELECT id FROM ") + tableFor(kind) + " WHERE name = ?1");
    sqlite3_bind_text(select.get(), 1, name.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(select.get()) != SQLITE_ROW) {
        throw PersistenceError("Stored row vanished: " + name);
    }
    std::int64_t id = sqlite3_column_int64(select.get(), 0);
    LOG_INFO(std::string("Stored ") + toString(kind) + " song: " + name + " (id=" + std::to_string(id) + ")");
    return id;
}

std::optional<FeatureVector> SqliteFeatureStore::findByName(FeatureKind kind, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(db_, std::string("SELECT id, name, features FROM ") + tableFor(kind) + " WHERE name = ?1");
    sqlite3_bind_text(stmt.get(), 1, name.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return readRow(stmt.get());
    }
    if (rc != SQLITE_DONE) {
        throw PersistenceError("Lookup failed for '" + name + "': " + sqlite3_errmsg(db_));
    }
    return std::nullopt;
}

std::size_t SqliteFeatureStore::count(FeatureKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(db_, std::string("SELECT COUNT(*) FROM ") + tableFor(kind));
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw PersistenceError(std::string("Count failed: ") + sqlite3_errmsg(db_));
    }
    return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

}
