/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

#include "openshaz/errors.hpp"
#include "openshaz/extractor.hpp"
#include "openshaz/feature_store.hpp"
#include "openshaz/storage.hpp"

namespace openshaz::test {

inline int g_failures = 0;

#define EXPECT(cond)                                                                   \
    do {                                                                               \
        if (!(cond)) {                                                                 \
            std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__ << ": " #cond << "\n"; \
            ++::openshaz::test::g_failures;                                            \
        }                                                                              \
    } while (0)

#define EXPECT_NEAR(a, b, eps) EXPECT(std::fabs((a) - (b)) <= (eps))

#define EXPECT_THROWS(expr, Type)                                                              \
    do {                                                                                       \
        bool thrown_ = false;                                                                  \
        try {                                                                                  \
            (void)(expr);                                                                      \
        } catch (const Type&) {                                                                \
            thrown_ = true;                                                                    \
        }                                                                                      \
        if (!thrown_) {                                                                        \
            std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__ << ": expected " #Type        \
                      << " from " #expr << "\n";                                               \
            ++::openshaz::test::g_failures;                                                    \
        }                                                                                      \
    } while (0)

inline int finish(const char* name) {
    if (g_failures == 0) {
        std::cout << "[Test] " << name << " passed" << std::endl;
        return 0;
    }
    std::cout << "[Test] " << name << ": " << g_failures << " failure(s)" << std::endl;
    return 1;
}

// Private scratch directory, removed on scope exit.
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("openshaz_" + tag + "_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

inline void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary);
    file << content;
}

// Polls cond until it holds or the timeout passes.
inline bool waitFor(const std::function<bool()>& cond,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return cond();
}

class FakeStore final : public FeatureStore {
public:
    std::vector<FeatureVector> fetchAll(FeatureKind kind) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++fetchCalls;
        if (failFetch) {
            throw PersistenceError("fetch failed");
        }
        return rows_[kind];
    }

    std::int64_t storeOne(FeatureKind kind, const std::string& name, const std::string& bucketUrl,
                          const std::vector<double>& values) override {
        std::lock_guard<std::mutex> lock(mutex_);
        (void)bucketUrl;
        if (failStores > 0) {
            --failStores;
            throw PersistenceError("store failed");
        }
        auto& rows = rows_[kind];
        for (auto& row : rows) {
            if (row.name == name) {
                row.values = values;
                return row.id;
            }
        }
        rows.push_back({nextId_++, name, values});
        return rows.back().id;
    }

    std::optional<FeatureVector> findByName(FeatureKind kind, const std::string& name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& row : rows_[kind]) {
            if (row.name == name) {
                return row;
            }
        }
        return std::nullopt;
    }

    std::size_t count(FeatureKind kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        return rows_[kind].size();
    }

    int fetchCalls = 0;
    bool failFetch = false;
    int failStores = 0;

private:
    std::mutex mutex_;
    std::map<FeatureKind, std::vector<FeatureVector>> rows_;
    std::int64_t nextId_ = 1;
};

// Objects live in memory; download writes them to a scratch file.
class FakeStorage final : public ObjectStore {
public:
    explicit FakeStorage(std::filesystem::path scratch) : scratch_(std::move(scratch)) {}

    std::filesystem::path download(const std::string& url) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++downloads;
        if (failDownloads > 0) {
            --failDownloads;
            throw StorageError("download failed: " + url);
        }
        auto path = scratch_ / ("dl_" + std::to_string(downloads) + "_" + url.substr(url.rfind('/') + 1));
        writeFile(path, url);
        return path;
    }

    std::string upload(const std::filesystem::path& localFile, const std::string& name,
                       const std::string& bucket) override {
        (void)localFile;
        return "s3://" + bucket + "/" + name;
    }

    void cleanup(const std::filesystem::path& localPath) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++cleanups;
        std::error_code ec;
        std::filesystem::remove(localPath, ec);
    }

    int downloads = 0;
    int cleanups = 0;
    int failDownloads = 0;

private:
    std::filesystem::path scratch_;
    std::mutex mutex_;
};

// Features keyed by the downloaded file's content (the URL FakeStorage wrote).
class FakeExtractor final : public FeatureExtractor {
public:
    std::vector<double> extract(const std::filesystem::path& localPath) override {
        std::ifstream file(localPath, std::ios::binary);
        std::string url((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls;
        auto it = features.find(url);
        if (it == features.end()) {
            throw ExtractionError("no features for " + url);
        }
        return it->second;
    }

    std::map<std::string, std::vector<double>> features;
    int calls = 0;

private:
    std::mutex mutex_;
};

}
