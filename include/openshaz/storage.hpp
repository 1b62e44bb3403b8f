/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <filesystem>
#include <string>

namespace openshaz {

// Object storage. Implementations throw StorageError.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Fetches the object into a local file the caller owns until cleanup().
    [[nodiscard]] virtual std::filesystem::path download(const std::string& url) = 0;
    // Returns the object's URL. An object that already exists is not overwritten.
    virtual std::string upload(const std::filesystem::path& localFile, const std::string& name,
                               const std::string& bucket) = 0;
    virtual void cleanup(const std::filesystem::path& localPath) = 0;
};

// Buckets are directories under root. Accepts file://<root>/<bucket>/<key>
// and s3://<bucket>/<key> URLs.
class LocalObjectStore final : public ObjectStore {
public:
    LocalObjectStore(const std::filesystem::path& root, const std::filesystem::path& downloadDir);

    [[nodiscard]] std::filesystem::path download(const std::string& url) override;
    std::string upload(const std::filesystem::path& localFile, const std::string& name,
                       const std::string& bucket) override;
    void cleanup(const std::filesystem::path& localPath) override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    [[nodiscard]] std::filesystem::path resolve(const std::string& url) const;

private:
    std::filesystem::path root_;
    std::filesystem::path downloadDir_;
    std::atomic<unsigned long> counter_{0};
};

[[nodiscard]] std::string sanitizeFilename(const std::string& name);

}
