/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/storage.hpp"
#include "openshaz/errors.hpp"
#include "openshaz/logger.hpp"
#include <cctype>
#include <unistd.h>

namespace openshaz {

namespace {
bool validSegment(const std::string& segment) {
    return !segment.empty() && segment != "." && segment != ".." &&
           segment.find('/') == std::string::npos;
}
}

std::string sanitizeFilename(const std::string& name) {
    std::string out = name;
    for (auto& c : out) {
        unsigned char u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && c != '.' && c != '_' && c != '-') {
            c = '_';
        }
    }
    return out;
}

LocalObjectStore::LocalObjectStore(const std::filesystem::path& root, const std::filesystem::path& downloadDir)
    : root_(std::filesystem::absolute(root).lexically_normal()), downloadDir_(downloadDir) {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        throw StorageError("Cannot create storage root " + root_.string() + ": " + ec.message());
    }
}

std::filesystem::path LocalObjectStore::resolve(const std::string& url) const {
    std::string bucket;
    std::string key;
    if (url.rfind("s3://", 0) == 0) {
        std::string rest = url.substr(5);
        auto slash = rest.find('/');
        bucket = rest.substr(0, slash);
        key = slash == std::string::npos ? "" : rest.substr(slash + 1);
    } else if (url.rfind("file://", 0) == 0) {
        std::filesystem::path path = std::filesystem::path(url.substr(7)).lexically_normal();
        auto relative = path.lexically_relative(root_);
        if (relative.empty() || *relative.begin() == "..") {
            throw StorageError("URL outside storage root: " + url);
        }
        auto it = relative.begin();
        bucket = it->string();
        ++it;
        std::filesystem::path rest;
        for (; it != relative.end(); ++it) {
            rest /= *it;
        }
        key = rest.string();
    } else {
        throw StorageError("Unsupported storage URL: " + url);
    }

    if (!validSegment(bucket) || key.empty()) {
        throw StorageError("Invalid storage URL format: " + url);
    }
    auto resolved = (root_ / bucket / key).lexically_normal();
    auto inBucket = resolved.lexically_relative(root_ / bucket);
    if (inBucket.empty() || inBucket == "." || *inBucket.begin() == "..") {
        throw StorageError("URL outside bucket: " + url);
    }
    return resolved;
}

std::filesystem::path LocalObjectStore::download(const std::string& url) {
    auto source = resolve(url);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        throw StorageError("Object not found: " + url);
    }

    std::filesystem::create_directories(downloadDir_, ec);
    if (ec) {
        throw StorageError("Cannot create download directory " + downloadDir_.string() + ": " + ec.message());
    }

    // Two consumer threads may fetch the same object at once.
    auto dest = downloadDir_ / (std::to_string(::getpid()) + "_" + std::to_string(counter_.fetch_add(1)) +
                                "_" + sanitizeFilename(source.filename().string()));
    LOG_INFO("Downloading " + url + " -> " + dest.string());
    std::filesystem::copy_file(source, dest, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        throw StorageError("Failed to download " + url + ": " + ec.message());
    }
    return dest;
}

std::string LocalObjectStore::upload(const std::filesystem::path& localFile, const std::string& name,
                                     const std::string& bucket) {
    if (!validSegment(bucket) || !validSegment(name)) {
        throw StorageError("Invalid object name: " + bucket + "/" + name);
    }
    auto bucketDir = root_ / bucket;
    auto dest = bucketDir / name;
    std::string url = "file://" + dest.string();

    std::error_code ec;
    if (std::filesystem::exists(dest, ec)) {
        LOG_INFO("Object " + name + " already exists in bucket " + bucket + ". Skipping upload.");
        return url;
    }
    if (!std::filesystem::is_regular_file(localFile, ec)) {
        throw StorageError("File not found: " + localFile.string());
    }

    std::filesystem::create_directories(bucketDir, ec);
    if (ec) {
        throw StorageError("Cannot create bucket " + bucket + ": " + ec.message());
    }

    // Copy beside the target and rename so readers never see a partial object.
    auto temp = bucketDir / ("." + name + ".uploading");
    std::filesystem::copy_file(localFile, temp, std::filesystem::copy_options::overwrite_existing, ec);
    if (!ec) {
        std::filesystem::rename(temp, dest, ec);
    }
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        throw StorageError("Failed to upload " + localFile.string() + ": " + ec.message());
    }

    LOG_INFO("Uploaded " + localFile.string() + " -> " + url);
    return url;
}

void LocalObjectStore::cleanup(const std::filesystem::path& localPath) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(localPath, ec)) {
        LOG_WARN("File not found or not a file: " + localPath.string());
        return;
    }
    std::filesystem::remove(localPath, ec);
    if (ec) {
        throw StorageError("Failed to cleanup " + localPath.string() + ": " + ec.message());
    }
    LOG_DEBUG("Cleaned up file: " + localPath.string());
}

}
