/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <string>

#include "openshaz/dispatcher.hpp"
#include "openshaz/retry.hpp"
#include "openshaz/similarity.hpp"

namespace openshaz {

struct Config {
    std::filesystem::path spool = "./spool";
    std::filesystem::path database = "./openshaz.db";
    std::filesystem::path storageRoot = "./storage";
    std::filesystem::path downloadDir;
    std::string extractorCommand;
    std::string extractionBucket = "opensource-songs";
    std::string similarityBucket = "query-songs";

    int connectAttempts = 3;
    std::chrono::milliseconds connectBackoff{5000};

    int maxRetries = kMaxRetries;
    std::chrono::milliseconds retryDelay{1000};
    std::chrono::milliseconds retryDelayMax{30000};
    bool terminalValidation = false;

    Metric metric = Metric::Cosine;
    bool normalize = true;

    // OPENSHAZ_* variables over the defaults above. Unparseable values keep the default.
    [[nodiscard]] static Config fromEnv();

    [[nodiscard]] RetryPolicy retryPolicy() const noexcept;
    [[nodiscard]] DispatcherOptions dispatcherOptions() const noexcept;
};

}
