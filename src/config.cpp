/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/config.hpp"
#include "openshaz/logger.hpp"
#include <cstdlib>

namespace openshaz {

namespace {
std::string env_string(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    return (val && *val) ? std::string(val) : defv;
}

long long env_number(const char* name, long long defv, long long minv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::size_t used = 0;
        long long parsed = std::stoll(val, &used);
        if (used != std::string(val).size() || parsed < minv) {
            LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
            return defv;
        }
        return parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

bool env_flag(const char* name, bool defv) {
    std::string val = env_string(name, "");
    if (val.empty()) return defv;
    if (val == "1" || val == "true" || val == "yes" || val == "on") return true;
    if (val == "0" || val == "false" || val == "no" || val == "off") return false;
    LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
    return defv;
}
}

Config Config::fromEnv() {
    Config c;
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    c.downloadDir = (ec ? std::filesystem::path("/tmp") : tmp) / "openshaz";

    c.spool = env_string("OPENSHAZ_SPOOL", c.spool.string());
    c.database = env_string("OPENSHAZ_DB", c.database.string());
    c.storageRoot = env_string("OPENSHAZ_STORAGE_ROOT", c.storageRoot.string());
    c.downloadDir = env_string("OPENSHAZ_DOWNLOAD_DIR", c.downloadDir.string());
    c.extractorCommand = env_string("OPENSHAZ_EXTRACTOR", "");
    c.extractionBucket = env_string("OPENSHAZ_EXTRACTION_BUCKET", c.extractionBucket);
    c.similarityBucket = env_string("OPENSHAZ_SIMILARITY_BUCKET", c.similarityBucket);

    c.connectAttempts = static_cast<int>(env_number("OPENSHAZ_CONNECT_ATTEMPTS", c.connectAttempts, 1));
    c.connectBackoff = std::chrono::milliseconds(env_number("OPENSHAZ_CONNECT_BACKOFF_MS", c.connectBackoff.count(), 0));
    c.maxRetries = static_cast<int>(env_number("OPENSHAZ_MAX_RETRIES", c.maxRetries, 0));
    c.retryDelay = std::chrono::milliseconds(env_number("OPENSHAZ_RETRY_DELAY_MS", c.retryDelay.count(), 0));
    c.retryDelayMax = std::chrono::milliseconds(env_number("OPENSHAZ_RETRY_DELAY_MAX_MS", c.retryDelayMax.count(), 0));

    std::string metric = env_string("OPENSHAZ_METRIC", "");
    if (!metric.empty() && !parseMetric(metric, c.metric)) {
        LOG_WARN("Ignoring unknown OPENSHAZ_METRIC=" + metric);
    }
    c.normalize = env_flag("OPENSHAZ_NORMALIZE", c.normalize);
    c.terminalValidation = env_flag("OPENSHAZ_TERMINAL_VALIDATION", c.terminalValidation);
    return c;
}

RetryPolicy Config::retryPolicy() const noexcept {
    RetryPolicy policy;
    policy.maxRetries = maxRetries;
    policy.baseDelay = retryDelay;
    policy.maxDelay = retryDelayMax;
    policy.terminalValidation = terminalValidation;
    return policy;
}

DispatcherOptions Config::dispatcherOptions() const noexcept {
    DispatcherOptions options;
    options.connectAttempts = connectAttempts;
    options.connectBackoff = connectBackoff;
    options.metric = metric;
    options.normalize = normalize;
    options.retry = retryPolicy();
    return options;
}

}
