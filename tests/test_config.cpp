/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/config.hpp"
#include "openshaz/logger.hpp"
#include "test_util.hpp"

#include <cstdlib>

using namespace openshaz;
using namespace std::chrono_literals;

namespace {

void clearEnv() {
    for (const char* name : {"OPENSHAZ_DB", "OPENSHAZ_EXTRACTOR", "OPENSHAZ_CONNECT_ATTEMPTS",
                             "OPENSHAZ_MAX_RETRIES", "OPENSHAZ_RETRY_DELAY_MS", "OPENSHAZ_METRIC",
                             "OPENSHAZ_NORMALIZE", "OPENSHAZ_TERMINAL_VALIDATION"}) {
        ::unsetenv(name);
    }
}

void testDefaults() {
    std::cout << "[Test] Defaults..." << std::endl;
    clearEnv();
    Config config = Config::fromEnv();
    EXPECT(config.extractorCommand.empty());
    EXPECT(config.connectAttempts == 3);
    EXPECT(config.maxRetries == kMaxRetries);
    EXPECT(config.metric == Metric::Cosine);
    EXPECT(config.normalize);
    EXPECT(config.downloadDir.filename() == "openshaz");
    EXPECT(config.extractionBucket == "opensource-songs");
    EXPECT(config.similarityBucket == "query-songs");

    DispatcherOptions options = config.dispatcherOptions();
    EXPECT(!options.fanout);
    EXPECT(options.connectAttempts == 3);
    EXPECT(options.retry.maxRetries == kMaxRetries);
    EXPECT(options.retry.baseDelay == 1000ms);
    EXPECT(!options.retry.terminalValidation);
}

void testOverrides() {
    std::cout << "[Test] Environment overrides..." << std::endl;
    clearEnv();
    ::setenv("OPENSHAZ_DB", "/var/lib/openshaz/features.db", 1);
    ::setenv("OPENSHAZ_EXTRACTOR", "extract-features {}", 1);
    ::setenv("OPENSHAZ_MAX_RETRIES", "5", 1);
    ::setenv("OPENSHAZ_RETRY_DELAY_MS", "0", 1);
    ::setenv("OPENSHAZ_METRIC", "manhattan", 1);
    ::setenv("OPENSHAZ_NORMALIZE", "off", 1);
    ::setenv("OPENSHAZ_TERMINAL_VALIDATION", "yes", 1);

    Config config = Config::fromEnv();
    EXPECT(config.database == "/var/lib/openshaz/features.db");
    EXPECT(config.extractorCommand == "extract-features {}");
    EXPECT(config.maxRetries == 5);
    EXPECT(config.metric == Metric::Manhattan);
    EXPECT(!config.normalize);

    RetryPolicy policy = config.retryPolicy();
    EXPECT(policy.maxRetries == 5);
    EXPECT(policy.delayFor(1) == 0ms);
    EXPECT(policy.terminalValidation);
    clearEnv();
}

void testInvalidValuesKeepDefaults() {
    std::cout << "[Test] Invalid values..." << std::endl;
    clearEnv();
    ::setenv("OPENSHAZ_CONNECT_ATTEMPTS", "0", 1);
    ::setenv("OPENSHAZ_MAX_RETRIES", "three", 1);
    ::setenv("OPENSHAZ_METRIC", "hamming", 1);
    ::setenv("OPENSHAZ_NORMALIZE", "maybe", 1);

    Config config = Config::fromEnv();
    EXPECT(config.connectAttempts == 3);
    EXPECT(config.maxRetries == kMaxRetries);
    EXPECT(config.metric == Metric::Cosine);
    EXPECT(config.normalize);
    clearEnv();
}

void testLogLevels() {
    std::cout << "[Test] Log level names..." << std::endl;
    LogLevel level = LogLevel::INFO;
    EXPECT(Logger::parseLevel("debug", level));
    EXPECT(level == LogLevel::DEBUG);
    EXPECT(!Logger::parseLevel("verbose", level));
    EXPECT(level == LogLevel::DEBUG);

    Logger::setLevel(LogLevel::WARN);
    EXPECT(Logger::level() == LogLevel::WARN);
}

}

int main() {
    Logger::setLevel(LogLevel::CRITICAL);
    std::cout << "=== Config Tests ===" << std::endl;

    testDefaults();
    testOverrides();
    testInvalidValuesKeepDefaults();
    testLogLevels();

    return test::finish("config");
}
