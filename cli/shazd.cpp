/*
 * openshaz - Worker daemon (shazd)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/config.hpp"
#include "openshaz/dispatcher.hpp"
#include "openshaz/extractor.hpp"
#include "openshaz/feature_store.hpp"
#include "openshaz/logger.hpp"
#include "openshaz/spool_broker.hpp"
#include "openshaz/storage.hpp"
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <thread>
#include <unistd.h>

using namespace openshaz;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flags, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;
static volatile sig_atomic_t g_reload_requested = 0;

void signalHandler(int signal) {
    if (signal == SIGHUP) {
        g_reload_requested = 1;
    } else {
        g_shutdown_requested = 1;
    }
}

void printUsage(const char* progName) {
    std::cout << "openshaz worker daemon v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <spool> [options]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  spool               Broker spool directory shared with clients\n\n";
    std::cout << "Options:\n";
    std::cout << "  --fanout            Consume music_tasks and route by job type\n";
    std::cout << "  --metric <m>        cosine, euclidean or manhattan\n";
    std::cout << "  --no-normalize      Rank raw features without standardization\n";
    std::cout << "  --extractor <cmd>   Feature extractor command ({} = audio path)\n";
    std::cout << "  --db <path>         SQLite feature store\n";
    std::cout << "  --storage <dir>     Object storage root\n";
    std::cout << "  -h, --help          Show this help message\n";
    std::cout << "  -v, --version       Show version\n\n";
    std::cout << "Signals:\n";
    std::cout << "  SIGINT, SIGTERM     Finish in-flight jobs and stop\n";
    std::cout << "  SIGHUP              Reload reference features on next request\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  OPENSHAZ_EXTRACTOR, OPENSHAZ_DB, OPENSHAZ_STORAGE_ROOT, OPENSHAZ_DOWNLOAD_DIR,\n";
    std::cout << "  OPENSHAZ_CONNECT_ATTEMPTS, OPENSHAZ_CONNECT_BACKOFF_MS, OPENSHAZ_MAX_RETRIES,\n";
    std::cout << "  OPENSHAZ_RETRY_DELAY_MS, OPENSHAZ_RETRY_DELAY_MAX_MS, OPENSHAZ_METRIC,\n";
    std::cout << "  OPENSHAZ_NORMALIZE, OPENSHAZ_LOG_LEVEL\n";
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    Logger::initFromEnv();
    Config config = Config::fromEnv();
    config.spool = argv[1];
    bool fanout = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--fanout") {
            fanout = true;
        } else if (arg == "--no-normalize") {
            config.normalize = false;
        } else if (arg == "--metric" && i + 1 < argc) {
            std::string metric = argv[++i];
            if (!parseMetric(metric, config.metric)) {
                std::cerr << "Error: Unknown metric: " << metric << "\n";
                return 1;
            }
        } else if (arg == "--extractor" && i + 1 < argc) {
            config.extractorCommand = argv[++i];
        } else if (arg == "--db" && i + 1 < argc) {
            config.database = argv[++i];
        } else if (arg == "--storage" && i + 1 < argc) {
            config.storageRoot = argv[++i];
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return 1;
        }
    }

    if (config.extractorCommand.empty()) {
        std::cerr << "Error: No feature extractor configured (--extractor or OPENSHAZ_EXTRACTOR)\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGHUP, signalHandler);

    try {
        SqliteFeatureStore store(config.database);
        LocalObjectStore storage(config.storageRoot, config.downloadDir);
        CommandExtractor extractor(config.extractorCommand);

        DispatcherOptions options = config.dispatcherOptions();
        options.fanout = fanout;

        std::filesystem::path spool = config.spool;
        BrokerFactory factory = [spool]() -> std::unique_ptr<Broker> {
            return std::make_unique<SpoolBroker>(spool);
        };

        Dispatcher dispatcher(factory, store, storage, extractor, options);
        if (!dispatcher.start()) {
            std::cerr << "Failed to start: broker unavailable at " << spool.string() << "\n";
            return 1;
        }

        std::filesystem::path pidPath = spool / ".shazd.pid";
        {
            std::ofstream pf(pidPath);
            if (pf) {
                pf << getpid();
            }
        }

        LOG_INFO("Worker running - spool: " + spool.string() + ", db: " + config.database.string() +
                 ", metric: " + toString(config.metric) + (config.normalize ? "" : " (raw)"));

        while (!g_shutdown_requested && dispatcher.isRunning()) {
            if (g_reload_requested) {
                g_reload_requested = 0;
                dispatcher.cache().invalidate();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (g_shutdown_requested) {
            LOG_INFO("Shutdown requested, stopping worker...");
        }
        bool lost = dispatcher.failed();
        dispatcher.shutdown();
        {
            std::error_code ec;
            std::filesystem::remove(pidPath, ec);
        }

        if (lost) {
            LOG_CRITICAL("Broker connection lost for good, exiting");
            return 1;
        }

    } catch (const std::exception& e) {
        LOG_CRITICAL("Worker error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("openshaz worker stopped");
    return 0;
}
