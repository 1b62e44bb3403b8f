/*
 * openshaz - Batch indexing and metric evaluation (shz-index)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/config.hpp"
#include "openshaz/extractor.hpp"
#include "openshaz/feature_store.hpp"
#include "openshaz/indexer.hpp"
#include "openshaz/logger.hpp"
#include "openshaz/pool.hpp"
#include "openshaz/similarity.hpp"
#include "openshaz/storage.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <thread>

using namespace openshaz;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "openshaz Batch Indexer v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <dir> [options]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  dir                   Directory of audio files (.wav .mp3 .flac .ogg .au .m4a)\n\n";
    std::cout << "Options:\n";
    std::cout << "  --compare-metrics     Evaluate cosine, euclidean and manhattan on a held-out split\n";
    std::cout << "  --test-fraction <f>   Held-out share for --compare-metrics (default 0.2)\n";
    std::cout << "  --query <file>        Rank the indexed songs against this file\n";
    std::cout << "  --metric <m>          Metric for --query (default cosine)\n";
    std::cout << "  --top-k <k>           Matches to consider (default 5)\n";
    std::cout << "  --workers <n>         Extraction threads (default: hardware concurrency)\n";
    std::cout << "  --extractor <cmd>     Feature extractor command ({} = audio path)\n";
    std::cout << "  --db <path>           SQLite feature store\n";
    std::cout << "  -h, --help            Show this help message\n";
    std::cout << "  -v, --version         Show version\n\n";
    std::cout << "Labels for --compare-metrics are the file name up to the first '.', e.g. blues.00042.wav\n";
}

void printComparison(const std::vector<Evaluation>& results) {
    std::cout << std::left << std::setw(12) << "metric" << std::right << std::setw(10) << "accuracy"
              << std::setw(10) << "correct" << std::setw(8) << "total" << "\n";
    for (const auto& r : results) {
        std::cout << std::left << std::setw(12) << toString(r.metric) << std::right << std::setw(9)
                  << std::fixed << std::setprecision(1) << r.accuracy() * 100.0 << "%"
                  << std::setw(10) << r.correct << std::setw(8) << r.total << "\n";
    }
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
    std::filesystem::path dir = argv[1];
    bool compare = false;
    double testFraction = 0.2;
    std::filesystem::path queryFile;
    int topK = 5;
    int workers = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        try {
            if (arg == "--compare-metrics") {
                compare = true;
            } else if (arg == "--test-fraction" && i + 1 < argc) {
                testFraction = std::stod(argv[++i]);
            } else if (arg == "--query" && i + 1 < argc) {
                queryFile = argv[++i];
            } else if (arg == "--metric" && i + 1 < argc) {
                std::string metric = argv[++i];
                if (!parseMetric(metric, config.metric)) {
                    std::cerr << "Error: Unknown metric: " << metric << "\n";
                    return 1;
                }
            } else if (arg == "--top-k" && i + 1 < argc) {
                topK = std::stoi(argv[++i]);
            } else if ((arg == "-w" || arg == "--workers") && i + 1 < argc) {
                workers = std::stoi(argv[++i]);
            } else if (arg == "--extractor" && i + 1 < argc) {
                config.extractorCommand = argv[++i];
            } else if (arg == "--db" && i + 1 < argc) {
                config.database = argv[++i];
            } else {
                std::cerr << "Error: Unknown option: " << arg << "\n";
                return 1;
            }
        } catch (const std::exception&) {
            std::cerr << "Error: Invalid value for " << arg << "\n";
            return 1;
        }
    }

    if (config.extractorCommand.empty()) {
        std::cerr << "Error: No feature extractor configured (--extractor or OPENSHAZ_EXTRACTOR)\n";
        return 1;
    }
    if (topK < 1 || workers < 1) {
        std::cerr << "Error: --top-k and --workers must be positive\n";
        return 1;
    }

    const auto startTime = std::chrono::steady_clock::now();
    try {
        SqliteFeatureStore store(config.database);
        LocalObjectStore storage(config.storageRoot, config.downloadDir);
        CommandExtractor extractor(config.extractorCommand);

        Pool pool(workers);
        if (!pool.start()) {
            std::cerr << "Error: Failed to start worker pool\n";
            return 1;
        }
        Indexer indexer(store, storage, extractor, config.extractionBucket);
        IndexReport report = indexer.indexDirectory(dir, pool);
        pool.stop();

        std::cout << "Indexed " << report.indexed << "/" << report.scanned << " files";
        if (report.failed() > 0) {
            std::cout << " (" << report.failed() << " failed)";
        }
        std::cout << "\n";

        auto references = store.fetchAll(FeatureKind::Reference);

        if (compare) {
            printComparison(compareMetrics(references, testFraction, topK));
        }

        if (!queryFile.empty()) {
            SimilarityEngine engine(config.metric, config.normalize);
            engine.fit(references);
            auto matches = engine.findSimilar(extractor.extract(queryFile), topK);

            nlohmann::json similar = nlohmann::json::array();
            for (const auto& match : matches) {
                auto entry = toJson(match);
                entry["index"] = match.index;
                similar.push_back(entry);
            }
            std::cout << nlohmann::json{{"query_song", queryFile.filename().string()},
                                        {"metric", toString(config.metric)},
                                        {"similar", similar}}.dump(2) << std::endl;
        }

        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
        LOG_INFO("Execution completed in " + std::to_string(elapsed) + " seconds");

        if (report.scanned > 0 && report.indexed == 0) {
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
