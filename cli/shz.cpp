/*
 * openshaz - Job submission tool (shz)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/config.hpp"
#include "openshaz/logger.hpp"
#include "openshaz/rpc_client.hpp"
#include "openshaz/spool_broker.hpp"
#include "openshaz/storage.hpp"
#include "openshaz/work.hpp"
#include <cstdlib>
#include <iostream>

using namespace openshaz;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "openshaz Job Submission Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <spool> add <file> [--wait] [--timeout <s>]\n";
    std::cout << "       " << progName << " <spool> similar <file> [--top-k <k>] [--timeout <s>]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Commands:\n";
    std::cout << "  add           Upload a reference song and queue feature extraction\n";
    std::cout << "  similar       Upload a query song and wait for the closest references\n\n";
    std::cout << "Options:\n";
    std::cout << "  --wait        Wait for the extraction result instead of printing the job id\n";
    std::cout << "  --top-k <k>   Number of matches (default 5)\n";
    std::cout << "  --timeout <s> Reply deadline in seconds (default 45 add, 60 similar)\n\n";
    std::cout << "Exit codes:\n";
    std::cout << "  0 success, 1 error, 2 timeout\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  OPENSHAZ_STORAGE_ROOT   Object storage root\n";
    std::cout << "  OPENSHAZ_LOG_LEVEL      Log level (critical, error, warn, info, debug, trace)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./spool add blues.00000.wav\n";
    std::cout << "  " << progName << " ./spool similar query.wav --top-k 3\n";
}

int printCall(const CallResult& result) {
    if (result.ok) {
        std::cout << result.reply.payload.dump(2) << std::endl;
        return result.reply.status == JobStatus::Error ? 1 : 0;
    }
    std::cerr << "Error: " << toString(result.error) << ": " << result.message << std::endl;
    return result.error == CallError::Timeout ? 2 : 1;
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; OPENSHAZ_LOG_LEVEL overrides
    if (!std::getenv("OPENSHAZ_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

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

    if (argc < 4) {
        printUsage(argv[0]);
        return 1;
    }

    Config config = Config::fromEnv();
    config.spool = argv[1];
    std::string command = argv[2];
    std::filesystem::path file = argv[3];
    bool wait = false;
    int topK = 5;
    long long timeoutSec = 0;

    for (int i = 4; i < argc; ++i) {
        std::string arg = argv[i];
        try {
            if (arg == "--wait") {
                wait = true;
            } else if (arg == "--top-k" && i + 1 < argc) {
                topK = std::stoi(argv[++i]);
            } else if (arg == "--timeout" && i + 1 < argc) {
                timeoutSec = std::stoll(argv[++i]);
            } else {
                std::cerr << "Error: Unknown option: " << arg << "\n";
                return 1;
            }
        } catch (const std::exception&) {
            std::cerr << "Error: Invalid value for " << arg << "\n";
            return 1;
        }
    }

    if (command != "add" && command != "similar") {
        std::cerr << "Error: Unknown command: " << command << "\n";
        return 1;
    }
    if (topK < 1) {
        std::cerr << "Error: --top-k must be positive\n";
        return 1;
    }

    std::filesystem::path spool = config.spool;
    BrokerFactory factory = [spool]() -> std::unique_ptr<Broker> {
        return std::make_unique<SpoolBroker>(spool);
    };

    try {
        LocalObjectStore storage(config.storageRoot, config.downloadDir);
        std::string name = file.filename().string();

        if (command == "add") {
            std::string url = storage.upload(file, name, config.extractionBucket);
            if (!wait) {
                Work work(factory);
                work.setConnectRetry(config.connectAttempts, config.connectBackoff);
                SubmitResult result = work.submitExtraction(name, url);
                if (!result) {
                    std::cerr << "Error: " << result.message << std::endl;
                    return 1;
                }
                // Just the job ID - clean for piping, no noise
                std::cout << result.id << std::endl;
                return 0;
            }

            RpcClient client(factory);
            client.setConnectRetry(config.connectAttempts, config.connectBackoff);
            auto timeout = timeoutSec > 0 ? std::chrono::milliseconds(timeoutSec * 1000)
                                          : std::chrono::milliseconds(kExtractionTimeout);
            return printCall(client.submitExtraction(name, url, timeout));
        }

        std::string url = storage.upload(file, name, config.similarityBucket);
        RpcClient client(factory);
        client.setConnectRetry(config.connectAttempts, config.connectBackoff);
        auto timeout = timeoutSec > 0 ? std::chrono::milliseconds(timeoutSec * 1000)
                                      : std::chrono::milliseconds(kSimilarityTimeout);
        return printCall(client.submitSimilarity(name, url, topK, timeout));

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
