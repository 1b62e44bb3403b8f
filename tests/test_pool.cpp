/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/logger.hpp"
#include "openshaz/pool.hpp"
#include "test_util.hpp"

using namespace openshaz;

namespace {

void testResultsThroughFutures() {
    std::cout << "[Test] Results and exceptions through futures..." << std::endl;
    Pool pool(4);
    EXPECT(pool.start());
    EXPECT(pool.isRunning());
    EXPECT(pool.workerCount() == 4);
    EXPECT(!pool.start());

    std::vector<std::future<int>> squares;
    for (int i = 0; i < 50; ++i) {
        squares.push_back(pool.submit([i]() { return i * i; }));
    }
    long sum = 0;
    for (auto& f : squares) {
        sum += f.get();
    }
    EXPECT(sum == 40425);

    auto failing = pool.submit([]() -> int { throw ExtractionError("bad file"); });
    EXPECT_THROWS(failing.get(), ExtractionError);

    pool.stop();
    EXPECT(!pool.isRunning());
    EXPECT_THROWS(pool.submit([]() { return 1; }), Error);
}

void testStopDrainsQueue() {
    std::cout << "[Test] Stop runs queued work first..." << std::endl;
    std::atomic<int> done{0};
    Pool pool(1);
    EXPECT(pool.start());

    std::vector<std::future<void>> pending;
    for (int i = 0; i < 5; ++i) {
        pending.push_back(pool.submit([&done]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            ++done;
        }));
    }
    pool.stop();
    EXPECT(done.load() == 5);
    EXPECT(pool.queueSize() == 0);
}

void testZeroWorkers() {
    std::cout << "[Test] Worker count floor..." << std::endl;
    Pool pool(0);
    EXPECT(pool.workerCount() == 1);
    EXPECT(pool.start());
    EXPECT(pool.submit([]() { return 7; }).get() == 7);
}

}

int main() {
    Logger::setLevel(LogLevel::ERROR);
    std::cout << "=== Pool Tests ===" << std::endl;

    testResultsThroughFutures();
    testStopDrainsQueue();
    testZeroWorkers();

    return test::finish("pool");
}
