/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/logger.hpp"
#include "openshaz/memory_broker.hpp"
#include "openshaz/retry.hpp"
#include "test_util.hpp"

using namespace openshaz;
using namespace std::chrono_literals;

namespace {

struct Attempt {
    int retryCount = 0;
    RetryOutcome outcome = RetryOutcome::Requeued;
    std::string correlationId;
    std::string replyTo;
    std::int64_t notBefore = 0;
};

// Fails every delivery of "jobs" with the given kind and records what the governor did.
std::vector<Attempt> failRepeatedly(MemoryBroker& memory, RetryGovernor& governor, FailureKind kind, int rounds) {
    auto conn = memory.connect();
    conn->declareQueue("jobs");

    Properties properties;
    properties.correlationId = "corr-7";
    properties.replyTo = "amq.gen-reply";
    conn->publish("", "jobs", R"({"music_name":"a.wav"})", properties);

    std::vector<Attempt> attempts;
    Broker& channel = *conn;
    conn->consume("jobs", 1, [&](const Delivery& d) {
        Attempt attempt;
        attempt.retryCount = RetryGovernor::retryCount(d.message.properties);
        attempt.correlationId = d.message.properties.correlationId;
        attempt.replyTo = d.message.properties.replyTo;
        attempt.notBefore = d.message.properties.notBefore;
        attempt.outcome = governor.onFailure(channel, d, kind, "simulated failure");
        attempts.push_back(attempt);
    });

    for (int i = 0; i < rounds; ++i) {
        (void)conn->processEvents(500ms);
    }
    return attempts;
}

void testRetryThenDiscard() {
    std::cout << "[Test] Retry up to the limit, then discard..." << std::endl;
    MemoryBroker memory;
    RetryGovernor governor(RetryPolicy::immediate());

    auto attempts = failRepeatedly(memory, governor, FailureKind::Retryable, 6);
    EXPECT(attempts.size() == 4);
    for (std::size_t i = 0; i < attempts.size(); ++i) {
        EXPECT(attempts[i].retryCount == static_cast<int>(i));
        EXPECT(attempts[i].correlationId == "corr-7");
        EXPECT(attempts[i].replyTo == "amq.gen-reply");
        EXPECT(attempts[i].notBefore == 0);
        EXPECT(attempts[i].outcome == (i < 3 ? RetryOutcome::Requeued : RetryOutcome::Discarded));
    }

    EXPECT(memory.depth("jobs") == 0);
    auto dead = memory.deadLetters("jobs");
    EXPECT(dead.size() == 1);
    if (dead.size() == 1) {
        EXPECT(RetryGovernor::retryCount(dead[0].properties) == 3);
        EXPECT(dead[0].body == R"({"music_name":"a.wav"})");
    }
}

void testTerminalUsesRetryBudgetByDefault() {
    std::cout << "[Test] Terminal failure is retried unless configured otherwise..." << std::endl;
    MemoryBroker memory;
    RetryGovernor governor(RetryPolicy::immediate());
    EXPECT(!governor.policy().terminalValidation);

    auto attempts = failRepeatedly(memory, governor, FailureKind::Terminal, 6);
    EXPECT(attempts.size() == 4);
    for (std::size_t i = 0; i < attempts.size(); ++i) {
        EXPECT(attempts[i].retryCount == static_cast<int>(i));
        EXPECT(attempts[i].outcome == (i < 3 ? RetryOutcome::Requeued : RetryOutcome::Discarded));
    }
    EXPECT(memory.deadLetters("jobs").size() == 1);
}

void testTerminalDiscardsAtOnce() {
    std::cout << "[Test] Terminal failure with terminalValidation is never retried..." << std::endl;
    MemoryBroker memory;
    RetryPolicy policy = RetryPolicy::immediate();
    policy.terminalValidation = true;
    RetryGovernor governor(policy);

    auto attempts = failRepeatedly(memory, governor, FailureKind::Terminal, 2);
    EXPECT(attempts.size() == 1);
    EXPECT(attempts.size() == 1 && attempts[0].outcome == RetryOutcome::Discarded);
    EXPECT(memory.depth("jobs") == 0);
    EXPECT(memory.deadLetters("jobs").size() == 1);
}

void testZeroRetries() {
    std::cout << "[Test] Zero retry budget..." << std::endl;
    MemoryBroker memory;
    RetryGovernor governor(RetryPolicy::immediate(0));

    auto attempts = failRepeatedly(memory, governor, FailureKind::Retryable, 2);
    EXPECT(attempts.size() == 1);
    EXPECT(memory.deadLetters("jobs").size() == 1);
}

void testDelayedRetry() {
    std::cout << "[Test] Backoff delays the republished job..." << std::endl;
    MemoryBroker memory;
    RetryPolicy policy;
    policy.baseDelay = 150ms;
    RetryGovernor governor(policy);

    auto conn = memory.connect();
    conn->declareQueue("jobs");
    conn->publish("", "jobs", "payload", Properties{});

    std::vector<std::int64_t> notBefore;
    Broker& channel = *conn;
    conn->consume("jobs", 1, [&](const Delivery& d) {
        notBefore.push_back(d.message.properties.notBefore);
        if (notBefore.size() == 1) {
            (void)governor.onFailure(channel, d, FailureKind::Retryable, "transient");
        } else {
            channel.ack(d.tag);
        }
    });

    const std::int64_t before = nowMillis();
    EXPECT(conn->processEvents(100ms) == 1);
    EXPECT(conn->processEvents(20ms) == 0);
    EXPECT(conn->processEvents(2000ms) == 1);
    EXPECT(notBefore.size() == 2);
    EXPECT(notBefore.size() == 2 && notBefore[1] >= before + 150);
    EXPECT(nowMillis() >= before + 150);
}

void testPolicyAndHeader() {
    std::cout << "[Test] Backoff schedule and header parsing..." << std::endl;
    RetryPolicy policy;
    EXPECT(policy.maxRetries == kMaxRetries);
    EXPECT(policy.delayFor(1) == 1000ms);
    EXPECT(policy.delayFor(2) == 2000ms);
    EXPECT(policy.delayFor(3) == 4000ms);
    EXPECT(policy.delayFor(10) == 30000ms);
    EXPECT(policy.delayFor(0) == 0ms);
    EXPECT(RetryPolicy::immediate().delayFor(3) == 0ms);

    Properties properties;
    EXPECT(RetryGovernor::retryCount(properties) == 0);
    properties.headers[kRetryHeader] = 2;
    EXPECT(RetryGovernor::retryCount(properties) == 2);
    properties.headers[kRetryHeader] = -4;
    EXPECT(RetryGovernor::retryCount(properties) == 0);
}

}

int main() {
    Logger::setLevel(LogLevel::CRITICAL);
    std::cout << "=== Retry Governor Tests ===" << std::endl;

    testRetryThenDiscard();
    testTerminalUsesRetryBudgetByDefault();
    testTerminalDiscardsAtOnce();
    testZeroRetries();
    testDelayedRetry();
    testPolicyAndHeader();

    return test::finish("retry_governor");
}
