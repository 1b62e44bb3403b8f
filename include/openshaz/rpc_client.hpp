/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <future>
#include <string>

#include <nlohmann/json.hpp>

#include "openshaz/broker.hpp"
#include "openshaz/job.hpp"

namespace openshaz {

enum class CallError : uint8_t {
    None = 0,
    Timeout,
    BrokerUnavailable,
    InvalidRequest,
    InvalidReply
};

struct CallResult {
    bool ok = false;
    JobResult reply;
    CallError error = CallError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

[[nodiscard]] const char* toString(CallError error) noexcept;

inline constexpr std::chrono::seconds kExtractionTimeout{45};
inline constexpr std::chrono::seconds kSimilarityTimeout{60};

// Request/response over the broker. Every call opens its own connection and
// private reply queue, so one client may be used from several threads.
class RpcClient final {
public:
    explicit RpcClient(BrokerFactory factory);

    RpcClient(const RpcClient&) = delete;
    RpcClient& operator=(const RpcClient&) = delete;

    // Returns the matching reply, or Timeout once the deadline passes.
    [[nodiscard]] CallResult call(const std::string& queue, const nlohmann::json& payload,
                                  std::chrono::milliseconds timeout);

    // Runs call() on a background thread. The client must outlive the future.
    [[nodiscard]] std::future<CallResult> callAsync(const std::string& queue, nlohmann::json payload,
                                                    std::chrono::milliseconds timeout);

    [[nodiscard]] CallResult submitExtraction(const std::string& musicName, const std::string& bucketUrl,
                                              std::chrono::milliseconds timeout = kExtractionTimeout);
    [[nodiscard]] CallResult submitSimilarity(const std::string& musicName, const std::string& bucketUrl,
                                              int topK = 5,
                                              std::chrono::milliseconds timeout = kSimilarityTimeout);

    void setConnectRetry(int attempts, std::chrono::milliseconds backoff) noexcept {
        connectAttempts_ = attempts;
        connectBackoff_ = backoff;
    }

private:
    BrokerFactory factory_;
    int connectAttempts_ = 1;
    std::chrono::milliseconds connectBackoff_{0};
};

}
