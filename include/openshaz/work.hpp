/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "openshaz/broker.hpp"
#include "openshaz/types.hpp"

namespace openshaz {

enum class SubmissionError : uint8_t {
    None = 0,
    BrokerUnavailable,
    InvalidSize,
    InvalidContent,
    PublishFailed
};

struct SubmitResult {
    bool ok = false;
    JobId id;
    SubmissionError error = SubmissionError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Fire-and-forget submission: publishes without reply_to and returns the job
// id at once. No completion signal flows back.
class Work final {
public:
    explicit Work(BrokerFactory factory);

    Work(const Work&) = delete;
    Work& operator=(const Work&) = delete;

    // Assigns job_id when the payload has none.
    [[nodiscard]] SubmitResult submit(const std::string& queue, nlohmann::json payload);
    [[nodiscard]] SubmitResult submitExtraction(const std::string& musicName, const std::string& bucketUrl);
    [[nodiscard]] SubmitResult submitSimilarity(const std::string& musicName, const std::string& bucketUrl,
                                                int topK = 5);

    void setMaxSize(std::size_t maxBytes) noexcept { maxBytes_ = maxBytes; }
    [[nodiscard]] std::size_t maxSize() const noexcept { return maxBytes_; }

    void setConnectRetry(int attempts, std::chrono::milliseconds backoff) noexcept {
        connectAttempts_ = attempts;
        connectBackoff_ = backoff;
    }

private:
    BrokerFactory factory_;
    std::unique_ptr<Broker> broker_;
    std::mutex mutex_;
    std::size_t maxBytes_ = 1'000'000;
    int connectAttempts_ = 1;
    std::chrono::milliseconds connectBackoff_{0};

    [[nodiscard]] Broker& connection();
};

}
