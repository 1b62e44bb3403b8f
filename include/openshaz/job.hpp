/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "openshaz/types.hpp"

namespace openshaz {

struct ExtractionTask {
    JobId jobId;
    std::string musicName;
    std::string bucketUrl;
};

struct SimilarityTask {
    JobId jobId;
    std::string musicName;
    std::string bucketUrl;
    int topK = 5;
};

struct Match {
    std::int64_t id = 0;
    std::string name;
    std::size_t index = 0;
    double similarity = 0.0;
};

struct ExtractionResult {
    JobId jobId;
    std::string musicName;
    std::string bucketUrl;
    std::vector<double> features;
};

struct SimilarityResult {
    JobId jobId;
    std::string querySong;
    std::string bucketUrl;
    std::vector<Match> similar;
};

// Reply as seen by an RPC caller. payload holds the full reply document.
struct JobResult {
    JobId jobId;
    JobStatus status = JobStatus::Error;
    nlohmann::json payload;
};

[[nodiscard]] nlohmann::json toJson(const ExtractionTask& task);
[[nodiscard]] nlohmann::json toJson(const SimilarityTask& task);
[[nodiscard]] nlohmann::json toJson(const ExtractionResult& result);
[[nodiscard]] nlohmann::json toJson(const SimilarityResult& result);
[[nodiscard]] nlohmann::json toJson(const Match& match);

// Decoders throw ValidationError on malformed bodies.
[[nodiscard]] ExtractionTask parseExtractionTask(const std::string& body);
[[nodiscard]] SimilarityTask parseSimilarityTask(const std::string& body);
[[nodiscard]] JobType parseJobType(const std::string& body);
[[nodiscard]] JobResult parseJobResult(const std::string& body);
[[nodiscard]] std::vector<Match> parseMatches(const nlohmann::json& similar);

}
