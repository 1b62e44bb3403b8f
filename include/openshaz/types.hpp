/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace openshaz {

// Opaque job identifier (UUID string).
using JobId = std::string;

enum class JobType : std::uint8_t { Extraction, Similarity };

// Terminal status carried by a JobResult.
enum class JobStatus : std::uint8_t { Extracted, Completed, Error };

// Which feature table a vector belongs to.
enum class FeatureKind : std::uint8_t { Reference, Query };

inline constexpr const char* kExtractionQueue = "audio_extraction_tasks";
inline constexpr const char* kSimilarityQueue = "audio_similarity_tasks";
inline constexpr const char* kFanoutQueue = "music_tasks";

inline constexpr const char* kRetryHeader = "x-retry-count";
inline constexpr int kMaxRetries = 3;

// Snapshot of one persisted feature row.
struct FeatureVector {
    std::int64_t id = 0;
    std::string name;
    std::vector<double> values;
};

[[nodiscard]] const char* toString(JobType type) noexcept;
[[nodiscard]] const char* toString(JobStatus status) noexcept;
[[nodiscard]] const char* toString(FeatureKind kind) noexcept;

// Random version-4 UUID, lowercase canonical form.
[[nodiscard]] std::string generateUuid();

} // namespace openshaz
