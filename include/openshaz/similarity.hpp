/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "openshaz/job.hpp"
#include "openshaz/types.hpp"

namespace openshaz {

enum class Metric : uint8_t {
    Cosine = 0,
    Euclidean = 1,
    Manhattan = 2
};

[[nodiscard]] const char* toString(Metric metric) noexcept;
// Returns false for an unknown name and leaves out untouched.
[[nodiscard]] bool parseMetric(const std::string& text, Metric& out) noexcept;

struct LabelAccuracy {
    std::size_t correct = 0;
    std::size_t total = 0;
    [[nodiscard]] double accuracy() const noexcept {
        return total == 0 ? 0.0 : static_cast<double>(correct) / static_cast<double>(total);
    }
};

struct Evaluation {
    Metric metric = Metric::Cosine;
    int topK = 0;
    std::size_t correct = 0;
    std::size_t total = 0;
    std::size_t trainSize = 0;
    std::size_t testSize = 0;
    std::map<std::string, LabelAccuracy> perLabel;

    [[nodiscard]] double accuracy() const noexcept {
        return total == 0 ? 0.0 : static_cast<double>(correct) / static_cast<double>(total);
    }
};

// Nearest-neighbour ranking over a fitted reference matrix. Not thread-safe;
// FeatureCache serializes access for the dispatcher.
class SimilarityEngine {
public:
    explicit SimilarityEngine(Metric metric = Metric::Cosine, bool normalize = true) noexcept;

    // Replaces all prior state. Throws ValidationError when the rows differ in
    // length or have no columns. An empty set is a valid fit.
    void fit(const std::vector<FeatureVector>& references);

    // Throws NotFittedError before fit() and ValidationError when the query
    // length differs from the fitted dimension.
    [[nodiscard]] std::vector<Match> findSimilar(const std::vector<double>& query, int topK) const;
    [[nodiscard]] std::vector<Match> findSimilar(const std::vector<double>& query, int topK, Metric metric) const;

    // Hit when the query's label (name up to the first '.') is among the top-k labels.
    [[nodiscard]] Evaluation evaluate(const std::vector<FeatureVector>& testSet, int topK) const;

    [[nodiscard]] bool isFitted() const noexcept { return fitted_; }
    [[nodiscard]] std::size_t size() const noexcept { return ids_.size(); }
    [[nodiscard]] std::size_t dimension() const noexcept { return dimension_; }
    [[nodiscard]] Metric metric() const noexcept { return metric_; }
    [[nodiscard]] bool normalizes() const noexcept { return normalize_; }

private:
    Metric metric_;
    bool normalize_;
    bool fitted_ = false;
    std::size_t dimension_ = 0;

    // Row-major N x D; ids_ and names_ stay aligned with the rows.
    std::vector<double> matrix_;
    std::vector<double> mean_;
    std::vector<double> scale_;
    std::vector<std::int64_t> ids_;
    std::vector<std::string> names_;

    [[nodiscard]] std::vector<double> transform(const std::vector<double>& query) const;
    [[nodiscard]] double score(const double* row, const std::vector<double>& query, Metric metric) const noexcept;
};

[[nodiscard]] std::string labelOf(const std::string& name);

// Seeded shuffle, then trains on (1 - testFraction) and evaluates each metric
// with normalization on. Throws ValidationError for a fraction outside (0, 1).
[[nodiscard]] std::vector<Evaluation> compareMetrics(const std::vector<FeatureVector>& vectors,
                                                     double testFraction, int topK,
                                                     std::uint32_t seed = 42);

}
