/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/similarity.hpp"
#include "openshaz/errors.hpp"
#include "openshaz/logger.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

namespace openshaz {

const char* toString(Metric metric) noexcept {
    switch (metric) {
        case Metric::Cosine: return "cosine";
        case Metric::Euclidean: return "euclidean";
        case Metric::Manhattan: return "manhattan";
    }
    return "unknown";
}

bool parseMetric(const std::string& text, Metric& out) noexcept {
    if (text == "cosine") {
        out = Metric::Cosine;
    } else if (text == "euclidean") {
        out = Metric::Euclidean;
    } else if (text == "manhattan") {
        out = Metric::Manhattan;
    } else {
        return false;
    }
    return true;
}

std::string labelOf(const std::string& name) {
    return name.substr(0, name.find('.'));
}

SimilarityEngine::SimilarityEngine(Metric metric, bool normalize) noexcept
    : metric_(metric), normalize_(normalize) {}

void SimilarityEngine::fit(const std::vector<FeatureVector>& references) {
    LOG_INFO("Fitting similarity engine with " + std::to_string(references.size()) + " audio files");

    std::size_t dim = references.empty() ? 0 : references.front().values.size();
    for (const auto& ref : references) {
        if (ref.values.empty()) {
            throw ValidationError("Reference '" + ref.name + "' has no features");
        }
        if (ref.values.size() != dim) {
            throw ValidationError("Reference '" + ref.name + "' has " + std::to_string(ref.values.size()) +
                                  " features, expected " + std::to_string(dim));
        }
    }

    const std::size_t n = references.size();
    std::vector<double> matrix;
    matrix.reserve(n * dim);
    std::vector<std::int64_t> ids;
    std::vector<std::string> names;
    ids.reserve(n);
    names.reserve(n);
    for (const auto& ref : references) {
        matrix.insert(matrix.end(), ref.values.begin(), ref.values.end());
        ids.push_back(ref.id);
        names.push_back(ref.name);
    }

    std::vector<double> mean(dim, 0.0);
    std::vector<double> scale(dim, 1.0);
    if (normalize_ && n > 0) {
        for (std::size_t r = 0; r < n; ++r) {
            for (std::size_t c = 0; c < dim; ++c) {
                mean[c] += matrix[r * dim + c];
            }
        }
        for (auto& m : mean) {
            m /= static_cast<double>(n);
        }
        // Population standard deviation, as StandardScaler computes it.
        std::vector<double> var(dim, 0.0);
        for (std::size_t r = 0; r < n; ++r) {
            for (std::size_t c = 0; c < dim; ++c) {
                double d = matrix[r * dim + c] - mean[c];
                var[c] += d * d;
            }
        }
        for (std::size_t c = 0; c < dim; ++c) {
            double sd = std::sqrt(var[c] / static_cast<double>(n));
            scale[c] = sd == 0.0 ? 1.0 : sd;
        }
        for (std::size_t r = 0; r < n; ++r) {
            for (std::size_t c = 0; c < dim; ++c) {
                matrix[r * dim + c] = (matrix[r * dim + c] - mean[c]) / scale[c];
            }
        }
        LOG_DEBUG("Features standardized per column");
    }

    matrix_ = std::move(matrix);
    mean_ = std::move(mean);
    scale_ = std::move(scale);
    ids_ = std::move(ids);
    names_ = std::move(names);
    dimension_ = dim;
    fitted_ = true;

    LOG_INFO("Feature matrix shape: (" + std::to_string(n) + ", " + std::to_string(dim) + ")");
}

std::vector<double> SimilarityEngine::transform(const std::vector<double>& query) const {
    if (!normalize_) {
        return query;
    }
    std::vector<double> out(query.size());
    for (std::size_t c = 0; c < query.size(); ++c) {
        out[c] = (query[c] - mean_[c]) / scale_[c];
    }
    return out;
}

double SimilarityEngine::score(const double* row, const std::vector<double>& query, Metric metric) const noexcept {
    switch (metric) {
        case Metric::Cosine: {
            double dot = 0.0, qn = 0.0, rn = 0.0;
            for (std::size_t c = 0; c < dimension_; ++c) {
                dot += query[c] * row[c];
                qn += query[c] * query[c];
                rn += row[c] * row[c];
            }
            if (qn == 0.0 || rn == 0.0) {
                return 0.0;
            }
            return dot / (std::sqrt(qn) * std::sqrt(rn));
        }
        case Metric::Euclidean: {
            double sum = 0.0;
            for (std::size_t c = 0; c < dimension_; ++c) {
                double d = query[c] - row[c];
                sum += d * d;
            }
            return 1.0 / (1.0 + std::sqrt(sum));
        }
        case Metric::Manhattan: {
            double sum = 0.0;
            for (std::size_t c = 0; c < dimension_; ++c) {
                sum += std::fabs(query[c] - row[c]);
            }
            return 1.0 / (1.0 + sum);
        }
    }
    return 0.0;
}

std::vector<Match> SimilarityEngine::findSimilar(const std::vector<double>& query, int topK) const {
    return findSimilar(query, topK, metric_);
}

std::vector<Match> SimilarityEngine::findSimilar(const std::vector<double>& query, int topK, Metric metric) const {
    if (!fitted_) {
        throw NotFittedError();
    }
    const std::size_t n = ids_.size();
    if (n == 0) {
        return {};
    }
    if (query.size() != dimension_) {
        throw ValidationError("Query has " + std::to_string(query.size()) +
                              " features, expected " + std::to_string(dimension_));
    }
    if (topK <= 0) {
        return {};
    }

    std::vector<double> q = transform(query);
    std::vector<double> scores(n);
    for (std::size_t r = 0; r < n; ++r) {
        scores[r] = score(&matrix_[r * dimension_], q, metric);
    }

    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::size_t k = std::min<std::size_t>(static_cast<std::size_t>(topK), n);
    std::partial_sort(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(k), order.end(),
        [&scores](std::size_t a, std::size_t b) {
            if (scores[a] != scores[b]) return scores[a] > scores[b];
            return a < b;
        });

    std::vector<Match> results;
    results.reserve(k);
    for (std::size_t i = 0; i < k; ++i) {
        std::size_t idx = order[i];
        results.push_back({ids_[idx], names_[idx], idx, scores[idx]});
    }

    LOG_DEBUG("Found " + std::to_string(results.size()) + " similar audio files");
    return results;
}

Evaluation SimilarityEngine::evaluate(const std::vector<FeatureVector>& testSet, int topK) const {
    LOG_INFO("Evaluating similarity engine on " + std::to_string(testSet.size()) + " test samples");

    Evaluation eval;
    eval.metric = metric_;
    eval.topK = topK;
    eval.trainSize = size();
    eval.testSize = testSet.size();

    for (const auto& sample : testSet) {
        std::string label = labelOf(sample.name);
        auto similar = findSimilar(sample.values, topK);
        bool hit = std::any_of(similar.begin(), similar.end(),
            [&label](const Match& m) { return labelOf(m.name) == label; });

        auto& bucket = eval.perLabel[label];
        ++bucket.total;
        ++eval.total;
        if (hit) {
            ++bucket.correct;
            ++eval.correct;
        }
    }

    LOG_INFO("Overall accuracy (top-" + std::to_string(topK) + ", " + toString(metric_) + "): " +
             std::to_string(eval.accuracy() * 100.0) + "%");
    return eval;
}

std::vector<Evaluation> compareMetrics(const std::vector<FeatureVector>& vectors, double testFraction,
                                       int topK, std::uint32_t seed) {
    if (!(testFraction > 0.0 && testFraction < 1.0)) {
        throw ValidationError("Test fraction must be between 0 and 1");
    }

    std::vector<FeatureVector> shuffled = vectors;
    std::mt19937 rng(seed);
    std::shuffle(shuffled.begin(), shuffled.end(), rng);

    auto testCount = static_cast<std::size_t>(std::ceil(testFraction * static_cast<double>(shuffled.size())));
    testCount = std::min(testCount, shuffled.size());
    std::vector<FeatureVector> test(shuffled.begin(), shuffled.begin() + static_cast<std::ptrdiff_t>(testCount));
    std::vector<FeatureVector> train(shuffled.begin() + static_cast<std::ptrdiff_t>(testCount), shuffled.end());

    LOG_INFO("Train set: " + std::to_string(train.size()) + " samples, Test set: " +
             std::to_string(test.size()) + " samples");

    std::vector<Evaluation> results;
    for (Metric metric : {Metric::Cosine, Metric::Euclidean, Metric::Manhattan}) {
        SimilarityEngine engine(metric, true);
        engine.fit(train);
        results.push_back(engine.evaluate(test, topK));
    }
    return results;
}

}
