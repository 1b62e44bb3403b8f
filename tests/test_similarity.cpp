/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/logger.hpp"
#include "openshaz/similarity.hpp"
#include "test_util.hpp"

using namespace openshaz;

namespace {

FeatureVector row(std::int64_t id, const std::string& name, std::vector<double> values) {
    return FeatureVector{id, name, std::move(values)};
}

std::vector<FeatureVector> unitSquare() {
    return {row(1, "A", {1.0, 0.0}), row(2, "B", {0.0, 1.0}), row(3, "C", {1.0, 1.0})};
}

void testNotFitted() {
    std::cout << "[Test] Ranking before fit..." << std::endl;
    SimilarityEngine engine;
    EXPECT(!engine.isFitted());
    EXPECT_THROWS(engine.findSimilar({1.0, 0.0}, 1), NotFittedError);
}

void testCosineRanking() {
    std::cout << "[Test] Cosine ranking..." << std::endl;
    SimilarityEngine engine(Metric::Cosine, false);
    engine.fit(unitSquare());

    auto top = engine.findSimilar({1.0, 0.0}, 1);
    EXPECT(top.size() == 1);
    EXPECT(top[0].name == "A");
    EXPECT(top[0].id == 1);
    EXPECT(top[0].index == 0);
    EXPECT_NEAR(top[0].similarity, 1.0, 1e-9);

    auto all = engine.findSimilar({1.0, 0.0}, 3);
    EXPECT(all.size() == 3);
    EXPECT(all[1].name == "C");
    EXPECT_NEAR(all[1].similarity, 1.0 / std::sqrt(2.0), 1e-9);
    EXPECT(all[2].name == "B");
    EXPECT_NEAR(all[2].similarity, 0.0, 1e-9);
}

void testDistanceMetrics() {
    std::cout << "[Test] Euclidean and manhattan scores..." << std::endl;
    SimilarityEngine engine(Metric::Euclidean, false);
    engine.fit(unitSquare());

    auto ranked = engine.findSimilar({1.0, 0.0}, 3);
    EXPECT(ranked.size() == 3);
    EXPECT(ranked[0].name == "A");
    EXPECT_NEAR(ranked[0].similarity, 1.0, 1e-9);
    EXPECT(ranked[1].name == "C");
    EXPECT_NEAR(ranked[1].similarity, 0.5, 1e-9);
    EXPECT(ranked[2].name == "B");
    EXPECT_NEAR(ranked[2].similarity, 1.0 / (1.0 + std::sqrt(2.0)), 1e-9);

    // Same fit, metric chosen per call
    auto manhattan = engine.findSimilar({1.0, 0.0}, 3, Metric::Manhattan);
    EXPECT(manhattan[0].name == "A");
    EXPECT(manhattan[1].name == "C");
    EXPECT_NEAR(manhattan[1].similarity, 0.5, 1e-9);
    EXPECT(manhattan[2].name == "B");
    EXPECT_NEAR(manhattan[2].similarity, 1.0 / 3.0, 1e-9);
}

void testRefitIsDeterministic() {
    std::cout << "[Test] Refit gives identical results..." << std::endl;
    SimilarityEngine engine(Metric::Cosine, true);
    engine.fit(unitSquare());
    auto first = engine.findSimilar({0.5, 0.2}, 3);
    engine.fit(unitSquare());
    auto second = engine.findSimilar({0.5, 0.2}, 3);

    EXPECT(first.size() == second.size());
    for (std::size_t i = 0; i < first.size() && i < second.size(); ++i) {
        EXPECT(first[i].index == second[i].index);
        EXPECT(first[i].similarity == second[i].similarity);
    }
}

void testStandardization() {
    std::cout << "[Test] Column standardization..." << std::endl;
    // Second column is constant: its deviation is zero and must not divide by zero.
    SimilarityEngine engine(Metric::Cosine, true);
    engine.fit({row(1, "low", {1.0, 10.0}), row(2, "high", {3.0, 10.0})});
    EXPECT(engine.normalizes());
    EXPECT(engine.dimension() == 2);

    auto ranked = engine.findSimilar({3.0, 10.0}, 2);
    EXPECT(ranked.size() == 2);
    EXPECT(ranked[0].index == 1);
    EXPECT_NEAR(ranked[0].similarity, 1.0, 1e-9);
    EXPECT(ranked[1].index == 0);
    EXPECT_NEAR(ranked[1].similarity, -1.0, 1e-9);
    for (const auto& m : ranked) {
        EXPECT(std::isfinite(m.similarity));
    }
}

void testTiesAndZeroVectors() {
    std::cout << "[Test] Ties and zero vectors..." << std::endl;
    SimilarityEngine engine(Metric::Cosine, false);
    engine.fit({row(7, "zero", {0.0, 0.0}), row(8, "twin1", {1.0, 1.0}), row(9, "twin2", {1.0, 1.0})});

    auto ranked = engine.findSimilar({2.0, 2.0}, 3);
    EXPECT(ranked.size() == 3);
    EXPECT(ranked[0].index == 1);
    EXPECT(ranked[1].index == 2);
    EXPECT(ranked[0].similarity == ranked[1].similarity);
    EXPECT(ranked[2].name == "zero");
    EXPECT(ranked[2].similarity == 0.0);

    auto zeroQuery = engine.findSimilar({0.0, 0.0}, 3);
    EXPECT(zeroQuery.size() == 3);
    for (std::size_t i = 0; i < zeroQuery.size(); ++i) {
        EXPECT(zeroQuery[i].similarity == 0.0);
        EXPECT(zeroQuery[i].index == i);
    }
}

void testInputValidation() {
    std::cout << "[Test] Input validation..." << std::endl;
    SimilarityEngine engine;
    EXPECT_THROWS(engine.fit({row(1, "a", {1.0, 2.0}), row(2, "b", {1.0})}), ValidationError);
    EXPECT_THROWS(engine.fit({row(1, "a", {})}), ValidationError);
    EXPECT(!engine.isFitted());

    engine.fit(unitSquare());
    EXPECT_THROWS(engine.findSimilar({1.0, 0.0, 0.0}, 1), ValidationError);
    // The length check does not depend on topK
    EXPECT_THROWS(engine.findSimilar({1.0, 0.0, 0.0}, 0), ValidationError);
    EXPECT_THROWS(engine.findSimilar({1.0}, -1), ValidationError);

    EXPECT(engine.findSimilar({1.0, 0.0}, 10).size() == 3);
    EXPECT(engine.findSimilar({1.0, 0.0}, 0).empty());
}

void testEmptyFit() {
    std::cout << "[Test] Empty reference set..." << std::endl;
    SimilarityEngine engine;
    engine.fit({});
    EXPECT(engine.isFitted());
    EXPECT(engine.size() == 0);
    EXPECT(engine.findSimilar({1.0, 2.0, 3.0}, 5).empty());
}

void testEvaluate() {
    std::cout << "[Test] Top-k label accuracy..." << std::endl;
    SimilarityEngine engine(Metric::Euclidean, false);
    engine.fit({row(1, "blues.00001.wav", {0.0, 0.0}), row(2, "rock.00001.wav", {10.0, 10.0})});

    std::vector<FeatureVector> test = {
        row(3, "blues.00002.wav", {0.1, 0.0}),
        row(4, "rock.00002.wav", {10.0, 9.9}),
        row(5, "jazz.00001.wav", {0.2, 0.1}),
    };
    Evaluation eval = engine.evaluate(test, 1);

    EXPECT(eval.metric == Metric::Euclidean);
    EXPECT(eval.topK == 1);
    EXPECT(eval.trainSize == 2);
    EXPECT(eval.testSize == 3);
    EXPECT(eval.correct == 2);
    EXPECT(eval.total == 3);
    EXPECT_NEAR(eval.accuracy(), 2.0 / 3.0, 1e-9);
    EXPECT(eval.perLabel["blues"].correct == 1);
    EXPECT(eval.perLabel["rock"].correct == 1);
    EXPECT(eval.perLabel["jazz"].correct == 0);
    EXPECT(eval.perLabel["jazz"].total == 1);
    EXPECT(eval.perLabel["jazz"].accuracy() == 0.0);
}

void testLabelsAndMetricNames() {
    std::cout << "[Test] Labels and metric names..." << std::endl;
    EXPECT(labelOf("blues.00042.wav") == "blues");
    EXPECT(labelOf("untagged") == "untagged");

    Metric metric = Metric::Cosine;
    EXPECT(parseMetric("manhattan", metric));
    EXPECT(metric == Metric::Manhattan);
    EXPECT(parseMetric("euclidean", metric));
    EXPECT(metric == Metric::Euclidean);
    EXPECT(!parseMetric("chebyshev", metric));
    EXPECT(metric == Metric::Euclidean);
    EXPECT(std::string(toString(Metric::Cosine)) == "cosine");
}

void testCompareMetrics() {
    std::cout << "[Test] Metric comparison on separated clusters..." << std::endl;
    std::vector<FeatureVector> vectors;
    for (int i = 0; i < 10; ++i) {
        vectors.push_back(row(i + 1, "a." + std::to_string(i) + ".wav", {i * 0.1, i * 0.05}));
        vectors.push_back(row(i + 11, "b." + std::to_string(i) + ".wav", {100.0 + i * 0.1, 100.0 + i * 0.05}));
    }

    auto results = compareMetrics(vectors, 0.25, 3);
    EXPECT(results.size() == 3);
    if (results.size() == 3) {
        EXPECT(results[0].metric == Metric::Cosine);
        EXPECT(results[1].metric == Metric::Euclidean);
        EXPECT(results[2].metric == Metric::Manhattan);
        for (const auto& r : results) {
            EXPECT(r.testSize == 5);
            EXPECT(r.trainSize + r.testSize == vectors.size());
            EXPECT(r.total == 5);
            EXPECT_NEAR(r.accuracy(), 1.0, 1e-9);
        }
    }

    auto again = compareMetrics(vectors, 0.25, 3);
    EXPECT(again.size() == results.size());

    EXPECT_THROWS(compareMetrics(vectors, 0.0, 3), ValidationError);
    EXPECT_THROWS(compareMetrics(vectors, 1.0, 3), ValidationError);
}

}

int main() {
    Logger::setLevel(LogLevel::ERROR);
    std::cout << "=== Similarity Engine Tests ===" << std::endl;

    testNotFitted();
    testCosineRanking();
    testDistanceMetrics();
    testRefitIsDeterministic();
    testStandardization();
    testTiesAndZeroVectors();
    testInputValidation();
    testEmptyFit();
    testEvaluate();
    testLabelsAndMetricNames();
    testCompareMetrics();

    return test::finish("similarity");
}
