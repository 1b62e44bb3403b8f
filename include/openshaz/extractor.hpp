/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace openshaz {

// Turns an audio file into a fixed-length feature vector. Throws ExtractionError.
class FeatureExtractor {
public:
    virtual ~FeatureExtractor() = default;
    [[nodiscard]] virtual std::vector<double> extract(const std::filesystem::path& localPath) = 0;
};

// Runs an external command and reads a JSON array of numbers from its stdout.
// Every "{}" in the template is replaced by the quoted audio path; without one
// the path is appended.
class CommandExtractor final : public FeatureExtractor {
public:
    explicit CommandExtractor(std::string commandTemplate);

    [[nodiscard]] std::vector<double> extract(const std::filesystem::path& localPath) override;

    [[nodiscard]] std::string commandFor(const std::filesystem::path& localPath) const;

    void setMaxOutput(std::size_t bytes) noexcept { maxOutput_ = bytes; }

private:
    std::string template_;
    std::size_t maxOutput_ = 16'000'000;
};

[[nodiscard]] std::string shellQuote(const std::string& value);

}
