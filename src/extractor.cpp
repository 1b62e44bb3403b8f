/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/extractor.hpp"
#include "openshaz/errors.hpp"
#include "openshaz/logger.hpp"
#include <array>
#include <cstdio>
#include <sys/wait.h>

#include <nlohmann/json.hpp>

namespace openshaz {

std::string shellQuote(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

CommandExtractor::CommandExtractor(std::string commandTemplate) : template_(std::move(commandTemplate)) {
    if (template_.empty()) {
        throw ExtractionError("Extractor command is empty");
    }
}

std::string CommandExtractor::commandFor(const std::filesystem::path& localPath) const {
    const std::string quoted = shellQuote(localPath.string());
    std::string cmd;
    bool substituted = false;
    for (std::size_t i = 0; i < template_.size(); ++i) {
        if (template_[i] == '{' && i + 1 < template_.size() && template_[i + 1] == '}') {
            cmd += quoted;
            substituted = true;
            ++i;
        } else {
            cmd += template_[i];
        }
    }
    if (!substituted) {
        cmd += " " + quoted;
    }
    return cmd;
}

std::vector<double> CommandExtractor::extract(const std::filesystem::path& localPath) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(localPath, ec)) {
        throw ExtractionError("Audio file not found: " + localPath.string());
    }

    std::string cmd = commandFor(localPath);
    LOG_DEBUG("Running extractor: " + cmd);

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        throw ExtractionError("Failed to start extractor: " + cmd);
    }
    std::array<char, 4096> buf;
    std::string out;
    std::size_t n;
    while ((n = std::fread(buf.data(), 1, buf.size(), pipe)) > 0) {
        if (out.size() + n > maxOutput_) {
            pclose(pipe);
            throw ExtractionError("Extractor output exceeds " + std::to_string(maxOutput_) + " bytes");
        }
        out.append(buf.data(), n);
    }
    int status = pclose(pipe);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        throw ExtractionError("Extractor failed for " + localPath.string() + " (status " +
                              std::to_string(status) + ")");
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(out);
    } catch (const nlohmann::json::parse_error& e) {
        throw ExtractionError("Extractor output is not JSON: " + std::string(e.what()));
    }
    if (!j.is_array() || j.empty()) {
        throw ExtractionError("Extractor output is not a non-empty array");
    }

    std::vector<double> features;
    features.reserve(j.size());
    for (const auto& v : j) {
        if (!v.is_number()) {
            throw ExtractionError("Extractor output contains a non-numeric value");
        }
        features.push_back(v.get<double>());
    }
    LOG_INFO("Extracted " + std::to_string(features.size()) + " features from " + localPath.filename().string());
    return features;
}

}
