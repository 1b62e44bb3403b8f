/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/job.hpp"
#include "openshaz/errors.hpp"
#include <algorithm>

using json = nlohmann::json;

namespace openshaz {

namespace {

json parseObject(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw ValidationError(std::string("Payload is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw ValidationError("Payload is not a JSON object");
    }
    return j;
}

std::string requireString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw ValidationError(std::string("Missing or empty field: ") + key);
    }
    return it->get<std::string>();
}

std::string optionalString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

}

json toJson(const ExtractionTask& task) {
    return {
        {"job_id", task.jobId},
        {"type", toString(JobType::Extraction)},
        {"music_name", task.musicName},
        {"bucket_url", task.bucketUrl}
    };
}

json toJson(const SimilarityTask& task) {
    return {
        {"job_id", task.jobId},
        {"type", toString(JobType::Similarity)},
        {"music_name", task.musicName},
        {"bucket_url", task.bucketUrl},
        {"top_k", task.topK}
    };
}

json toJson(const ExtractionResult& result) {
    return {
        {"job_id", result.jobId},
        {"music_name", result.musicName},
        {"bucket_url", result.bucketUrl},
        {"status", toString(JobStatus::Extracted)},
        {"features", result.features}
    };
}

json toJson(const Match& match) {
    return {
        {"id", match.id},
        {"name", match.name},
        {"similarity", match.similarity}
    };
}

json toJson(const SimilarityResult& result) {
    json similar = json::array();
    for (const auto& match : result.similar) {
        similar.push_back(toJson(match));
    }
    return {
        {"job_id", result.jobId},
        {"query_song", result.querySong},
        {"bucket_url", result.bucketUrl},
        {"status", toString(JobStatus::Completed)},
        {"similar", similar}
    };
}

ExtractionTask parseExtractionTask(const std::string& body) {
    json j = parseObject(body);
    ExtractionTask task;
    task.jobId = optionalString(j, "job_id");
    task.musicName = requireString(j, "music_name");
    task.bucketUrl = requireString(j, "bucket_url");
    return task;
}

SimilarityTask parseSimilarityTask(const std::string& body) {
    json j = parseObject(body);
    SimilarityTask task;
    task.jobId = optionalString(j, "job_id");
    task.musicName = requireString(j, "music_name");
    task.bucketUrl = requireString(j, "bucket_url");

    auto topK = j.find("top_k");
    if (topK != j.end() && !topK->is_null()) {
        if (!topK->is_number_integer() || topK->get<long long>() < 1) {
            throw ValidationError("top_k must be a positive integer");
        }
        task.topK = static_cast<int>(std::min<long long>(topK->get<long long>(), 1000000));
    }
    return task;
}

JobType parseJobType(const std::string& body) {
    json j = parseObject(body);
    std::string type = optionalString(j, "type");
    if (type == "extraction") return JobType::Extraction;
    if (type == "similarity") return JobType::Similarity;
    throw ValidationError("Unknown job type: '" + type + "'");
}

std::vector<Match> parseMatches(const json& similar) {
    std::vector<Match> matches;
    if (!similar.is_array()) {
        return matches;
    }
    for (const auto& entry : similar) {
        if (!entry.is_object()) {
            continue;
        }
        Match match;
        match.id = entry.value("id", std::int64_t{0});
        match.name = entry.value("name", std::string{});
        match.similarity = entry.value("similarity", 0.0);
        match.index = matches.size();
        matches.push_back(std::move(match));
    }
    return matches;
}

JobResult parseJobResult(const std::string& body) {
    json j = parseObject(body);
    JobResult result;
    result.jobId = optionalString(j, "job_id");

    std::string status = optionalString(j, "status");
    if (status == "extracted") {
        result.status = JobStatus::Extracted;
    } else if (status == "completed") {
        result.status = JobStatus::Completed;
    } else if (status == "error") {
        result.status = JobStatus::Error;
    } else {
        throw ValidationError("Unknown result status: '" + status + "'");
    }

    result.payload = std::move(j);
    return result;
}

}
