/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/work.hpp"
#include "openshaz/errors.hpp"
#include "openshaz/job.hpp"
#include "openshaz/logger.hpp"

namespace openshaz {

Work::Work(BrokerFactory factory) : factory_(std::move(factory)) {}

Broker& Work::connection() {
    if (!broker_ || !broker_->isOpen()) {
        broker_ = connectWithRetry(factory_, connectAttempts_, connectBackoff_);
    }
    return *broker_;
}

SubmitResult Work::submit(const std::string& queue, nlohmann::json payload) {
    if (queue.empty()) {
        return {false, "", SubmissionError::InvalidContent, "Queue name is empty"};
    }
    if (!payload.is_object()) {
        LOG_DEBUG("Invalid payload: not a JSON object");
        return {false, "", SubmissionError::InvalidContent, "Payload must be a JSON object"};
    }

    auto idField = payload.find("job_id");
    if (idField == payload.end() || !idField->is_string() || idField->get<std::string>().empty()) {
        payload["job_id"] = generateUuid();
    }
    JobId jobId = payload["job_id"].get<std::string>();

    std::string body = payload.dump();
    if (body.size() > maxBytes_) {
        LOG_DEBUG("Payload exceeds size limit: " + std::to_string(body.size()) + " > " + std::to_string(maxBytes_));
        return {false, "", SubmissionError::InvalidSize,
                "Payload exceeds maximum size limit (" + std::to_string(maxBytes_) + " bytes)"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Broker* broker = nullptr;
    try {
        broker = &connection();
    } catch (const BrokerError& e) {
        LOG_ERROR("Cannot submit job " + jobId + ": " + std::string(e.what()));
        return {false, "", SubmissionError::BrokerUnavailable, e.what()};
    }

    try {
        broker->declareQueue(queue, QueueOptions{true, false, false});
        Properties properties;
        properties.persistent = true;
        broker->publish("", queue, body, properties);
    } catch (const BrokerError& e) {
        LOG_ERROR("Failed to publish job " + jobId + " to " + queue + ": " + std::string(e.what()));
        broker_.reset();
        return {false, "", SubmissionError::PublishFailed, e.what()};
    }

    LOG_INFO("Job submitted successfully: " + jobId + " -> " + queue);
    return {true, jobId, SubmissionError::None, ""};
}

SubmitResult Work::submitExtraction(const std::string& musicName, const std::string& bucketUrl) {
    if (musicName.empty() || bucketUrl.empty()) {
        return {false, "", SubmissionError::InvalidContent, "music_name and bucket_url are required"};
    }
    return submit(kExtractionQueue, toJson(ExtractionTask{generateUuid(), musicName, bucketUrl}));
}

SubmitResult Work::submitSimilarity(const std::string& musicName, const std::string& bucketUrl, int topK) {
    if (musicName.empty() || bucketUrl.empty()) {
        return {false, "", SubmissionError::InvalidContent, "music_name and bucket_url are required"};
    }
    if (topK < 1) {
        return {false, "", SubmissionError::InvalidContent, "top_k must be a positive integer"};
    }
    return submit(kSimilarityQueue, toJson(SimilarityTask{generateUuid(), musicName, bucketUrl, topK}));
}

}
