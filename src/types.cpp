/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/types.hpp"
#include <uuid/uuid.h>

namespace openshaz {

const char* toString(JobType type) noexcept {
    switch (type) {
        case JobType::Extraction: return "extraction";
        case JobType::Similarity: return "similarity";
        default: return "unknown";
    }
}

const char* toString(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Extracted: return "extracted";
        case JobStatus::Completed: return "completed";
        case JobStatus::Error: return "error";
        default: return "unknown";
    }
}

const char* toString(FeatureKind kind) noexcept {
    switch (kind) {
        case FeatureKind::Reference: return "reference";
        case FeatureKind::Query: return "query";
        default: return "unknown";
    }
}

std::string generateUuid() {
    uuid_t raw;
    uuid_generate_random(raw);
    char text[37];
    uuid_unparse_lower(raw, text);
    return std::string(text);
}

}
