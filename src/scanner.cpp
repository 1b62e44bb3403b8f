/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/scanner.hpp"
#include "openshaz/logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace openshaz {

Scanner::Scanner(const std::filesystem::path& root, bool recursive) noexcept
    : root_(root), recursive_(recursive) {
}

bool Scanner::isAudioFile(const std::filesystem::path& path) noexcept {
    try {
        std::string ext = path.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        static const std::array<const char*, 6> kExtensions = {".wav", ".mp3", ".flac", ".ogg", ".au", ".m4a"};
        return std::any_of(kExtensions.begin(), kExtensions.end(),
            [&ext](const char* candidate) { return ext == candidate; });
    } catch (...) {
        return false;
    }
}

std::vector<std::filesystem::path> Scanner::scan() const noexcept {
    std::vector<std::filesystem::path> files;

    try {
        if (!std::filesystem::is_directory(root_)) {
            LOG_WARN("Dataset directory does not exist: " + root_.string());
            return files;
        }

        auto collect = [&files](const std::filesystem::directory_entry& entry) {
            if (entry.is_regular_file() && isAudioFile(entry.path())) {
                files.push_back(entry.path());
                LOG_TRACE("Found audio file: " + entry.path().string());
            }
        };

        if (recursive_) {
            for (const auto& entry : std::filesystem::recursive_directory_iterator(
                     root_, std::filesystem::directory_options::skip_permission_denied)) {
                collect(entry);
            }
        } else {
            for (const auto& entry : std::filesystem::directory_iterator(root_)) {
                collect(entry);
            }
        }

        std::sort(files.begin(), files.end());
        LOG_INFO("Found " + std::to_string(files.size()) + " audio files in " + root_.string());

    } catch (const std::exception& e) {
        LOG_ERROR("Scanner error: " + std::string(e.what()));
    }

    return files;
}

std::size_t Scanner::audioFileCount() const noexcept {
    return scan().size();
}

}
