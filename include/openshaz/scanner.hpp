/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <vector>

namespace openshaz {

// Lists audio files in a dataset directory.
class Scanner {
public:
    explicit Scanner(const std::filesystem::path& root, bool recursive = true) noexcept;

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;
    Scanner(Scanner&&) noexcept = default;
    Scanner& operator=(Scanner&&) noexcept = default;

    // Sorted by path so repeated scans index in the same order.
    [[nodiscard]] std::vector<std::filesystem::path> scan() const noexcept;
    [[nodiscard]] std::size_t audioFileCount() const noexcept;

    [[nodiscard]] static bool isAudioFile(const std::filesystem::path& path) noexcept;

private:
    std::filesystem::path root_;
    bool recursive_;
};

}
