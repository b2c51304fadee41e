/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "ocrd/workspace.hpp"
#include "ocrd/errors.hpp"
#include "ocrd/logger.hpp"
#include <atomic>
#include <chrono>
#include <fstream>
#include <unistd.h>

namespace ocrd {

Workspace::Workspace(const std::filesystem::path& root)
    : root_(std::filesystem::absolute(root).lexically_normal()),
      staging_(root_ / ".staging") {
}

void Workspace::ensureRoot() {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        throw ConfigError("cannot create working directory " + root_.string() + ": " + ec.message());
    }
    if (!std::filesystem::is_directory(root_, ec)) {
        throw ConfigError("working directory is not a directory: " + root_.string());
    }

    auto probe = root_ / (".write_probe_" + std::to_string(getpid()));
    {
        std::ofstream file(probe, std::ios::binary);
        if (!file) {
            throw ConfigError("working directory is not writable: " + root_.string());
        }
        file << "probe";
        file.flush();
        if (!file.good()) {
            file.close();
            std::filesystem::remove(probe, ec);
            throw ConfigError("working directory is not writable: " + root_.string());
        }
    }
    if (!std::filesystem::remove(probe, ec) || ec) {
        throw ConfigError("cannot remove probe file in " + root_.string());
    }

    std::filesystem::create_directories(staging_, ec);
    if (ec) {
        throw ConfigError("cannot create staging directory " + staging_.string() + ": " + ec.message());
    }

    LOG_DEBUG("Working directory ready: " + root_.string());
}

std::filesystem::path Workspace::allocate(const JobId& jobId) const {
    return root_ / jobId;
}

std::filesystem::path Workspace::sourcePath(const JobId& jobId, const std::string& filename) const {
    return root_ / (jobId + "_" + filename);
}

std::filesystem::path Workspace::stagingPath() const {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
    return staging_ / (std::to_string(now) + "_" + std::to_string(getpid()) + "_" +
                       std::to_string(counter.fetch_add(1)) + ".part");
}

}
