/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

#include "ocrd/types.hpp"

namespace ocrd {

// Owns the root working directory. Layout:
//   {root}/{jobId}_{filename}   persisted upload
//   {root}/{jobId}/             per-job workspace, created by the processor
//   {root}/.staging/            in-flight uploads
class Workspace final {
public:
    explicit Workspace(const std::filesystem::path& root);

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    // Creates the root and staging directories and probes write access.
    // Throws ConfigError when the root is unusable.
    void ensureRoot();

    [[nodiscard]] std::filesystem::path allocate(const JobId& jobId) const;
    [[nodiscard]] std::filesystem::path sourcePath(const JobId& jobId, const std::string& filename) const;
    [[nodiscard]] std::filesystem::path stagingPath() const;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
    std::filesystem::path staging_;
};

}
