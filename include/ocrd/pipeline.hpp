/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "ocrd/config.hpp"

namespace ocrd {

struct PipelineResult {
    bool ok = false;
    int exitCode = -1;
    std::string output;
    std::string error;
};

// The external OCR step. Implementations write markdown below
// {workspace}/markdown and report success or a diagnostic.
class Pipeline {
public:
    virtual ~Pipeline() = default;

    [[nodiscard]] virtual PipelineResult run(const std::filesystem::path& workspace,
                                             const std::filesystem::path& source,
                                             const PipelineOptions& options) = 0;
};

// Runs the configured command as a child process:
//   <command...> <workspace> [--markdown] [--extract_tables] [--extract_figures] --pdfs <source>
class ProcessPipeline final : public Pipeline {
public:
    ProcessPipeline(std::vector<std::string> command, std::chrono::seconds timeout);

    ProcessPipeline(const ProcessPipeline&) = delete;
    ProcessPipeline& operator=(const ProcessPipeline&) = delete;

    [[nodiscard]] PipelineResult run(const std::filesystem::path& workspace,
                                     const std::filesystem::path& source,
                                     const PipelineOptions& options) override;

    [[nodiscard]] std::vector<std::string> buildArguments(const std::filesystem::path& workspace,
                                                          const std::filesystem::path& source,
                                                          const PipelineOptions& options) const;

private:
    std::vector<std::string> command_;
    std::chrono::seconds timeout_;
};

}
