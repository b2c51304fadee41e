/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>

#include "ocrd/config.hpp"
#include "ocrd/types.hpp"

namespace ocrd {

class Registry;
class Workspace;
class Pipeline;

enum class ProcessResult : uint8_t {
    Success,
    Failed,
    NotFound,
    SystemError
};

inline constexpr const char* kNoResultFileError = "processing completed but no result file found";
inline constexpr const char* kEmptyResultError = "result file is empty";
inline constexpr const char* kInvalidResultEncodingError = "result file is not valid UTF-8";

// Drives one job from Queued to a terminal state. Called on worker threads;
// a worker has exclusive write access to the job it is processing.
class Processor {
public:
    Processor(Registry& registry, const Workspace& workspace, Pipeline& pipeline,
              const PipelineOptions& options) noexcept;
    
    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;
    Processor(Processor&&) = delete;
    Processor& operator=(Processor&&) = delete;

    // Never throws; every fault ends as a Failed job.
    [[nodiscard]] ProcessResult process(const JobId& jobId, int workerId) noexcept;

    // First markdown file below {workspace}/markdown in lexicographic order.
    [[nodiscard]] static std::optional<std::filesystem::path> findMarkdown(const std::filesystem::path& workspace);

private:
    Registry& registry_;
    const Workspace& workspace_;
    Pipeline& pipeline_;
    PipelineOptions options_;
    
    [[nodiscard]] bool finalizeSuccess(const JobId& jobId, const std::filesystem::path& markdown);
    [[nodiscard]] bool finalizeFailure(const JobId& jobId, const std::string& error) noexcept;
    [[nodiscard]] static std::string readResult(const std::filesystem::path& path);
};

}
