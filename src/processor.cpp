/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "ocrd/processor.hpp"
#include "ocrd/logger.hpp"
#include "ocrd/pipeline.hpp"
#include "ocrd/registry.hpp"
#include "ocrd/workspace.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace ocrd {

namespace {

std::string elapsedSince(std::chrono::steady_clock::time_point start) {
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << elapsed << "s";
    return ss.str();
}

}

Processor::Processor(Registry& registry, const Workspace& workspace, Pipeline& pipeline,
                     const PipelineOptions& options) noexcept
    : registry_(registry), workspace_(workspace), pipeline_(pipeline), options_(options) {
}

ProcessResult Processor::process(const JobId& jobId, int workerId) noexcept {
    try {
        // Step 1: claim the job
        if (!registry_.beginProcessing(jobId)) {
            LOG_WARN("Worker-" + std::to_string(workerId) + " could not claim job: " + jobId);
            return ProcessResult::NotFound;
        }
        auto job = registry_.get(jobId);
        if (!job) {
            LOG_ERROR("Job vanished after claim: " + jobId);
            return ProcessResult::NotFound;
        }

        auto startTime = std::chrono::steady_clock::now();
        LOG_INFO("Processing job " + jobId + ", source: " + job->sourceFile.string());

        // Step 2: per-job workspace, created on first use
        auto workspacePath = workspace_.allocate(jobId);
        std::error_code ec;
        std::filesystem::create_directories(workspacePath, ec);
        if (ec) {
            (void)finalizeFailure(jobId, "cannot create workspace " + workspacePath.string() + ": " + ec.message());
            return ProcessResult::SystemError;
        }

        // Step 3: run the external pipeline
        PipelineResult result = pipeline_.run(workspacePath, job->sourceFile, options_);
        if (!result.ok) {
            LOG_ERROR("Job " + jobId + " failed after " + elapsedSince(startTime) + ": " + result.error);
            (void)finalizeFailure(jobId, result.error.empty() ? "pipeline failed" : result.error);
            return ProcessResult::Failed;
        }

        // Step 4: locate the artifact
        auto markdown = findMarkdown(workspacePath);
        if (!markdown) {
            LOG_ERROR("Job " + jobId + " finished but produced no markdown");
            (void)finalizeFailure(jobId, kNoResultFileError);
            return ProcessResult::Failed;
        }

        if (!finalizeSuccess(jobId, *markdown)) {
            return ProcessResult::Failed;
        }
        LOG_INFO("JOB COMPLETED: " + jobId + " in " + elapsedSince(startTime) + " -> " + markdown->string());
        return ProcessResult::Success;

    } catch (const std::exception& e) {
        LOG_ERROR("Exception processing job " + jobId + ": " + std::string(e.what()));
        (void)finalizeFailure(jobId, e.what());
        return ProcessResult::SystemError;
    } catch (...) {
        LOG_ERROR("Unknown exception processing job: " + jobId);
        (void)finalizeFailure(jobId, "unknown internal processing error");
        return ProcessResult::SystemError;
    }
}

std::optional<std::filesystem::path> Processor::findMarkdown(const std::filesystem::path& workspace) {
    auto markdownDir = workspace / "markdown";
    std::error_code ec;
    if (!std::filesystem::is_directory(markdownDir, ec)) {
        return std::nullopt;
    }

    std::vector<std::filesystem::path> candidates;
    for (auto it = std::filesystem::recursive_directory_iterator(markdownDir, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().extension() == ".md") {
            candidates.push_back(it->path());
        }
    }
    if (ec) {
        throw std::runtime_error("cannot scan " + markdownDir.string() + ": " + ec.message());
    }
    if (candidates.empty()) {
        return std::nullopt;
    }

    std::sort(candidates.begin(), candidates.end());
    if (candidates.size() > 1) {
        LOG_DEBUG("Multiple markdown results in " + markdownDir.string() + ", using " + candidates.front().string());
    }
    return candidates.front();
}

bool Processor::finalizeSuccess(const JobId& jobId, const std::filesystem::path& markdown) {
    std::string text = readResult(markdown);
    if (text.empty()) {
        LOG_ERROR("Result file is empty for job " + jobId + ": " + markdown.string());
        (void)finalizeFailure(jobId, kEmptyResultError);
        return false;
    }
    if (!isValidUtf8(text)) {
        LOG_ERROR("Result file is not valid UTF-8 for job " + jobId + ": " + markdown.string());
        (void)finalizeFailure(jobId, kInvalidResultEncodingError);
        return false;
    }

    if (!registry_.complete(jobId, std::move(text), markdown)) {
        LOG_ERROR("Failed to record completion for job: " + jobId);
        return false;
    }
    return true;
}

bool Processor::finalizeFailure(const JobId& jobId, const std::string& error) noexcept {
    try {
        // stderr and exception text are stored verbatim apart from bad bytes
        if (!registry_.fail(jobId, toValidUtf8(error))) {
            LOG_ERROR("Failed to record failure for job: " + jobId);
            return false;
        }
        LOG_DEBUG("Job moved to failed: " + jobId);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to finalize failure for job " + jobId + ": " + std::string(e.what()));
        return false;
    } catch (...) {
        LOG_ERROR("Unknown error finalizing failure for job: " + jobId);
        return false;
    }
}

std::string Processor::readResult(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("cannot open result file " + path.string());
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw std::runtime_error("error reading result file " + path.string());
    }
    return content;
}

}
