/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "ocrd/server.hpp"
#include "ocrd/logger.hpp"
#include "ocrd/pipeline.hpp"
#include "ocrd/pool.hpp"
#include "ocrd/processor.hpp"

namespace ocrd {

// Note: Signal handling is done by the CLI (ocrd.cpp), not by Server class

Server::Server(const Config& config, std::unique_ptr<Pipeline> pipeline)
    : config_(config),
      workspace_(config_.ocr.workDir),
      credentials_(config_.users),
      tokens_(config_.security),
      pipeline_(std::move(pipeline)) {
    if (!pipeline_) {
        pipeline_ = std::make_unique<ProcessPipeline>(config_.ocr.command,
                                                      std::chrono::seconds(config_.ocr.timeoutSeconds));
    }
    pool_ = std::make_unique<Pool>(config_.app.workers, config_.ocr.queueCapacity);
    processor_ = std::make_unique<Processor>(registry_, workspace_, *pipeline_, config_.ocr.options);
    intake_ = std::make_unique<Intake>(config_.upload, workspace_, registry_,
                                       [this](const JobId& jobId) { return pool_->submit(jobId); });
    queries_ = std::make_unique<Queries>(registry_);

    LOG_DEBUG("Server created - workspace: " + workspace_.root().string() +
              ", workers: " + std::to_string(config_.app.workers));
}

Server::~Server() {
    shutdown();
}

bool Server::start() {
    if (running_.load()) {
        LOG_WARN("Server already running");
        return false;
    }

    LOG_INFO("Starting " + config_.app.title + " " + config_.app.version + "...");

    try {
        workspace_.ensureRoot();

        if (config_.usesDefaultSecret()) {
            LOG_WARN("security.secret_key is the built-in default; set SECRET_KEY for real deployments");
        }

        LOG_DEBUG("========================================");
        LOG_DEBUG("Working directory: " + workspace_.root().string());
        LOG_DEBUG("Workers: " + std::to_string(config_.app.workers));
        LOG_DEBUG("Queue capacity: " + std::to_string(config_.ocr.queueCapacity));
        LOG_DEBUG("Max upload: " + std::to_string(config_.upload.maxFileSizeMb) + "MB");
        LOG_DEBUG("Users: " + std::to_string(credentials_.size()));
        LOG_DEBUG("========================================");

        if (!pool_->start([this](const JobId& jobId, int workerId) {
            (void)processor_->process(jobId, workerId);
        })) {
            LOG_ERROR("Failed to start worker pool");
            return false;
        }

        running_.store(true);
        LOG_INFO("Working directory: " + workspace_.root().string());
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start server: " + std::string(e.what()));
        return false;
    }
}

void Server::shutdown() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("Shutting down server...");
    running_.store(false);

    if (pool_) {
        pool_->stop();
    }

    std::size_t unfinished = registry_.count(Status::Queued) + registry_.count(Status::Processing);
    if (unfinished > 0) {
        LOG_WARN(std::to_string(unfinished) + " job(s) were not finished; job state is not persisted");
    }
    LOG_INFO("Server shutdown complete");
}

}
