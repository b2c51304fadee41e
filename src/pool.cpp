/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "ocrd/pool.hpp"
#include "ocrd/logger.hpp"
#include <exception>
#include <string>

namespace ocrd {

Pool::Pool(int workers, std::size_t capacity) noexcept
    : workers_(workers), capacity_(capacity) {
    LOG_DEBUG("Pool created: " + std::to_string(workers) + " workers, queue capacity " +
              std::to_string(capacity));
}

Pool::~Pool() {
    stop();
}

bool Pool::start(JobHandler handler) {
    if (!handler) {
        LOG_ERROR("Pool cannot start without a job handler");
        return false;
    }
    if (running_.exchange(true)) {
        LOG_WARN("Pool is already running");
        return false;
    }

    handler_ = std::move(handler);
    shutdown_.store(false);

    try {
        workerThreads_.reserve(static_cast<std::size_t>(workers_));
        for (int id = 0; id < workers_; ++id) {
            workerThreads_.emplace_back([this, id] { workerLoop(id); });
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Could not spawn worker threads: " + std::string(e.what()));
        stop();
        return false;
    }

    LOG_INFO("Pool started: " + std::to_string(workers_) + " workers");
    return true;
}

void Pool::stop() noexcept {
    if (!running_.load() && workerThreads_.empty()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    jobAvailable_.notify_all();

    // a worker finishes the job in hand before it notices the shutdown
    for (auto& worker : workerThreads_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workerThreads_.clear();

    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        dropped = jobQueue_.size();
        std::queue<JobId>().swap(jobQueue_);
    }
    if (dropped > 0) {
        LOG_WARN("Pool stopped with " + std::to_string(dropped) + " queued job(s) never started");
    } else {
        LOG_INFO("Pool stopped");
    }
}

bool Pool::submit(const JobId& jobId) noexcept {
    try {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (shutdown_.load() || !running_.load()) {
            LOG_WARN("Pool is not running, refusing job " + jobId);
            return false;
        }
        if (jobQueue_.size() >= capacity_) {
            LOG_WARN("Job queue is full (" + std::to_string(capacity_) + "), refusing job " + jobId);
            return false;
        }
        jobQueue_.push(jobId);
        std::size_t depth = jobQueue_.size();
        lock.unlock();

        jobAvailable_.notify_one();
        LOG_DEBUG("Queued job " + jobId + " (depth " + std::to_string(depth) + ")");
        return true;
    } catch (...) {
        LOG_ERROR("Could not queue job " + jobId);
        return false;
    }
}

std::size_t Pool::queueSize() const noexcept {
    try {
        std::lock_guard<std::mutex> lock(queueMutex_);
        return jobQueue_.size();
    } catch (...) {
        return 0;
    }
}

bool Pool::takeNext(JobId& jobId) {
    std::unique_lock<std::mutex> lock(queueMutex_);
    jobAvailable_.wait(lock, [this] { return shutdown_.load() || !jobQueue_.empty(); });
    if (shutdown_.load()) {
        return false;
    }
    jobId = std::move(jobQueue_.front());
    jobQueue_.pop();
    return true;
}

void Pool::runJob(const JobId& jobId, int workerId) noexcept {
    try {
        handler_(jobId, workerId);
    } catch (const std::exception& e) {
        LOG_ERROR("Handler threw for job " + jobId + ": " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR("Handler threw a non-standard exception for job " + jobId);
    }
}

void Pool::workerLoop(int workerId) {
    setThreadName("Worker-" + std::to_string(workerId));
    LOG_DEBUG("Worker ready");

    try {
        JobId jobId;
        while (takeNext(jobId)) {
            LOG_DEBUG("Picked up job " + jobId);
            runJob(jobId, workerId);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Worker loop aborted: " + std::string(e.what()));
    }

    LOG_DEBUG("Worker exiting");
}

}
