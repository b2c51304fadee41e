/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "ocrd/types.hpp"

namespace ocrd {

using JobHandler = std::function<void(const JobId&, int workerId)>;

// Fixed set of worker threads draining a bounded FIFO of job ids.
class Pool {
public:
    Pool(int workers, std::size_t capacity) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(JobHandler handler);
    void stop() noexcept;

    // False when the pool is stopped or the queue is full.
    [[nodiscard]] bool submit(const JobId& jobId) noexcept;
    
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] int workerCount() const noexcept { return workers_; }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    void workerLoop(int workerId);

    // Blocks until a job is available. False once the pool is shutting down.
    [[nodiscard]] bool takeNext(JobId& jobId);
    void runJob(const JobId& jobId, int workerId) noexcept;
    
    int workers_;
    std::size_t capacity_;
    JobHandler handler_;
    
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    
    mutable std::mutex queueMutex_;
    std::condition_variable jobAvailable_;
    std::queue<JobId> jobQueue_;
    
    std::vector<std::thread> workerThreads_;
};

}
