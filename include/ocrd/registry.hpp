/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "ocrd/types.hpp"

namespace ocrd {

struct Job {
    JobId id;
    Status status = Status::Queued;
    std::string owner;
    std::filesystem::path sourceFile;
    std::filesystem::path workspace;
    std::string resultText;
    std::filesystem::path resultPath;
    std::string error;
    std::chrono::system_clock::time_point createdAt;
};

// In-memory job table shared by the request threads and the worker pool.
//
// The map itself is guarded by a shared mutex that is only taken exclusively
// to insert or erase. Each entry carries its own mutex, so updating one job
// never blocks readers or writers of another. Readers always receive a copy.
class Registry final {
public:
    Registry() = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // False if a job with the same id already exists.
    [[nodiscard]] bool insert(Job job);
    [[nodiscard]] std::optional<Job> get(const JobId& id) const;
    [[nodiscard]] bool contains(const JobId& id) const;

    // Removes a job that never left Queued (dispatch rollback).
    [[nodiscard]] bool erase(const JobId& id);

    // State transitions. Each returns false, leaving the job untouched, when
    // the job is unknown or not in the required source state.
    [[nodiscard]] bool beginProcessing(const JobId& id);
    [[nodiscard]] bool complete(const JobId& id, std::string text, const std::filesystem::path& resultPath);
    [[nodiscard]] bool fail(const JobId& id, std::string error);

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t count(Status status) const;

private:
    struct Entry {
        mutable std::mutex mutex;
        Job job;
    };

    [[nodiscard]] std::shared_ptr<Entry> find(const JobId& id) const;

    mutable std::shared_mutex mapMutex_;
    std::unordered_map<JobId, std::shared_ptr<Entry>> entries_;
};

}
