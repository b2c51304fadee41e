/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "ocrd/registry.hpp"
#include "ocrd/logger.hpp"

namespace ocrd {

bool Registry::insert(Job job) {
    auto entry = std::make_shared<Entry>();
    JobId id = job.id;
    entry->job = std::move(job);

    std::unique_lock<std::shared_mutex> lock(mapMutex_);
    bool inserted = entries_.emplace(id, std::move(entry)).second;
    if (!inserted) {
        LOG_ERROR("Duplicate job id rejected: " + id);
    }
    return inserted;
}

std::optional<Job> Registry::get(const JobId& id) const {
    auto entry = find(id);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->job;
}

bool Registry::contains(const JobId& id) const {
    return find(id) != nullptr;
}

bool Registry::erase(const JobId& id) {
    std::unique_lock<std::shared_mutex> lock(mapMutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return false;
    }
    {
        std::lock_guard<std::mutex> entryLock(it->second->mutex);
        if (it->second->job.status != Status::Queued) {
            return false;
        }
    }
    entries_.erase(it);
    return true;
}

bool Registry::beginProcessing(const JobId& id) {
    auto entry = find(id);
    if (!entry) {
        return false;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->job.status != Status::Queued) {
        LOG_WARN("Job " + id + " cannot start from state " + toString(entry->job.status));
        return false;
    }
    entry->job.status = Status::Processing;
    return true;
}

bool Registry::complete(const JobId& id, std::string text, const std::filesystem::path& resultPath) {
    auto entry = find(id);
    if (!entry) {
        return false;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->job.status != Status::Processing) {
        LOG_WARN("Job " + id + " cannot complete from state " + toString(entry->job.status));
        return false;
    }
    entry->job.status = Status::Completed;
    entry->job.resultText = std::move(text);
    entry->job.resultPath = resultPath;
    entry->job.error.clear();
    return true;
}

bool Registry::fail(const JobId& id, std::string error) {
    auto entry = find(id);
    if (!entry) {
        return false;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->job.status != Status::Processing) {
        LOG_WARN("Job " + id + " cannot fail from state " + toString(entry->job.status));
        return false;
    }
    entry->job.status = Status::Failed;
    entry->job.error = error.empty() ? "unknown processing error" : std::move(error);
    entry->job.resultText.clear();
    entry->job.resultPath.clear();
    return true;
}

std::size_t Registry::size() const {
    std::shared_lock<std::shared_mutex> lock(mapMutex_);
    return entries_.size();
}

std::size_t Registry::count(Status status) const {
    std::shared_lock<std::shared_mutex> lock(mapMutex_);
    std::size_t n = 0;
    for (const auto& kv : entries_) {
        std::lock_guard<std::mutex> entryLock(kv.second->mutex);
        if (kv.second->job.status == status) {
            ++n;
        }
    }
    return n;
}

std::shared_ptr<Registry::Entry> Registry::find(const JobId& id) const {
    std::shared_lock<std::shared_mutex> lock(mapMutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second;
}

}
