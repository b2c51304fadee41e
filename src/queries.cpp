/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "ocrd/queries.hpp"
#include "ocrd/logger.hpp"

namespace ocrd {

namespace {

Lookup refuse(ErrorKind kind, std::string message) {
    Lookup lookup;
    lookup.error = kind;
    lookup.message = std::move(message);
    return lookup;
}

}

Queries::Queries(const Registry& registry) noexcept
    : registry_(registry) {
}

Lookup Queries::status(const JobId& id, const std::string& caller) const {
    return owned(id, caller);
}

Lookup Queries::result(const JobId& id, const std::string& caller) const {
    Lookup lookup = owned(id, caller);
    if (!lookup) {
        return lookup;
    }

    if (lookup.job.status != Status::Completed) {
        return refuse(ErrorKind::InvalidState,
                      std::string("job is not completed, current status: ") + toString(lookup.job.status));
    }
    if (lookup.job.resultText.empty()) {
        LOG_ERROR("Job " + id + " is completed but has no result text");
        return refuse(ErrorKind::NotFound, "result not found");
    }
    return lookup;
}

Lookup Queries::owned(const JobId& id, const std::string& caller) const {
    auto job = registry_.get(id);
    if (!job) {
        LOG_WARN("User " + caller + " queried unknown job " + id);
        return refuse(ErrorKind::NotFound, "job not found");
    }
    if (!job->owner.empty() && job->owner != caller) {
        LOG_WARN("User " + caller + " tried to access job " + id + " owned by another user");
        return refuse(ErrorKind::Forbidden, "not allowed to access this job");
    }

    Lookup lookup;
    lookup.ok = true;
    lookup.job = std::move(*job);
    return lookup;
}

}
