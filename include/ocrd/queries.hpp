/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#pragma once
#include <string>

#include "ocrd/errors.hpp"
#include "ocrd/registry.hpp"
#include "ocrd/types.hpp"

namespace ocrd {

struct Lookup {
    bool ok = false;
    ErrorKind error = ErrorKind::None;
    std::string message;
    Job job; // snapshot, valid when ok
    explicit operator bool() const noexcept { return ok; }
};

// Read-only views over the registry with single-owner enforcement.
class Queries final {
public:
    explicit Queries(const Registry& registry) noexcept;

    Queries(const Queries&) = delete;
    Queries& operator=(const Queries&) = delete;

    [[nodiscard]] Lookup status(const JobId& id, const std::string& caller) const;
    [[nodiscard]] Lookup result(const JobId& id, const std::string& caller) const;

private:
    const Registry& registry_;

    [[nodiscard]] Lookup owned(const JobId& id, const std::string& caller) const;
};

}
