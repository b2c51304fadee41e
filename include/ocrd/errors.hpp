/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace ocrd {

enum class ErrorKind : uint8_t {
    None = 0,
    Validation,
    Authentication,
    Forbidden,
    NotFound,
    PayloadTooLarge,
    InvalidState,
    Unavailable,
    ProcessingFault,
    Internal
};

// HTTP status code a request-path error maps to.
[[nodiscard]] int httpStatus(ErrorKind kind) noexcept;

// Machine-stable reason string sent to clients ("validation_error", ...).
[[nodiscard]] const char* reasonOf(ErrorKind kind) noexcept;

// Raised while resolving configuration or preparing the working directory.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

}
