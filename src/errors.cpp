/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "ocrd/errors.hpp"

namespace ocrd {

int httpStatus(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None:            return 200;
        case ErrorKind::Validation:      return 400;
        case ErrorKind::Authentication:  return 401;
        case ErrorKind::Forbidden:       return 403;
        case ErrorKind::NotFound:        return 404;
        case ErrorKind::PayloadTooLarge: return 413;
        case ErrorKind::InvalidState:    return 400;
        case ErrorKind::Unavailable:     return 503;
        case ErrorKind::ProcessingFault: return 500;
        case ErrorKind::Internal:        return 500;
    }
    return 500;
}

const char* reasonOf(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None:            return "ok";
        case ErrorKind::Validation:      return "validation_error";
        case ErrorKind::Authentication:  return "authentication_error";
        case ErrorKind::Forbidden:       return "forbidden";
        case ErrorKind::NotFound:        return "not_found";
        case ErrorKind::PayloadTooLarge: return "payload_too_large";
        case ErrorKind::InvalidState:    return "invalid_state";
        case ErrorKind::Unavailable:     return "unavailable";
        case ErrorKind::ProcessingFault: return "processing_fault";
        case ErrorKind::Internal:        return "internal_error";
    }
    return "internal_error";
}

}
