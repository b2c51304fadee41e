/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <optional>
#include <string>

#include "ocrd/config.hpp"

namespace ocrd {

struct TokenCheck {
    bool ok = false;
    std::string subject;
    std::string reason;
    explicit operator bool() const noexcept { return ok; }
};

// HMAC-signed JWT bearer tokens (HS256/HS384/HS512) built on jwt-cpp.
class TokenService final {
public:
    static constexpr std::chrono::minutes kDefaultTtl{15};

    explicit TokenService(const SecuritySettings& settings);

    [[nodiscard]] std::string issue(const std::string& subject,
                                    std::optional<std::chrono::seconds> ttl = std::nullopt) const;
    [[nodiscard]] TokenCheck validate(const std::string& token) const;

    [[nodiscard]] std::chrono::minutes configuredTtl() const noexcept { return configuredTtl_; }

    // Hex encoded random secret suitable for security.secret_key.
    [[nodiscard]] static std::string generateSecret(std::size_t bytes = 32);

private:
    std::string secret_;
    std::string algorithm_;
    std::chrono::minutes configuredTtl_;
};

}
