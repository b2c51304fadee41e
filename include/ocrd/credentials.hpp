/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <unordered_map>
#include <vector>

#include "ocrd/config.hpp"

namespace ocrd {

// Configured users, immutable after construction.
class CredentialStore final {
public:
    explicit CredentialStore(const std::vector<UserRecord>& users);

    // Hash-aware verification. Stored values that are not a recognised
    // modular-crypt hash are compared as legacy plaintext.
    [[nodiscard]] bool verify(const std::string& username, const std::string& password) const;
    [[nodiscard]] bool contains(const std::string& username) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept { return users_.size(); }

    [[nodiscard]] static bool isHash(const std::string& stored) noexcept;

    // bcrypt ($2b$, cost 12). Throws std::runtime_error if the system crypt
    // library cannot produce a salt.
    [[nodiscard]] static std::string hash(const std::string& password);

private:
    std::unordered_map<std::string, std::string> users_;
};

}
