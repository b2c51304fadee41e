/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "ocrd/credentials.hpp"
#include "ocrd/logger.hpp"
#include <crypt.h>
#include <openssl/crypto.h>
#include <array>
#include <cstring>
#include <memory>
#include <stdexcept>

namespace ocrd {

namespace {

bool constantTimeEquals(const std::string& a, const std::string& b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

}

CredentialStore::CredentialStore(const std::vector<UserRecord>& users) {
    for (const auto& user : users) {
        if (!users_.emplace(user.username, user.password).second) {
            LOG_WARN("Duplicate user entry ignored: " + user.username);
            continue;
        }
        if (!isHash(user.password)) {
            LOG_WARN("User " + user.username + " has a plaintext password; store a hash instead");
        }
    }
}

bool CredentialStore::verify(const std::string& username, const std::string& password) const {
    auto it = users_.find(username);
    if (it == users_.end()) {
        return false;
    }
    const std::string& stored = it->second;

    if (!isHash(stored)) {
        return constantTimeEquals(password, stored);
    }

    auto data = std::make_unique<crypt_data>();
    std::memset(data.get(), 0, sizeof(crypt_data));
    const char* computed = crypt_r(password.c_str(), stored.c_str(), data.get());
    // libxcrypt signals failure with a string starting with '*'
    if (!computed || computed[0] == '*') {
        LOG_WARN("Unusable password hash for user " + username);
        return false;
    }
    return constantTimeEquals(computed, stored);
}

bool CredentialStore::contains(const std::string& username) const noexcept {
    return users_.find(username) != users_.end();
}

bool CredentialStore::isHash(const std::string& stored) noexcept {
    static const std::array<const char*, 6> prefixes = {"$2a$", "$2b$", "$2y$", "$5$", "$6$", "$y$"};
    for (const char* prefix : prefixes) {
        if (stored.rfind(prefix, 0) == 0) {
            return true;
        }
    }
    return false;
}

std::string CredentialStore::hash(const std::string& password) {
    char setting[CRYPT_GENSALT_OUTPUT_SIZE];
    if (!crypt_gensalt_rn("$2b$", 12, nullptr, 0, setting, sizeof(setting))) {
        throw std::runtime_error("crypt_gensalt_rn failed");
    }

    auto data = std::make_unique<crypt_data>();
    std::memset(data.get(), 0, sizeof(crypt_data));
    const char* computed = crypt_r(password.c_str(), setting, data.get());
    if (!computed || computed[0] == '*') {
        throw std::runtime_error("crypt_r failed");
    }
    return computed;
}

}
