/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "ocrd/token.hpp"
#include "ocrd/errors.hpp"
#include <jwt-cpp/jwt.h>
#include <jwt-cpp/traits/nlohmann-json/traits.h>
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace ocrd {

using traits = jwt::traits::nlohmann_json;

namespace {

bool supported(const std::string& algorithm) {
    return algorithm == "HS256" || algorithm == "HS384" || algorithm == "HS512";
}

// Calls fn with the jwt-cpp HMAC algorithm named by the configuration.
template <typename Fn>
auto withAlgorithm(const std::string& name, const std::string& secret, Fn&& fn) {
    if (name == "HS384") return fn(jwt::algorithm::hs384{secret});
    if (name == "HS512") return fn(jwt::algorithm::hs512{secret});
    return fn(jwt::algorithm::hs256{secret});
}

TokenCheck reject(const std::string& reason) {
    TokenCheck check;
    check.reason = reason;
    return check;
}

}

TokenService::TokenService(const SecuritySettings& settings)
    : secret_(settings.secretKey),
      algorithm_(settings.algorithm),
      configuredTtl_(settings.accessTokenExpireMinutes) {
    if (!supported(algorithm_)) {
        throw ConfigError("unsupported token algorithm: " + algorithm_);
    }
}

std::string TokenService::issue(const std::string& subject, std::optional<std::chrono::seconds> ttl) const {
    auto now = std::chrono::system_clock::now();
    auto lifetime = ttl ? *ttl : std::chrono::seconds(kDefaultTtl);

    auto builder = jwt::create<traits>()
        .set_type("JWT")
        .set_subject(subject)
        .set_issued_at(now)
        .set_expires_at(now + lifetime);
    return withAlgorithm(algorithm_, secret_, [&](auto algorithm) { return builder.sign(algorithm); });
}

TokenCheck TokenService::validate(const std::string& token) const {
    std::optional<jwt::decoded_jwt<traits>> decoded;
    try {
        decoded.emplace(jwt::decode<traits>(token));
    } catch (const std::exception&) {
        return reject("malformed token");
    }

    try {
        withAlgorithm(algorithm_, secret_, [&](auto algorithm) {
            jwt::verify<traits>().allow_algorithm(algorithm).verify(*decoded);
        });
    } catch (const jwt::error::signature_verification_exception&) {
        return reject("signature mismatch");
    } catch (const jwt::error::token_verification_exception& e) {
        if (e.code() == jwt::error::token_verification_error::wrong_algorithm) {
            return reject("unexpected signing algorithm");
        }
        if (e.code() == jwt::error::token_verification_error::token_expired) {
            return reject("token expired");
        }
        return reject(e.what());
    } catch (const std::exception&) {
        return reject("malformed token");
    }

    try {
        // jwt-cpp only checks exp when the claim is present
        if (!decoded->has_expires_at()) {
            return reject("token has no expiry");
        }
        if (!decoded->has_subject() || decoded->get_subject().empty()) {
            return reject("token has no subject");
        }

        TokenCheck check;
        check.ok = true;
        check.subject = decoded->get_subject();
        return check;
    } catch (const std::exception&) {
        return reject("malformed token");
    }
}

std::string TokenService::generateSecret(std::size_t bytes) {
    std::vector<unsigned char> buffer(bytes);
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    std::ostringstream hex;
    for (unsigned char b : buffer) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return hex.str();
}

}
