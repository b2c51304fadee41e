/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "ocrd/logger.hpp"

namespace ocrd {

struct UserRecord {
    std::string username;
    std::string password; // modular-crypt hash or legacy plaintext
};

struct PipelineOptions {
    bool markdown = true;
    bool extractTables = true;
    bool extractFigures = true;
};

struct AppSettings {
    std::string title = "olmOCR API";
    std::string description = "API for OCR processing of PDF and image documents";
    std::string version = "1.0.0";
    std::string host = "0.0.0.0";
    int port = 8000;
    bool debug = false;
    int workers = 2;
    int httpThreads = 8;
};

struct SecuritySettings {
    std::string secretKey = "your_secret_key_here";
    std::string algorithm = "HS256";
    int accessTokenExpireMinutes = 30;
};

struct OcrSettings {
    static constexpr std::size_t kMaxQueueCapacity = 1000000;

    std::filesystem::path workDir = "./olmocr_workdir";
    std::vector<std::string> command = {"python", "-m", "olmocr.pipeline"};
    PipelineOptions options;
    std::size_t queueCapacity = 256;
    int timeoutSeconds = 0; // 0 = wait forever
};

struct UploadSettings {
    // 1 TiB; keeps maxBytes() and the multipart allowance well inside size_t
    static constexpr std::size_t kMaxFileSizeMb = 1024 * 1024;

    std::vector<std::string> allowedExtensions = {".pdf", ".png", ".jpg", ".jpeg"};
    std::size_t maxFileSizeMb = 50;

    [[nodiscard]] std::size_t maxBytes() const noexcept { return maxFileSizeMb * 1024 * 1024; }
};

struct LoggingSettings {
    LogLevel level = LogLevel::INFO;
    std::string file = "olmocr_api.log";
};

// Returns the value of an environment variable, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

[[nodiscard]] EnvLookup processEnvironment();

// Resolved, validated configuration. Built once at startup and passed by
// const reference into every component; nothing reads the environment later.
struct Config {
    AppSettings app;
    SecuritySettings security;
    std::vector<UserRecord> users = {{"admin", "secret"}};
    OcrSettings ocr;
    UploadSettings upload;
    LoggingSettings logging;

    // Defaults, then the JSON file (if it exists), then environment overrides.
    // Throws ConfigError on a malformed file or an invalid value.
    [[nodiscard]] static Config load(const std::filesystem::path& file,
                                     const EnvLookup& env = processEnvironment());

    [[nodiscard]] static Config fromJson(const std::string& text);

    void applyEnvironment(const EnvLookup& env);
    void validate();

    [[nodiscard]] bool usesDefaultSecret() const noexcept;
};

}
