/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "ocrd/config.hpp"
#include "ocrd/errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace ocrd {

using json = nlohmann::json;

namespace {

constexpr const char* kDefaultSecret = "your_secret_key_here";

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

int envInt(const EnvLookup& env, const char* name, int defv) {
    auto val = env(name);
    if (!val || val->empty()) {
        return defv;
    }
    try {
        std::size_t used = 0;
        int parsed = std::stoi(*val, &used);
        if (used != val->size()) {
            throw ConfigError(std::string(name) + " is not an integer: " + *val);
        }
        return parsed;
    } catch (const ConfigError&) {
        throw;
    } catch (const std::exception&) {
        throw ConfigError(std::string(name) + " is not an integer: " + *val);
    }
}

// Reads a count as signed so that -1 is rejected instead of wrapping.
std::size_t sizeField(const json& j, const char* key, std::size_t current, std::size_t max) {
    if (!j.contains(key)) {
        return current;
    }
    auto value = j.at(key).get<long long>();
    if (value < 1 || static_cast<unsigned long long>(value) > max) {
        throw ConfigError(std::string(key) + " must be between 1 and " + std::to_string(max) +
                          ", got " + std::to_string(value));
    }
    return static_cast<std::size_t>(value);
}

std::vector<std::string> splitWords(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream in(text);
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

LogLevel levelFrom(const std::string& text) {
    auto level = Logger::parseLevel(text);
    if (!level) {
        throw ConfigError("unknown log level: " + text);
    }
    return *level;
}

void readApp(const json& j, AppSettings& app) {
    app.title = j.value("title", app.title);
    app.description = j.value("description", app.description);
    app.version = j.value("version", app.version);
    app.host = j.value("host", app.host);
    app.port = j.value("port", app.port);
    app.debug = j.value("debug", app.debug);
    app.workers = j.value("workers", app.workers);
    app.httpThreads = j.value("http_threads", app.httpThreads);
}

void readSecurity(const json& j, SecuritySettings& security) {
    security.secretKey = j.value("secret_key", security.secretKey);
    security.algorithm = j.value("algorithm", security.algorithm);
    security.accessTokenExpireMinutes =
        j.value("access_token_expire_minutes", security.accessTokenExpireMinutes);
}

std::vector<UserRecord> readUsers(const json& j) {
    if (!j.is_array()) {
        throw ConfigError("\"users\" must be an array");
    }
    std::vector<UserRecord> users;
    for (const auto& entry : j) {
        UserRecord user;
        user.username = entry.at("username").get<std::string>();
        if (entry.contains("hashed_password")) {
            user.password = entry.at("hashed_password").get<std::string>();
        } else {
            user.password = entry.at("password").get<std::string>();
        }
        users.push_back(std::move(user));
    }
    return users;
}

void readOcr(const json& j, OcrSettings& ocr) {
    if (j.contains("work_dir")) {
        ocr.workDir = j.at("work_dir").get<std::string>();
    }
    if (j.contains("command")) {
        ocr.command = j.at("command").get<std::vector<std::string>>();
    }
    ocr.queueCapacity = sizeField(j, "queue_capacity", ocr.queueCapacity, OcrSettings::kMaxQueueCapacity);
    ocr.timeoutSeconds = j.value("timeout_seconds", ocr.timeoutSeconds);
    if (j.contains("pipeline_options")) {
        const auto& opts = j.at("pipeline_options");
        ocr.options.markdown = opts.value("markdown", ocr.options.markdown);
        ocr.options.extractTables = opts.value("extract_tables", ocr.options.extractTables);
        ocr.options.extractFigures = opts.value("extract_figures", ocr.options.extractFigures);
    }
}

void readUpload(const json& j, UploadSettings& upload) {
    if (j.contains("allowed_extensions")) {
        upload.allowedExtensions = j.at("allowed_extensions").get<std::vector<std::string>>();
    }
    upload.maxFileSizeMb = sizeField(j, "max_file_size_mb", upload.maxFileSizeMb, UploadSettings::kMaxFileSizeMb);
}

void readLogging(const json& j, LoggingSettings& logging) {
    if (j.contains("level")) {
        logging.level = levelFrom(j.at("level").get<std::string>());
    }
    logging.file = j.value("file", logging.file);
}

}

EnvLookup processEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* val = std::getenv(name.c_str());
        if (!val) {
            return std::nullopt;
        }
        return std::string(val);
    };
}

Config Config::fromJson(const std::string& text) {
    Config config;
    try {
        json root = json::parse(text);
        if (!root.is_object()) {
            throw ConfigError("configuration root must be an object");
        }
        if (root.contains("app")) readApp(root.at("app"), config.app);
        if (root.contains("security")) readSecurity(root.at("security"), config.security);
        if (root.contains("users")) config.users = readUsers(root.at("users"));
        if (root.contains("olmocr")) readOcr(root.at("olmocr"), config.ocr);
        if (root.contains("upload")) readUpload(root.at("upload"), config.upload);
        if (root.contains("logging")) readLogging(root.at("logging"), config.logging);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }
    return config;
}

Config Config::load(const std::filesystem::path& file, const EnvLookup& env) {
    Config config;

    std::error_code ec;
    if (!file.empty() && std::filesystem::exists(file, ec)) {
        std::ifstream in(file, std::ios::binary);
        if (!in) {
            throw ConfigError("cannot read configuration file: " + file.string());
        }
        std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        config = fromJson(text);
        LOG_DEBUG("Configuration loaded from " + file.string());
    } else {
        LOG_DEBUG("No configuration file at " + file.string() + ", using defaults");
    }

    config.applyEnvironment(env);
    config.validate();
    return config;
}

void Config::applyEnvironment(const EnvLookup& env) {
    if (auto v = env("APP_HOST"); v && !v->empty()) app.host = *v;
    app.port = envInt(env, "APP_PORT", app.port);
    if (auto v = env("DEBUG"); v && !v->empty()) app.debug = toLowerCopy(*v) == "true";
    app.workers = envInt(env, "WORKERS", app.workers);

    if (auto v = env("SECRET_KEY"); v && !v->empty()) security.secretKey = *v;
    security.accessTokenExpireMinutes =
        envInt(env, "ACCESS_TOKEN_EXPIRE_MINUTES", security.accessTokenExpireMinutes);

    auto adminName = env("ADMIN_USERNAME");
    auto adminPassword = env("ADMIN_PASSWORD");
    if (adminName && !adminName->empty() && adminPassword && !adminPassword->empty()) {
        auto it = std::find_if(users.begin(), users.end(),
            [](const UserRecord& u) { return u.username == "admin"; });
        if (it != users.end()) {
            it->username = *adminName;
            it->password = *adminPassword;
        } else {
            users.push_back({*adminName, *adminPassword});
        }
    }

    if (auto v = env("WORK_DIR"); v && !v->empty()) ocr.workDir = *v;
    if (auto v = env("OCR_COMMAND"); v && !v->empty()) ocr.command = splitWords(*v);
    ocr.timeoutSeconds = envInt(env, "OCR_TIMEOUT_SECONDS", ocr.timeoutSeconds);

    if (auto v = env("LOG_LEVEL"); v && !v->empty()) logging.level = levelFrom(*v);
    if (auto v = env("LOG_FILE")) logging.file = *v;
}

void Config::validate() {
    if (app.port < 1 || app.port > 65535) {
        throw ConfigError("port out of range: " + std::to_string(app.port));
    }
    if (app.workers < 1) {
        throw ConfigError("workers must be at least 1");
    }
    if (app.httpThreads < 1) {
        throw ConfigError("http_threads must be at least 1");
    }
    if (security.secretKey.empty()) {
        throw ConfigError("secret_key must not be empty");
    }
    if (security.algorithm != "HS256" && security.algorithm != "HS384" &&
        security.algorithm != "HS512") {
        throw ConfigError("unsupported token algorithm: " + security.algorithm);
    }
    if (security.accessTokenExpireMinutes < 1) {
        throw ConfigError("access_token_expire_minutes must be at least 1");
    }
    if (ocr.workDir.empty()) {
        throw ConfigError("work_dir must not be empty");
    }
    if (ocr.command.empty()) {
        throw ConfigError("pipeline command must not be empty");
    }
    if (ocr.queueCapacity < 1 || ocr.queueCapacity > OcrSettings::kMaxQueueCapacity) {
        throw ConfigError("queue_capacity must be between 1 and " + std::to_string(OcrSettings::kMaxQueueCapacity));
    }
    if (ocr.timeoutSeconds < 0) {
        throw ConfigError("timeout_seconds must not be negative");
    }
    if (upload.maxFileSizeMb < 1 || upload.maxFileSizeMb > UploadSettings::kMaxFileSizeMb) {
        throw ConfigError("max_file_size_mb must be between 1 and " + std::to_string(UploadSettings::kMaxFileSizeMb));
    }
    if (upload.allowedExtensions.empty()) {
        throw ConfigError("allowed_extensions must not be empty");
    }
    for (auto& ext : upload.allowedExtensions) {
        ext = toLowerCopy(ext);
        if (ext.empty() || ext == ".") {
            throw ConfigError("empty entry in allowed_extensions");
        }
        if (ext.front() != '.') {
            ext.insert(ext.begin(), '.');
        }
    }
    for (const auto& user : users) {
        if (user.username.empty()) {
            throw ConfigError("user entry without a username");
        }
    }
}

bool Config::usesDefaultSecret() const noexcept {
    return security.secretKey == kDefaultSecret;
}

}
