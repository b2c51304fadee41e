/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "ocrd/logger.hpp"
#include <iostream>
#include <fstream>
#include <cstdlib>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <thread>

namespace ocrd {

namespace {

// Process-wide logging state. One mutex serialises level changes and
// writes so lines from different threads never interleave.
struct Sinks {
    std::mutex mutex;
    std::optional<LogLevel> level; // unset until first use or setLevel()
    std::ofstream file;
};

Sinks& sinks() {
    static Sinks instance;
    return instance;
}

thread_local std::string t_threadName;

std::string currentThreadLabel() {
    if (!t_threadName.empty()) {
        return t_threadName;
    }
    std::ostringstream oss;
    oss << "T" << std::this_thread::get_id();
    return oss.str();
}

// [2025-03-01 10:15:30.123] [INFO ] [Worker-0] message
std::string formatLine(const char* level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream line;
    line << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "."
         << std::setfill('0') << std::setw(3) << millis << "] "
         << "[" << level << "] [" << currentThreadLabel() << "] " << message;
    return line.str();
}

}

void Logger::setLevel(LogLevel level) noexcept {
    auto& s = sinks();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.level = level;
}

LogLevel Logger::level() noexcept {
    auto& s = sinks();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (!s.level) {
        s.level = parseEnvLevel();
    }
    return *s.level;
}

bool Logger::setFile(const std::string& path) noexcept {
    try {
        auto& s = sinks();
        std::lock_guard<std::mutex> lock(s.mutex);
        if (s.file.is_open()) {
            s.file.close();
        }
        if (path.empty()) {
            return true;
        }
        s.file.clear();
        s.file.open(path, std::ios::app);
        return s.file.is_open();
    } catch (...) {
        return false;
    }
}

std::optional<LogLevel> Logger::parseLevel(const std::string& text) noexcept {
    std::string lower;
    try {
        lower.reserve(text.size());
        for (char c : text) {
            lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    } catch (...) {
        return std::nullopt;
    }

    if (lower == "error" || lower == "critical") return LogLevel::ERROR;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "trace") return LogLevel::TRACE;
    return std::nullopt;
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (static_cast<uint8_t>(level) > static_cast<uint8_t>(Logger::level())) {
            return;
        }
        std::string line = formatLine(levelToString(level), message);

        auto& s = sinks();
        std::lock_guard<std::mutex> lock(s.mutex);
        std::cerr << line << std::endl;
        if (s.file.is_open()) {
            s.file << line << '\n';
            s.file.flush();
        }
    } catch (...) {
        // Never throw from logging
    }
}

LogLevel Logger::parseEnvLevel() noexcept {
    const char* env = std::getenv("OCRD_LOG_LEVEL");
    if (!env) {
        return LogLevel::INFO;
    }
    return parseLevel(env).value_or(LogLevel::INFO);
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "?????";
}

void setThreadName(const std::string& name) {
    t_threadName = name;
}

}
