/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace ocrd {

enum class LogLevel : uint8_t { 
    ERROR = 0, 
    WARN = 1, 
    INFO = 2, 
    DEBUG = 3, 
    TRACE = 4 
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;

    // Mirror every line into a file (appended). Empty path disables the file sink.
    [[nodiscard]] static bool setFile(const std::string& path) noexcept;

    // Case-insensitive "error", "warn"/"warning", "info", "debug", "trace".
    [[nodiscard]] static std::optional<LogLevel> parseLevel(const std::string& text) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;
    
    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Labels log lines written by the calling thread.
void setThreadName(const std::string& name);

}

#define LOG_ERROR(msg) ::ocrd::Logger::error(msg)
#define LOG_WARN(msg)  ::ocrd::Logger::warn(msg)
#define LOG_INFO(msg)  ::ocrd::Logger::info(msg)
#define LOG_DEBUG(msg) ::ocrd::Logger::debug(msg)
#define LOG_TRACE(msg) ::ocrd::Logger::trace(msg)
