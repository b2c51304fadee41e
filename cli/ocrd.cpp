/*
 * ocrd - OCR job service daemon (ocrd)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "ocrd/api.hpp"
#include "ocrd/config.hpp"
#include "ocrd/errors.hpp"
#include "ocrd/logger.hpp"
#include "ocrd/pipeline.hpp"
#include "ocrd/server.hpp"
#include <iostream>
#include <chrono>
#include <thread>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <memory>
#include <optional>

using namespace ocrd;

constexpr const char* VERSION = "1.0.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "ocrd - Document OCR job service\n\n";
    std::cout << "Usage: " << progName << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>     JSON configuration file (default: $CONFIG_PATH or config.json)\n";
    std::cout << "  --host <address>    Bind address (overrides app.host)\n";
    std::cout << "  --port <port>       Bind port (overrides app.port)\n";
    std::cout << "  -w, --workers <n>   OCR worker threads (overrides app.workers)\n";
    std::cout << "  -h, --help          Show this help\n";
    std::cout << "  -v, --version       Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  APP_HOST, APP_PORT, DEBUG, WORKERS, SECRET_KEY, ACCESS_TOKEN_EXPIRE_MINUTES,\n";
    std::cout << "  ADMIN_USERNAME, ADMIN_PASSWORD, WORK_DIR, OCR_COMMAND, OCR_TIMEOUT_SECONDS,\n";
    std::cout << "  LOG_LEVEL, LOG_FILE, OCRD_LOG_LEVEL\n";
}

std::optional<int> parseInt(const std::string& text) {
    try {
        std::size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int main(int argc, char* argv[]) {
    // Handle --help and --version before anything else
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    std::string configPath;
    if (const char* env = std::getenv("CONFIG_PATH"); env && *env) {
        configPath = env;
    } else {
        configPath = "config.json";
    }
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<int> workers;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;
        if (arg == "--config" && hasValue) {
            configPath = argv[++i];
        } else if (arg == "--host" && hasValue) {
            host = argv[++i];
        } else if (arg == "--port" && hasValue) {
            port = parseInt(argv[++i]);
            if (!port) {
                std::cerr << "Error: Invalid port\n";
                return 1;
            }
        } else if ((arg == "-w" || arg == "--workers") && hasValue) {
            workers = parseInt(argv[++i]);
            if (!workers) {
                std::cerr << "Error: Invalid worker count\n";
                return 1;
            }
        } else {
            std::cerr << "Error: Unknown argument: " << arg << "\n\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    Config config;
    try {
        config = Config::load(configPath);
        if (host) config.app.host = *host;
        if (port) config.app.port = *port;
        if (workers) config.app.workers = *workers;
        config.validate();
    } catch (const ConfigError& e) {
        LOG_ERROR("Configuration error: " + std::string(e.what()));
        return 1;
    }

    Logger::setLevel(config.app.debug ? LogLevel::DEBUG : config.logging.level);
    if (!Logger::setFile(config.logging.file)) {
        LOG_WARN("Cannot open log file " + config.logging.file + ", logging to stderr only");
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);

    try {
        Server core(config);
        if (!core.start()) {
            LOG_ERROR("Failed to start " + config.app.title);
            return 1;
        }

        Api api(core);
        std::atomic<bool> listenFailed{false};
        std::thread httpThread([&] {
            setThreadName("HTTP");
            if (!api.listen(config.app.host, config.app.port)) {
                LOG_ERROR("Cannot listen on " + config.app.host + ":" + std::to_string(config.app.port));
                listenFailed.store(true);
            }
        });

        while (!api.isRunning() && !listenFailed.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (!listenFailed.load()) {
            LOG_INFO(config.app.title + " " + VERSION + " ready on http://" + config.app.host + ":" +
                     std::to_string(config.app.port));
        }

        while (!g_shutdown_requested && !listenFailed.load() && core.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (g_shutdown_requested) {
            LOG_INFO("Shutdown requested, stopping server...");
        }
        api.stop();
        if (httpThread.joinable()) {
            httpThread.join();
        }
        core.shutdown();

        if (listenFailed.load()) {
            return 1;
        }

    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " + std::string(e.what()));
        return 1;
    }

    LOG_INFO("ocrd stopped");
    return 0;
}
