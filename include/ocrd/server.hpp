/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <memory>

#include "ocrd/config.hpp"
#include "ocrd/credentials.hpp"
#include "ocrd/intake.hpp"
#include "ocrd/queries.hpp"
#include "ocrd/registry.hpp"
#include "ocrd/token.hpp"
#include "ocrd/workspace.hpp"

namespace ocrd {

class Pipeline;
class Pool;
class Processor;

// Owns the job lifecycle components. Transport agnostic; the HTTP layer
// talks to it through intake(), queries(), credentials() and tokens().
class Server final {
public:
    // A null pipeline means "run the configured external command".
    explicit Server(const Config& config, std::unique_ptr<Pipeline> pipeline = nullptr);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    [[nodiscard]] bool start();
    void shutdown() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] Intake& intake() noexcept { return *intake_; }
    [[nodiscard]] const Queries& queries() const noexcept { return *queries_; }
    [[nodiscard]] const CredentialStore& credentials() const noexcept { return credentials_; }
    [[nodiscard]] const TokenService& tokens() const noexcept { return tokens_; }
    [[nodiscard]] const Registry& registry() const noexcept { return registry_; }
    [[nodiscard]] const Workspace& workspace() const noexcept { return workspace_; }

private:
    Config config_;
    Workspace workspace_;
    Registry registry_;
    CredentialStore credentials_;
    TokenService tokens_;

    std::unique_ptr<Pipeline> pipeline_;
    std::unique_ptr<Pool> pool_;
    std::unique_ptr<Processor> processor_;
    std::unique_ptr<Intake> intake_;
    std::unique_ptr<Queries> queries_;

    std::atomic<bool> running_{false};
};

}
