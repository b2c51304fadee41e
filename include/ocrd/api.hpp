/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <optional>
#include <string>

namespace httplib {
class Server;
struct Request;
struct Response;
class ContentReader;
}

namespace ocrd {

class Server;

// HTTP surface over a running Server. Routes:
//   POST /token, GET /users/me, POST /ocr/upload,
//   GET /ocr/status/{id}, GET /ocr/result/{id}, GET /, GET /health
class Api final {
public:
    explicit Api(Server& core);
    ~Api();

    Api(const Api&) = delete;
    Api& operator=(const Api&) = delete;

    // Blocks until stop() is called. False if the address cannot be bound.
    [[nodiscard]] bool listen(const std::string& host, int port);

    // Split form of listen() used when the port is picked by the kernel.
    [[nodiscard]] int bindToAnyPort(const std::string& host);
    [[nodiscard]] bool listenAfterBind();

    void stop() noexcept;
    [[nodiscard]] bool isRunning() const noexcept;

private:
    Server& core_;
    std::unique_ptr<httplib::Server> http_;

    void configure();
    void routes();

    void handleToken(const httplib::Request& req, httplib::Response& res);
    void handleMe(const httplib::Request& req, httplib::Response& res);
    void handleUpload(const httplib::Request& req, httplib::Response& res,
                      const httplib::ContentReader& reader);
    void handleStatus(const httplib::Request& req, httplib::Response& res);
    void handleResult(const httplib::Request& req, httplib::Response& res);

    // Resolves the bearer token to a configured user or answers 401.
    [[nodiscard]] std::optional<std::string> authenticate(const httplib::Request& req,
                                                          httplib::Response& res) const;
};

}
