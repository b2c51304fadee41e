/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "ocrd/api.hpp"
#include "ocrd/errors.hpp"
#include "ocrd/logger.hpp"
#include "ocrd/server.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <exception>

namespace ocrd {

using json = nlohmann::json;

namespace {

constexpr std::size_t kMultipartOverhead = 1024 * 1024;

void replyJson(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

void replyError(httplib::Response& res, ErrorKind kind, const std::string& detail) {
    if (kind == ErrorKind::Authentication) {
        res.set_header("WWW-Authenticate", "Bearer");
    }
    replyJson(res, httpStatus(kind), {{"error", reasonOf(kind)}, {"detail", detail}});
}

json nullable(const std::string& value) {
    return value.empty() ? json(nullptr) : json(value);
}

json statusJson(const Job& job) {
    return {
        {"task_id", job.id},
        {"status", toString(job.status)},
        {"progress", progressOf(job.status)},
        {"result_path", nullable(job.resultPath.string())},
        {"error", nullable(job.error)},
        {"created_at", formatTimestamp(job.createdAt)}
    };
}

json resultJson(const Job& job) {
    return {
        {"task_id", job.id},
        {"text", job.resultText},
        {"metadata", {
            {"created_at", formatTimestamp(job.createdAt)},
            {"file_path", job.sourceFile.string()},
            {"result_path", job.resultPath.string()}
        }}
    };
}

// Form field from either an urlencoded or a multipart body.
std::optional<std::string> formField(const httplib::Request& req, const std::string& key) {
    if (req.has_param(key)) {
        return req.get_param_value(key);
    }
    if (req.has_file(key)) {
        return req.get_file_value(key).content;
    }
    return std::nullopt;
}

bool startsWithBearer(const std::string& header) {
    static const std::string scheme = "bearer ";
    if (header.size() <= scheme.size()) {
        return false;
    }
    return std::equal(scheme.begin(), scheme.end(), header.begin(),
        [](char a, char b) { return a == std::tolower(static_cast<unsigned char>(b)); });
}

// Reads and drops a request body the handler will not use.
void discardBody(const httplib::Request& req, const httplib::ContentReader& reader) {
    auto sink = [](const char*, std::size_t) { return true; };
    if (req.is_multipart_form_data()) {
        (void)reader([](const httplib::MultipartFormData&) { return true; }, sink);
    } else {
        (void)reader(sink);
    }
}

ErrorKind kindForStatus(int status) {
    switch (status) {
        case 400: return ErrorKind::Validation;
        case 401: return ErrorKind::Authentication;
        case 403: return ErrorKind::Forbidden;
        case 404: return ErrorKind::NotFound;
        case 413: return ErrorKind::PayloadTooLarge;
        case 503: return ErrorKind::Unavailable;
        default: return ErrorKind::Internal;
    }
}

}

Api::Api(Server& core)
    : core_(core), http_(std::make_unique<httplib::Server>()) {
    configure();
    routes();
}

Api::~Api() {
    stop();
}

void Api::configure() {
    const auto& config = core_.config();

    std::size_t threads = static_cast<std::size_t>(std::max(1, config.app.httpThreads));
    http_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };

    http_->set_payload_max_length(config.upload.maxBytes() + kMultipartOverhead);

    http_->set_default_headers({{"Access-Control-Allow-Origin", "*"}});

    http_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LOG_DEBUG(req.method + " " + req.path + " " + std::to_string(res.status));
    });

    // Responses produced by httplib itself (unknown route, oversized body)
    // arrive here without a body; handler-made errors already carry one.
    http_->set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (!res.body.empty()) {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        ErrorKind kind = kindForStatus(res.status);
        std::string detail = res.status == 404 ? "route not found" : httplib::status_message(res.status);
        res.set_content(json{{"error", reasonOf(kind)}, {"detail", detail}}.dump(), "application/json");
        return httplib::Server::HandlerResponse::Handled;
    });

    http_->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "unknown exception";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            what = "non-standard exception";
        }
        LOG_ERROR("Unhandled exception on " + req.method + " " + req.path + ": " + what);
        replyError(res, ErrorKind::Internal, "internal server error");
    });
}

void Api::routes() {
    http_->Get("/", [this](const httplib::Request&, httplib::Response& res) {
        replyJson(res, 200, {{"message", "Welcome to the " + core_.config().app.title + " service"}});
    });

    http_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        replyJson(res, 200, {{"status", "ok"}, {"timestamp", formatTimestamp(std::chrono::system_clock::now())}});
    });

    http_->Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Authorization, Content-Type");
        res.status = 204;
    });

    http_->Post("/token", [this](const httplib::Request& req, httplib::Response& res) {
        handleToken(req, res);
    });
    http_->Get("/users/me", [this](const httplib::Request& req, httplib::Response& res) {
        handleMe(req, res);
    });
    http_->Post("/ocr/upload", [this](const httplib::Request& req, httplib::Response& res,
                                      const httplib::ContentReader& reader) {
        handleUpload(req, res, reader);
    });
    http_->Get(R"(/ocr/status/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        handleStatus(req, res);
    });
    http_->Get(R"(/ocr/result/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        handleResult(req, res);
    });
}

bool Api::listen(const std::string& host, int port) {
    LOG_INFO("Listening on " + host + ":" + std::to_string(port));
    return http_->listen(host, port);
}

int Api::bindToAnyPort(const std::string& host) {
    return http_->bind_to_any_port(host);
}

bool Api::listenAfterBind() {
    return http_->listen_after_bind();
}

void Api::stop() noexcept {
    if (http_ && http_->is_running()) {
        http_->stop();
    }
}

bool Api::isRunning() const noexcept {
    return http_ && http_->is_running();
}

std::optional<std::string> Api::authenticate(const httplib::Request& req, httplib::Response& res) const {
    const std::string header = req.get_header_value("Authorization");
    if (!startsWithBearer(header)) {
        replyError(res, ErrorKind::Authentication, "not authenticated");
        return std::nullopt;
    }

    auto check = core_.tokens().validate(header.substr(7));
    if (!check) {
        LOG_DEBUG("Rejected bearer token: " + check.reason);
        replyError(res, ErrorKind::Authentication, "invalid authentication credentials");
        return std::nullopt;
    }
    if (!core_.credentials().contains(check.subject)) {
        LOG_WARN("Token subject is not a configured user: " + check.subject);
        replyError(res, ErrorKind::Authentication, "invalid authentication credentials");
        return std::nullopt;
    }
    return check.subject;
}

void Api::handleToken(const httplib::Request& req, httplib::Response& res) {
    auto username = formField(req, "username");
    auto password = formField(req, "password");
    if (!username || !password) {
        replyError(res, ErrorKind::Validation, "username and password form fields are required");
        return;
    }

    if (!core_.credentials().verify(*username, *password)) {
        LOG_WARN("Failed login for user: " + *username);
        replyError(res, ErrorKind::Authentication, "incorrect username or password");
        return;
    }

    auto ttl = std::chrono::duration_cast<std::chrono::seconds>(core_.tokens().configuredTtl());
    std::string token = core_.tokens().issue(*username, ttl);
    LOG_INFO("User " + *username + " logged in");
    replyJson(res, 200, {{"access_token", token}, {"token_type", "bearer"}});
}

void Api::handleMe(const httplib::Request& req, httplib::Response& res) {
    auto user = authenticate(req, res);
    if (!user) {
        return;
    }
    replyJson(res, 200, {{"username", *user}});
}

void Api::handleUpload(const httplib::Request& req, httplib::Response& res,
                       const httplib::ContentReader& reader) {
    auto user = authenticate(req, res);
    if (!user) {
        discardBody(req, reader);
        return;
    }
    if (!req.is_multipart_form_data()) {
        discardBody(req, reader);
        replyError(res, ErrorKind::Validation, "expected multipart/form-data with a file field");
        return;
    }

    Intake& intake = core_.intake();
    std::unique_ptr<Upload> upload;
    SubmitResult rejected;
    bool sawFile = false;
    bool inFile = false;

    // Rejected or oversized parts are read to the end (bounded by the
    // payload limit) so the response is not lost to a connection reset.
    bool complete = reader(
        [&](const httplib::MultipartFormData& part) {
            inFile = false;
            if (part.name != "file" || sawFile) {
                return true;
            }
            sawFile = true;
            upload = intake.open(part.filename, *user, rejected);
            inFile = upload != nullptr;
            return true;
        },
        [&](const char* data, std::size_t length) {
            if (!inFile) {
                return true;
            }
            if (!upload->append(data, length)) {
                inFile = false;
                return !upload->failed();
            }
            return true;
        });

    if (sawFile && !upload) {
        replyError(res, rejected.error, rejected.message);
        return;
    }
    if (upload && (upload->exceeded() || upload->failed())) {
        SubmitResult result = intake.commit(*upload);
        replyError(res, result.error, result.message);
        return;
    }
    if (!complete) {
        replyError(res, ErrorKind::Validation, "incomplete multipart body");
        return;
    }
    if (!sawFile) {
        replyError(res, ErrorKind::Validation, "missing file field");
        return;
    }

    SubmitResult result = intake.commit(*upload);
    if (!result) {
        replyError(res, result.error, result.message);
        return;
    }

    Job job;
    job.id = result.id;
    job.status = Status::Queued;
    job.createdAt = result.createdAt;
    replyJson(res, 200, statusJson(job));
}

void Api::handleStatus(const httplib::Request& req, httplib::Response& res) {
    auto user = authenticate(req, res);
    if (!user) {
        return;
    }
    Lookup lookup = core_.queries().status(req.matches[1].str(), *user);
    if (!lookup) {
        replyError(res, lookup.error, lookup.message);
        return;
    }
    replyJson(res, 200, statusJson(lookup.job));
}

void Api::handleResult(const httplib::Request& req, httplib::Response& res) {
    auto user = authenticate(req, res);
    if (!user) {
        return;
    }
    Lookup lookup = core_.queries().result(req.matches[1].str(), *user);
    if (!lookup) {
        replyError(res, lookup.error, lookup.message);
        return;
    }
    replyJson(res, 200, resultJson(lookup.job));
}

}
