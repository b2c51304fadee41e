/*
 * ocrd - Job submission client (ocrc)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "ocrd/logger.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <thread>
#include <vector>

using namespace ocrd;
using json = nlohmann::json;

constexpr const char* VERSION = "1.0.0";
constexpr auto kPollInterval = std::chrono::milliseconds(500);

void printUsage(const char* progName) {
    std::cout << "ocrd Job Submission Client v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <base-url> <user> <password> <file> [--wait]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  base-url      Service address, e.g. http://localhost:8000\n";
    std::cout << "  user          Account name\n";
    std::cout << "  password      Account password\n";
    std::cout << "  file          Document to OCR (.pdf, .png, .jpg, .jpeg by default)\n\n";
    std::cout << "Options:\n";
    std::cout << "  -w, --wait      Poll until the job finishes and print its text\n";
    std::cout << "  -h, --help      Show this help message\n";
    std::cout << "  -v, --version   Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  OCRD_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " http://localhost:8000 admin secret scan.pdf\n";
    std::cout << "  " << progName << " http://localhost:8000 admin secret scan.pdf --wait > scan.md\n";
}

// Prints the service's error detail (or the transport error) to stderr.
void reportFailure(const std::string& action, const httplib::Result& res) {
    if (!res) {
        std::cerr << "Error: " << action << " failed: " << httplib::to_string(res.error()) << std::endl;
        return;
    }
    std::string detail = res->body;
    json body = json::parse(res->body, nullptr, false);
    if (!body.is_discarded() && body.contains("detail") && body["detail"].is_string()) {
        detail = body["detail"].get<std::string>();
    }
    std::cerr << "Error: " << action << " failed (" << res->status << "): " << detail << std::endl;
}

std::optional<json> parseBody(const httplib::Result& res) {
    json body = json::parse(res->body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        std::cerr << "Error: malformed response from service" << std::endl;
        return std::nullopt;
    }
    return body;
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; OCRD_LOG_LEVEL overrides
    if (!std::getenv("OCRD_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

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

    std::vector<std::string> positional;
    bool wait = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-w" || arg == "--wait") {
            wait = true;
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() != 4) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string& baseUrl = positional[0];
    const std::string& user = positional[1];
    const std::string& password = positional[2];
    std::filesystem::path file = positional[3];

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        std::cerr << "Error: cannot read " << file.string() << std::endl;
        return 1;
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    try {
        httplib::Client client(baseUrl);
        client.set_read_timeout(std::chrono::seconds(60));

        auto login = client.Post("/token", httplib::Params{{"username", user}, {"password", password}});
        if (!login || login->status != 200) {
            reportFailure("login", login);
            return 1;
        }
        auto token = parseBody(login);
        if (!token || !token->contains("access_token")) {
            return 1;
        }
        client.set_bearer_token_auth((*token)["access_token"].get<std::string>());
        LOG_DEBUG("Logged in as " + user);

        httplib::MultipartFormDataItems items = {
            {"file", content, file.filename().string(), "application/octet-stream"}
        };
        auto upload = client.Post("/ocr/upload", items);
        if (!upload || upload->status != 200) {
            reportFailure("upload", upload);
            return 1;
        }
        auto submitted = parseBody(upload);
        if (!submitted || !submitted->contains("task_id")) {
            return 1;
        }
        std::string jobId = (*submitted)["task_id"].get<std::string>();
        LOG_INFO("Created job " + jobId);

        if (!wait) {
            std::cout << jobId << std::endl;
            return 0;
        }

        // Wait loop
        std::string status;
        json job;
        while (true) {
            auto polled = client.Get("/ocr/status/" + jobId);
            if (!polled || polled->status != 200) {
                reportFailure("status", polled);
                return 1;
            }
            auto body = parseBody(polled);
            if (!body) {
                return 1;
            }
            job = *body;
            status = job.value("status", "");
            if (status == "completed" || status == "failed") break;
            std::this_thread::sleep_for(kPollInterval);
        }

        if (status == "failed") {
            std::cerr << "Job failed: " << jobId << std::endl;
            if (job.contains("error") && job["error"].is_string()) {
                std::cerr << "Error: " << job["error"].get<std::string>() << std::endl;
            }
            return 1;
        }

        auto result = client.Get("/ocr/result/" + jobId);
        if (!result || result->status != 200) {
            reportFailure("result", result);
            return 1;
        }
        auto body = parseBody(result);
        if (!body) {
            return 1;
        }
        std::cout << body->value("text", "") << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
