/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "ocrd/intake.hpp"
#include "ocrd/logger.hpp"
#include "ocrd/registry.hpp"
#include "ocrd/workspace.hpp"
#include <openssl/rand.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace ocrd {

namespace {

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

SubmitResult rejectWith(ErrorKind kind, std::string message) {
    SubmitResult result;
    result.error = kind;
    result.message = std::move(message);
    return result;
}

}

Upload::Upload(Key, std::filesystem::path staging, std::string filename, std::string owner, std::size_t limit)
    : staging_(std::move(staging)),
      out_(staging_, std::ios::binary | std::ios::trunc),
      filename_(std::move(filename)),
      owner_(std::move(owner)),
      limit_(limit) {
    if (!out_) {
        ioError_ = true;
    }
}

Upload::~Upload() {
    discard();
}

bool Upload::append(const char* data, std::size_t length) noexcept {
    if (exceeded_ || ioError_) {
        return false;
    }
    if (length > limit_ - received_) {
        exceeded_ = true;
        received_ += length;
        discard();
        return false;
    }
    try {
        out_.write(data, static_cast<std::streamsize>(length));
        if (!out_) {
            ioError_ = true;
            discard();
            return false;
        }
    } catch (...) {
        ioError_ = true;
        discard();
        return false;
    }
    received_ += length;
    return true;
}

void Upload::discard() noexcept {
    try {
        if (out_.is_open()) {
            out_.close();
        }
    } catch (...) {
        // closing a failed stream may throw with exceptions enabled
    }
    if (!staging_.empty()) {
        std::error_code ec;
        std::filesystem::remove(staging_, ec);
        if (ec) {
            LOG_WARN("Could not remove staging file " + staging_.string() + ": " + ec.message());
        }
    }
}

Intake::Intake(const UploadSettings& settings, const Workspace& workspace, Registry& registry, Dispatch dispatch)
    : settings_(settings), workspace_(workspace), registry_(registry), dispatch_(std::move(dispatch)) {
}

std::unique_ptr<Upload> Intake::open(const std::string& filename, const std::string& owner,
                                     SubmitResult& rejected) const {
    std::string name = sanitizeFilename(filename);
    if (name.empty()) {
        LOG_WARN("User " + owner + " uploaded a file without a usable name");
        rejected = rejectWith(ErrorKind::Validation, "missing file name");
        return nullptr;
    }
    if (!isAllowed(name)) {
        LOG_WARN("User " + owner + " uploaded an unsupported file type: " + name);
        rejected = rejectWith(ErrorKind::Validation,
                              "unsupported file format, allowed: " + allowedList());
        return nullptr;
    }

    auto upload = std::make_unique<Upload>(Upload::Key(), workspace_.stagingPath(), name, owner, settings_.maxBytes());
    if (upload->ioError_) {
        LOG_ERROR("Cannot open staging file " + upload->staging_.string());
        rejected = rejectWith(ErrorKind::Internal, "cannot stage upload");
        return nullptr;
    }
    return upload;
}

SubmitResult Intake::commit(Upload& upload) {
    if (upload.exceeded_) {
        LOG_WARN("User " + upload.owner_ + " uploaded an oversized file (" +
                 std::to_string(upload.received_ / (1024 * 1024)) + "+ MB): " + upload.filename_);
        return rejectWith(ErrorKind::PayloadTooLarge,
                          "file exceeds the size limit of " + std::to_string(settings_.maxFileSizeMb) + "MB");
    }
    if (upload.ioError_) {
        return rejectWith(ErrorKind::Internal, "failed to write upload");
    }

    upload.out_.flush();
    upload.out_.close();
    if (upload.out_.fail()) {
        upload.discard();
        return rejectWith(ErrorKind::Internal, "failed to write upload");
    }

    JobId jobId = generateId();
    while (registry_.contains(jobId)) {
        jobId = generateId();
    }

    // Atomic publish: staging and destination share the working directory
    auto target = workspace_.sourcePath(jobId, upload.filename_);
    std::error_code ec;
    std::filesystem::rename(upload.staging_, target, ec);
    if (ec) {
        LOG_ERROR("Failed to persist upload for job " + jobId + ": " + ec.message());
        upload.discard();
        return rejectWith(ErrorKind::Internal, "failed to persist upload");
    }
    upload.staging_.clear();

    Job job;
    job.id = jobId;
    job.status = Status::Queued;
    job.owner = upload.owner_;
    job.sourceFile = target;
    job.workspace = workspace_.allocate(jobId);
    job.createdAt = std::chrono::system_clock::now();
    auto createdAt = job.createdAt;

    if (!registry_.insert(std::move(job))) {
        std::filesystem::remove(target, ec);
        return rejectWith(ErrorKind::Internal, "job id collision");
    }

    if (!dispatch_ || !dispatch_(jobId)) {
        LOG_WARN("Dispatch refused for job " + jobId + ", rolling back");
        (void)registry_.erase(jobId);
        std::filesystem::remove(target, ec);
        return rejectWith(ErrorKind::Unavailable, "job queue is full, retry later");
    }

    LOG_INFO("User " + upload.owner_ + " uploaded " + upload.filename_ + " (" +
             std::to_string(upload.received_) + " bytes), created job " + jobId);

    SubmitResult result;
    result.ok = true;
    result.id = jobId;
    result.createdAt = createdAt;
    return result;
}

SubmitResult Intake::submit(const std::string& filename, const std::string& owner, const std::string& content) {
    SubmitResult rejected;
    auto upload = open(filename, owner, rejected);
    if (!upload) {
        return rejected;
    }
    (void)upload->append(content.data(), content.size());
    return commit(*upload);
}

bool Intake::isAllowed(const std::string& filename) const {
    std::string lower = toLowerCopy(filename);
    for (const auto& ext : settings_.allowedExtensions) {
        // a bare extension such as ".pdf" is not a file name
        if (lower.size() > ext.size() && endsWith(lower, ext)) {
            return true;
        }
    }
    return false;
}

std::string Intake::sanitizeFilename(const std::string& filename) {
    auto slash = filename.find_last_of("/\\");
    std::string name = slash == std::string::npos ? filename : filename.substr(slash + 1);
    if (name == "." || name == "..") {
        return "";
    }
    for (char c : name) {
        if (static_cast<unsigned char>(c) < 0x20) {
            return "";
        }
    }
    return name;
}

JobId Intake::generateId() {
    std::array<unsigned char, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80); // RFC 4122 variant

    char text[37];
    std::snprintf(text, sizeof(text),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
                  bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return text;
}

std::string Intake::allowedList() const {
    std::string list;
    for (const auto& ext : settings_.allowedExtensions) {
        if (!list.empty()) list += ", ";
        list += ext;
    }
    return list;
}

}
