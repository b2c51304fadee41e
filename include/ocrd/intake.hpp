/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>

#include "ocrd/config.hpp"
#include "ocrd/errors.hpp"
#include "ocrd/types.hpp"

namespace ocrd {

class Registry;
class Workspace;

struct SubmitResult {
    bool ok = false;
    JobId id;
    ErrorKind error = ErrorKind::None;
    std::string message;
    std::chrono::system_clock::time_point createdAt;
    explicit operator bool() const noexcept { return ok; }
};

// Hands a freshly registered job to the background lane. False = refused.
using Dispatch = std::function<bool(const JobId&)>;

// One in-flight upload streaming into a staging file. The staging file is
// removed when the Upload is destroyed unless it was committed.
class Upload final {
public:
    // Only Intake can open uploads.
    class Key {
        friend class Intake;
        Key() {}
    };

    Upload(Key, std::filesystem::path staging, std::string filename, std::string owner, std::size_t limit);
    ~Upload();

    Upload(const Upload&) = delete;
    Upload& operator=(const Upload&) = delete;

    // Returns false once the size limit is exceeded or a write fails; the
    // caller should stop feeding data at that point.
    [[nodiscard]] bool append(const char* data, std::size_t length) noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return received_; }
    [[nodiscard]] bool exceeded() const noexcept { return exceeded_; }
    [[nodiscard]] bool failed() const noexcept { return ioError_; }
    [[nodiscard]] const std::string& filename() const noexcept { return filename_; }
    [[nodiscard]] const std::string& owner() const noexcept { return owner_; }

private:
    friend class Intake;

    void discard() noexcept;

    std::filesystem::path staging_;
    std::ofstream out_;
    std::string filename_;
    std::string owner_;
    std::size_t limit_;
    std::size_t received_ = 0;
    bool exceeded_ = false;
    bool ioError_ = false;
};

// Validates uploads, persists them and registers Queued jobs.
class Intake final {
public:
    Intake(const UploadSettings& settings, const Workspace& workspace, Registry& registry, Dispatch dispatch);

    Intake(const Intake&) = delete;
    Intake& operator=(const Intake&) = delete;

    // Starts a streamed upload. Returns nullptr and fills `rejected` when the
    // filename is unacceptable or staging cannot be opened.
    [[nodiscard]] std::unique_ptr<Upload> open(const std::string& filename, const std::string& owner,
                                               SubmitResult& rejected) const;

    // Size check, persistence, registration and dispatch.
    [[nodiscard]] SubmitResult commit(Upload& upload);

    // Whole-buffer convenience over open/append/commit.
    [[nodiscard]] SubmitResult submit(const std::string& filename, const std::string& owner,
                                      const std::string& content);

    [[nodiscard]] bool isAllowed(const std::string& filename) const;

    // Final path component of a client-supplied name ("" if unusable).
    [[nodiscard]] static std::string sanitizeFilename(const std::string& filename);
    [[nodiscard]] static JobId generateId();

private:
    UploadSettings settings_;
    const Workspace& workspace_;
    Registry& registry_;
    Dispatch dispatch_;

    [[nodiscard]] std::string allowedList() const;
};

}
