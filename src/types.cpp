/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "ocrd/types.hpp"
#include <cstdio>
#include <ctime>

namespace ocrd {

const char* toString(Status status) noexcept {
    switch (status) {
        case Status::Queued:     return "queued";
        case Status::Processing: return "processing";
        case Status::Completed:  return "completed";
        case Status::Failed:     return "failed";
    }
    return "unknown";
}

double progressOf(Status status) noexcept {
    switch (status) {
        case Status::Processing: return 0.5;
        case Status::Completed:  return 1.0;
        default:                 return 0.0;
    }
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    auto seconds = std::chrono::system_clock::to_time_t(tp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch()).count() % 1000000;
    if (micros < 0) {
        micros += 1000000;
    }
    std::tm local{};
    localtime_r(&seconds, &local);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &local);
    char full[48];
    std::snprintf(full, sizeof(full), "%s.%06lld", date, static_cast<long long>(micros));
    return full;
}

namespace {

// Length of the well-formed sequence starting at pos, or 0 if ill-formed.
std::size_t sequenceLength(std::string_view text, std::size_t pos) noexcept {
    auto byte = [&](std::size_t i) { return static_cast<unsigned char>(text[i]); };
    unsigned char lead = byte(pos);
    if (lead < 0x80) {
        return 1;
    }

    std::size_t length = 0;
    unsigned char low = 0x80;
    unsigned char high = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) low = 0xA0;   // overlong
        if (lead == 0xED) high = 0x9F;  // surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) low = 0x90;   // overlong
        if (lead == 0xF4) high = 0x8F;  // above U+10FFFF
    } else {
        return 0;
    }

    if (pos + length > text.size()) {
        return 0;
    }
    if (byte(pos + 1) < low || byte(pos + 1) > high) {
        return 0;
    }
    for (std::size_t i = 2; i < length; ++i) {
        if (byte(pos + i) < 0x80 || byte(pos + i) > 0xBF) {
            return 0;
        }
    }
    return length;
}

}

bool isValidUtf8(std::string_view text) noexcept {
    for (std::size_t pos = 0; pos < text.size();) {
        std::size_t length = sequenceLength(text, pos);
        if (length == 0) {
            return false;
        }
        pos += length;
    }
    return true;
}

std::string toValidUtf8(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t pos = 0; pos < text.size();) {
        std::size_t length = sequenceLength(text, pos);
        if (length == 0) {
            out += "\xEF\xBF\xBD";
            ++pos;
        } else {
            out.append(text.substr(pos, length));
            pos += length;
        }
    }
    return out;
}

}
