#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace ocrd {

// Job lifecycle states. Transitions only move forward:
// Queued -> Processing -> {Completed | Failed}.
enum class Status : std::uint8_t { Queued, Processing, Completed, Failed };

// Opaque job identifier (canonical UUID text).
using JobId = std::string;

[[nodiscard]] const char* toString(Status status) noexcept;

// Coarse progress bucket reported to clients.
[[nodiscard]] double progressOf(Status status) noexcept;

[[nodiscard]] inline bool isTerminal(Status status) noexcept {
    return status == Status::Completed || status == Status::Failed;
}

// ISO-8601 local time with microseconds, e.g. 2025-03-01T10:15:30.123456
[[nodiscard]] std::string formatTimestamp(std::chrono::system_clock::time_point tp);

[[nodiscard]] bool isValidUtf8(std::string_view text) noexcept;

// Replaces every ill-formed UTF-8 sequence with U+FFFD.
[[nodiscard]] std::string toValidUtf8(std::string_view text);

} // namespace ocrd
