/**
 * @file types.hpp
 * @brief Request and result vocabulary shared by every sandbox_exec module.
 *
 * ExecutionRequest is what a caller submits; ExecutionResult is what it
 * always gets back. Both are plain value types.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <json/value.h>

namespace sandbox_exec {

// ─────────────────────────────────────────────
// Time
// ─────────────────────────────────────────────

using Duration = std::chrono::milliseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

/// Longest accepted wall-clock limit for one execution.
inline constexpr Duration kMaxTimeout = std::chrono::hours(24);

/// Largest accepted memory cap; keeps the byte count well inside rlim_t.
inline constexpr uint64_t kMaxMemoryMb = 1ULL << 30;

// ─────────────────────────────────────────────
// Request
// ─────────────────────────────────────────────

/**
 * @brief A file materialized into the workspace before execution.
 */
struct FileSpec {
    std::string path;       ///< Relative to the workspace root
    std::string content;

    bool operator==(const FileSpec&) const = default;
};

/**
 * @brief One execution request. Immutable once handed to the executor.
 */
struct ExecutionRequest {
    std::string code;
    Duration timeout{30000};
    bool persist{false};
    bool globals_enabled{true};
    std::vector<FileSpec> files;
    std::vector<std::string> requirements;
    std::optional<std::string> session_id;
    std::optional<uint64_t> max_memory_mb;

    /// True when the workspace should be keyed by session_id and kept.
    [[nodiscard]] bool uses_session() const noexcept {
        return persist && session_id.has_value();
    }
};

// ─────────────────────────────────────────────
// Result
// ─────────────────────────────────────────────

/**
 * @brief Failure-mode tags synthesized by the host when no structured
 *        record could be recovered from the child.
 */
namespace failure_kind {
inline constexpr std::string_view kTimeout = "timeout";
inline constexpr std::string_view kParseFailure = "parse-failure";
inline constexpr std::string_view kProcessError = "process-error";
}  // namespace failure_kind

/**
 * @brief Uncaught error raised by the executed code, or a host-side
 *        failure-mode record.
 */
struct ExceptionInfo {
    std::string kind;       ///< e.g. "ZeroDivisionError" or "timeout"
    std::string message;
    std::string trace;

    bool operator==(const ExceptionInfo&) const = default;
};

/**
 * @brief What the memory cap actually did for one launch.
 */
enum class MemoryLimit : uint8_t {
    NotRequested,   ///< No cap asked for
    Applied,        ///< RLIMIT_AS installed in the child
    Unsupported     ///< Asked for, but this host cannot honor it
};

[[nodiscard]] constexpr std::string_view to_string(MemoryLimit limit) noexcept {
    switch (limit) {
        case MemoryLimit::NotRequested: return "not-requested";
        case MemoryLimit::Applied:      return "applied";
        case MemoryLimit::Unsupported:  return "unsupported";
    }
    return "unknown";
}

/**
 * @brief The single well-formed record returned for every execution.
 *
 * Exactly one of {exception set, value possibly set} holds.
 */
struct ExecutionResult {
    std::string stdout_text;
    std::string stderr_text;
    std::optional<Json::Value> value;
    std::optional<ExceptionInfo> exception;
    std::map<std::string, std::string> locals_snapshot;
    std::vector<std::string> files_written;
    double execution_time{0.0};             ///< Seconds, spawn to exit
    MemoryLimit memory_limit{MemoryLimit::NotRequested};
    std::optional<std::string> session_id;  ///< Set when the workspace was kept

    [[nodiscard]] bool ok() const noexcept { return !exception.has_value(); }
};

}  // namespace sandbox_exec
