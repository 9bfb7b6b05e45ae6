/**
 * @file tool_payload.hpp
 * @brief Conversion between tool-call JSON and executor types.
 *
 * Payload fields (all optional except `code`):
 *   code           string
 *   timeout        number, seconds
 *   persist        bool
 *   globals        bool
 *   files          [{path: string, content: string}]
 *   requirements   [string]
 *   session_id     string | null
 *   max_memory_mb  positive integer | null
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

#include <json/value.h>

namespace sandbox_exec {

/**
 * @brief Build a request from an already-parsed payload object.
 *
 * Missing `timeout` falls back to `limits.default_timeout_ms`.
 */
Result<ExecutionRequest> request_from_json(const Json::Value& payload, const LimitsConfig& limits);

/**
 * @brief Parse payload text. Syntax errors and wrong field types are
 *        ErrorKind::InvalidRequest.
 */
Result<ExecutionRequest> parse_tool_request(std::string_view json_text, const LimitsConfig& limits);

/// Machine-readable form of a result.
[[nodiscard]] Json::Value result_to_json(const ExecutionResult& result);

/// Human-readable block handed back to the conversation.
[[nodiscard]] std::string format_result_block(const ExecutionResult& result);

}  // namespace sandbox_exec
