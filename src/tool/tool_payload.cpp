/**
 * @file tool_payload.cpp
 * @brief Tool-call payload parsing and result formatting with jsoncpp.
 */

#include "tool/tool_payload.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <memory>
#include <sstream>

#include <json/json.h>

namespace sandbox_exec {

namespace {

std::string compact(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

Result<std::vector<std::string>> string_list(const Json::Value& value, const char* field) {
    std::vector<std::string> out;
    if (value.isNull()) return out;
    if (!value.isArray()) {
        return invalid_request(std::string("'") + field + "' must be an array of strings");
    }
    for (const auto& item : value) {
        if (!item.isString()) {
            return invalid_request(std::string("'") + field + "' must be an array of strings");
        }
        out.push_back(item.asString());
    }
    return out;
}

Result<std::vector<FileSpec>> file_list(const Json::Value& value) {
    std::vector<FileSpec> out;
    if (value.isNull()) return out;
    if (!value.isArray()) {
        return invalid_request("'files' must be an array of {path, content} objects");
    }
    for (const auto& item : value) {
        if (!item.isObject() || !item["path"].isString()) {
            return invalid_request("Each entry in 'files' needs a string 'path'");
        }
        const auto& content = item["content"];
        if (!content.isNull() && !content.isString()) {
            return invalid_request("'content' of " + item["path"].asString() + " must be a string");
        }
        out.push_back(FileSpec{item["path"].asString(), content.isString() ? content.asString() : ""});
    }
    return out;
}

}  // anonymous namespace

Result<ExecutionRequest> request_from_json(const Json::Value& payload, const LimitsConfig& limits) {
    if (!payload.isObject()) {
        return invalid_request("Tool payload must be a JSON object");
    }

    ExecutionRequest request;

    const auto& code = payload["code"];
    if (!code.isString()) {
        return invalid_request("Missing required string field 'code'");
    }
    request.code = code.asString();

    const auto& timeout = payload["timeout"];
    if (timeout.isNull()) {
        request.timeout = Duration{limits.default_timeout_ms};
    } else if (timeout.isNumeric() && std::isfinite(timeout.asDouble()) && timeout.asDouble() > 0) {
        const double seconds = timeout.asDouble();
        if (seconds * 1000.0 > static_cast<double>(kMaxTimeout.count())) {
            return invalid_request("'timeout' must not exceed "
                                   + std::to_string(kMaxTimeout.count() / 1000) + " seconds");
        }
        auto ms = static_cast<int64_t>(std::llround(seconds * 1000.0));
        request.timeout = Duration{std::max<int64_t>(ms, 1)};
    } else {
        return invalid_request("'timeout' must be a positive number of seconds");
    }

    for (const auto* flag : {"persist", "globals"}) {
        const auto& v = payload[flag];
        if (!v.isNull() && !v.isBool()) {
            return invalid_request(std::string("'") + flag + "' must be a boolean");
        }
    }
    request.persist = payload.get("persist", false).asBool();
    request.globals_enabled = payload.get("globals", true).asBool();

    auto files = file_list(payload["files"]);
    if (!files) return files.error();
    request.files = std::move(*files);

    auto requirements = string_list(payload["requirements"], "requirements");
    if (!requirements) return requirements.error();
    request.requirements = std::move(*requirements);

    const auto& session = payload["session_id"];
    if (session.isString() && !session.asString().empty()) {
        request.session_id = session.asString();
    } else if (!session.isNull() && !session.isString()) {
        return invalid_request("'session_id' must be a string");
    }

    const auto& memory = payload["max_memory_mb"];
    if (!memory.isNull()) {
        if (!memory.isUInt64() || memory.asUInt64() == 0 || memory.asUInt64() > kMaxMemoryMb) {
            return invalid_request("'max_memory_mb' must be an integer between 1 and "
                                   + std::to_string(kMaxMemoryMb));
        }
        request.max_memory_mb = memory.asUInt64();
    }

    return request;
}

Result<ExecutionRequest> parse_tool_request(std::string_view json_text, const LimitsConfig& limits) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    try {
        if (!reader->parse(json_text.data(), json_text.data() + json_text.size(), &root, &errors)) {
            return invalid_request("Tool payload is not valid JSON: " + errors);
        }
    } catch (const Json::Exception& e) {
        return invalid_request(std::string("Tool payload is not valid JSON: ") + e.what());
    }
    return request_from_json(root, limits);
}

Json::Value result_to_json(const ExecutionResult& result) {
    Json::Value out(Json::objectValue);
    out["stdout"] = result.stdout_text;
    out["stderr"] = result.stderr_text;
    out["value"] = result.value ? *result.value : Json::Value(Json::nullValue);
    out["has_value"] = result.value.has_value();

    if (result.exception) {
        Json::Value exc(Json::objectValue);
        exc["kind"] = result.exception->kind;
        exc["message"] = result.exception->message;
        exc["trace"] = result.exception->trace;
        out["exception"] = exc;
    } else {
        out["exception"] = Json::Value(Json::nullValue);
    }

    Json::Value locals(Json::objectValue);
    for (const auto& [name, text] : result.locals_snapshot) locals[name] = text;
    out["locals"] = locals;

    Json::Value files(Json::arrayValue);
    for (const auto& f : result.files_written) files.append(f);
    out["files_written"] = files;

    out["execution_time"] = result.execution_time;
    out["memory_limit"] = std::string(to_string(result.memory_limit));
    if (result.session_id) out["session_id"] = *result.session_id;
    return out;
}

std::string format_result_block(const ExecutionResult& result) {
    std::ostringstream oss;

    oss << "stdout:\n" << result.stdout_text;
    if (!result.stdout_text.empty() && result.stdout_text.back() != '\n') oss << '\n';

    oss << "stderr:\n" << result.stderr_text;
    if (!result.stderr_text.empty() && result.stderr_text.back() != '\n') oss << '\n';

    oss << "result: " << (result.value ? compact(*result.value) : std::string{"<none>"}) << '\n';

    oss << "locals:";
    if (result.locals_snapshot.empty()) oss << " <none>";
    oss << '\n';
    for (const auto& [name, text] : result.locals_snapshot) {
        oss << "  " << name << " = " << text << '\n';
    }

    oss << "files written:";
    if (result.files_written.empty()) oss << " <none>";
    for (size_t i = 0; i < result.files_written.size(); ++i) {
        oss << (i == 0 ? " " : ", ") << result.files_written[i];
    }
    oss << '\n';

    oss << "execution time: " << std::fixed << std::setprecision(3)
        << result.execution_time << "s\n";

    if (result.session_id) {
        oss << "session: " << *result.session_id << '\n';
    }

    if (result.exception) {
        oss << "exception: " << result.exception->kind << ": " << result.exception->message << '\n';
        if (!result.exception->trace.empty()) {
            oss << result.exception->trace;
            if (result.exception->trace.back() != '\n') oss << '\n';
        }
    }
    return oss.str();
}

}  // namespace sandbox_exec
