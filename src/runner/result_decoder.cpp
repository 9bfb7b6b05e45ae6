/**
 * @file result_decoder.cpp
 * @brief ResultDecoder implementation.
 */

#include "runner/result_decoder.hpp"

#include "runner/protocol.hpp"

#include <memory>
#include <sstream>

#include <json/json.h>

namespace sandbox_exec {

namespace {

std::string describe_exit(const ProcessOutput& output) {
    std::ostringstream oss;
    if (output.term_signal) {
        oss << "Entry program was terminated by signal " << *output.term_signal;
    } else if (output.exit_code) {
        oss << "Entry program exited with status " << *output.exit_code;
    } else {
        oss << "Entry program ended in an unknown state";
    }
    return oss.str();
}

std::string string_member(const Json::Value& obj, const char* key) {
    const auto& v = obj[key];
    if (v.isString()) return v.asString();
    if (v.isNull()) return {};
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, v);
}

}  // anonymous namespace

std::optional<LocatedRecord> locate_record(std::string_view text) {
    auto pos = text.rfind(protocol::kResultSentinel);
    if (pos == std::string_view::npos) return std::nullopt;

    auto body_start = pos + protocol::kResultSentinel.size();
    auto line_end = text.find('\n', body_start);
    auto body_end = line_end == std::string_view::npos ? text.size() : line_end;
    auto rest_start = line_end == std::string_view::npos ? text.size() : line_end + 1;

    LocatedRecord record;
    record.payload = std::string(text.substr(body_start, body_end - body_start));
    if (!record.payload.empty() && record.payload.back() == '\r') record.payload.pop_back();
    record.residue = std::string(text.substr(0, pos));
    record.residue += text.substr(rest_start);
    return record;
}

ResultDecoder::ResultDecoder(Logger& logger) : logger_(logger) {}

ExecutionResult ResultDecoder::synthesize(std::string_view kind,
                                          std::string message,
                                          const ProcessOutput& output,
                                          const std::vector<std::string>& files_written) {
    ExecutionResult result;
    result.stdout_text = output.stdout_text;
    result.stderr_text = output.stderr_text;
    result.exception = ExceptionInfo{std::string(kind), std::move(message), describe_exit(output)};
    result.files_written = files_written;
    result.execution_time = output.elapsed_seconds;
    result.memory_limit = output.memory_limit;
    return result;
}

ExecutionResult ResultDecoder::spawn_failure(const Error& error,
                                             const std::vector<std::string>& files_written) {
    ExecutionResult result;
    result.exception = ExceptionInfo{std::string(failure_kind::kProcessError),
                                     "Failed to launch entry program: " + error.message, ""};
    result.files_written = files_written;
    return result;
}

ExecutionResult ResultDecoder::decode(const ProcessOutput& output,
                                      const std::vector<std::string>& files_written) const {
    if (output.timed_out) {
        return synthesize(failure_kind::kTimeout,
                          "Execution exceeded its time limit and was killed",
                          output, files_written);
    }

    bool from_stdout = true;
    auto located = locate_record(output.stdout_text);
    if (!located) {
        located = locate_record(output.stderr_text);
        from_stdout = false;
    }

    if (!located) {
        if (output.exited_cleanly()) {
            logger_.warn("Entry program produced no result record");
            return synthesize(failure_kind::kParseFailure,
                              "Entry program produced no result record",
                              output, files_written);
        }
        logger_.warn(describe_exit(output));
        return synthesize(failure_kind::kProcessError, describe_exit(output),
                          output, files_written);
    }

    Json::Value root;
    std::string errors;
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["allowSpecialFloats"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    const char* begin = located->payload.data();
    const char* end = begin + located->payload.size();

    bool parsed = false;
    try {
        parsed = !located->payload.empty() && reader->parse(begin, end, &root, &errors);
    } catch (const Json::Exception& e) {
        // Thrown for records nested deeper than the reader's stack limit.
        errors = e.what();
    }

    if (!parsed || !root.isObject()) {
        logger_.warn("Malformed result record: " + errors);
        return synthesize(failure_kind::kParseFailure,
                          "Malformed result record" + (errors.empty() ? "" : ": " + errors),
                          output, files_written);
    }

    namespace f = protocol::field;
    ExecutionResult result;
    result.execution_time = output.elapsed_seconds;
    result.memory_limit = output.memory_limit;

    // Anything the wrapper did not capture itself (native writes to fd 1/2
    // from extensions or subprocesses) is appended rather than dropped.
    result.stdout_text = string_member(root, f::kStdout);
    result.stderr_text = string_member(root, f::kStderr);
    if (from_stdout) {
        result.stdout_text += located->residue;
        result.stderr_text += output.stderr_text;
    } else {
        result.stdout_text += output.stdout_text;
        result.stderr_text += located->residue;
    }

    const auto& exc = root[f::kException];
    if (exc.isObject()) {
        result.exception = ExceptionInfo{
            string_member(exc, f::kKind),
            string_member(exc, f::kMessage),
            string_member(exc, f::kTrace)};
    } else if (!exc.isNull()) {
        return synthesize(failure_kind::kParseFailure,
                          "Malformed result record: exception is not an object",
                          output, files_written);
    } else if (root.isMember(f::kValue)) {
        result.value = root[f::kValue];
    }

    const auto& locals = root[f::kLocals];
    if (locals.isObject()) {
        for (const auto& name : locals.getMemberNames()) {
            result.locals_snapshot[name] = string_member(locals, name.c_str());
        }
    }

    const auto& files = root[f::kFilesWritten];
    if (files.isArray()) {
        for (const auto& file : files) {
            if (file.isString()) result.files_written.push_back(file.asString());
        }
    } else {
        result.files_written = files_written;
    }

    if (!output.exited_cleanly()) {
        logger_.debug(describe_exit(output) + " after emitting its result record");
    }
    return result;
}

}  // namespace sandbox_exec
