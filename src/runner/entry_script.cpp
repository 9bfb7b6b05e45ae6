/**
 * @file entry_script.cpp
 * @brief EntryScriptBuilder implementation and the entry program template.
 */

#include "runner/entry_script.hpp"

#include "runner/protocol.hpp"

#include <cstdio>
#include <fstream>

#include <json/json.h>

namespace sandbox_exec {

namespace {

// Placeholders are substituted with ASCII-only Python expressions, so the
// generated file never depends on the source encoding of the request.
constexpr std::string_view kTemplate = R"PY(import asyncio
import builtins
import contextlib
import inspect
import io
import json
import os
import time
import traceback

SENTINEL = @SENTINEL@
SOURCE = @SOURCE@
FILES_WRITTEN = json.loads(@FILES@)
GLOBALS_ENABLED = @GLOBALS@
ALLOWED_BUILTINS = json.loads(@ALLOWED@)
LOCAL_REPR_LIMIT = 10000


def _json_safe(value):
    try:
        json.dumps(value, allow_nan=False)
        return value
    except Exception:
        try:
            return str(value)
        except Exception:
            return "<unrepresentable>"


def _text(value):
    try:
        return str(value)
    except Exception:
        return "<unrepresentable>"


def _snapshot(ns):
    out = {}
    for name, value in list(ns.items()):
        if not isinstance(name, str) or name.startswith("__"):
            continue
        text = _text(value)
        if len(text) > LOCAL_REPR_LIMIT:
            text = text[:LOCAL_REPR_LIMIT] + "..."
        out[name] = text
    return out


async def _await(awaitable):
    return await awaitable


def _namespace():
    ns = {"__name__": "__sandbox__"}
    if not GLOBALS_ENABLED:
        ns["__builtins__"] = {
            name: getattr(builtins, name)
            for name in ALLOWED_BUILTINS
            if hasattr(builtins, name)
        }
    return ns


def _emit(record):
    data = (SENTINEL + json.dumps(record, default=str) + "\n").encode("utf-8", "replace")
    while data:
        data = data[os.write(1, data):]


def _run():
    start = time.perf_counter()
    out_buf, err_buf = io.StringIO(), io.StringIO()
    ns = _namespace()
    record = {"exception": None}
    try:
        with contextlib.redirect_stdout(out_buf), contextlib.redirect_stderr(err_buf):
            exec(compile(SOURCE, "<submitted>", "exec"), ns, ns)
            entry = ns.get("main")
            if callable(entry):
                result = entry()
                if inspect.isawaitable(result):
                    result = asyncio.run(_await(result))
                record["value"] = _json_safe(result)
    except BaseException as exc:
        record.pop("value", None)
        record["exception"] = {
            "kind": type(exc).__name__,
            "message": _text(exc) or repr(exc),
            "trace": traceback.format_exc(),
        }
    record["stdout"] = out_buf.getvalue()
    record["stderr"] = err_buf.getvalue()
    record["locals"] = _snapshot(ns)
    record["files_written"] = FILES_WRITTEN
    record["execution_time"] = time.perf_counter() - start
    _emit(record)


if __name__ == "__main__":
    _run()
)PY";

void replace_all(std::string& text, std::string_view token, std::string_view replacement) {
    size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), replacement);
        pos += replacement.size();
    }
}

std::string compact_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

}  // anonymous namespace

std::string python_str_expr(std::string_view text) {
    std::string out = "b'";
    out.reserve(text.size() + 32);
    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\'': out += "\\'"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                // '@' is escaped so substituted text never contains a placeholder.
                if (c < 0x20 || c >= 0x7f || c == '@') {
                    char buf[5];
                    std::snprintf(buf, sizeof(buf), "\\x%02x", c);
                    out += buf;
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    out += "'.decode('utf-8', 'replace')";
    return out;
}

const std::vector<std::string_view>& restricted_builtins() {
    // Control flow, containers, arithmetic and common exception types.
    // No import machinery, no eval/exec/compile, no open(), no attribute
    // or namespace introspection (getattr, vars, globals, type, ...).
    static const std::vector<std::string_view> names = {
        "abs", "all", "any", "ascii", "bin", "bool", "bytearray", "bytes",
        "callable", "chr", "classmethod", "complex", "dict", "divmod",
        "enumerate", "filter", "float", "format", "frozenset", "hash", "hex",
        "int", "isinstance", "issubclass", "iter", "len", "list", "map",
        "max", "min", "next", "object", "oct", "ord", "pow", "print",
        "property", "range", "repr", "reversed", "round", "set", "slice",
        "sorted", "staticmethod", "str", "sum", "super", "tuple", "zip",
        "__build_class__",
        "True", "False", "None", "Ellipsis", "NotImplemented",
        "ArithmeticError", "AssertionError", "AttributeError", "BaseException",
        "Exception", "IndexError", "KeyError", "LookupError", "NameError",
        "NotImplementedError", "OverflowError", "RuntimeError",
        "StopAsyncIteration", "StopIteration", "TypeError", "ValueError",
        "ZeroDivisionError",
    };
    return names;
}

EntryScriptBuilder::EntryScriptBuilder(std::string entry_name)
    : entry_name_(std::move(entry_name)) {}

std::string EntryScriptBuilder::render(const std::string& code,
                                       const std::vector<std::string>& files_written,
                                       bool globals_enabled) const {
    Json::Value files(Json::arrayValue);
    for (const auto& f : files_written) files.append(f);

    Json::Value allowed(Json::arrayValue);
    for (auto name : restricted_builtins()) allowed.append(std::string(name));

    std::string program(kTemplate);
    replace_all(program, "@SENTINEL@", python_str_expr(protocol::kResultSentinel));
    replace_all(program, "@FILES@", python_str_expr(compact_json(files)));
    replace_all(program, "@GLOBALS@", globals_enabled ? "True" : "False");
    replace_all(program, "@ALLOWED@", python_str_expr(compact_json(allowed)));
    replace_all(program, "@SOURCE@", python_str_expr(code));
    return program;
}

Result<std::filesystem::path> EntryScriptBuilder::build(const std::string& code,
                                                        const Workspace& workspace,
                                                        bool globals_enabled) const {
    auto path = workspace.root / entry_name_;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorKind::Io, "Cannot write entry program " + path.string()};
    }

    auto program = render(code, workspace.files_written, globals_enabled);
    out.write(program.data(), static_cast<std::streamsize>(program.size()));
    if (!out) {
        return Error{ErrorKind::Io, "Failed writing entry program " + path.string()};
    }
    return path;
}

}  // namespace sandbox_exec
