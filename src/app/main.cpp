/**
 * @file main.cpp
 * @brief sandbox_exec command-line entry point.
 *
 * Reads one tool-call payload (file, stdin or flags), executes it and
 * prints the result block. Logs go to stderr or the configured log dir;
 * stdout carries only the result.
 *
 * Exit codes: 0 result produced, 1 configuration/usage error,
 *             2 request rejected.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/code_executor.hpp"
#include "logging/json_sink.hpp"
#include "tool/tool_payload.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>

#include <json/json.h>

using namespace sandbox_exec;

namespace {

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    bool config_given = false;
    std::optional<std::string> request_path;
    std::optional<std::string> code;
    std::optional<double> timeout_s;
    bool persist = false;
    std::optional<std::string> session_id;
    bool no_globals = false;
    bool json_output = false;
    std::optional<std::string> remove_session;
    bool list_sessions = false;
};

void print_usage() {
    std::cout << "Usage: sandbox_exec [OPTIONS]\n"
              << "  --config <path>          Configuration file (default: config/default.toml)\n"
              << "  --request <path|->       Tool-call JSON payload (default: stdin)\n"
              << "  --code <text>            Code to run instead of a payload\n"
              << "  --timeout <seconds>      Wall-clock limit for --code\n"
              << "  --persist                Keep the workspace as a session\n"
              << "  --session <id>           Session id for --persist\n"
              << "  --no-globals             Run with restricted builtins\n"
              << "  --json                   Print the result as JSON\n"
              << "  --remove-session <id>    Delete a persistent session and exit\n"
              << "  --list-sessions          List persistent sessions and exit\n"
              << "  --help, -h               Show this help message\n";
}

std::optional<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 < argc) return std::string(argv[++i]);
            std::cerr << "Missing value for " << arg << std::endl;
            return std::nullopt;
        };

        if (arg == "--config") {
            auto v = next(); if (!v) return std::nullopt;
            args.config_path = *v;
            args.config_given = true;
        } else if (arg == "--request") {
            auto v = next(); if (!v) return std::nullopt;
            args.request_path = *v;
        } else if (arg == "--code") {
            auto v = next(); if (!v) return std::nullopt;
            args.code = *v;
        } else if (arg == "--timeout") {
            auto v = next(); if (!v) return std::nullopt;
            try {
                args.timeout_s = std::stod(*v);
            } catch (const std::exception&) {
                std::cerr << "Invalid --timeout: " << *v << std::endl;
                return std::nullopt;
            }
        } else if (arg == "--persist") {
            args.persist = true;
        } else if (arg == "--session") {
            auto v = next(); if (!v) return std::nullopt;
            args.session_id = *v;
        } else if (arg == "--no-globals") {
            args.no_globals = true;
        } else if (arg == "--json") {
            args.json_output = true;
        } else if (arg == "--remove-session") {
            auto v = next(); if (!v) return std::nullopt;
            args.remove_session = *v;
        } else if (arg == "--list-sessions") {
            args.list_sessions = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return std::nullopt;
        }
    }
    return args;
}

std::optional<std::string> read_payload(const CLIArgs& args) {
    if (args.request_path && *args.request_path != "-") {
        std::ifstream in(*args.request_path, std::ios::binary);
        if (!in) {
            std::cerr << "Cannot read request file: " << *args.request_path << std::endl;
            return std::nullopt;
        }
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

/// Payload assembled from --code and friends.
Json::Value payload_from_flags(const CLIArgs& args) {
    Json::Value payload(Json::objectValue);
    payload["code"] = *args.code;
    if (args.timeout_s) payload["timeout"] = *args.timeout_s;
    payload["persist"] = args.persist;
    payload["globals"] = !args.no_globals;
    if (args.session_id) payload["session_id"] = *args.session_id;
    return payload;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        print_usage();
        return 1;
    }
    auto args = *parsed;

    // Load configuration; the default path is optional, an explicit one is not.
    Config config = default_config();
    auto config_result = load_config(args.config_path);
    if (config_result) {
        config = *config_result;
    } else if (args.config_given) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        return 1;
    }
    apply_env_overrides(config);

    auto level = parse_log_level(config.logging.log_level);
    if (!level) {
        std::cerr << level.error().message << std::endl;
        return 1;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.logging.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.logging.log_dir, "sandbox_exec",
                                                  config.logging.max_file_size_mb,
                                                  config.logging.rotate_count);
    } else {
        log_sink = std::make_unique<StderrSink>();
    }
    Logger logger(std::move(log_sink), *level);

    CodeExecutor executor(config, logger);

    // ── Session management shortcuts ─────────
    if (args.list_sessions) {
        for (const auto& id : executor.workspaces().list_sessions()) {
            std::cout << id << '\n';
        }
        return 0;
    }
    if (args.remove_session) {
        auto removed = executor.workspaces().remove_session(*args.remove_session);
        if (!removed) {
            std::cerr << removed.error().message << std::endl;
            return removed.error().kind == ErrorKind::InvalidRequest ? 2 : 1;
        }
        return 0;
    }

    // ── Build request ────────────────────────
    Result<ExecutionRequest> request = invalid_request("No request");
    if (args.code) {
        request = request_from_json(payload_from_flags(args), config.limits);
    } else {
        auto text = read_payload(args);
        if (!text) return 1;
        request = parse_tool_request(*text, config.limits);
    }
    if (!request) {
        std::cerr << "Invalid request: " << request.error().message << std::endl;
        return 2;
    }

    // ── Execute ──────────────────────────────
    auto result = executor.execute(*request);
    logger.flush();
    if (!result) {
        std::cerr << "Request rejected: " << result.error().message << std::endl;
        return result.error().kind == ErrorKind::InvalidRequest ? 2 : 1;
    }

    if (args.json_output) {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        std::cout << Json::writeString(builder, result_to_json(*result)) << std::endl;
    } else {
        std::cout << format_result_block(*result);
    }
    return 0;
}
