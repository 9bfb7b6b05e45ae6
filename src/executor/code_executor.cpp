/**
 * @file code_executor.cpp
 * @brief CodeExecutor implementation.
 */

#include "executor/code_executor.hpp"

#include <cstdlib>

namespace sandbox_exec {

CodeExecutor::CodeExecutor(Config config, Logger& logger)
    : config_(std::move(config))
    , logger_(logger)
    , launcher_(logger)
    , store_(config_.workspace, logger)
    , installer_(config_.interpreter, launcher_, logger)
    , builder_(config_.workspace.entry_name)
    , decoder_(logger)
    , lifecycle_(logger) {}

Result<void> CodeExecutor::validate(const ExecutionRequest& request) const {
    if (request.timeout.count() <= 0) {
        return invalid_request("Timeout must be positive");
    }
    if (request.timeout > kMaxTimeout) {
        return invalid_request("Timeout must not exceed " + std::to_string(kMaxTimeout.count()) + "ms");
    }
    if (request.max_memory_mb && (*request.max_memory_mb == 0 || *request.max_memory_mb > kMaxMemoryMb)) {
        return invalid_request("max_memory_mb must be between 1 and " + std::to_string(kMaxMemoryMb));
    }
    if (request.persist && request.session_id) {
        if (auto v = validate_session_id(*request.session_id); !v) return v.error();
    }
    if (auto v = store_.validate_files(request.files); !v) return v.error();
    if (auto v = validate_requirements(request.requirements); !v) return v.error();
    return {};
}

std::map<std::string, std::string> CodeExecutor::child_environment(const Workspace& workspace) const {
    std::map<std::string, std::string> env;
    for (const auto& name : config_.environment.passthrough) {
        if (const char* value = std::getenv(name.c_str())) {
            env[name] = value;
        }
    }
    if (env.find("PATH") == env.end()) {
        env["PATH"] = "/usr/local/bin:/usr/bin:/bin";
    }

    auto python_path = workspace.deps.string();
    if (auto it = env.find("PYTHONPATH"); it != env.end() && !it->second.empty()) {
        python_path += ":" + it->second;
    }
    env["PYTHONPATH"] = python_path;
    env["PYTHONUNBUFFERED"] = "1";
    env["PYTHONDONTWRITEBYTECODE"] = "1";
    env["PYTHONIOENCODING"] = "utf-8";
    return env;
}

Result<ExecutionResult> CodeExecutor::execute(const ExecutionRequest& request) {
    if (auto valid = validate(request); !valid) {
        logger_.warn("Rejected request: " + valid.error().message);
        return valid.error();
    }

    auto workspace = store_.resolve(request.persist, request.session_id, request.files);
    if (!workspace) {
        logger_.warn("Workspace setup failed: " + workspace.error().message);
        return workspace.error();
    }

    auto env = child_environment(*workspace);

    if (!request.requirements.empty()) {
        auto installed = installer_.install(request.requirements, *workspace, env,
                                            Duration{config_.limits.install_timeout_ms});
        if (!installed.succeeded) {
            logger_.debug("Running without a complete dependency set in " + installed.path.string());
        }
    }

    ExecutionResult result;
    auto entry = builder_.build(request.code, *workspace, request.globals_enabled);
    if (!entry) {
        logger_.error(entry.error().message);
        result = ResultDecoder::spawn_failure(entry.error(), workspace->files_written);
    } else {
        LaunchSpec spec;
        spec.argv = {config_.interpreter.command, entry->string()};
        spec.working_dir = workspace->root;
        spec.env = std::move(env);
        spec.timeout = request.timeout;
        spec.max_output_bytes = config_.limits.max_output_bytes;
        spec.kill_grace = Duration{config_.limits.kill_grace_ms};
        if (request.max_memory_mb) {
            spec.max_memory_mb = request.max_memory_mb;
        } else if (config_.limits.default_max_memory_mb > 0) {
            spec.max_memory_mb = config_.limits.default_max_memory_mb;
        }

        auto output = launcher_.run(spec);
        if (output) {
            result = decoder_.decode(*output, workspace->files_written);
        } else {
            logger_.error("Launch failed: " + output.error().message);
            result = ResultDecoder::spawn_failure(output.error(), workspace->files_written);
        }
    }

    if (workspace->persisted) {
        result.session_id = workspace->session_id;
    }
    lifecycle_.finalize(*workspace, workspace->persisted);

    logger_.info("Execution finished in " + std::to_string(result.execution_time) + "s"
                 + (result.exception ? " with " + result.exception->kind : std::string{}));
    return result;
}

}  // namespace sandbox_exec
