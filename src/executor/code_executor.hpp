/**
 * @file code_executor.hpp
 * @brief Public entry point: one request in, one result out.
 *
 * Pipeline per call:
 *   validate → WorkspaceStore → DependencyInstaller → EntryScriptBuilder
 *            → ProcessLauncher → ResultDecoder → LifecycleManager
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "deps/dependency_installer.hpp"
#include "launcher/process_launcher.hpp"
#include "runner/entry_script.hpp"
#include "runner/result_decoder.hpp"
#include "workspace/lifecycle.hpp"
#include "workspace/workspace_store.hpp"

#include <map>
#include <string>

namespace sandbox_exec {

/**
 * @brief Runs submitted code in a child interpreter.
 *
 * execute() blocks until the child exits or its timeout fires. It may be
 * called concurrently from several threads; calls only interact through
 * a shared session directory, which is not locked.
 */
class CodeExecutor {
public:
    CodeExecutor(Config config, Logger& logger);

    /**
     * @brief Execute one request.
     *
     * The error branch carries only failures detected before any process
     * is spawned: ErrorKind::InvalidRequest, or ErrorKind::Io when the
     * workspace itself cannot be created. Everything later is reported
     * through ExecutionResult::exception.
     */
    Result<ExecutionResult> execute(const ExecutionRequest& request);

    /// Request checks that need no filesystem access.
    [[nodiscard]] Result<void> validate(const ExecutionRequest& request) const;

    /// Child environment for a workspace: passthrough vars plus PYTHONPATH.
    [[nodiscard]] std::map<std::string, std::string> child_environment(const Workspace& workspace) const;

    [[nodiscard]] WorkspaceStore& workspaces() noexcept { return store_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    Config config_;
    Logger& logger_;
    ProcessLauncher launcher_;
    WorkspaceStore store_;
    DependencyInstaller installer_;
    EntryScriptBuilder builder_;
    ResultDecoder decoder_;
    LifecycleManager lifecycle_;
};

}  // namespace sandbox_exec
