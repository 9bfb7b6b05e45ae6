/**
 * @file dependency_installer.hpp
 * @brief Best-effort installation of declared packages into a workspace.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "launcher/process_launcher.hpp"
#include "workspace/workspace_store.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace sandbox_exec {

/**
 * @brief Outcome of one installer run.
 *
 * `path` is always the workspace dependency directory; a failed install
 * still returns it so the code runs and reports the missing import itself.
 */
struct InstallOutcome {
    std::filesystem::path path;
    bool succeeded{false};
    std::string diagnostics;        ///< Installer stderr (or launch error)
};

/**
 * @brief Requirement strings are package specifiers, never installer options.
 */
Result<void> validate_requirements(const std::vector<std::string>& requirements);

/**
 * @brief Runs `<python> -m pip install --target <deps> <requirements...>` once.
 */
class DependencyInstaller {
public:
    DependencyInstaller(InterpreterConfig interpreter,
                        ProcessLauncher& launcher,
                        Logger& logger);

    [[nodiscard]] std::vector<std::string>
    command(const std::vector<std::string>& requirements, const Workspace& workspace) const;

    InstallOutcome install(const std::vector<std::string>& requirements,
                           const Workspace& workspace,
                           const std::map<std::string, std::string>& env,
                           Duration timeout);

private:
    InterpreterConfig interpreter_;
    ProcessLauncher& launcher_;
    Logger& logger_;
};

}  // namespace sandbox_exec
