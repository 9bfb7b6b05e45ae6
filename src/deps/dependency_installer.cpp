/**
 * @file dependency_installer.cpp
 * @brief DependencyInstaller implementation.
 */

#include "deps/dependency_installer.hpp"

namespace sandbox_exec {

Result<void> validate_requirements(const std::vector<std::string>& requirements) {
    for (const auto& req : requirements) {
        if (req.empty()) {
            return invalid_request("Empty requirement specifier");
        }
        if (req.front() == '-') {
            return invalid_request("Requirement looks like an installer option: " + req);
        }
        if (req.find_first_of("\n\r") != std::string::npos || req.find('\0') != std::string::npos) {
            return invalid_request("Requirement contains control characters");
        }
    }
    return {};
}

DependencyInstaller::DependencyInstaller(InterpreterConfig interpreter,
                                         ProcessLauncher& launcher,
                                         Logger& logger)
    : interpreter_(std::move(interpreter)), launcher_(launcher), logger_(logger) {}

std::vector<std::string>
DependencyInstaller::command(const std::vector<std::string>& requirements,
                             const Workspace& workspace) const {
    std::vector<std::string> argv;
    argv.push_back(interpreter_.command);
    argv.insert(argv.end(), interpreter_.pip_args.begin(), interpreter_.pip_args.end());
    argv.push_back("--target");
    argv.push_back(workspace.deps.string());
    argv.insert(argv.end(), requirements.begin(), requirements.end());
    return argv;
}

InstallOutcome DependencyInstaller::install(const std::vector<std::string>& requirements,
                                            const Workspace& workspace,
                                            const std::map<std::string, std::string>& env,
                                            Duration timeout) {
    InstallOutcome outcome;
    outcome.path = workspace.deps;
    if (requirements.empty()) {
        outcome.succeeded = true;
        return outcome;
    }

    std::string joined;
    for (const auto& req : requirements) {
        if (!joined.empty()) joined += ' ';
        joined += req;
    }
    logger_.info("Installing into " + workspace.deps.string() + ": " + joined);

    LaunchSpec spec;
    spec.argv = command(requirements, workspace);
    spec.working_dir = workspace.root;
    spec.env = env;
    spec.timeout = timeout;

    auto run = launcher_.run(spec);
    if (!run) {
        outcome.diagnostics = run.error().message;
        logger_.warn("Dependency installer could not start: " + run.error().message);
        return outcome;
    }

    outcome.diagnostics = run->stderr_text;
    outcome.succeeded = !run->timed_out && run->exited_cleanly();
    if (outcome.succeeded) {
        logger_.info("Dependencies installed in " + std::to_string(run->elapsed_seconds) + "s");
    } else if (run->timed_out) {
        logger_.warn("Dependency install timed out; continuing without it");
    } else {
        logger_.warn("Dependency install failed (" + std::to_string(run->exit_code.value_or(-1))
                     + "); continuing: " + run->stderr_text);
    }
    return outcome;
}

}  // namespace sandbox_exec
