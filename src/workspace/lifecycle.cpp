/**
 * @file lifecycle.cpp
 * @brief LifecycleManager implementation.
 */

#include "workspace/lifecycle.hpp"

#include <filesystem>
#include <system_error>

namespace sandbox_exec {

LifecycleManager::LifecycleManager(Logger& logger) : logger_(logger) {}

bool LifecycleManager::finalize(const Workspace& workspace, bool persisted) {
    if (persisted) {
        logger_.debug("Keeping session workspace " + workspace.root.string());
        return true;
    }
    if (workspace.root.empty()) return true;

    std::error_code ec;
    std::filesystem::remove_all(workspace.root, ec);
    if (ec) {
        logger_.warn("Failed to remove workspace " + workspace.root.string()
                     + ": " + ec.message());
        return false;
    }
    logger_.debug("Removed workspace " + workspace.root.string());
    return true;
}

}  // namespace sandbox_exec
