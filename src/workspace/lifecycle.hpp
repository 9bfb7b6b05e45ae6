/**
 * @file lifecycle.hpp
 * @brief End-of-call workspace disposal.
 */

#pragma once

#include "core/logger.hpp"
#include "workspace/workspace_store.hpp"

namespace sandbox_exec {

/**
 * @brief Deletes ephemeral workspaces; leaves persistent ones alone.
 *
 * Filesystem errors are logged, never raised; a directory that cannot
 * be removed is left in place.
 */
class LifecycleManager {
public:
    explicit LifecycleManager(Logger& logger);

    /// @return true if the directory is gone (or was meant to stay).
    bool finalize(const Workspace& workspace, bool persisted);

private:
    Logger& logger_;
};

}  // namespace sandbox_exec
