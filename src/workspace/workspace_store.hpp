/**
 * @file workspace_store.hpp
 * @brief On-disk execution directories, ephemeral or session-persistent.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sandbox_exec {

/**
 * @brief A resolved execution directory.
 *
 * `files_written` lists the request's files in request order, as
 * normalized relative paths.
 */
struct Workspace {
    std::filesystem::path root;
    std::filesystem::path deps;
    std::vector<std::string> files_written;
    std::string session_id;
    bool persisted{false};
};

/**
 * @brief Check that a caller-supplied path stays inside a workspace.
 *
 * Rejects empty, absolute and `..`-escaping paths, and paths that do not
 * name a file. Purely lexical; symlinks are checked at write time.
 */
Result<std::filesystem::path> validate_relative_path(std::string_view path);

/**
 * @brief Session ids become directory names: `[A-Za-z0-9_.-]+`, not `.`/`..`.
 */
Result<void> validate_session_id(std::string_view id);

/**
 * @brief Creates, reuses and populates workspaces.
 *
 * Ephemeral workspaces are fresh `mkdtemp` directories under the system
 * temp dir. Persistent ones live at `<session_root>/session_<id>` and are
 * reused as-is across calls; concurrent calls on the same id are not
 * serialized here (last write wins).
 */
class WorkspaceStore {
public:
    WorkspaceStore(WorkspaceConfig config, Logger& logger);

    /**
     * @brief Resolve the workspace for one call and write `files` into it.
     *
     * persist && session_id  → reuse/create the session directory.
     * persist && !session_id → create a session with a generated id.
     * !persist               → fresh temporary directory.
     *
     * On failure no ephemeral directory is left behind.
     */
    Result<Workspace> resolve(bool persist,
                              const std::optional<std::string>& session_id,
                              const std::vector<FileSpec>& files);

    /// Validate every file path without touching the disk.
    [[nodiscard]] Result<void> validate_files(const std::vector<FileSpec>& files) const;

    [[nodiscard]] std::filesystem::path session_path(std::string_view session_id) const;

    /// Caller-owned cleanup of a persistent session.
    Result<void> remove_session(std::string_view session_id);

    /// Ids of the sessions currently on disk, sorted.
    [[nodiscard]] std::vector<std::string> list_sessions() const;

    [[nodiscard]] const WorkspaceConfig& config() const noexcept { return config_; }

private:
    Result<std::filesystem::path> make_temp_dir() const;
    Result<void> write_files(Workspace& workspace, const std::vector<FileSpec>& files) const;

    WorkspaceConfig config_;
    Logger& logger_;
};

}  // namespace sandbox_exec
