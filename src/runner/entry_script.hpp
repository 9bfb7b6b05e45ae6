/**
 * @file entry_script.hpp
 * @brief Generation of the Python entry program run by the child.
 */

#pragma once

#include "core/result.hpp"
#include "workspace/workspace_store.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace sandbox_exec {

/**
 * @brief Encode arbitrary bytes as an ASCII-only Python expression that
 *        evaluates to the equivalent `str` (invalid UTF-8 is replaced).
 */
[[nodiscard]] std::string python_str_expr(std::string_view text);

/**
 * @brief Builtins left visible when globals are disabled.
 */
[[nodiscard]] const std::vector<std::string_view>& restricted_builtins();

/**
 * @brief Writes the self-contained entry program into a workspace.
 *
 * The submitted code is embedded as a literal; nothing is evaluated in
 * the host process.
 */
class EntryScriptBuilder {
public:
    explicit EntryScriptBuilder(std::string entry_name);

    /// @return path of the written program inside `workspace.root`.
    Result<std::filesystem::path> build(const std::string& code,
                                        const Workspace& workspace,
                                        bool globals_enabled) const;

    /// Program text only; no I/O.
    [[nodiscard]] std::string render(const std::string& code,
                                     const std::vector<std::string>& files_written,
                                     bool globals_enabled) const;

private:
    std::string entry_name_;
};

}  // namespace sandbox_exec
