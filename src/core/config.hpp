/**
 * @file config.hpp
 * @brief Executor configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/result.hpp"

namespace sandbox_exec {

struct InterpreterConfig {
    std::string command = "python3";
    std::vector<std::string> pip_args = {
        "-m", "pip", "install", "--quiet", "--disable-pip-version-check"};
};

struct WorkspaceConfig {
    std::filesystem::path session_root;          ///< empty = <tmp>/sandbox-exec
    std::string temp_prefix = "sandbox-exec-";
    std::string deps_dir = "deps";
    std::string entry_name = ".sandbox_exec_entry.py";

    [[nodiscard]] std::filesystem::path effective_session_root() const;
};

struct LimitsConfig {
    uint32_t default_timeout_ms = 30000;
    uint32_t install_timeout_ms = 300000;
    uint32_t kill_grace_ms = 0;                  ///< SIGTERM→SIGKILL delay; 0 = SIGKILL at once
    uint64_t max_output_bytes = 8ULL * 1024 * 1024;
    uint64_t default_max_memory_mb = 0;          ///< 0 = no cap unless requested
};

struct EnvironmentConfig {
    std::vector<std::string> passthrough = {"PATH", "HOME", "LANG", "LC_ALL", "TMPDIR"};
};

struct LoggingConfig {
    std::filesystem::path log_dir;               ///< empty = stderr
    std::string log_level = "info";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    InterpreterConfig interpreter;
    WorkspaceConfig workspace;
    LimitsConfig limits;
    EnvironmentConfig environment;
    LoggingConfig logging;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Apply SANDBOX_EXEC_* environment overrides on top of a config.
 *
 * Recognized: SANDBOX_EXEC_PYTHON, SANDBOX_EXEC_SESSION_ROOT,
 * SANDBOX_EXEC_LOG_LEVEL, SANDBOX_EXEC_LOG_DIR.
 */
void apply_env_overrides(Config& config);

}  // namespace sandbox_exec
