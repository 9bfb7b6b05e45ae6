/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/types.hpp"

#include <cstdlib>
#include <string>

#include <toml++/toml.hpp>

namespace sandbox_exec {

namespace {

std::vector<std::string> string_array(const toml::node_view<toml::node>& node,
                                      std::vector<std::string> fallback) {
    const auto* arr = node.as_array();
    if (!arr) return fallback;

    std::vector<std::string> out;
    for (const auto& item : *arr) {
        if (auto s = item.value<std::string>()) {
            out.push_back(*s);
        }
    }
    return out;
}

/// A single path component: no separators, not "." or "..".
bool is_plain_name(const std::string& name) {
    return !name.empty() && name != "." && name != ".."
        && name.find('/') == std::string::npos && name.find('\0') == std::string::npos;
}

}  // anonymous namespace

std::filesystem::path WorkspaceConfig::effective_session_root() const {
    if (!session_root.empty()) return session_root;
    return std::filesystem::temp_directory_path() / "sandbox-exec";
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::Config, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [interpreter]
        if (auto interp = tbl["interpreter"]; interp.is_table()) {
            config.interpreter.command = interp["command"].value_or(std::string{config.interpreter.command});
            config.interpreter.pip_args = string_array(interp["pip_args"],
                                                       config.interpreter.pip_args);
        }

        // [workspace]
        if (auto ws = tbl["workspace"]; ws.is_table()) {
            config.workspace.session_root = ws["session_root"].value_or(std::string{});
            config.workspace.temp_prefix = ws["temp_prefix"].value_or(std::string{config.workspace.temp_prefix});
            config.workspace.deps_dir = ws["deps_dir"].value_or(std::string{config.workspace.deps_dir});
            config.workspace.entry_name = ws["entry_name"].value_or(std::string{config.workspace.entry_name});
        }

        // [limits]
        if (auto limits = tbl["limits"]; limits.is_table()) {
            config.limits.default_timeout_ms = static_cast<uint32_t>(
                limits["default_timeout_ms"].value_or(int64_t{30000}));
            config.limits.install_timeout_ms = static_cast<uint32_t>(
                limits["install_timeout_ms"].value_or(int64_t{300000}));
            config.limits.kill_grace_ms = static_cast<uint32_t>(
                limits["kill_grace_ms"].value_or(int64_t{0}));
            config.limits.max_output_bytes = static_cast<uint64_t>(
                limits["max_output_bytes"].value_or(int64_t{8 * 1024 * 1024}));
            config.limits.default_max_memory_mb = static_cast<uint64_t>(
                limits["default_max_memory_mb"].value_or(int64_t{0}));
        }

        // [environment]
        if (auto env = tbl["environment"]; env.is_table()) {
            config.environment.passthrough = string_array(env["passthrough"],
                                                          config.environment.passthrough);
        }

        // [logging]
        if (auto logging = tbl["logging"]; logging.is_table()) {
            config.logging.log_dir = logging["log_dir"].value_or(std::string{});
            config.logging.log_level = logging["log_level"].value_or(std::string{"info"});
            config.logging.max_file_size_mb = static_cast<uint32_t>(
                logging["max_file_size_mb"].value_or(int64_t{50}));
            config.logging.rotate_count = static_cast<uint32_t>(
                logging["rotate_count"].value_or(int64_t{5}));
        }

        if (config.limits.default_timeout_ms == 0
            || Duration{config.limits.default_timeout_ms} > kMaxTimeout) {
            return Error{ErrorKind::Config, "limits.default_timeout_ms must be between 1 and "
                         + std::to_string(kMaxTimeout.count())};
        }
        if (config.limits.default_max_memory_mb > kMaxMemoryMb) {
            return Error{ErrorKind::Config, "limits.default_max_memory_mb must not exceed "
                         + std::to_string(kMaxMemoryMb)};
        }
        if (!is_plain_name(config.workspace.entry_name)) {
            return Error{ErrorKind::Config, "workspace.entry_name must be a plain file name: "
                         + config.workspace.entry_name};
        }
        if (!is_plain_name(config.workspace.deps_dir)) {
            return Error{ErrorKind::Config, "workspace.deps_dir must be a plain directory name: "
                         + config.workspace.deps_dir};
        }
        if (config.workspace.entry_name == config.workspace.deps_dir) {
            return Error{ErrorKind::Config, "workspace.entry_name and workspace.deps_dir must differ"};
        }
        if (config.interpreter.command.empty()) {
            return Error{ErrorKind::Config, "interpreter.command must not be empty"};
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

void apply_env_overrides(Config& config) {
    if (const char* v = std::getenv("SANDBOX_EXEC_PYTHON"); v && *v) {
        config.interpreter.command = v;
    }
    if (const char* v = std::getenv("SANDBOX_EXEC_SESSION_ROOT"); v && *v) {
        config.workspace.session_root = v;
    }
    if (const char* v = std::getenv("SANDBOX_EXEC_LOG_LEVEL"); v && *v) {
        config.logging.log_level = v;
    }
    if (const char* v = std::getenv("SANDBOX_EXEC_LOG_DIR"); v) {
        config.logging.log_dir = v;
    }
}

}  // namespace sandbox_exec
