/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace sandbox_exec;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "sandbox_exec_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
        ::unsetenv("SANDBOX_EXEC_PYTHON");
        ::unsetenv("SANDBOX_EXEC_SESSION_ROOT");
        ::unsetenv("SANDBOX_EXEC_LOG_LEVEL");
        ::unsetenv("SANDBOX_EXEC_LOG_DIR");
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.interpreter.command, "python3");
    EXPECT_EQ(config.limits.default_timeout_ms, 30000u);
    EXPECT_EQ(config.limits.kill_grace_ms, 0u);
    EXPECT_EQ(config.workspace.deps_dir, "deps");
    EXPECT_TRUE(config.logging.log_dir.empty());
    EXPECT_EQ(config.workspace.effective_session_root(),
              std::filesystem::temp_directory_path() / "sandbox-exec");
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [interpreter]
        command = "/usr/bin/python3.11"
        pip_args = ["-m", "pip", "install"]

        [workspace]
        session_root = "/var/lib/sandbox"
        temp_prefix = "run-"
        deps_dir = "site"

        [limits]
        default_timeout_ms = 5000
        install_timeout_ms = 60000
        kill_grace_ms = 200
        max_output_bytes = 1024
        default_max_memory_mb = 512

        [environment]
        passthrough = ["PATH", "LANG"]

        [logging]
        log_dir = "/tmp/sandbox_logs"
        log_level = "debug"
        max_file_size_mb = 10
        rotate_count = 2
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.interpreter.command, "/usr/bin/python3.11");
    EXPECT_EQ(config.interpreter.pip_args.size(), 3u);
    EXPECT_EQ(config.workspace.session_root, "/var/lib/sandbox");
    EXPECT_EQ(config.workspace.effective_session_root(), "/var/lib/sandbox");
    EXPECT_EQ(config.workspace.temp_prefix, "run-");
    EXPECT_EQ(config.workspace.deps_dir, "site");
    EXPECT_EQ(config.limits.default_timeout_ms, 5000u);
    EXPECT_EQ(config.limits.install_timeout_ms, 60000u);
    EXPECT_EQ(config.limits.kill_grace_ms, 200u);
    EXPECT_EQ(config.limits.max_output_bytes, 1024u);
    EXPECT_EQ(config.limits.default_max_memory_mb, 512u);
    EXPECT_EQ(config.environment.passthrough, (std::vector<std::string>{"PATH", "LANG"}));
    EXPECT_EQ(config.logging.log_dir, "/tmp/sandbox_logs");
    EXPECT_EQ(config.logging.log_level, "debug");
    EXPECT_EQ(config.logging.rotate_count, 2u);
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [limits]
        default_timeout_ms = 1500
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->limits.default_timeout_ms, 1500u);
    // Defaults for everything else
    EXPECT_EQ(result->interpreter.command, "python3");
    EXPECT_EQ(result->logging.log_level, "info");
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Config);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Config);
}

TEST_F(ConfigTest, ZeroTimeoutRejected) {
    auto path = write_toml(R"(
        [limits]
        default_timeout_ms = 0
    )");
    EXPECT_FALSE(load_config(path).has_value());
}

TEST_F(ConfigTest, OutOfRangeLimitsRejected) {
    for (const char* body : {
             "[limits]\ndefault_timeout_ms = 86400001\n",
             "[limits]\ndefault_max_memory_mb = 1073741825\n",
         }) {
        auto result = load_config(write_toml(body));
        ASSERT_FALSE(result.has_value()) << body;
        EXPECT_EQ(result.error().kind, ErrorKind::Config) << body;
    }
}

TEST_F(ConfigTest, WorkspaceNamesMustBePlainNames) {
    for (const char* body : {
             "[workspace]\nentry_name = \"../x.py\"\n",
             "[workspace]\nentry_name = \"\"\n",
             "[workspace]\ndeps_dir = \"a/b\"\n",
             "[workspace]\ndeps_dir = \"..\"\n",
             "[workspace]\nentry_name = \"same\"\ndeps_dir = \"same\"\n",
         }) {
        auto result = load_config(write_toml(body));
        ASSERT_FALSE(result.has_value()) << body;
        EXPECT_EQ(result.error().kind, ErrorKind::Config) << body;
    }
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    ::setenv("SANDBOX_EXEC_PYTHON", "/opt/py/bin/python", 1);
    ::setenv("SANDBOX_EXEC_SESSION_ROOT", "/srv/sessions", 1);
    ::setenv("SANDBOX_EXEC_LOG_LEVEL", "warn", 1);

    auto config = default_config();
    apply_env_overrides(config);
    EXPECT_EQ(config.interpreter.command, "/opt/py/bin/python");
    EXPECT_EQ(config.workspace.session_root, "/srv/sessions");
    EXPECT_EQ(config.logging.log_level, "warn");
}
