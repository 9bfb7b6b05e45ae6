/**
 * @file process_launcher.hpp
 * @brief Child process execution under a wall-clock deadline.
 *
 * The child runs in its own process group so that a timeout can kill it
 * together with everything it spawned. The environment is passed
 * explicitly; the launcher never reads or mutates the parent's.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sandbox_exec {

/**
 * @brief Everything one launch needs. Built per call, never shared.
 */
struct LaunchSpec {
    std::vector<std::string> argv;              ///< argv[0] is looked up on env PATH
    std::filesystem::path working_dir;
    std::map<std::string, std::string> env;     ///< Complete child environment
    Duration timeout{30000};                    ///< Clamped to kMaxTimeout
    std::optional<uint64_t> max_memory_mb;      ///< Advisory RLIMIT_AS cap, clamped to kMaxMemoryMb
    uint64_t max_output_bytes{8ULL * 1024 * 1024};
    Duration kill_grace{0};
};

/**
 * @brief Raw outcome of a launch that did start.
 */
struct ProcessOutput {
    std::string stdout_text;
    std::string stderr_text;
    std::optional<int> exit_code;       ///< Set on normal exit
    std::optional<int> term_signal;     ///< Set when terminated by a signal
    bool timed_out{false};
    bool stdout_truncated{false};
    bool stderr_truncated{false};
    MemoryLimit memory_limit{MemoryLimit::NotRequested};
    double elapsed_seconds{0.0};

    [[nodiscard]] bool exited_cleanly() const noexcept {
        return exit_code.has_value() && *exit_code == 0;
    }
};

/**
 * @brief Spawns one child per call and waits for it.
 *
 * run() blocks until the child exits or the deadline passes. The error
 * branch is used only when the child could not be started at all
 * (executable missing, fork/chdir/exec failure).
 */
class ProcessLauncher {
public:
    explicit ProcessLauncher(Logger& logger);

    Result<ProcessOutput> run(const LaunchSpec& spec);

    /// Whether RLIMIT_AS caps are honored on this host.
    [[nodiscard]] static bool memory_limit_supported() noexcept;

    /// Resolve `name` against a colon-separated search path.
    [[nodiscard]] static std::optional<std::filesystem::path>
    find_executable(const std::string& name, const std::string& search_path);

private:
    Logger& logger_;
};

}  // namespace sandbox_exec
