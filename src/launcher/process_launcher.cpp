/**
 * @file process_launcher.cpp
 * @brief ProcessLauncher implementation: fork/execve with poll()-driven capture.
 *
 * Spawn protocol:
 *   The child reports setup failures over a close-on-exec status pipe as
 *   fixed-size {stage, errno} records. EOF without a fatal record means
 *   execve() succeeded. Because the child calls setpgid(0, 0) before
 *   execve(), the process group is guaranteed to exist once EOF is seen.
 */

#include "launcher/process_launcher.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandbox_exec {

namespace {

constexpr int kPollSliceMs = 50;
constexpr int kDrainWindowMs = 500;
constexpr size_t kReadChunk = 64 * 1024;

enum class ChildStage : int {
    Stdio = 1,
    Chdir = 2,
    Rlimit = 3,
    Exec = 4
};

struct ChildReport {
    int stage;
    int error;
};

const char* stage_name(int stage) {
    switch (static_cast<ChildStage>(stage)) {
        case ChildStage::Stdio:  return "redirecting stdio";
        case ChildStage::Chdir:  return "changing to working directory";
        case ChildStage::Rlimit: return "setting memory limit";
        case ChildStage::Exec:   return "executing";
    }
    return "starting child";
}

// Only async-signal-safe calls below: this runs between fork and exec.
void child_report(int fd, ChildStage stage) {
    ChildReport report{static_cast<int>(stage), errno};
    ssize_t n = ::write(fd, &report, sizeof(report));
    (void)n;
}

[[noreturn]] void child_fail(int fd, ChildStage stage) {
    child_report(fd, stage);
    ::_exit(127);
}

/**
 * @brief Owning file descriptor.
 */
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.fd_);
            other.fd_ = -1;
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_{-1};
};

Result<void> make_pipe(UniqueFd& read_end, UniqueFd& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return Error{ErrorKind::Spawn, "pipe2 failed: " + std::string(std::strerror(errno))};
    }
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return {};
}

/**
 * @brief One captured stream of the child.
 */
struct Stream {
    UniqueFd fd;
    std::string* sink;
    bool* truncated;
    uint64_t cap;

    /// @return false once the stream reached EOF or failed.
    bool read_once() {
        char buf[kReadChunk];
        ssize_t n = ::read(fd.get(), buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) return true;
            fd.reset();
            return false;
        }
        if (n == 0) {
            fd.reset();
            return false;
        }
        auto room = cap > sink->size() ? cap - sink->size() : 0;
        auto take = std::min<uint64_t>(room, static_cast<uint64_t>(n));
        sink->append(buf, static_cast<size_t>(take));
        if (take < static_cast<uint64_t>(n)) *truncated = true;
        return true;
    }
};

/**
 * @brief Poll open streams once for at most `timeout_ms`.
 * @return number of streams still open.
 */
int pump(Stream* streams, size_t count, int timeout_ms) {
    pollfd fds[2];
    Stream* owners[2];
    nfds_t n = 0;
    for (size_t i = 0; i < count; ++i) {
        if (!streams[i].fd.valid()) continue;
        fds[n].fd = streams[i].fd.get();
        fds[n].events = POLLIN;
        fds[n].revents = 0;
        owners[n] = &streams[i];
        ++n;
    }
    if (n == 0) return 0;

    int ready = ::poll(fds, n, timeout_ms);
    if (ready > 0) {
        for (nfds_t i = 0; i < n; ++i) {
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)) {
                owners[i]->read_once();
            }
        }
    }

    int still_open = 0;
    for (size_t i = 0; i < count; ++i) {
        if (streams[i].fd.valid()) ++still_open;
    }
    return still_open;
}

int millis_until(SteadyTime deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return static_cast<int>(std::max<int64_t>(left, 0));
}

pid_t wait_child(pid_t pid, int* status, int options) {
    pid_t w;
    do {
        w = ::waitpid(pid, status, options);
    } while (w < 0 && errno == EINTR);
    return w;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// ProcessLauncher
// ─────────────────────────────────────────────

ProcessLauncher::ProcessLauncher(Logger& logger) : logger_(logger) {}

bool ProcessLauncher::memory_limit_supported() noexcept {
#if defined(__linux__)
    return true;
#else
    // RLIMIT_AS is accepted but not enforced on Darwin.
    return false;
#endif
}

std::optional<std::filesystem::path>
ProcessLauncher::find_executable(const std::string& name, const std::string& search_path) {
    auto executable = [](const std::filesystem::path& p) {
        struct stat st{};
        return ::stat(p.c_str(), &st) == 0 && S_ISREG(st.st_mode)
            && ::access(p.c_str(), X_OK) == 0;
    };

    if (name.empty()) return std::nullopt;
    if (name.find('/') != std::string::npos) {
        if (executable(name)) return std::filesystem::path{name};
        return std::nullopt;
    }

    std::istringstream dirs(search_path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        auto candidate = std::filesystem::path{dir.empty() ? "." : dir} / name;
        if (executable(candidate)) return candidate;
    }
    return std::nullopt;
}

Result<ProcessOutput> ProcessLauncher::run(const LaunchSpec& spec) {
    if (spec.argv.empty()) {
        return Error{ErrorKind::Spawn, "Empty argument vector"};
    }

    auto path_it = spec.env.find("PATH");
    std::string search_path = path_it != spec.env.end()
        ? path_it->second : std::string{"/usr/local/bin:/usr/bin:/bin"};
    auto executable = find_executable(spec.argv[0], search_path);
    if (!executable) {
        return Error{ErrorKind::Spawn, "Executable not found: " + spec.argv[0]};
    }

    // Everything the child touches is prepared before fork().
    const std::string exe = executable->string();
    const std::string work_dir = spec.working_dir.string();

    std::vector<char*> c_argv;
    c_argv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) c_argv.push_back(const_cast<char*>(arg.c_str()));
    c_argv.push_back(nullptr);

    std::vector<std::string> env_entries;
    env_entries.reserve(spec.env.size());
    for (const auto& [key, value] : spec.env) env_entries.push_back(key + "=" + value);
    std::vector<char*> c_envp;
    c_envp.reserve(env_entries.size() + 1);
    for (auto& entry : env_entries) c_envp.push_back(entry.data());
    c_envp.push_back(nullptr);

    const bool want_limit = spec.max_memory_mb.has_value() && *spec.max_memory_mb > 0;
    const bool apply_limit = want_limit && memory_limit_supported();
    rlimit limit{};
    if (apply_limit) {
        limit.rlim_cur = limit.rlim_max =
            static_cast<rlim_t>(std::min(*spec.max_memory_mb, kMaxMemoryMb)) * 1024ULL * 1024ULL;
    }

    UniqueFd out_r, out_w, err_r, err_w, status_r, status_w;
    if (auto r = make_pipe(out_r, out_w); !r) return r.error();
    if (auto r = make_pipe(err_r, err_w); !r) return r.error();
    if (auto r = make_pipe(status_r, status_w); !r) return r.error();
    UniqueFd dev_null(::open("/dev/null", O_RDONLY | O_CLOEXEC));

    const auto start = std::chrono::steady_clock::now();
    pid_t pid = ::fork();
    if (pid < 0) {
        return Error{ErrorKind::Spawn, "fork failed: " + std::string(std::strerror(errno))};
    }

    if (pid == 0) {
        const int report_fd = status_w.get();
        ::setpgid(0, 0);
        if (dev_null.valid() && ::dup2(dev_null.get(), STDIN_FILENO) < 0) {
            child_fail(report_fd, ChildStage::Stdio);
        }
        if (::dup2(out_w.get(), STDOUT_FILENO) < 0 || ::dup2(err_w.get(), STDERR_FILENO) < 0) {
            child_fail(report_fd, ChildStage::Stdio);
        }
        if (::chdir(work_dir.c_str()) != 0) {
            child_fail(report_fd, ChildStage::Chdir);
        }
        if (apply_limit && ::setrlimit(RLIMIT_AS, &limit) != 0) {
            child_report(report_fd, ChildStage::Rlimit);
        }
        ::execve(exe.c_str(), c_argv.data(), c_envp.data());
        child_fail(report_fd, ChildStage::Exec);
    }

    out_w.reset();
    err_w.reset();
    status_w.reset();
    dev_null.reset();

    ProcessOutput output;
    output.memory_limit = !want_limit ? MemoryLimit::NotRequested
                        : apply_limit ? MemoryLimit::Applied
                                      : MemoryLimit::Unsupported;

    // Blocks until execve() closes the pipe or the child reports failure.
    ChildReport report{};
    while (true) {
        ssize_t n = ::read(status_r.get(), &report, sizeof(report));
        if (n < 0 && errno == EINTR) continue;
        if (n != static_cast<ssize_t>(sizeof(report))) break;

        if (static_cast<ChildStage>(report.stage) == ChildStage::Rlimit) {
            output.memory_limit = MemoryLimit::Unsupported;
            logger_.warn("Memory limit not applied: " + std::string(std::strerror(report.error)));
            continue;
        }

        int ignored = 0;
        wait_child(pid, &ignored, 0);
        return Error{ErrorKind::Spawn, std::string("Child failed while ") + stage_name(report.stage)
                     + ": " + std::strerror(report.error)};
    }
    status_r.reset();

    logger_.debug("Launched pid " + std::to_string(pid) + ": " + exe);

    Stream streams[2] = {
        {std::move(out_r), &output.stdout_text, &output.stdout_truncated, spec.max_output_bytes},
        {std::move(err_r), &output.stderr_text, &output.stderr_truncated, spec.max_output_bytes},
    };

    // Clamped so the steady_clock arithmetic cannot overflow into the past.
    const auto deadline = start + std::clamp(spec.timeout, Duration{0}, kMaxTimeout);
    int wait_status = 0;
    bool reaped = false;
    SteadyTime drain_until{};

    while (true) {
        if (!reaped && wait_child(pid, &wait_status, WNOHANG) == pid) {
            reaped = true;
            // The leader is gone; nothing else in its group may outlive it.
            ::kill(-pid, SIGKILL);
            drain_until = std::chrono::steady_clock::now()
                        + std::chrono::milliseconds(kDrainWindowMs);
        }

        int wait_ms;
        if (reaped) {
            wait_ms = millis_until(drain_until);
            if (wait_ms == 0) break;
        } else {
            wait_ms = millis_until(deadline);
            if (wait_ms == 0) {
                output.timed_out = true;
                break;
            }
        }

        int still_open = pump(streams, 2, std::min(wait_ms, kPollSliceMs));
        if (still_open == 0 && reaped) break;
        if (still_open == 0) {
            // Streams closed but the child is still alive: just wait it out.
            std::this_thread::sleep_for(std::chrono::milliseconds(
                std::min(millis_until(deadline), kPollSliceMs)));
        }
    }

    if (output.timed_out) {
        logger_.warn("Timeout after " + std::to_string(spec.timeout.count())
                     + "ms, killing process group " + std::to_string(pid));
        if (spec.kill_grace.count() > 0) {
            ::kill(-pid, SIGTERM);
            const auto grace_end = std::chrono::steady_clock::now() + spec.kill_grace;
            while (std::chrono::steady_clock::now() < grace_end) {
                if (wait_child(pid, &wait_status, WNOHANG) == pid) {
                    reaped = true;
                    break;
                }
                pump(streams, 2, 10);
            }
        }
        ::kill(-pid, SIGKILL);
        if (!reaped) {
            wait_child(pid, &wait_status, 0);
            reaped = true;
        }
        const auto drain_end = std::chrono::steady_clock::now()
                             + std::chrono::milliseconds(kDrainWindowMs);
        while (pump(streams, 2, std::min(millis_until(drain_end), kPollSliceMs)) > 0
               && millis_until(drain_end) > 0) {
        }
    }

    output.elapsed_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    if (WIFEXITED(wait_status)) {
        output.exit_code = WEXITSTATUS(wait_status);
    } else if (WIFSIGNALED(wait_status)) {
        output.term_signal = WTERMSIG(wait_status);
    }

    if (output.stdout_truncated || output.stderr_truncated) {
        logger_.warn("Child output exceeded " + std::to_string(spec.max_output_bytes)
                     + " bytes and was truncated");
    }
    logger_.debug("pid " + std::to_string(pid) + " finished in "
                  + std::to_string(output.elapsed_seconds) + "s");
    return output;
}

}  // namespace sandbox_exec
