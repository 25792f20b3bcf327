#include "tutorgate/gateway/resource_governor.hpp"
#include "tutorgate/gateway/observability.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tutorgate {
namespace gateway {

namespace {

// Records the child writes to the status pipe before exec
enum ChildStage : int {
    stage_isolated = 0,  // informational, value = 1 when the network namespace was created
    stage_redirect = 1,
    stage_chdir = 2,
    stage_isolation = 3,
    stage_rlimit = 4,
    stage_exec = 5
};

struct ChildReport {
    int stage;
    int value;
};

const char* stage_name(int stage) {
    switch (stage) {
        case stage_redirect: return "redirect";
        case stage_chdir: return "chdir";
        case stage_isolation: return "network isolation";
        case stage_rlimit: return "setrlimit";
        case stage_exec: return "exec";
        default: return "setup";
    }
}

[[noreturn]] void child_fail(int status_fd, int stage) {
    ChildReport report{stage, errno};
    ssize_t written = write(status_fd, &report, sizeof(report));
    (void)written;
    _exit(127);
}

class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

caf::expected<std::pair<int, int>> make_pipe(int flags) {
    int fds[2];
    if (pipe2(fds, flags) != 0) {
        return caf::make_error(caf::sec::runtime_error, std::string("pipe2 failed: ") + std::strerror(errno));
    }
    return std::make_pair(fds[0], fds[1]);
}

// Disposable working directory, removed with everything in it
class ScratchDirectory {
public:
    static caf::expected<std::unique_ptr<ScratchDirectory>> create(const std::string& root) {
        std::string pattern = root + "/tutorgate-XXXXXX";
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (mkdtemp(buffer.data()) == nullptr) {
            return caf::make_error(caf::sec::runtime_error,
                                   "mkdtemp failed under " + root + ": " + std::strerror(errno));
        }
        return std::unique_ptr<ScratchDirectory>(new ScratchDirectory(buffer.data()));
    }

    ~ScratchDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::string& path() const { return path_; }

    caf::expected<void> write_file(const std::string& name, const std::string& content) {
        if (name.empty() || name.find('/') != std::string::npos) {
            return caf::make_error(caf::sec::invalid_argument, "invalid scratch file name: " + name);
        }
        std::ofstream file(path_ + "/" + name, std::ios::binary | std::ios::trunc);
        file << content;
        file.close();
        if (!file) {
            return caf::make_error(caf::sec::runtime_error, "failed to write scratch file " + name);
        }
        return caf::unit;
    }

private:
    explicit ScratchDirectory(std::string path) : path_(std::move(path)) {}
    std::string path_;
};

// One captured output stream
struct StreamCapture {
    FileDescriptor fd;
    std::string* out;
    bool* truncated;
    size_t cap;

    bool open() const { return fd.valid(); }

    void drain() {
        char buffer[8192];
        while (fd.valid()) {
            ssize_t n = read(fd.get(), buffer, sizeof(buffer));
            if (n > 0) {
                size_t room = cap > out->size() ? cap - out->size() : 0;
                if (static_cast<size_t>(n) > room) {
                    out->append(buffer, room);
                    *truncated = true;
                } else {
                    out->append(buffer, static_cast<size_t>(n));
                }
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                return;
            }
            fd.reset();  // EOF or hard error
        }
    }
};

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

std::chrono::milliseconds to_millis(const struct timeval& tv) {
    return std::chrono::milliseconds(static_cast<int64_t>(tv.tv_sec) * 1000 + tv.tv_usec / 1000);
}

KilledReason classify(const BoundedResult& result, const ResourceLimits& limits,
                      const std::vector<std::string>& memory_markers) {
    if (result.timed_out) {
        return KilledReason::timeout;
    }
    int sig = result.term_signal;
    if (sig == SIGXCPU ||
        (sig == SIGKILL && limits.cpu_seconds > 0 && result.cpu_time.count() >= limits.cpu_seconds * 1000)) {
        return KilledReason::cpu_limit;
    }
    if (sig == SIGXFSZ) {
        return KilledReason::file_size_limit;
    }
    if (result.exit_code != 0) {
        for (const auto& marker : memory_markers) {
            if (result.stderr_text.find(marker) != std::string::npos) {
                return KilledReason::memory_limit;
            }
        }
    }
    return KilledReason::none;
}

} // namespace

ResourceGovernor::ResourceGovernor(std::string temp_root,
                                   std::shared_ptr<Observability> observability,
                                   bool require_network_isolation)
    : temp_root_(std::move(temp_root)),
      observability_(std::move(observability)),
      require_network_isolation_(require_network_isolation) {
    // Writes to a child that already exited must fail with EPIPE, not kill us
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

caf::expected<std::string> ResourceGovernor::resolve_program(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        if (access(program.c_str(), X_OK) == 0) {
            return program;
        }
        return caf::make_error(caf::sec::invalid_argument, "program not executable: " + program);
    }

    std::stringstream path(kSandboxPath);
    std::string dir;
    while (std::getline(path, dir, ':')) {
        std::string candidate = dir + "/" + program;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return caf::make_error(caf::sec::invalid_argument, "program not found on sandbox PATH: " + program);
}

caf::expected<BoundedResult> ResourceGovernor::run_bounded(const BoundedCommand& command,
                                                           const ResourceLimits& limits) {
    auto program = resolve_program(command.program);
    if (!program) {
        return program.error();
    }

    auto scratch = ScratchDirectory::create(temp_root_);
    if (!scratch) {
        return scratch.error();
    }
    const std::string& workdir = (*scratch)->path();

    for (const auto& [name, content] : command.files) {
        auto written = (*scratch)->write_file(name, content);
        if (!written) {
            return written.error();
        }
    }

    // Everything the child needs is built before fork
    std::vector<std::string> argv_storage;
    argv_storage.push_back(*program);
    argv_storage.insert(argv_storage.end(), command.args.begin(), command.args.end());
    std::vector<char*> argv;
    for (auto& arg : argv_storage) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage = {
        std::string("PATH=") + kSandboxPath,
        "HOME=" + workdir,
        "TMPDIR=" + workdir,
        "LANG=C.UTF-8"
    };
    std::vector<char*> envp;
    for (auto& var : env_storage) {
        envp.push_back(const_cast<char*>(var.c_str()));
    }
    envp.push_back(nullptr);

    struct LimitSetting {
        int resource;
        rlim_t soft;
        rlim_t hard;
    };
    std::vector<LimitSetting> rlimits;
    rlimits.push_back({RLIMIT_CORE, 0, 0});
    if (limits.cpu_seconds > 0) {
        // Soft limit raises SIGXCPU, the hard limit one second later SIGKILL
        rlimits.push_back({RLIMIT_CPU, static_cast<rlim_t>(limits.cpu_seconds),
                           static_cast<rlim_t>(limits.cpu_seconds + 1)});
    }
    if (limits.limit_address_space && limits.memory_bytes > 0) {
        rlimits.push_back({RLIMIT_AS, static_cast<rlim_t>(limits.memory_bytes),
                           static_cast<rlim_t>(limits.memory_bytes)});
    }
    if (limits.max_file_bytes > 0) {
        rlimits.push_back({RLIMIT_FSIZE, static_cast<rlim_t>(limits.max_file_bytes),
                           static_cast<rlim_t>(limits.max_file_bytes)});
    }
    if (limits.max_open_files > 0) {
        rlimits.push_back({RLIMIT_NOFILE, static_cast<rlim_t>(limits.max_open_files),
                           static_cast<rlim_t>(limits.max_open_files)});
    }
    if (limits.max_processes > 0) {
        rlimits.push_back({RLIMIT_NPROC, static_cast<rlim_t>(limits.max_processes),
                           static_cast<rlim_t>(limits.max_processes)});
    }

    long open_max = sysconf(_SC_OPEN_MAX);
    int max_fd = open_max > 0 && open_max < 65536 ? static_cast<int>(open_max) : 65536;
    const bool require_isolation = require_network_isolation_;

    auto stdin_pipe = make_pipe(O_CLOEXEC);
    auto stdout_pipe = make_pipe(O_CLOEXEC);
    auto stderr_pipe = make_pipe(O_CLOEXEC);
    auto status_pipe = make_pipe(O_CLOEXEC);
    if (!stdin_pipe || !stdout_pipe || !stderr_pipe || !status_pipe) {
        for (auto* p : {&stdin_pipe, &stdout_pipe, &stderr_pipe, &status_pipe}) {
            if (*p) {
                close((*p)->first);
                close((*p)->second);
            }
        }
        return caf::make_error(caf::sec::runtime_error, "failed to create sandbox pipes");
    }

    FileDescriptor stdin_read(stdin_pipe->first), stdin_write(stdin_pipe->second);
    FileDescriptor stdout_read(stdout_pipe->first), stdout_write(stdout_pipe->second);
    FileDescriptor stderr_read(stderr_pipe->first), stderr_write(stderr_pipe->second);
    FileDescriptor status_read(status_pipe->first), status_write(status_pipe->second);

    auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        return caf::make_error(caf::sec::runtime_error, std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only from here on
        int status_fd = status_write.get();
        setsid();

        if (dup2(stdin_read.get(), STDIN_FILENO) < 0 ||
            dup2(stdout_write.get(), STDOUT_FILENO) < 0 ||
            dup2(stderr_write.get(), STDERR_FILENO) < 0) {
            child_fail(status_fd, stage_redirect);
        }
        for (int fd = 3; fd < max_fd; ++fd) {
            if (fd != status_fd) {
                close(fd);
            }
        }

        struct sigaction default_action;
        std::memset(&default_action, 0, sizeof(default_action));
        default_action.sa_handler = SIG_DFL;
        sigaction(SIGPIPE, &default_action, nullptr);
        sigset_t empty_mask;
        sigemptyset(&empty_mask);
        sigprocmask(SIG_SETMASK, &empty_mask, nullptr);

        if (chdir(workdir.c_str()) != 0) {
            child_fail(status_fd, stage_chdir);
        }

        bool isolated = unshare(CLONE_NEWNET) == 0 || unshare(CLONE_NEWUSER | CLONE_NEWNET) == 0;
        if (!isolated && require_isolation) {
            child_fail(status_fd, stage_isolation);
        }
        ChildReport info{stage_isolated, isolated ? 1 : 0};
        ssize_t written = write(status_fd, &info, sizeof(info));
        (void)written;

        for (const auto& setting : rlimits) {
            struct rlimit rl;
            rl.rlim_cur = setting.soft;
            rl.rlim_max = setting.hard;
            if (setrlimit(setting.resource, &rl) != 0) {
                child_fail(status_fd, stage_rlimit);
            }
        }

        execve(argv[0], argv.data(), envp.data());
        child_fail(status_fd, stage_exec);
    }

    // Parent
    stdin_read.reset();
    stdout_write.reset();
    stderr_write.reset();
    status_write.reset();

    BoundedResult result;

    // The status pipe closes on exec (CLOEXEC); any failure record arrives first
    ChildReport report{};
    for (;;) {
        ssize_t n = read(status_read.get(), &report, sizeof(report));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n != static_cast<ssize_t>(sizeof(report))) {
            break;
        }
        if (report.stage == stage_isolated) {
            result.network_isolated = report.value == 1;
            continue;
        }
        int child_status = 0;
        while (waitpid(pid, &child_status, 0) < 0 && errno == EINTR) {}
        observability_->log_error("Sandbox process setup failed", "", "", {
            {"stage", stage_name(report.stage)},
            {"error", std::strerror(report.value)},
            {"program", command.program}
        });
        return caf::make_error(caf::sec::runtime_error,
                               std::string("sandbox setup failed at ") + stage_name(report.stage) +
                               ": " + std::strerror(report.value));
    }
    status_read.reset();

    if (!result.network_isolated) {
        observability_->log_debug("Sandbox process runs without a private network namespace", "", "", {
            {"program", command.program}
        });
    }

    StreamCapture out{FileDescriptor(), &result.stdout_text, &result.stdout_truncated, limits.max_output_bytes};
    StreamCapture err{FileDescriptor(), &result.stderr_text, &result.stderr_truncated, limits.max_output_bytes};
    out.fd.reset(stdout_read.release());
    err.fd.reset(stderr_read.release());
    set_nonblocking(out.fd.get());
    set_nonblocking(err.fd.get());

    size_t stdin_offset = 0;
    if (command.stdin_data.empty()) {
        stdin_write.reset();
    } else {
        set_nonblocking(stdin_write.get());
    }

    const auto deadline = start + limits.wall_timeout;
    std::chrono::steady_clock::time_point kill_at;
    bool term_sent = false;
    bool kill_sent = false;
    bool reaped = false;
    int status = 0;
    struct rusage usage;
    std::memset(&usage, 0, sizeof(usage));

    while (!reaped) {
        auto now = std::chrono::steady_clock::now();
        if (!term_sent && now >= deadline) {
            kill(-pid, SIGTERM);
            term_sent = true;
            result.timed_out = true;
            kill_at = now + limits.grace_period;
        }
        if (term_sent && !kill_sent && now >= kill_at) {
            kill(-pid, SIGKILL);
            kill_sent = true;
        }

        auto next_event = term_sent ? (kill_sent ? now + std::chrono::milliseconds(50) : kill_at) : deadline;
        auto wait_ms = std::chrono::duration_cast<std::chrono::milliseconds>(next_event - now).count();
        wait_ms = std::max<int64_t>(0, std::min<int64_t>(wait_ms, 50));

        std::vector<struct pollfd> fds;
        if (out.open()) fds.push_back({out.fd.get(), POLLIN, 0});
        if (err.open()) fds.push_back({err.fd.get(), POLLIN, 0});
        if (stdin_write.valid()) fds.push_back({stdin_write.get(), POLLOUT, 0});

        int rc = poll(fds.data(), fds.size(), static_cast<int>(wait_ms));
        if (rc < 0 && errno != EINTR) {
            kill(-pid, SIGKILL);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            return caf::make_error(caf::sec::runtime_error, std::string("poll failed: ") + std::strerror(errno));
        }

        for (const auto& entry : fds) {
            if (entry.revents == 0) continue;
            if (entry.fd == out.fd.get()) {
                out.drain();
            } else if (entry.fd == err.fd.get()) {
                err.drain();
            } else if (entry.fd == stdin_write.get()) {
                ssize_t n = write(stdin_write.get(), command.stdin_data.data() + stdin_offset,
                                  command.stdin_data.size() - stdin_offset);
                if (n > 0) {
                    stdin_offset += static_cast<size_t>(n);
                }
                if ((n < 0 && errno != EAGAIN && errno != EINTR) || stdin_offset >= command.stdin_data.size()) {
                    stdin_write.reset();
                }
            }
        }

        pid_t waited = wait4(pid, &status, WNOHANG, &usage);
        if (waited == pid) {
            reaped = true;
        } else if (waited < 0 && errno != EINTR) {
            return caf::make_error(caf::sec::runtime_error, std::string("wait4 failed: ") + std::strerror(errno));
        }
    }
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    // Background children left in the group die with the leader
    kill(-pid, SIGKILL);
    stdin_write.reset();
    auto linger_until = std::chrono::steady_clock::now() + std::chrono::milliseconds(200);
    while ((out.open() || err.open()) && std::chrono::steady_clock::now() < linger_until) {
        std::vector<struct pollfd> fds;
        if (out.open()) fds.push_back({out.fd.get(), POLLIN, 0});
        if (err.open()) fds.push_back({err.fd.get(), POLLIN, 0});
        if (poll(fds.data(), fds.size(), 20) < 0 && errno != EINTR) {
            break;
        }
        out.drain();
        err.drain();
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    }
    result.cpu_time = to_millis(usage.ru_utime) + to_millis(usage.ru_stime);
    result.peak_rss_bytes = static_cast<int64_t>(usage.ru_maxrss) * 1024;
    result.killed_reason = classify(result, limits, command.memory_error_markers);

    observability_->log_debug("Sandbox process finished", "", "", {
        {"program", command.program},
        {"exit_code", std::to_string(result.exit_code)},
        {"elapsed_ms", std::to_string(result.elapsed.count())},
        {"cpu_ms", std::to_string(result.cpu_time.count())},
        {"timed_out", result.timed_out ? "true" : "false"}
    });

    return result;
}

} // namespace gateway
} // namespace tutorgate
