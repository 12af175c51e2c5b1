/**
 * @file subprocess.cpp
 * @brief Subprocess implementation — fork/exec, poll-driven stdio pump.
 */

#include "runtime/subprocess.hpp"

#include <fcntl.h>
#include <grp.h>
#include <poll.h>
#include <sched.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>

extern char** environ;

namespace sandbox_gate {

namespace {

constexpr size_t kReadChunk = 64 * 1024;

/// Writers that outlive the child (background grandchildren) are cut off
/// this long after the child itself exits.
constexpr auto kDrainAfterExit = Millis{100};

/// Reported through the CLOEXEC error pipe when the child fails before exec.
struct ChildFailure {
    int stage;
    int error;
};

enum ChildStage : int {
    StageSetsid = 1,
    StageRedirect,
    StageChdir,
    StageRlimit,
    StageSetgroups,
    StageSetgid,
    StageSetuid,
    StageNoNewPrivs,
    StageExec
};

const char* stage_name(int stage) {
    switch (stage) {
        case StageSetsid:     return "setsid";
        case StageRedirect:   return "dup2";
        case StageChdir:      return "chdir";
        case StageRlimit:     return "setrlimit";
        case StageSetgroups:  return "setgroups";
        case StageSetgid:     return "setgid";
        case StageSetuid:     return "setuid";
        case StageNoNewPrivs: return "prctl(PR_SET_NO_NEW_PRIVS)";
        case StageExec:       return "exec";
        default:              return "child setup";
    }
}

/// Everything the child touches, prepared before fork so that the child
/// only calls async-signal-safe functions.
struct ChildContext {
    char* const* argv;
    char* const* envp;
    const char* working_dir;
    int stdin_fd;
    int stdout_fd;
    int stderr_fd;
    int error_fd;
    const ChildRestrictions* restrictions;
};

[[noreturn]] void child_die(int error_fd, int stage, int err) {
    ChildFailure failure{stage, err};
    [[maybe_unused]] auto written = ::write(error_fd, &failure, sizeof(failure));
    ::_exit(127);
}

bool set_limit(int resource, uint64_t value) {
    if (value == 0) return true;
    rlimit lim{};
    lim.rlim_cur = static_cast<rlim_t>(value);
    lim.rlim_max = static_cast<rlim_t>(value);
    return ::setrlimit(resource, &lim) == 0;
}

[[noreturn]] void child_main(const ChildContext& ctx) {
    const auto& r = *ctx.restrictions;

    if (::setsid() == -1) child_die(ctx.error_fd, StageSetsid, errno);

    if (::dup2(ctx.stdin_fd, STDIN_FILENO) == -1 ||
        ::dup2(ctx.stdout_fd, STDOUT_FILENO) == -1 ||
        ::dup2(ctx.stderr_fd, STDERR_FILENO) == -1) {
        child_die(ctx.error_fd, StageRedirect, errno);
    }

    if (ctx.working_dir[0] != '\0' && ::chdir(ctx.working_dir) == -1) {
        child_die(ctx.error_fd, StageChdir, errno);
    }

    if (!set_limit(RLIMIT_AS, r.address_space_bytes) ||
        !set_limit(RLIMIT_CPU, r.cpu_seconds) ||
        !set_limit(RLIMIT_FSIZE, r.file_size_bytes) ||
        !set_limit(RLIMIT_NOFILE, r.open_files) ||
        !set_limit(RLIMIT_NPROC, r.processes)) {
        child_die(ctx.error_fd, StageRlimit, errno);
    }
    if (r.disable_core_dumps) {
        rlimit zero{};
        if (::setrlimit(RLIMIT_CORE, &zero) == -1) child_die(ctx.error_fd, StageRlimit, errno);
    }

    if (r.isolate_network) {
        // Needs CAP_SYS_ADMIN or user namespaces; silently skipped otherwise.
        [[maybe_unused]] int ignored = ::unshare(CLONE_NEWNET);
    }

    if (r.gid) {
        if (::setgroups(0, nullptr) == -1) child_die(ctx.error_fd, StageSetgroups, errno);
        if (::setgid(*r.gid) == -1) child_die(ctx.error_fd, StageSetgid, errno);
    }
    if (r.uid && ::setuid(*r.uid) == -1) child_die(ctx.error_fd, StageSetuid, errno);

    if (r.no_new_privs && ::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1) {
        child_die(ctx.error_fd, StageNoNewPrivs, errno);
    }

    ::execvpe(ctx.argv[0], ctx.argv, ctx.envp);
    child_die(ctx.error_fd, StageExec, errno);
}

std::vector<char*> to_cstrings(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

void close_pair(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) ::close(fds[i]);
        fds[i] = -1;
    }
}

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

std::string join_argv(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out.push_back(' ');
        out += arg;
    }
    return out;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Result<std::unique_ptr<Subprocess>> Subprocess::start(const SubprocessOptions& options) {
    if (options.argv.empty()) {
        return Error{ErrorKind::Internal, "Subprocess argv is empty"};
    }

    // Writes to a child that has closed stdin must fail with EPIPE, not kill us.
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, [] { ::signal(SIGPIPE, SIG_IGN); });

    auto argv_storage = options.argv;
    auto env_storage = options.env;
    auto argv = to_cstrings(argv_storage);
    auto envp = to_cstrings(env_storage);

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    if (::pipe2(in_pipe, O_CLOEXEC) == -1 || ::pipe2(out_pipe, O_CLOEXEC) == -1 ||
        ::pipe2(err_pipe, O_CLOEXEC) == -1 || ::pipe2(status_pipe, O_CLOEXEC) == -1) {
        int err = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(status_pipe);
        return Error{ErrorKind::InfrastructureError,
                     std::string{"pipe2: "} + std::strerror(err)};
    }

    ChildContext ctx{
        .argv = argv.data(),
        .envp = options.inherit_env ? environ : envp.data(),
        .working_dir = options.working_dir.c_str(),
        .stdin_fd = in_pipe[0],
        .stdout_fd = out_pipe[1],
        .stderr_fd = err_pipe[1],
        .error_fd = status_pipe[1],
        .restrictions = &options.restrictions
    };

    auto started = std::chrono::steady_clock::now();
    pid_t pid = ::fork();
    if (pid == -1) {
        int err = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(status_pipe);
        return Error{ErrorKind::InfrastructureError, std::string{"fork: "} + std::strerror(err)};
    }
    if (pid == 0) {
        child_main(ctx);
    }

    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(status_pipe[1]);

    // EOF here means exec succeeded (the CLOEXEC write end closed).
    ChildFailure failure{};
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &failure, sizeof(failure));
    } while (n == -1 && errno == EINTR);
    ::close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        return Error{ErrorKind::InfrastructureError,
                     std::string{stage_name(failure.stage)} + " failed for '" +
                         options.argv.front() + "': " + std::strerror(failure.error)};
    }

    std::unique_ptr<Subprocess> proc(new Subprocess());
    proc->pid_ = pid;
    proc->stdin_fd_ = in_pipe[1];
    proc->stdout_fd_ = out_pipe[0];
    proc->stderr_fd_ = err_pipe[0];
    proc->stdin_data_ = options.stdin_data;
    proc->output_limit_ = options.output_limit_bytes;
    proc->started_ = started;

    set_nonblocking(proc->stdin_fd_);
    set_nonblocking(proc->stdout_fd_);
    set_nonblocking(proc->stderr_fd_);
    if (proc->stdin_data_.empty()) {
        proc->close_fd(proc->stdin_fd_);
    }
    return proc;
}

Subprocess::~Subprocess() {
    if (pid_ > 0 && !reaped_) {
        // The unreaped leader still reserves the group ID.
        ::kill(-pid_, SIGKILL);
        ::kill(pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {}
    }
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

Result<ProcessOutcome> Subprocess::run(const std::vector<std::string>& argv,
                                       Millis timeout,
                                       const std::string& stdin_data,
                                       uint64_t output_limit_bytes) {
    SubprocessOptions options{
        .argv = argv,
        .inherit_env = true,
        .stdin_data = stdin_data,
        .output_limit_bytes = output_limit_bytes
    };
    auto proc = start(options);
    if (!proc) return proc.error();

    if (auto outcome = (*proc)->wait_for(timeout)) {
        return std::move(*outcome);
    }

    (*proc)->signal_group(SIGKILL);
    [[maybe_unused]] auto ignored = (*proc)->wait_for(Millis{2000});
    return Error{ErrorKind::InfrastructureError,
                 "'" + join_argv(argv) + "' did not finish within " +
                     std::to_string(timeout.count()) + " ms"};
}

// ─────────────────────────────────────────────
// I/O Pump
// ─────────────────────────────────────────────

std::optional<ProcessOutcome> Subprocess::wait_for(Millis timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        auto now = std::chrono::steady_clock::now();
        auto remaining = std::chrono::duration_cast<Millis>(deadline - now).count();
        pump(static_cast<int>(std::clamp<int64_t>(remaining, 0, 10)));

        if (!reaped_) try_reap();

        if (reaped_) {
            bool drained = stdout_fd_ < 0 && stderr_fd_ < 0;
            if (!drained && std::chrono::steady_clock::now() - exited_at_ >= kDrainAfterExit) {
                close_fd(stdout_fd_);
                close_fd(stderr_fd_);
                drained = true;
            }
            if (drained) {
                close_fd(stdin_fd_);
                outcome_.usage.wall_time_seconds =
                    std::chrono::duration<double>(exited_at_ - started_).count();
                return outcome_;
            }
        }

        if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
    }
}

void Subprocess::pump(int timeout_ms) {
    pollfd fds[3];
    nfds_t count = 0;
    if (stdin_fd_ >= 0) fds[count++] = pollfd{stdin_fd_, POLLOUT, 0};
    if (stdout_fd_ >= 0) fds[count++] = pollfd{stdout_fd_, POLLIN, 0};
    if (stderr_fd_ >= 0) fds[count++] = pollfd{stderr_fd_, POLLIN, 0};

    int ready = ::poll(count > 0 ? fds : nullptr, count, timeout_ms);
    if (ready <= 0) return;

    for (nfds_t i = 0; i < count; ++i) {
        if (fds[i].revents == 0) continue;

        if (fds[i].fd == stdin_fd_) {
            if (fds[i].revents & (POLLERR | POLLHUP)) {
                close_fd(stdin_fd_);
                continue;
            }
            auto n = ::write(stdin_fd_, stdin_data_.data() + stdin_offset_,
                             stdin_data_.size() - stdin_offset_);
            if (n > 0) stdin_offset_ += static_cast<size_t>(n);
            if ((n < 0 && errno != EAGAIN && errno != EINTR) ||
                stdin_offset_ >= stdin_data_.size()) {
                close_fd(stdin_fd_);
            }
        } else if (fds[i].fd == stdout_fd_) {
            read_into(stdout_fd_, outcome_.stdout_data);
        } else if (fds[i].fd == stderr_fd_) {
            read_into(stderr_fd_, outcome_.stderr_data);
        }
    }
}

void Subprocess::read_into(int& fd, std::string& buffer) {
    char chunk[kReadChunk];
    while (fd >= 0) {
        auto n = ::read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            auto room = output_limit_ > buffer.size() ? output_limit_ - buffer.size() : 0;
            auto take = std::min<uint64_t>(room, static_cast<uint64_t>(n));
            buffer.append(chunk, static_cast<size_t>(take));
            if (take < static_cast<uint64_t>(n)) outcome_.output_truncated = true;
            continue;
        }
        if (n == 0) {
            close_fd(fd);
        } else if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
            close_fd(fd);
        } else if (errno == EINTR) {
            continue;
        }
        return;
    }
}

void Subprocess::close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool Subprocess::try_reap() {
    std::lock_guard lock(reap_mutex_);
    if (reaped_) return true;

    // Peek first: while the exited leader is unreaped its ID cannot be
    // reused, so background children left in the group are killed now.
    siginfo_t info{};
    if (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) == 0) {
        if (info.si_pid == 0) return false;
        ::kill(-pid_, SIGKILL);
    } else if (errno == EINTR) {
        return false;
    }

    int status = 0;
    rusage usage{};
    pid_t ret = -1;
    do {
        ret = ::wait4(pid_, &status, 0, &usage);
    } while (ret == -1 && errno == EINTR);

    reaped_ = true;
    exited_at_ = std::chrono::steady_clock::now();
    if (ret == pid_) {
        outcome_.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : 0;
        outcome_.signal = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
        outcome_.usage.cpu_time_seconds =
            static_cast<double>(usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) +
            static_cast<double>(usage.ru_utime.tv_usec + usage.ru_stime.tv_usec) / 1e6;
        outcome_.usage.peak_memory_bytes = static_cast<uint64_t>(usage.ru_maxrss) * 1024;
    } else {
        // ECHILD: reaped elsewhere; the exit status is unknown.
        outcome_.exit_code = -1;
    }
    return true;
}

void Subprocess::signal_group(int sig) noexcept {
    std::lock_guard lock(reap_mutex_);
    if (pid_ <= 0 || reaped_) return;
    ::kill(-pid_, sig);
    ::kill(pid_, sig);
}

}  // namespace sandbox_gate
