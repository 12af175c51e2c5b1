/**
 * @file subprocess.hpp
 * @brief fork/exec child process with piped stdio, rlimits and rusage.
 *
 * Used directly by the native process backend and, for short-lived CLI
 * invocations and `docker exec` clients, by the Docker backend.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "runtime/container_runtime.hpp"

#include <sys/types.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sandbox_gate {

/**
 * @brief Restrictions applied in the child between fork and exec.
 *
 * A zero limit means "leave unchanged".
 */
struct ChildRestrictions {
    uint64_t address_space_bytes{0};
    uint64_t cpu_seconds{0};
    uint64_t file_size_bytes{0};
    uint64_t open_files{0};
    uint64_t processes{0};
    bool disable_core_dumps{false};
    bool no_new_privs{false};
    bool isolate_network{false};        ///< Best effort: unshare(CLONE_NEWNET)
    std::optional<uint32_t> uid;
    std::optional<uint32_t> gid;
};

struct SubprocessOptions {
    std::vector<std::string> argv;
    std::vector<std::string> env;       ///< "KEY=VALUE"; empty and !inherit_env = empty env
    bool inherit_env{false};
    std::string working_dir;
    std::string stdin_data;
    uint64_t output_limit_bytes{1024 * 1024};
    ChildRestrictions restrictions;
};

/**
 * @brief A running child in its own session and process group.
 *
 * Destroying a Subprocess that has not been reaped kills its process group
 * and waits for it, so no child outlives its owner. The group is killed
 * before the leader is reaped: once reaped the group is empty and its ID is
 * never signalled again, since the kernel may hand it to another group.
 */
class Subprocess {
public:
    static Result<std::unique_ptr<Subprocess>> start(const SubprocessOptions& options);

    /// Run to completion. Exceeding `timeout` kills the child and is an error.
    static Result<ProcessOutcome> run(const std::vector<std::string>& argv,
                                      Millis timeout,
                                      const std::string& stdin_data = {},
                                      uint64_t output_limit_bytes = 1024 * 1024);

    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    /// Pump stdio for up to `timeout`; the outcome once the child is reaped.
    std::optional<ProcessOutcome> wait_for(Millis timeout);

    /// kill(-pgid, sig). No-op once reaped. Safe to call from another thread.
    void signal_group(int sig) noexcept;

private:
    Subprocess() = default;

    void pump(int timeout_ms);
    void read_into(int& fd, std::string& buffer);
    void close_fd(int& fd) noexcept;
    bool try_reap();

    pid_t pid_{-1};
    int stdin_fd_{-1};
    int stdout_fd_{-1};
    int stderr_fd_{-1};

    std::string stdin_data_;
    size_t stdin_offset_{0};
    uint64_t output_limit_{0};

    std::mutex reap_mutex_;             ///< Orders reaping against group signals
    bool reaped_{false};
    SteadyTime started_;
    SteadyTime exited_at_;
    ProcessOutcome outcome_;
};

}  // namespace sandbox_gate
