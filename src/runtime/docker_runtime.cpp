/**
 * @file docker_runtime.cpp
 * @brief DockerRuntime implementation.
 */

#include "runtime/docker_runtime.hpp"
#include "core/request_id.hpp"
#include "runtime/subprocess.hpp"

#include <csignal>
#include <fstream>
#include <sstream>
#include <system_error>

namespace sandbox_gate {

namespace fs = std::filesystem;

namespace {

/// Lifetime of the container's idle entrypoint; the reaper removes it long before.
constexpr const char* kKeepaliveSeconds = "3600";

/// `docker` itself failed (daemon unreachable, bad flag, missing container).
constexpr int kDockerCliError = 125;

std::string trim(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

std::optional<uint64_t> read_number(const fs::path& path) {
    std::ifstream in(path);
    uint64_t value = 0;
    if (in >> value) return value;
    return std::nullopt;
}

/// Value of "<key> <n>" in a flat-keyed stats file.
std::optional<uint64_t> read_keyed(const fs::path& path, std::string_view key) {
    std::ifstream in(path);
    std::string name;
    uint64_t value = 0;
    while (in >> name >> value) {
        if (name == key) return value;
    }
    return std::nullopt;
}

std::string cli_failure(const std::string& what, const ProcessOutcome& outcome) {
    auto detail = trim(outcome.stderr_data);
    if (detail.empty()) detail = "exit code " + std::to_string(outcome.exit_code);
    return what + ": " + detail;
}

class DockerSandboxProcess : public ISandboxProcess {
public:
    DockerSandboxProcess(std::unique_ptr<Subprocess> client, std::optional<CgroupStats> cgroup)
        : client_(std::move(client)), cgroup_(std::move(cgroup)) {
        if (cgroup_) {
            oom_baseline_ = cgroup_->oom_kills();
            cpu_baseline_ = cgroup_->cpu_seconds();
        }
    }

    std::optional<ProcessOutcome> wait_for(Millis timeout) override {
        auto outcome = client_->wait_for(timeout);
        if (!outcome) return std::nullopt;

        // docker exec reports a signalled command as 128 + signo.
        if (outcome->signal == 0 && outcome->exit_code > 128 && outcome->exit_code < 128 + 65) {
            outcome->signal = outcome->exit_code - 128;
        }

        // The client's rusage says nothing about the container.
        outcome->usage.cpu_time_seconds = 0.0;
        outcome->usage.peak_memory_bytes = 0;
        if (cgroup_) {
            outcome->oom_killed = cgroup_->oom_kills() > oom_baseline_;
            outcome->usage.cpu_time_seconds = cgroup_->cpu_seconds() - cpu_baseline_;
            outcome->usage.peak_memory_bytes = cgroup_->peak_memory_bytes();
        }
        return outcome;
    }

    void kill() override { client_->signal_group(SIGKILL); }

private:
    std::unique_ptr<Subprocess> client_;
    std::optional<CgroupStats> cgroup_;
    uint64_t oom_baseline_{0};
    double cpu_baseline_{0.0};
};

}  // anonymous namespace

// ─────────────────────────────────────────────
// CgroupStats
// ─────────────────────────────────────────────

std::optional<CgroupStats> CgroupStats::locate(const std::string& container_id) {
    if (container_id.empty()) return std::nullopt;

    const fs::path root = "/sys/fs/cgroup";
    std::error_code ec;

    if (fs::exists(root / "cgroup.controllers", ec)) {
        for (const auto& dir : {root / "system.slice" / ("docker-" + container_id + ".scope"),
                                root / "docker" / container_id}) {
            if (fs::exists(dir / "memory.events", ec)) {
                CgroupStats stats(true);
                stats.memory_dir_ = dir;
                stats.cpu_dir_ = dir;
                return stats;
            }
        }
        return std::nullopt;
    }

    CgroupStats stats(false);
    for (const auto& dir : {root / "memory" / "docker" / container_id,
                            root / "memory" / "system.slice" / ("docker-" + container_id + ".scope")}) {
        if (fs::exists(dir, ec)) stats.memory_dir_ = dir;
    }
    for (const auto& dir : {root / "cpuacct" / "docker" / container_id,
                            root / "cpu,cpuacct" / "docker" / container_id,
                            root / "cpuacct" / "system.slice" / ("docker-" + container_id + ".scope")}) {
        if (fs::exists(dir, ec)) stats.cpu_dir_ = dir;
    }
    if (stats.memory_dir_.empty() && stats.cpu_dir_.empty()) return std::nullopt;
    return stats;
}

uint64_t CgroupStats::oom_kills() const {
    if (memory_dir_.empty()) return 0;
    auto file = v2_ ? memory_dir_ / "memory.events" : memory_dir_ / "memory.oom_control";
    return read_keyed(file, "oom_kill").value_or(0);
}

uint64_t CgroupStats::peak_memory_bytes() const {
    if (memory_dir_.empty()) return 0;
    if (v2_) {
        // memory.peak needs Linux 5.19; memory.current is the best remaining sample.
        if (auto peak = read_number(memory_dir_ / "memory.peak")) return *peak;
        return read_number(memory_dir_ / "memory.current").value_or(0);
    }
    return read_number(memory_dir_ / "memory.max_usage_in_bytes").value_or(0);
}

double CgroupStats::cpu_seconds() const {
    if (cpu_dir_.empty()) return 0.0;
    if (v2_) {
        return static_cast<double>(read_keyed(cpu_dir_ / "cpu.stat", "usage_usec").value_or(0)) / 1e6;
    }
    return static_cast<double>(read_number(cpu_dir_ / "cpuacct.usage").value_or(0)) / 1e9;
}

// ─────────────────────────────────────────────
// DockerRuntime
// ─────────────────────────────────────────────

DockerRuntime::DockerRuntime(const RuntimeConfig& config, std::shared_ptr<Logger> logger)
    : docker_(config.docker_binary)
    , work_root_(config.work_root)
    , sandbox_uid_(config.sandbox_uid)
    , sandbox_gid_(config.sandbox_gid)
    , cli_timeout_(config.provisioning.timeout_ms)
    , logger_(std::move(logger)) {}

Result<void> DockerRuntime::ping() {
    auto outcome = Subprocess::run({docker_, "version", "--format", "{{.Server.Version}}"},
                                   Millis{5000});
    if (!outcome) return outcome.error();
    if (outcome->exit_code != 0) {
        return Error{ErrorKind::InfrastructureError,
                     cli_failure("Docker daemon unavailable", *outcome)};
    }
    return Result<void>{};
}

std::vector<std::string> DockerRuntime::run_arguments(const SandboxId& id,
                                                      const SandboxSpec& spec,
                                                      const fs::path& host_code_dir,
                                                      Timestamp created_at) const {
    const auto& limits = spec.limits;
    const auto created_s =
        std::chrono::duration_cast<std::chrono::seconds>(created_at.time_since_epoch()).count();
    const auto cpu_quota = static_cast<uint64_t>(limits.cpu_quota * kCpuPeriod);
    const auto memory = std::to_string(limits.memory_limit_bytes);

    return {
        docker_, "run", "--detach",
        "--name", id,
        "--label", std::string{kManagedLabel} + "=true",
        "--label", std::string{kCreatedLabel} + "=" + std::to_string(created_s),
        "--label", std::string{kRequestLabel} + "=" + spec.request_id,
        "--network", limits.network_access ? "bridge" : "none",
        "--read-only",
        "--tmpfs", std::string{kScratchMount} + ":rw,noexec,nosuid,nodev,size=" +
                       std::to_string(spec.scratch_bytes),
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        "--user", std::to_string(sandbox_uid_) + ":" + std::to_string(sandbox_gid_),
        "--memory", memory,
        "--memory-swap", memory,
        "--cpu-period", std::to_string(kCpuPeriod),
        "--cpu-quota", std::to_string(cpu_quota),
        "--pids-limit", std::to_string(spec.pids_limit),
        "--ulimit", "nofile=" + std::to_string(spec.open_files_limit) + ":" +
                        std::to_string(spec.open_files_limit),
        "--volume", host_code_dir.string() + ":" + kCodeMount + ":ro",
        "--workdir", kScratchMount,
        "--entrypoint", "sleep",
        spec.image, kKeepaliveSeconds
    };
}

std::vector<std::string> DockerRuntime::exec_arguments(const SandboxId& id,
                                                       const ExecSpec& exec) const {
    std::vector<std::string> args = {docker_, "exec", "--interactive", "--workdir", kScratchMount};
    for (const auto& [key, value] : exec.env) {
        args.push_back("--env");
        args.push_back(key + "=" + value);
    }
    args.push_back(id);
    args.insert(args.end(), exec.argv.begin(), exec.argv.end());
    return args;
}

Result<SandboxHandle> DockerRuntime::provision(const SandboxSpec& spec) {
    const auto id = generate_sandbox_id();
    const auto host_dir = work_root_ / id;
    const auto code_dir = host_dir / "code";
    const auto created_at = std::chrono::system_clock::now();

    std::error_code ec;
    fs::create_directories(code_dir, ec);
    if (ec) {
        return Error{ErrorKind::InfrastructureError,
                     "Cannot create " + code_dir.string() + ": " + ec.message()};
    }

    for (const auto& file : spec.files) {
        if (file.name.empty() || file.name.find('/') != std::string::npos) {
            [[maybe_unused]] auto removed = remove_host_dir(id);
            return Error{ErrorKind::Internal, "Invalid file name: " + file.name};
        }
        std::ofstream out(code_dir / file.name, std::ios::binary | std::ios::trunc);
        out << file.content;
        if (!out) {
            [[maybe_unused]] auto removed = remove_host_dir(id);
            return Error{ErrorKind::InfrastructureError,
                         "Cannot write " + (code_dir / file.name).string()};
        }
        out.close();
        fs::permissions(code_dir / file.name, fs::perms::owner_read | fs::perms::group_read |
                                              fs::perms::others_read, ec);
    }
    fs::permissions(code_dir, fs::perms::owner_read | fs::perms::owner_exec |
                              fs::perms::group_read | fs::perms::group_exec |
                              fs::perms::others_read | fs::perms::others_exec, ec);

    auto outcome = Subprocess::run(run_arguments(id, spec, code_dir, created_at), cli_timeout_);
    if (!outcome || outcome->exit_code != 0) {
        auto message = outcome ? cli_failure("docker run failed", *outcome)
                               : outcome.error().message;
        // A timed-out `docker run` may still have created the container.
        [[maybe_unused]] auto removed = destroy(id);
        return Error{ErrorKind::InfrastructureError, message};
    }

    {
        std::lock_guard lock(mutex_);
        container_ids_[id] = trim(outcome->stdout_data);
    }

    return SandboxHandle{
        .id = id,
        .code_dir = kCodeMount,
        .scratch_dir = kScratchMount,
        .limits = spec.limits,
        .created_at = created_at
    };
}

Result<std::unique_ptr<ISandboxProcess>> DockerRuntime::spawn(const SandboxHandle& handle,
                                                              const ExecSpec& exec) {
    std::string container_id;
    {
        std::lock_guard lock(mutex_);
        if (auto it = container_ids_.find(handle.id); it != container_ids_.end()) {
            container_id = it->second;
        }
    }

    SubprocessOptions options;
    options.argv = exec_arguments(handle.id, exec);
    options.inherit_env = true;
    options.stdin_data = exec.stdin_data;
    options.output_limit_bytes = exec.output_limit_bytes;

    auto client = Subprocess::start(options);
    if (!client) return client.error();

    return std::unique_ptr<ISandboxProcess>(std::make_unique<DockerSandboxProcess>(
        std::move(*client), CgroupStats::locate(container_id)));
}

Result<void> DockerRuntime::signal_all(const SandboxHandle& handle, ProcessSignal signal) {
    // kill -1 reaches every process the sandbox user owns except PID 1, so the
    // container survives for the next test case.
    const char* name = signal == ProcessSignal::Kill ? "KILL" : "TERM";
    auto outcome = Subprocess::run({docker_, "exec", handle.id, "kill", "-s", name, "-1"},
                                   Millis{5000});
    if (!outcome) return outcome.error();
    if (outcome->exit_code == kDockerCliError) {
        return Error{ErrorKind::InfrastructureError, cli_failure("docker exec kill", *outcome)};
    }
    return Result<void>{};
}

Result<void> DockerRuntime::destroy(const SandboxId& id) {
    {
        std::lock_guard lock(mutex_);
        container_ids_.erase(id);
    }

    auto outcome = Subprocess::run({docker_, "rm", "--force", "--volumes", id}, cli_timeout_);
    if (!outcome) return outcome.error();
    if (outcome->exit_code != 0 &&
        outcome->stderr_data.find("No such container") == std::string::npos) {
        return Error{ErrorKind::InfrastructureError, cli_failure("docker rm failed", *outcome)};
    }
    return remove_host_dir(id);
}

Result<void> DockerRuntime::remove_host_dir(const SandboxId& id) {
    const auto host_dir = work_root_ / id;
    std::error_code ec;
    if (!fs::exists(host_dir, ec)) return Result<void>{};
    fs::permissions(host_dir / "code", fs::perms::owner_all, fs::perm_options::add, ec);
    fs::remove_all(host_dir, ec);
    if (ec) {
        return Error{ErrorKind::InfrastructureError,
                     "Cannot remove " + host_dir.string() + ": " + ec.message()};
    }
    return Result<void>{};
}

Result<std::vector<SandboxInfo>> DockerRuntime::list_managed() {
    auto outcome = Subprocess::run(
        {docker_, "ps", "--all", "--filter", std::string{"label="} + kManagedLabel + "=true",
         "--format", std::string{"{{.Names}} {{.Label \""} + kCreatedLabel + "\"}}"},
        cli_timeout_);
    if (!outcome) return outcome.error();
    if (outcome->exit_code != 0) {
        return Error{ErrorKind::InfrastructureError, cli_failure("docker ps failed", *outcome)};
    }

    std::vector<SandboxInfo> found;
    std::istringstream lines(outcome->stdout_data);
    std::string line;
    while (std::getline(lines, line)) {
        std::istringstream fields(line);
        SandboxInfo info;
        int64_t created_s = 0;
        if (!(fields >> info.id)) continue;
        if (fields >> created_s) {
            info.created_at = Timestamp{std::chrono::seconds{created_s}};
        }
        found.push_back(std::move(info));
    }
    return found;
}

}  // namespace sandbox_gate
