/**
 * @file process_runtime.cpp
 * @brief ProcessRuntime implementation.
 */

#include "runtime/process_runtime.hpp"
#include "core/request_id.hpp"
#include "runtime/subprocess.hpp"

#include <unistd.h>

#include <cerrno>
#include <cmath>
#include <csignal>
#include <cstring>
#include <fstream>
#include <system_error>

namespace sandbox_gate {

namespace fs = std::filesystem;

namespace {

constexpr const char* kCreatedMarker = ".created";
constexpr const char* kSandboxPrefix = "sg-";

class NativeSandboxProcess : public ISandboxProcess {
public:
    explicit NativeSandboxProcess(std::shared_ptr<Subprocess> proc)
        : proc_(std::move(proc)) {}

    std::optional<ProcessOutcome> wait_for(Millis timeout) override {
        return proc_->wait_for(timeout);
    }

    void kill() override { proc_->signal_group(SIGKILL); }

private:
    std::shared_ptr<Subprocess> proc_;
};

Result<void> write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorKind::InfrastructureError, "Cannot create " + path.string()};
    }
    out << content;
    if (!out) {
        return Error{ErrorKind::InfrastructureError, "Cannot write " + path.string()};
    }
    return Result<void>{};
}

/// Processes already dropped by their owner were killed and reaped then.
void signal_processes(const std::vector<std::weak_ptr<Subprocess>>& processes, int sig) {
    for (const auto& weak : processes) {
        if (auto proc = weak.lock()) proc->signal_group(sig);
    }
}

int64_t epoch_ms(Timestamp ts) {
    return std::chrono::duration_cast<Millis>(ts.time_since_epoch()).count();
}

}  // anonymous namespace

ProcessRuntime::ProcessRuntime(const RuntimeConfig& config, std::shared_ptr<Logger> logger)
    : work_root_(config.work_root)
    , sandbox_uid_(config.sandbox_uid)
    , sandbox_gid_(config.sandbox_gid)
    , drop_privileges_(::geteuid() == 0)
    , logger_(std::move(logger)) {}

ProcessRuntime::~ProcessRuntime() {
    std::lock_guard lock(mutex_);
    for (const auto& [id, state] : sandboxes_) {
        signal_processes(state.processes, SIGKILL);
    }
}

fs::path ProcessRuntime::root_of(const SandboxId& id) const {
    return work_root_ / id;
}

Result<void> ProcessRuntime::ping() {
    std::error_code ec;
    fs::create_directories(work_root_, ec);
    if (ec) {
        return Error{ErrorKind::InfrastructureError,
                     "Cannot create work root " + work_root_.string() + ": " + ec.message()};
    }
    if (::access(work_root_.c_str(), W_OK | X_OK) != 0) {
        return Error{ErrorKind::InfrastructureError,
                     "Work root not writable: " + work_root_.string()};
    }
    return Result<void>{};
}

Result<SandboxHandle> ProcessRuntime::provision(const SandboxSpec& spec) {
    const auto id = generate_sandbox_id();
    const auto root = root_of(id);
    const auto code_dir = root / "code";
    const auto scratch_dir = root / "scratch";
    const auto created_at = std::chrono::system_clock::now();

    std::error_code ec;
    fs::create_directories(code_dir, ec);
    if (!ec) fs::create_directories(scratch_dir, ec);
    if (ec) {
        fs::remove_all(root, ec);
        return Error{ErrorKind::InfrastructureError,
                     "Cannot create sandbox directories under " + root.string()};
    }

    auto cleanup_on_error = [&](Error err) -> Result<SandboxHandle> {
        std::error_code ignored;
        fs::permissions(code_dir, fs::perms::owner_all, fs::perm_options::add, ignored);
        fs::remove_all(root, ignored);
        return err;
    };

    if (auto marker = write_file(root / kCreatedMarker, std::to_string(epoch_ms(created_at)));
        !marker) {
        return cleanup_on_error(marker.error());
    }

    for (const auto& file : spec.files) {
        if (file.name.empty() || file.name.find('/') != std::string::npos) {
            return cleanup_on_error(Error{ErrorKind::Internal, "Invalid file name: " + file.name});
        }
        if (auto written = write_file(code_dir / file.name, file.content); !written) {
            return cleanup_on_error(written.error());
        }
        fs::permissions(code_dir / file.name,
                        fs::perms::owner_read | fs::perms::group_read | fs::perms::others_read, ec);
    }

    // r-x for everyone: the sandbox user may read but never modify its code.
    fs::permissions(code_dir,
                    fs::perms::owner_read | fs::perms::owner_exec |
                    fs::perms::group_read | fs::perms::group_exec |
                    fs::perms::others_read | fs::perms::others_exec, ec);

    if (drop_privileges_) {
        if (::chown(scratch_dir.c_str(), sandbox_uid_, sandbox_gid_) != 0) {
            return cleanup_on_error(Error{ErrorKind::InfrastructureError,
                                          "chown scratch: " + std::string{std::strerror(errno)}});
        }
    }
    fs::permissions(scratch_dir, fs::perms::owner_all, ec);

    {
        std::lock_guard lock(mutex_);
        sandboxes_[id] = SandboxState{
            .scratch_bytes = spec.scratch_bytes,
            .pids_limit = spec.pids_limit,
            .open_files_limit = spec.open_files_limit
        };
    }

    return SandboxHandle{
        .id = id,
        .code_dir = code_dir.string(),
        .scratch_dir = scratch_dir.string(),
        .limits = spec.limits,
        .created_at = created_at
    };
}

Result<std::unique_ptr<ISandboxProcess>> ProcessRuntime::spawn(const SandboxHandle& handle,
                                                               const ExecSpec& exec) {
    uint64_t scratch_bytes = 0;
    uint32_t pids_limit = 0;
    uint32_t open_files_limit = 0;
    {
        std::lock_guard lock(mutex_);
        auto it = sandboxes_.find(handle.id);
        if (it == sandboxes_.end()) {
            return Error{ErrorKind::NotFound, "Unknown sandbox " + handle.id};
        }
        scratch_bytes = it->second.scratch_bytes;
        pids_limit = it->second.pids_limit;
        open_files_limit = it->second.open_files_limit;
    }

    SubprocessOptions options;
    options.argv = exec.argv;
    options.env = {
        "PATH=/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin",
        "HOME=" + handle.scratch_dir,
        "TMPDIR=" + handle.scratch_dir,
        "LANG=C.UTF-8"
    };
    for (const auto& [key, value] : exec.env) {
        options.env.push_back(key + "=" + value);
    }
    options.working_dir = handle.scratch_dir;
    options.stdin_data = exec.stdin_data;
    options.output_limit_bytes = exec.output_limit_bytes;

    auto& r = options.restrictions;
    r.address_space_bytes = exec.limit_address_space ? handle.limits.memory_limit_bytes : 0;
    // CPU rlimit is a backstop behind the wall-clock timeout.
    r.cpu_seconds = static_cast<uint64_t>(std::ceil(handle.limits.timeout_seconds)) + 1;
    r.file_size_bytes = scratch_bytes;
    r.open_files = open_files_limit;
    r.disable_core_dumps = true;
    r.no_new_privs = true;
    r.isolate_network = !handle.limits.network_access;
    if (drop_privileges_) {
        r.processes = pids_limit;
        r.uid = sandbox_uid_;
        r.gid = sandbox_gid_;
    }

    auto started = Subprocess::start(options);
    if (!started) return started.error();
    std::shared_ptr<Subprocess> proc = std::move(*started);

    {
        std::lock_guard lock(mutex_);
        if (auto it = sandboxes_.find(handle.id); it != sandboxes_.end()) {
            auto& processes = it->second.processes;
            std::erase_if(processes, [](const auto& p) { return p.expired(); });
            processes.push_back(proc);
        }
    }
    return std::unique_ptr<ISandboxProcess>(
        std::make_unique<NativeSandboxProcess>(std::move(proc)));
}

Result<void> ProcessRuntime::signal_all(const SandboxHandle& handle, ProcessSignal signal) {
    const int sig = signal == ProcessSignal::Kill ? SIGKILL : SIGTERM;
    std::lock_guard lock(mutex_);
    auto it = sandboxes_.find(handle.id);
    if (it == sandboxes_.end()) {
        return Error{ErrorKind::NotFound, "Unknown sandbox " + handle.id};
    }
    signal_processes(it->second.processes, sig);
    return Result<void>{};
}

Result<void> ProcessRuntime::destroy(const SandboxId& id) {
    {
        std::lock_guard lock(mutex_);
        if (auto it = sandboxes_.find(id); it != sandboxes_.end()) {
            signal_processes(it->second.processes, SIGKILL);
            sandboxes_.erase(it);
        }
    }

    const auto root = root_of(id);
    std::error_code ec;
    if (!fs::exists(root, ec)) return Result<void>{};

    fs::permissions(root / "code", fs::perms::owner_all, fs::perm_options::add, ec);
    fs::remove_all(root, ec);
    if (ec) {
        return Error{ErrorKind::InfrastructureError,
                     "Cannot remove " + root.string() + ": " + ec.message()};
    }
    return Result<void>{};
}

Result<std::vector<SandboxInfo>> ProcessRuntime::list_managed() {
    std::vector<SandboxInfo> found;
    std::error_code ec;
    if (!fs::exists(work_root_, ec)) return found;

    for (const auto& entry : fs::directory_iterator(work_root_, ec)) {
        if (!entry.is_directory()) continue;
        auto name = entry.path().filename().string();
        if (!name.starts_with(kSandboxPrefix)) continue;

        Timestamp created_at{};
        std::ifstream marker(entry.path() / kCreatedMarker);
        int64_t ms = 0;
        if (marker >> ms) {
            created_at = Timestamp{Millis{ms}};
        }
        found.push_back(SandboxInfo{.id = std::move(name), .created_at = created_at});
    }
    if (ec) {
        return Error{ErrorKind::InfrastructureError,
                     "Cannot list " + work_root_.string() + ": " + ec.message()};
    }
    return found;
}

}  // namespace sandbox_gate
