/**
 * @file process_runtime.hpp
 * @brief Native fork/exec isolation backend.
 *
 * Each sandbox is a directory pair (read-only code, writable scratch) and
 * every command runs in its own session with rlimits, no_new_privs, a
 * best-effort private network namespace and, when the service runs as
 * root, an unprivileged uid/gid. There is no read-only root filesystem or
 * cgroup accounting, so this backend is for development and tests.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "runtime/container_runtime.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace sandbox_gate {

class Subprocess;

class ProcessRuntime : public IContainerRuntime {
public:
    ProcessRuntime(const RuntimeConfig& config, std::shared_ptr<Logger> logger);
    ~ProcessRuntime() override;

    [[nodiscard]] std::string_view name() const noexcept override { return "process"; }

    Result<void> ping() override;
    Result<SandboxHandle> provision(const SandboxSpec& spec) override;
    Result<std::unique_ptr<ISandboxProcess>> spawn(const SandboxHandle& handle,
                                                   const ExecSpec& exec) override;
    Result<void> signal_all(const SandboxHandle& handle, ProcessSignal signal) override;
    Result<void> destroy(const SandboxId& id) override;
    Result<std::vector<SandboxInfo>> list_managed() override;

    [[nodiscard]] bool drops_privileges() const noexcept { return drop_privileges_; }

private:
    struct SandboxState {
        uint64_t scratch_bytes{0};
        uint32_t pids_limit{0};
        uint32_t open_files_limit{0};
        std::vector<std::weak_ptr<Subprocess>> processes;
    };

    [[nodiscard]] std::filesystem::path root_of(const SandboxId& id) const;

    std::filesystem::path work_root_;
    uint32_t sandbox_uid_;
    uint32_t sandbox_gid_;
    bool drop_privileges_;
    std::shared_ptr<Logger> logger_;

    std::mutex mutex_;
    std::unordered_map<SandboxId, SandboxState> sandboxes_;
};

}  // namespace sandbox_gate
