/**
 * @file docker_runtime.hpp
 * @brief Production isolation backend driving the Docker CLI.
 *
 * One container per sandbox, started detached with a sleeping entrypoint so
 * that the build step and every test case run in the same container through
 * `docker exec`. The container has no network, a read-only root, a noexec
 * tmpfs scratch area, no capabilities, an unprivileged user and hard
 * memory/CPU/pid ceilings. Submitted files are bind-mounted read-only.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "runtime/container_runtime.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace sandbox_gate {

/**
 * @brief cgroup counters of one container, v2 layout with v1 fallbacks.
 */
class CgroupStats {
public:
    /// Locate the container's cgroup; empty when not visible from this host.
    static std::optional<CgroupStats> locate(const std::string& container_id);

    [[nodiscard]] uint64_t oom_kills() const;
    [[nodiscard]] uint64_t peak_memory_bytes() const;
    [[nodiscard]] double cpu_seconds() const;

private:
    explicit CgroupStats(bool v2) : v2_(v2) {}

    bool v2_;
    std::filesystem::path memory_dir_;
    std::filesystem::path cpu_dir_;
};

class DockerRuntime : public IContainerRuntime {
public:
    static constexpr const char* kManagedLabel = "sandbox-gate.managed";
    static constexpr const char* kCreatedLabel = "sandbox-gate.created";
    static constexpr const char* kRequestLabel = "sandbox-gate.request";
    static constexpr const char* kCodeMount = "/sandbox";
    static constexpr const char* kScratchMount = "/tmp";
    static constexpr uint32_t kCpuPeriod = 100000;

    DockerRuntime(const RuntimeConfig& config, std::shared_ptr<Logger> logger);

    [[nodiscard]] std::string_view name() const noexcept override { return "docker"; }

    Result<void> ping() override;
    Result<SandboxHandle> provision(const SandboxSpec& spec) override;
    Result<std::unique_ptr<ISandboxProcess>> spawn(const SandboxHandle& handle,
                                                   const ExecSpec& exec) override;
    Result<void> signal_all(const SandboxHandle& handle, ProcessSignal signal) override;
    Result<void> destroy(const SandboxId& id) override;
    Result<std::vector<SandboxInfo>> list_managed() override;

    /// `docker run` arguments for a sandbox; exposed for tests.
    [[nodiscard]] std::vector<std::string> run_arguments(const SandboxId& id,
                                                         const SandboxSpec& spec,
                                                         const std::filesystem::path& host_code_dir,
                                                         Timestamp created_at) const;

    /// `docker exec` arguments for a command; exposed for tests.
    [[nodiscard]] std::vector<std::string> exec_arguments(const SandboxId& id,
                                                          const ExecSpec& exec) const;

private:
    Result<void> remove_host_dir(const SandboxId& id);

    std::string docker_;
    std::filesystem::path work_root_;
    uint32_t sandbox_uid_;
    uint32_t sandbox_gid_;
    Millis cli_timeout_;
    std::shared_ptr<Logger> logger_;

    std::mutex mutex_;
    std::unordered_map<SandboxId, std::string> container_ids_;  ///< name -> full id
};

}  // namespace sandbox_gate
