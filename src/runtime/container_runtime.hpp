/**
 * @file container_runtime.hpp
 * @brief IContainerRuntime — the isolation backend port.
 *
 * Everything the orchestrator needs from an isolation technology goes
 * through this interface: create a sandbox, run commands in it, signal its
 * processes, tear it down and enumerate leftovers. The backend is chosen
 * once at startup, so virtual dispatch is used here.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sandbox_gate {

// ─────────────────────────────────────────────
// Sandbox description
// ─────────────────────────────────────────────

struct SandboxFile {
    std::string name;           ///< Relative to the code directory, no '/'
    std::string content;
};

/**
 * @brief Everything needed to create one sandbox.
 */
struct SandboxSpec {
    RequestId request_id;
    std::string image;
    ResourceLimits limits;
    std::vector<SandboxFile> files;
    uint64_t scratch_bytes{64ULL * 1024 * 1024};
    uint32_t pids_limit{64};
    uint32_t open_files_limit{256};
};

/**
 * @brief A provisioned sandbox. Paths are as seen from inside it.
 */
struct SandboxHandle {
    SandboxId id;
    std::string code_dir;
    std::string scratch_dir;
    ResourceLimits limits;
    Timestamp created_at;
};

/// A sandbox found by enumeration, possibly left over from a crash.
struct SandboxInfo {
    SandboxId id;
    Timestamp created_at;
};

// ─────────────────────────────────────────────
// Processes
// ─────────────────────────────────────────────

struct ExecSpec {
    std::vector<std::string> argv;
    std::string stdin_data;
    std::vector<std::pair<std::string, std::string>> env;
    uint64_t output_limit_bytes{1024 * 1024};
    bool limit_address_space{true};     ///< false for runtimes that reserve huge VM (V8)
};

/**
 * @brief Terminal state of one process run inside a sandbox.
 */
struct ProcessOutcome {
    int exit_code{0};
    int signal{0};                  ///< Terminating signal, 0 if exited normally
    bool oom_killed{false};         ///< Reported by the isolation layer
    std::string stdout_data;
    std::string stderr_data;
    bool output_truncated{false};
    ResourceUsage usage;
};

enum class ProcessSignal : uint8_t {
    Terminate,
    Kill
};

/**
 * @brief A command running inside a sandbox.
 */
class ISandboxProcess {
public:
    virtual ~ISandboxProcess() = default;

    /// Pump I/O for up to `timeout`; the outcome once the process has exited.
    virtual std::optional<ProcessOutcome> wait_for(Millis timeout) = 0;

    /// Force-kill the local handle (e.g. the `docker exec` client).
    virtual void kill() = 0;
};

// ─────────────────────────────────────────────
// IContainerRuntime
// ─────────────────────────────────────────────

class IContainerRuntime {
public:
    virtual ~IContainerRuntime() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// Whether the backend can currently create sandboxes.
    virtual Result<void> ping() = 0;

    virtual Result<SandboxHandle> provision(const SandboxSpec& spec) = 0;

    virtual Result<std::unique_ptr<ISandboxProcess>> spawn(const SandboxHandle& handle,
                                                           const ExecSpec& exec) = 0;

    /// Signal every process in the sandbox.
    virtual Result<void> signal_all(const SandboxHandle& handle, ProcessSignal signal) = 0;

    /// Remove everything provision() created. Destroying twice is not an error.
    virtual Result<void> destroy(const SandboxId& id) = 0;

    /// Sandboxes owned by this service, including ones from earlier runs.
    virtual Result<std::vector<SandboxInfo>> list_managed() = 0;
};

}  // namespace sandbox_gate
