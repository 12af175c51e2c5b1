/**
 * @file mock_runtime.hpp
 * @brief In-memory scriptable IContainerRuntime for tests.
 *
 * Processes do not run; a script decides what each command "does". The
 * runtime counts provisioning, live and peak-live sandboxes so tests can
 * assert resource discipline without Docker.
 */

#pragma once

#include "runtime/container_runtime.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace sandbox_gate {

/**
 * @brief What a mock command does once spawned.
 */
struct MockBehavior {
    int exit_code{0};
    int signal{0};
    bool oom_killed{false};
    std::string stdout_data;
    std::string stderr_data;
    Millis duration{0};             ///< Simulated run time before exiting
    bool hang{false};               ///< Runs until signalled
    bool ignore_terminate{false};   ///< Survives SIGTERM
    ResourceUsage usage;
};

using MockScript = std::function<MockBehavior(const SandboxHandle&, const ExecSpec&)>;

class MockRuntime : public IContainerRuntime {
public:
    MockRuntime();

    [[nodiscard]] std::string_view name() const noexcept override { return "mock"; }

    Result<void> ping() override;
    Result<SandboxHandle> provision(const SandboxSpec& spec) override;
    Result<std::unique_ptr<ISandboxProcess>> spawn(const SandboxHandle& handle,
                                                   const ExecSpec& exec) override;
    Result<void> signal_all(const SandboxHandle& handle, ProcessSignal signal) override;
    Result<void> destroy(const SandboxId& id) override;
    Result<std::vector<SandboxInfo>> list_managed() override;

    // ── Scripting ────────────────────────────
    void set_script(MockScript script);
    void fail_next_provisions(uint32_t count);
    void set_available(bool available);
    void set_provision_delay(Millis delay);
    void set_fail_destroy(bool fail);

    /// Register a sandbox as if left behind by a previous process.
    SandboxId inject_leftover(Timestamp created_at);
    void backdate(const SandboxId& id, Timestamp created_at);

    // ── Observation ──────────────────────────
    [[nodiscard]] uint32_t provision_calls() const noexcept { return provision_calls_.load(); }
    [[nodiscard]] uint32_t spawn_calls() const noexcept { return spawn_calls_.load(); }
    [[nodiscard]] uint32_t destroy_calls() const noexcept { return destroy_calls_.load(); }
    [[nodiscard]] uint32_t live_count() const;
    [[nodiscard]] uint32_t peak_live() const;
    [[nodiscard]] std::vector<ProcessSignal> signals_sent() const;
    [[nodiscard]] std::vector<SandboxSpec> provisioned_specs() const;
    [[nodiscard]] std::vector<ExecSpec> executed() const;

    /// Shared by a mock process and the runtime that signals it.
    struct ProcessState {
        std::mutex mutex;
        std::condition_variable cv;
        bool terminated{false};
        bool killed{false};
    };

private:
    struct MockSandbox {
        Timestamp created_at;
        std::vector<std::weak_ptr<ProcessState>> processes;
    };

    mutable std::mutex mutex_;
    MockScript script_;
    std::map<SandboxId, MockSandbox> sandboxes_;
    std::vector<ProcessSignal> signals_;
    std::vector<SandboxSpec> specs_;
    std::vector<ExecSpec> executed_;
    uint32_t fail_provisions_{0};
    bool available_{true};
    bool fail_destroy_{false};
    Millis provision_delay_{0};
    uint32_t peak_live_{0};

    std::atomic<uint32_t> provision_calls_{0};
    std::atomic<uint32_t> spawn_calls_{0};
    std::atomic<uint32_t> destroy_calls_{0};
};

}  // namespace sandbox_gate
