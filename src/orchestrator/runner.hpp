/**
 * @file runner.hpp
 * @brief ContainerOrchestrator — drives one sandbox per request.
 *
 * Owns the sandbox lifecycle for a request:
 *   1. Provision with retry, exponential backoff and a circuit breaker
 *   2. Run the build / run / test steps inside the same sandbox
 *   3. Enforce the wall-clock deadline (TERM, grace, KILL, destroy)
 *   4. Destroy the sandbox when the SandboxSession goes out of scope
 *
 *   CREATED → PROVISIONING → RUNNING → {COMPLETED | TIMED_OUT |
 *   RESOURCE_EXCEEDED | RUNTIME_ERROR | INFRA_ERROR | CANCELLED}
 *   → CLEANUP → TERMINAL
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "orchestrator/circuit_breaker.hpp"
#include "orchestrator/languages.hpp"
#include "runtime/container_runtime.hpp"
#include "telemetry/audit_log.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace sandbox_gate {

// ─────────────────────────────────────────────
// Sandbox state machine
// ─────────────────────────────────────────────

enum class SandboxState : uint8_t {
    Created,
    Provisioning,
    Running,
    Completed,
    TimedOut,
    ResourceExceeded,
    RuntimeError,
    InfraError,
    Cancelled,
    Cleanup,
    Terminal
};

[[nodiscard]] constexpr std::string_view to_string(SandboxState state) noexcept {
    switch (state) {
        case SandboxState::Created:          return "created";
        case SandboxState::Provisioning:     return "provisioning";
        case SandboxState::Running:          return "running";
        case SandboxState::Completed:        return "completed";
        case SandboxState::TimedOut:         return "timed_out";
        case SandboxState::ResourceExceeded: return "resource_exceeded";
        case SandboxState::RuntimeError:     return "runtime_error";
        case SandboxState::InfraError:       return "infra_error";
        case SandboxState::Cancelled:        return "cancelled";
        case SandboxState::Cleanup:          return "cleanup";
        case SandboxState::Terminal:         return "terminal";
    }
    return "unknown";
}

[[nodiscard]] bool is_legal_transition(SandboxState from, SandboxState to) noexcept;

/// Outcome state a finished step maps to.
[[nodiscard]] SandboxState outcome_state(ExecutionStatus status) noexcept;

/**
 * @brief Tracks one sandbox's state; illegal transitions are refused and logged.
 */
class SandboxLifecycle {
public:
    SandboxLifecycle(RequestId request_id, std::shared_ptr<Logger> logger);

    /// false (and a warning) if the transition is not allowed.
    bool transition(SandboxState next);

    [[nodiscard]] SandboxState state() const noexcept { return state_; }
    [[nodiscard]] const RequestId& request_id() const noexcept { return request_id_; }

private:
    RequestId request_id_;
    std::shared_ptr<Logger> logger_;
    SandboxState state_{SandboxState::Created};
};

// ─────────────────────────────────────────────
// Step results
// ─────────────────────────────────────────────

enum class StepKind : uint8_t {
    Build,      ///< compile or syntax check; failure is a compilation error
    Run,
    Test
};

/**
 * @brief What happened when one or more steps ran in a sandbox.
 */
struct RawExecutionResult {
    ExecutionStatus status{ExecutionStatus::Success};
    std::string stdout_data;
    std::string stderr_data;
    int exit_code{0};
    int exit_signal{0};
    bool output_truncated{false};
    ResourceUsage usage;
    std::optional<std::string> error;     ///< Infrastructure or cancellation detail
};

/**
 * @brief Status of a finished process. Timeouts and cancellation are decided
 *        by the caller before this is consulted.
 *
 * @param killed_by_orchestrator  true when SIGKILL came from timeout escalation
 */
[[nodiscard]] ExecutionStatus classify_outcome(const ProcessOutcome& outcome,
                                               const LanguageProfile& profile,
                                               StepKind kind,
                                               bool killed_by_orchestrator);

class ContainerOrchestrator;

// ─────────────────────────────────────────────
// SandboxSession
// ─────────────────────────────────────────────

/**
 * @brief A provisioned sandbox. The destructor destroys it.
 */
class SandboxSession {
public:
    SandboxSession(SandboxSession&& other) noexcept;
    SandboxSession& operator=(SandboxSession&&) = delete;
    SandboxSession(const SandboxSession&) = delete;
    SandboxSession& operator=(const SandboxSession&) = delete;
    ~SandboxSession();

    [[nodiscard]] const SandboxHandle& handle() const noexcept { return handle_; }
    [[nodiscard]] const LanguageProfile& profile() const noexcept { return *profile_; }
    [[nodiscard]] const RequestId& request_id() const noexcept { return lifecycle_.request_id(); }
    [[nodiscard]] SandboxState state() const noexcept { return lifecycle_.state(); }
    [[nodiscard]] bool destroyed() const noexcept { return destroyed_; }

    /// Placeholder values for this sandbox's command templates.
    [[nodiscard]] CommandContext context() const;

    /// Record how the request ended; later calls are ignored.
    void conclude(ExecutionStatus status);

private:
    friend class ContainerOrchestrator;

    SandboxSession(ContainerOrchestrator& orchestrator, SandboxLifecycle lifecycle,
                   SandboxHandle handle, const LanguageProfile& profile);

    ContainerOrchestrator* orchestrator_;
    SandboxLifecycle lifecycle_;
    SandboxHandle handle_;
    const LanguageProfile* profile_;
    bool destroyed_{false};
};

// ─────────────────────────────────────────────
// ContainerOrchestrator
// ─────────────────────────────────────────────

class ContainerOrchestrator {
public:
    ContainerOrchestrator(IContainerRuntime& runtime,
                          const RuntimeConfig& config,
                          std::shared_ptr<Logger> logger,
                          std::shared_ptr<AuditLog> audit = nullptr);

    ContainerOrchestrator(const ContainerOrchestrator&) = delete;
    ContainerOrchestrator& operator=(const ContainerOrchestrator&) = delete;

    /**
     * @brief Provision a sandbox holding the submission (and the test driver
     *        when with_driver is set).
     *
     * Errors: InfrastructureError after exhausting retries or while the
     * breaker is open, Cancelled when stop is requested first.
     */
    Result<SandboxSession> open_session(const RequestId& request_id,
                                        const LanguageProfile& profile,
                                        const std::string& code,
                                        const ResourceLimits& limits,
                                        bool with_driver,
                                        std::stop_token stop);

    /**
     * @brief Run one command in the session's sandbox until it exits, the
     *        deadline passes or stop is requested.
     */
    RawExecutionResult execute(SandboxSession& session,
                               const std::vector<std::string>& argv,
                               StepKind kind,
                               const std::string& stdin_data,
                               SteadyTime deadline,
                               std::stop_token stop);

    /// Compile step, or the syntax check when for_tests and no compile exists.
    RawExecutionResult prepare(SandboxSession& session, bool for_tests,
                               SteadyTime deadline, std::stop_token stop);

    /// The profile's run command with empty stdin.
    RawExecutionResult run_program(SandboxSession& session, SteadyTime deadline,
                                   std::stop_token stop);

    /**
     * @brief Whole no-test plan: provision, [compile], run, destroy.
     *
     * The wall-clock budget starts once the sandbox is provisioned.
     */
    RawExecutionResult run(const RequestId& request_id,
                           const std::string& code,
                           const LanguageProfile& profile,
                           const ResourceLimits& limits,
                           std::stop_token stop);

    [[nodiscard]] uint32_t live_sandboxes() const noexcept { return live_.load(); }
    [[nodiscard]] uint32_t peak_live_sandboxes() const noexcept { return peak_live_.load(); }
    [[nodiscard]] uint64_t provisioned_total() const noexcept { return provisioned_.load(); }

    [[nodiscard]] CircuitBreaker& breaker() noexcept { return breaker_; }
    [[nodiscard]] IContainerRuntime& runtime() noexcept { return runtime_; }

private:
    friend class SandboxSession;

    /// Signal escalation once the deadline passed or stop was requested.
    std::optional<ProcessOutcome> escalate(SandboxSession& session,
                                           ISandboxProcess& process,
                                           ExecutionStatus reason,
                                           bool& killed_by_orchestrator);

    void teardown(SandboxSession& session) noexcept;

    IContainerRuntime& runtime_;
    RuntimeConfig config_;
    std::shared_ptr<Logger> logger_;
    std::shared_ptr<AuditLog> audit_;
    CircuitBreaker breaker_;

    std::atomic<uint32_t> live_{0};
    std::atomic<uint32_t> peak_live_{0};
    std::atomic<uint64_t> provisioned_{0};
};

}  // namespace sandbox_gate
