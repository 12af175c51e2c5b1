/**
 * @file runner.cpp
 * @brief ContainerOrchestrator implementation: provisioning, step execution,
 *        deadline enforcement and teardown.
 */

#include "orchestrator/runner.hpp"

#include <csignal>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace sandbox_gate {

namespace {

constexpr uint64_t kMiB = 1024ULL * 1024;
constexpr Millis kKillWait{2000};

/// Sleep unless stop is requested first; false when interrupted.
bool sleep_interruptible(std::stop_token stop, Millis duration) {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    cv.wait_for(lock, stop, duration, [] { return false; });
    return !stop.stop_requested();
}

double seconds_since(SteadyTime start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

bool is_outcome(SandboxState state) noexcept {
    switch (state) {
        case SandboxState::Completed:
        case SandboxState::TimedOut:
        case SandboxState::ResourceExceeded:
        case SandboxState::RuntimeError:
        case SandboxState::InfraError:
        case SandboxState::Cancelled:
            return true;
        default:
            return false;
    }
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// State machine
// ─────────────────────────────────────────────

bool is_legal_transition(SandboxState from, SandboxState to) noexcept {
    switch (from) {
        case SandboxState::Created:
            return to == SandboxState::Provisioning || to == SandboxState::Cancelled;
        case SandboxState::Provisioning:
            return to == SandboxState::Running || to == SandboxState::InfraError
                || to == SandboxState::Cancelled;
        case SandboxState::Running:
            return is_outcome(to);
        case SandboxState::Cleanup:
            return to == SandboxState::Terminal;
        case SandboxState::Terminal:
            return false;
        default:
            return is_outcome(from) && to == SandboxState::Cleanup;
    }
}

SandboxState outcome_state(ExecutionStatus status) noexcept {
    switch (status) {
        case ExecutionStatus::TimedOut:            return SandboxState::TimedOut;
        case ExecutionStatus::ResourceExceeded:    return SandboxState::ResourceExceeded;
        case ExecutionStatus::RuntimeError:
        case ExecutionStatus::CompilationError:    return SandboxState::RuntimeError;
        case ExecutionStatus::InfrastructureError: return SandboxState::InfraError;
        case ExecutionStatus::Cancelled:           return SandboxState::Cancelled;
        default:                                   return SandboxState::Completed;
    }
}

SandboxLifecycle::SandboxLifecycle(RequestId request_id, std::shared_ptr<Logger> logger)
    : request_id_(std::move(request_id))
    , logger_(std::move(logger)) {}

bool SandboxLifecycle::transition(SandboxState next) {
    if (!is_legal_transition(state_, next)) {
        if (logger_) {
            logger_->warn("Illegal sandbox state transition refused", {
                {"request_id", request_id_},
                {"from", std::string{to_string(state_)}},
                {"to", std::string{to_string(next)}}
            });
        }
        return false;
    }
    if (logger_) {
        logger_->debug("Sandbox state changed", {
            {"request_id", request_id_},
            {"from", std::string{to_string(state_)}},
            {"to", std::string{to_string(next)}}
        });
    }
    state_ = next;
    return true;
}

// ─────────────────────────────────────────────
// Classification
// ─────────────────────────────────────────────

ExecutionStatus classify_outcome(const ProcessOutcome& outcome,
                                 const LanguageProfile& profile,
                                 StepKind kind,
                                 bool killed_by_orchestrator) {
    if (outcome.oom_killed) return ExecutionStatus::ResourceExceeded;
    if (outcome.signal == SIGKILL && !killed_by_orchestrator) {
        return ExecutionStatus::ResourceExceeded;
    }
    if (outcome.signal == SIGXCPU) return ExecutionStatus::ResourceExceeded;

    const bool failed = outcome.exit_code != 0 || outcome.signal != 0;
    if (failed) {
        for (const auto& marker : profile.oom_markers) {
            if (outcome.stderr_data.find(marker) != std::string::npos) {
                return ExecutionStatus::ResourceExceeded;
            }
        }
        return kind == StepKind::Build ? ExecutionStatus::CompilationError
                                       : ExecutionStatus::RuntimeError;
    }
    return ExecutionStatus::Success;
}

// ─────────────────────────────────────────────
// SandboxSession
// ─────────────────────────────────────────────

SandboxSession::SandboxSession(ContainerOrchestrator& orchestrator, SandboxLifecycle lifecycle,
                               SandboxHandle handle, const LanguageProfile& profile)
    : orchestrator_(&orchestrator)
    , lifecycle_(std::move(lifecycle))
    , handle_(std::move(handle))
    , profile_(&profile) {}

SandboxSession::SandboxSession(SandboxSession&& other) noexcept
    : orchestrator_(other.orchestrator_)
    , lifecycle_(std::move(other.lifecycle_))
    , handle_(std::move(other.handle_))
    , profile_(other.profile_)
    , destroyed_(other.destroyed_) {
    other.orchestrator_ = nullptr;
    other.destroyed_ = true;
}

SandboxSession::~SandboxSession() {
    if (orchestrator_) orchestrator_->teardown(*this);
}

CommandContext SandboxSession::context() const {
    CommandContext ctx;
    ctx.src = handle_.code_dir + "/" + profile_->source_file;
    ctx.workdir = handle_.code_dir;
    ctx.scratch = handle_.scratch_dir;
    if (!profile_->driver_file.empty()) {
        ctx.driver = handle_.code_dir + "/" + profile_->driver_file;
    }
    ctx.heap_mb = std::max<uint64_t>(16, handle_.limits.memory_limit_bytes / kMiB * 3 / 4);
    return ctx;
}

void SandboxSession::conclude(ExecutionStatus status) {
    if (lifecycle_.state() != SandboxState::Running) return;
    lifecycle_.transition(outcome_state(status));
}

// ─────────────────────────────────────────────
// ContainerOrchestrator
// ─────────────────────────────────────────────

ContainerOrchestrator::ContainerOrchestrator(IContainerRuntime& runtime,
                                             const RuntimeConfig& config,
                                             std::shared_ptr<Logger> logger,
                                             std::shared_ptr<AuditLog> audit)
    : runtime_(runtime)
    , config_(config)
    , logger_(std::move(logger))
    , audit_(std::move(audit))
    , breaker_(config.circuit_breaker.failure_threshold,
               Millis{config.circuit_breaker.open_duration_ms}) {}

Result<SandboxSession> ContainerOrchestrator::open_session(const RequestId& request_id,
                                                           const LanguageProfile& profile,
                                                           const std::string& code,
                                                           const ResourceLimits& limits,
                                                           bool with_driver,
                                                           std::stop_token stop) {
    SandboxLifecycle lifecycle(request_id, logger_);
    auto abandon = [&lifecycle](SandboxState outcome) {
        lifecycle.transition(outcome);
        lifecycle.transition(SandboxState::Cleanup);
        lifecycle.transition(SandboxState::Terminal);
    };

    lifecycle.transition(SandboxState::Provisioning);

    const SandboxSpec spec{
        .request_id = request_id,
        .image = profile.image,
        .limits = limits,
        .files = profile.files_for(code, with_driver),
        .scratch_bytes = config_.scratch_size_mb * kMiB,
        .pids_limit = config_.pids_limit,
        .open_files_limit = config_.open_files_limit
    };

    const auto& policy = config_.provisioning;
    const uint32_t max_attempts = std::max<uint32_t>(1, policy.max_attempts);
    Millis backoff{policy.initial_backoff_ms};
    std::string last_error;

    for (uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
        if (stop.stop_requested()) {
            abandon(SandboxState::Cancelled);
            return Error{ErrorKind::Cancelled, "Cancelled before a sandbox was provisioned"};
        }
        if (!breaker_.allow()) {
            logger_->warn("Provisioning refused, circuit breaker open", {
                {"request_id", request_id},
                {"runtime", std::string{runtime_.name()}}
            });
            abandon(SandboxState::InfraError);
            return Error{ErrorKind::InfrastructureError,
                         "Sandbox runtime unavailable (circuit breaker open)"};
        }

        auto handle = runtime_.provision(spec);
        if (handle) {
            breaker_.record_success();
            const uint32_t live = live_.fetch_add(1) + 1;
            uint32_t peak = peak_live_.load();
            while (live > peak && !peak_live_.compare_exchange_weak(peak, live)) {}
            provisioned_.fetch_add(1);

            logger_->info("Sandbox provisioned", {
                {"request_id", request_id},
                {"sandbox", handle->id},
                {"image", profile.image},
                {"attempt", std::to_string(attempt)}
            });
            if (audit_) audit_->record_sandbox_event(handle->id, "provisioned", request_id);

            lifecycle.transition(SandboxState::Running);
            SandboxSession session(*this, std::move(lifecycle), std::move(*handle), profile);
            if (stop.stop_requested()) {
                // Cancelled while the runtime was provisioning; the session destroys it.
                session.conclude(ExecutionStatus::Cancelled);
                return Error{ErrorKind::Cancelled, "Cancelled while the sandbox was provisioning"};
            }
            return session;
        }

        breaker_.record_failure();
        last_error = handle.error().message;
        logger_->warn("Sandbox provisioning attempt failed", {
            {"request_id", request_id},
            {"attempt", std::to_string(attempt)},
            {"max_attempts", std::to_string(max_attempts)},
            {"error", last_error}
        });

        if (attempt == max_attempts) break;
        if (!sleep_interruptible(stop, backoff)) continue;   // loop head reports cancellation

        const auto next = static_cast<int64_t>(
            static_cast<double>(backoff.count()) * policy.backoff_multiplier);
        backoff = std::min(Millis{next}, Millis{policy.max_backoff_ms});
    }

    logger_->error("Sandbox provisioning exhausted", {
        {"request_id", request_id},
        {"attempts", std::to_string(max_attempts)},
        {"error", last_error}
    });
    abandon(SandboxState::InfraError);
    return Error{ErrorKind::InfrastructureError,
                 "Sandbox provisioning failed after " + std::to_string(max_attempts)
                 + " attempt(s): " + last_error};
}

RawExecutionResult ContainerOrchestrator::execute(SandboxSession& session,
                                                  const std::vector<std::string>& argv,
                                                  StepKind kind,
                                                  const std::string& stdin_data,
                                                  SteadyTime deadline,
                                                  std::stop_token stop) {
    RawExecutionResult result;
    const auto& profile = session.profile();

    if (session.destroyed()) {
        result.status = ExecutionStatus::InfrastructureError;
        result.error = "Sandbox was already destroyed";
        return result;
    }
    if (stop.stop_requested()) {
        result.status = ExecutionStatus::Cancelled;
        result.error = "Execution cancelled";
        return result;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
        result.status = ExecutionStatus::TimedOut;
        return result;
    }

    const ExecSpec exec{
        .argv = argv,
        .stdin_data = stdin_data,
        .env = profile.env,
        .output_limit_bytes = config_.output_limit_kb * 1024,
        .limit_address_space = profile.limit_address_space
    };

    const auto started = std::chrono::steady_clock::now();
    auto spawned = runtime_.spawn(session.handle(), exec);
    if (!spawned) {
        logger_->error("Failed to start process in sandbox", {
            {"request_id", session.request_id()},
            {"sandbox", session.handle().id},
            {"error", spawned.error().message}
        });
        result.status = ExecutionStatus::InfrastructureError;
        result.error = "Failed to start process in sandbox: " + spawned.error().message;
        return result;
    }
    ISandboxProcess& process = **spawned;

    const Millis poll{std::max<uint32_t>(1, config_.poll_interval_ms)};
    std::optional<ProcessOutcome> outcome;
    bool timed_out = false;
    bool cancelled = false;
    bool killed_by_orchestrator = false;

    while (!outcome) {
        if (stop.stop_requested()) {
            cancelled = true;
            break;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            timed_out = true;
            break;
        }
        const auto left = std::chrono::duration_cast<Millis>(deadline - now) + Millis{1};
        outcome = process.wait_for(std::min(poll, left));
    }

    if (!outcome) {
        const auto reason = timed_out ? ExecutionStatus::TimedOut : ExecutionStatus::Cancelled;
        logger_->info(timed_out ? "Deadline reached, terminating sandbox processes"
                                : "Cancellation requested, terminating sandbox processes", {
            {"request_id", session.request_id()},
            {"sandbox", session.handle().id}
        });
        outcome = escalate(session, process, reason, killed_by_orchestrator);
    }

    if (outcome) {
        result.stdout_data = std::move(outcome->stdout_data);
        result.stderr_data = std::move(outcome->stderr_data);
        result.exit_code = outcome->exit_code;
        result.exit_signal = outcome->signal;
        result.output_truncated = outcome->output_truncated;
        result.usage = outcome->usage;
    }
    if (result.usage.wall_time_seconds <= 0.0) {
        result.usage.wall_time_seconds = seconds_since(started);
    }

    if (timed_out) {
        result.status = ExecutionStatus::TimedOut;
    } else if (cancelled) {
        result.status = ExecutionStatus::Cancelled;
        result.error = "Execution cancelled";
    } else {
        result.status = classify_outcome(*outcome, profile, kind, killed_by_orchestrator);
    }
    return result;
}

std::optional<ProcessOutcome> ContainerOrchestrator::escalate(SandboxSession& session,
                                                              ISandboxProcess& process,
                                                              ExecutionStatus reason,
                                                              bool& killed_by_orchestrator) {
    const LogFields fields{
        {"request_id", session.request_id()},
        {"sandbox", session.handle().id}
    };

    if (auto sent = runtime_.signal_all(session.handle(), ProcessSignal::Terminate); !sent) {
        logger_->warn("SIGTERM delivery failed: " + sent.error().message, fields);
    }
    if (auto outcome = process.wait_for(Millis{config_.grace_period_ms})) {
        return outcome;
    }

    killed_by_orchestrator = true;
    if (auto sent = runtime_.signal_all(session.handle(), ProcessSignal::Kill); !sent) {
        logger_->warn("SIGKILL delivery failed: " + sent.error().message, fields);
    }
    process.kill();
    if (auto outcome = process.wait_for(kKillWait)) {
        return outcome;
    }

    logger_->error("Process survived SIGKILL, destroying sandbox", fields);
    session.conclude(reason);
    teardown(session);
    return process.wait_for(kKillWait);
}

RawExecutionResult ContainerOrchestrator::prepare(SandboxSession& session, bool for_tests,
                                                  SteadyTime deadline, std::stop_token stop) {
    const auto& profile = session.profile();
    const CommandTemplate* step = nullptr;
    if (profile.compile) {
        step = &*profile.compile;
    } else if (for_tests && profile.check) {
        step = &*profile.check;
    }
    if (!step) return RawExecutionResult{};

    return execute(session, expand_command(*step, session.context()), StepKind::Build, {},
                   deadline, stop);
}

RawExecutionResult ContainerOrchestrator::run_program(SandboxSession& session,
                                                      SteadyTime deadline,
                                                      std::stop_token stop) {
    return execute(session, expand_command(session.profile().run, session.context()),
                   StepKind::Run, {}, deadline, stop);
}

RawExecutionResult ContainerOrchestrator::run(const RequestId& request_id,
                                              const std::string& code,
                                              const LanguageProfile& profile,
                                              const ResourceLimits& limits,
                                              std::stop_token stop) {
    auto opened = open_session(request_id, profile, code, limits, false, stop);
    if (!opened) {
        RawExecutionResult failed;
        failed.status = opened.error().kind == ErrorKind::Cancelled
            ? ExecutionStatus::Cancelled : ExecutionStatus::InfrastructureError;
        failed.error = opened.error().message;
        return failed;
    }
    SandboxSession& session = *opened;

    const auto deadline = std::chrono::steady_clock::now() + limits.timeout();

    auto build = prepare(session, false, deadline, stop);
    if (build.status != ExecutionStatus::Success) {
        session.conclude(build.status);
        return build;
    }

    auto result = run_program(session, deadline, stop);
    ResourceUsage usage = build.usage;
    usage.accumulate(result.usage);
    result.usage = usage;
    session.conclude(result.status);
    return result;
}

void ContainerOrchestrator::teardown(SandboxSession& session) noexcept {
    if (session.destroyed_) return;
    session.destroyed_ = true;

    auto& lifecycle = session.lifecycle_;
    if (lifecycle.state() == SandboxState::Running) {
        lifecycle.transition(SandboxState::Completed);
    }
    lifecycle.transition(SandboxState::Cleanup);

    const auto& id = session.handle_.id;
    const LogFields fields{
        {"request_id", lifecycle.request_id()},
        {"sandbox", id}
    };

    try {
        if (auto destroyed = runtime_.destroy(id); destroyed) {
            logger_->debug("Sandbox destroyed", fields);
            if (audit_) audit_->record_sandbox_event(id, "destroyed", lifecycle.request_id());
        } else {
            auto with_error = fields;
            with_error.emplace_back("error", destroyed.error().message);
            logger_->error("Sandbox destroy failed, leaving it to the reaper", with_error);
            if (audit_) audit_->record_sandbox_event(id, "destroy_failed", lifecycle.request_id());
        }
    } catch (const std::exception& e) {
        logger_->error(std::string{"Sandbox destroy threw: "} + e.what(), fields);
    }

    live_.fetch_sub(1);
    lifecycle.transition(SandboxState::Terminal);
}

}  // namespace sandbox_gate
