/**
 * @file test_runner.cpp
 * @brief Unit tests for ContainerOrchestrator against the mock runtime.
 */

#include "orchestrator/runner.hpp"
#include "runtime/mock_runtime.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

#include <csignal>
#include <thread>

using namespace sandbox_gate;

namespace {

std::shared_ptr<Logger> quiet_logger() {
    return std::make_shared<Logger>(std::make_unique<NullSink>(), LogLevel::Error);
}

RuntimeConfig fast_config() {
    RuntimeConfig config;
    config.grace_period_ms = 50;
    config.poll_interval_ms = 5;
    config.provisioning.max_attempts = 3;
    config.provisioning.initial_backoff_ms = 1;
    config.provisioning.max_backoff_ms = 4;
    config.circuit_breaker.failure_threshold = 100;
    return config;
}

ResourceLimits limits_with_timeout(double seconds) {
    return ResourceLimits{.timeout_seconds = seconds};
}

}  // anonymous namespace

class RunnerTest : public ::testing::Test {
protected:
    MockRuntime runtime_;
    LanguageRegistry registry_;
    std::unique_ptr<ContainerOrchestrator> orchestrator_;

    void SetUp() override { rebuild(fast_config()); }

    void rebuild(const RuntimeConfig& config) {
        orchestrator_ = std::make_unique<ContainerOrchestrator>(runtime_, config, quiet_logger());
    }

    const LanguageProfile& python() { return *registry_.find(Language::Python); }

    RawExecutionResult run_python(const std::string& code, double timeout = 2.0,
                                  std::stop_token stop = {}) {
        return orchestrator_->run("req-1", code, python(), limits_with_timeout(timeout), stop);
    }
};

// ── Happy path & outcome mapping ─────────────

TEST_F(RunnerTest, SuccessfulRunCapturesOutputAndDestroys) {
    runtime_.set_script([](const SandboxHandle&, const ExecSpec&) {
        return MockBehavior{.stdout_data = "hello\n"};
    });

    auto result = run_python("print('hello')");
    EXPECT_EQ(result.status, ExecutionStatus::Success);
    EXPECT_EQ(result.stdout_data, "hello\n");
    EXPECT_EQ(runtime_.provision_calls(), 1u);
    EXPECT_EQ(runtime_.destroy_calls(), 1u);
    EXPECT_EQ(runtime_.live_count(), 0u);
    EXPECT_EQ(orchestrator_->live_sandboxes(), 0u);
    EXPECT_EQ(orchestrator_->provisioned_total(), 1u);
}

TEST_F(RunnerTest, NoTestPlanSkipsSyntaxCheck) {
    auto result = run_python("print(1)");
    ASSERT_EQ(result.status, ExecutionStatus::Success);
    auto executed = runtime_.executed();
    ASSERT_EQ(executed.size(), 1u);
    EXPECT_EQ(executed[0].argv.front(), "python3");
    EXPECT_EQ(executed[0].argv.back(), "/sandbox/solution.py");
}

TEST_F(RunnerTest, SubmissionAndLimitsReachTheSandbox) {
    auto result = orchestrator_->run("req-2", "print(2)", python(),
                                     ResourceLimits{.timeout_seconds = 1.0,
                                                    .memory_limit_bytes = 64ULL << 20},
                                     {});
    ASSERT_EQ(result.status, ExecutionStatus::Success);
    auto specs = runtime_.provisioned_specs();
    ASSERT_EQ(specs.size(), 1u);
    EXPECT_EQ(specs[0].request_id, "req-2");
    EXPECT_EQ(specs[0].image, "python:3.11-alpine");
    EXPECT_EQ(specs[0].limits.memory_limit_bytes, 64ULL << 20);
    ASSERT_EQ(specs[0].files.size(), 1u);
    EXPECT_EQ(specs[0].files[0].content, "print(2)");
}

TEST_F(RunnerTest, NonZeroExitIsRuntimeError) {
    runtime_.set_script([](const SandboxHandle&, const ExecSpec&) {
        return MockBehavior{.exit_code = 1, .stderr_data = "ZeroDivisionError: division by zero\n"};
    });
    auto result = run_python("1/0");
    EXPECT_EQ(result.status, ExecutionStatus::RuntimeError);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.stderr_data.find("ZeroDivisionError"), std::string::npos);
    EXPECT_EQ(runtime_.live_count(), 0u);
}

TEST_F(RunnerTest, OomKillIsResourceExceeded) {
    runtime_.set_script([](const SandboxHandle&, const ExecSpec&) {
        return MockBehavior{.exit_code = 137, .signal = SIGKILL, .oom_killed = true};
    });
    EXPECT_EQ(run_python("x = [0] * 10**10").status, ExecutionStatus::ResourceExceeded);
}

TEST_F(RunnerTest, MemoryErrorOnStderrIsResourceExceeded) {
    runtime_.set_script([](const SandboxHandle&, const ExecSpec&) {
        return MockBehavior{.exit_code = 1, .stderr_data = "Traceback...\nMemoryError\n"};
    });
    EXPECT_EQ(run_python("x = 'a' * 10**12").status, ExecutionStatus::ResourceExceeded);
}

TEST_F(RunnerTest, CompileFailureStopsBeforeRun) {
    runtime_.set_script([](const SandboxHandle&, const ExecSpec& exec) {
        if (exec.argv.front() == "tsc") {
            return MockBehavior{.exit_code = 2, .stdout_data = "solution.ts(1,5): error TS2322"};
        }
        return MockBehavior{};
    });
    auto result = orchestrator_->run("req-ts", "let x: number = 'a';",
                                     *registry_.find(Language::TypeScript),
                                     limits_with_timeout(2.0), {});
    EXPECT_EQ(result.status, ExecutionStatus::CompilationError);
    EXPECT_EQ(runtime_.spawn_calls(), 1u);
    EXPECT_EQ(runtime_.live_count(), 0u);
}

// ── Deadlines ────────────────────────────────

TEST_F(RunnerTest, HangingProgramTimesOutWithTerminate) {
    runtime_.set_script([](const SandboxHandle&, const ExecSpec&) {
        return MockBehavior{.hang = true};
    });

    const auto started = std::chrono::steady_clock::now();
    auto result = run_python("while True: pass", 0.2);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(result.status, ExecutionStatus::TimedOut);
    EXPECT_LT(elapsed, std::chrono::seconds(2));
    auto signals = runtime_.signals_sent();
    ASSERT_FALSE(signals.empty());
    EXPECT_EQ(signals.front(), ProcessSignal::Terminate);
    EXPECT_EQ(runtime_.live_count(), 0u);
}

TEST_F(RunnerTest, TerminateIgnoredEscalatesToKill) {
    runtime_.set_script([](const SandboxHandle&, const ExecSpec&) {
        return MockBehavior{.hang = true, .ignore_terminate = true};
    });

    auto result = run_python("import signal", 0.1);
    EXPECT_EQ(result.status, ExecutionStatus::TimedOut);
    EXPECT_EQ(result.exit_signal, SIGKILL);
    auto signals = runtime_.signals_sent();
    ASSERT_EQ(signals.size(), 2u);
    EXPECT_EQ(signals[1], ProcessSignal::Kill);
}

TEST_F(RunnerTest, DeadlineStartsAfterProvisioning) {
    runtime_.set_provision_delay(Millis{300});
    runtime_.set_script([](const SandboxHandle&, const ExecSpec&) {
        return MockBehavior{.duration = Millis{50}};
    });
    EXPECT_EQ(run_python("print(1)", 0.25).status, ExecutionStatus::Success);
}

// ── Cancellation ─────────────────────────────

TEST_F(RunnerTest, CancelledBeforeProvisioning) {
    std::stop_source source;
    source.request_stop();
    auto result = run_python("print(1)", 2.0, source.get_token());
    EXPECT_EQ(result.status, ExecutionStatus::Cancelled);
    EXPECT_EQ(runtime_.provision_calls(), 0u);
}

TEST_F(RunnerTest, CancelledDuringProvisioningBackoff) {
    auto config = fast_config();
    config.provisioning.max_attempts = 5;
    config.provisioning.initial_backoff_ms = 2000;
    config.provisioning.max_backoff_ms = 2000;
    rebuild(config);
    runtime_.fail_next_provisions(5);

    std::stop_source source;
    std::jthread canceller([&source] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        source.request_stop();
    });

    const auto started = std::chrono::steady_clock::now();
    auto result = run_python("print(1)", 2.0, source.get_token());
    EXPECT_EQ(result.status, ExecutionStatus::Cancelled);
    EXPECT_EQ(runtime_.provision_calls(), 1u);
    EXPECT_EQ(runtime_.live_count(), 0u);
    EXPECT_EQ(orchestrator_->live_sandboxes(), 0u);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(1500));
}

TEST_F(RunnerTest, CancelledDuringSlowProvision) {
    runtime_.set_provision_delay(Millis{200});
    std::stop_source source;
    std::jthread canceller([&source] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        source.request_stop();
    });

    auto result = run_python("print(1)", 2.0, source.get_token());
    EXPECT_EQ(result.status, ExecutionStatus::Cancelled);
    EXPECT_EQ(runtime_.provision_calls(), 1u);
    EXPECT_EQ(runtime_.spawn_calls(), 0u);
    EXPECT_EQ(runtime_.destroy_calls(), 1u);
    EXPECT_EQ(runtime_.live_count(), 0u);
    EXPECT_EQ(orchestrator_->live_sandboxes(), 0u);
}

TEST_F(RunnerTest, CancelledWhileRunning) {
    runtime_.set_script([](const SandboxHandle&, const ExecSpec&) {
        return MockBehavior{.hang = true};
    });
    std::stop_source source;
    std::jthread canceller([&source] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        source.request_stop();
    });

    auto result = run_python("while True: pass", 5.0, source.get_token());
    EXPECT_EQ(result.status, ExecutionStatus::Cancelled);
    EXPECT_EQ(runtime_.live_count(), 0u);
}

// ── Provisioning policy ──────────────────────

TEST_F(RunnerTest, ProvisioningRetriesTransientFailures) {
    runtime_.fail_next_provisions(2);
    auto result = run_python("print(1)");
    EXPECT_EQ(result.status, ExecutionStatus::Success);
    EXPECT_EQ(runtime_.provision_calls(), 3u);
}

TEST_F(RunnerTest, ProvisioningGivesUpAfterMaxAttempts) {
    auto config = fast_config();
    config.provisioning.max_attempts = 2;
    rebuild(config);
    runtime_.fail_next_provisions(5);

    auto result = run_python("print(1)");
    EXPECT_EQ(result.status, ExecutionStatus::InfrastructureError);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("after 2 attempt(s)"), std::string::npos);
    EXPECT_EQ(runtime_.provision_calls(), 2u);
}

TEST_F(RunnerTest, OpenBreakerFailsFast) {
    auto config = fast_config();
    config.provisioning.max_attempts = 1;
    config.circuit_breaker.failure_threshold = 2;
    config.circuit_breaker.open_duration_ms = 60000;
    rebuild(config);
    runtime_.set_available(false);

    EXPECT_EQ(run_python("1").status, ExecutionStatus::InfrastructureError);
    EXPECT_EQ(run_python("1").status, ExecutionStatus::InfrastructureError);
    EXPECT_EQ(orchestrator_->breaker().state(), BreakerState::Open);

    auto result = run_python("1");
    EXPECT_EQ(result.status, ExecutionStatus::InfrastructureError);
    EXPECT_NE(result.error->find("circuit breaker"), std::string::npos);
    EXPECT_EQ(runtime_.provision_calls(), 2u);
}

// ── Sessions ─────────────────────────────────

TEST_F(RunnerTest, SessionDestroysSandboxOnScopeExit) {
    {
        auto session = orchestrator_->open_session("req-s", python(), "print(1)",
                                                   limits_with_timeout(1.0), true, {});
        ASSERT_TRUE(session.has_value());
        EXPECT_EQ(session->state(), SandboxState::Running);
        EXPECT_EQ(runtime_.live_count(), 1u);
        EXPECT_EQ(orchestrator_->live_sandboxes(), 1u);
        EXPECT_EQ(runtime_.provisioned_specs()[0].files.size(), 2u);
    }
    EXPECT_EQ(runtime_.live_count(), 0u);
    EXPECT_EQ(orchestrator_->live_sandboxes(), 0u);
    EXPECT_EQ(orchestrator_->peak_live_sandboxes(), 1u);
}

TEST_F(RunnerTest, ConcludeRecordsOutcomeOnce) {
    auto session = orchestrator_->open_session("req-c", python(), "print(1)",
                                               limits_with_timeout(1.0), false, {});
    ASSERT_TRUE(session.has_value());
    session->conclude(ExecutionStatus::TimedOut);
    EXPECT_EQ(session->state(), SandboxState::TimedOut);
    session->conclude(ExecutionStatus::Success);
    EXPECT_EQ(session->state(), SandboxState::TimedOut);
}

TEST_F(RunnerTest, ContextExpandsPaths) {
    auto session = orchestrator_->open_session(
        "req-ctx", python(), "print(1)",
        ResourceLimits{.timeout_seconds = 1.0, .memory_limit_bytes = 256ULL << 20}, true, {});
    ASSERT_TRUE(session.has_value());
    auto ctx = session->context();
    EXPECT_EQ(ctx.src, "/sandbox/solution.py");
    EXPECT_EQ(ctx.driver, "/sandbox/_driver.py");
    EXPECT_EQ(ctx.scratch, "/tmp");
    EXPECT_EQ(ctx.heap_mb, 192u);
}

TEST_F(RunnerTest, HeapHasAFloor) {
    auto session = orchestrator_->open_session(
        "req-heap", python(), "print(1)",
        ResourceLimits{.timeout_seconds = 1.0, .memory_limit_bytes = 16ULL << 20}, false, {});
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->context().heap_mb, 16u);
}

TEST_F(RunnerTest, DestroyFailureIsNotFatal) {
    runtime_.set_fail_destroy(true);
    auto result = run_python("print(1)");
    EXPECT_EQ(result.status, ExecutionStatus::Success);
    EXPECT_EQ(orchestrator_->live_sandboxes(), 0u);
    EXPECT_EQ(runtime_.live_count(), 1u);
}

// ── Pure helpers ─────────────────────────────

TEST(ClassifyOutcomeTest, Mapping) {
    LanguageRegistry registry;
    const auto& py = *registry.find(Language::Python);

    EXPECT_EQ(classify_outcome(ProcessOutcome{}, py, StepKind::Run, false),
              ExecutionStatus::Success);
    EXPECT_EQ(classify_outcome(ProcessOutcome{.exit_code = 1}, py, StepKind::Build, false),
              ExecutionStatus::CompilationError);
    EXPECT_EQ(classify_outcome(ProcessOutcome{.exit_code = 1}, py, StepKind::Test, false),
              ExecutionStatus::RuntimeError);
    EXPECT_EQ(classify_outcome(ProcessOutcome{.signal = SIGKILL}, py, StepKind::Run, false),
              ExecutionStatus::ResourceExceeded);
    EXPECT_EQ(classify_outcome(ProcessOutcome{.signal = SIGKILL}, py, StepKind::Run, true),
              ExecutionStatus::RuntimeError);
    EXPECT_EQ(classify_outcome(ProcessOutcome{.signal = SIGXCPU}, py, StepKind::Run, false),
              ExecutionStatus::ResourceExceeded);
    EXPECT_EQ(classify_outcome(ProcessOutcome{.signal = SIGSEGV}, py, StepKind::Run, false),
              ExecutionStatus::RuntimeError);
}

TEST(SandboxStateTest, LegalTransitions) {
    EXPECT_TRUE(is_legal_transition(SandboxState::Created, SandboxState::Provisioning));
    EXPECT_TRUE(is_legal_transition(SandboxState::Provisioning, SandboxState::Running));
    EXPECT_TRUE(is_legal_transition(SandboxState::Running, SandboxState::TimedOut));
    EXPECT_TRUE(is_legal_transition(SandboxState::TimedOut, SandboxState::Cleanup));
    EXPECT_TRUE(is_legal_transition(SandboxState::Cleanup, SandboxState::Terminal));

    EXPECT_FALSE(is_legal_transition(SandboxState::Created, SandboxState::Running));
    EXPECT_FALSE(is_legal_transition(SandboxState::Running, SandboxState::Cleanup));
    EXPECT_FALSE(is_legal_transition(SandboxState::Completed, SandboxState::Running));
    EXPECT_FALSE(is_legal_transition(SandboxState::Terminal, SandboxState::Cleanup));
}

TEST(SandboxStateTest, LifecycleRefusesIllegalTransition) {
    SandboxLifecycle lifecycle("req", nullptr);
    EXPECT_FALSE(lifecycle.transition(SandboxState::Running));
    EXPECT_EQ(lifecycle.state(), SandboxState::Created);
    EXPECT_TRUE(lifecycle.transition(SandboxState::Provisioning));
    EXPECT_EQ(lifecycle.state(), SandboxState::Provisioning);
}
