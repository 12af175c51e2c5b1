/**
 * @file test_gateway.cpp
 * @brief End-to-end pipeline tests for ExecutionGateway on the mock runtime.
 */

#include "gateway/gateway.hpp"
#include "runtime/mock_runtime.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <mutex>
#include <optional>
#include <thread>

using namespace sandbox_gate;

namespace {

/// Keeps every line written so tests can inspect the audit trail.
class CaptureSink : public ILogSink {
public:
    struct Lines {
        std::mutex mutex;
        std::vector<std::string> lines;
    };

    explicit CaptureSink(std::shared_ptr<Lines> lines) : lines_(std::move(lines)) {}

    void write(std::string_view json_line) override {
        std::lock_guard lock(lines_->mutex);
        lines_->lines.emplace_back(json_line);
    }
    void flush() override {}

private:
    std::shared_ptr<Lines> lines_;
};

size_t count_containing(CaptureSink::Lines& lines, const std::string& needle) {
    std::lock_guard lock(lines.mutex);
    return static_cast<size_t>(std::count_if(lines.lines.begin(), lines.lines.end(),
        [&](const std::string& l) { return l.find(needle) != std::string::npos; }));
}

Config test_config() {
    Config config;
    config.runtime.grace_period_ms = 50;
    config.runtime.poll_interval_ms = 5;
    config.runtime.provisioning.initial_backoff_ms = 1;
    config.runtime.provisioning.max_backoff_ms = 2;
    return config;
}

/// Behaves like the real interpreters for the handful of programs used below.
MockBehavior interpreter(const SandboxHandle&, const ExecSpec& exec) {
    const bool is_driver = std::any_of(exec.argv.begin(), exec.argv.end(),
        [](const std::string& a) { return a.find("_driver") != std::string::npos; });
    if (is_driver) {
        // multiply(a, b) driven with "a,b" on stdin
        int a = 0;
        int b = 0;
        if (std::sscanf(exec.stdin_data.c_str(), "%d,%d", &a, &b) == 2) {
            return MockBehavior{.stdout_data = std::to_string(a * b) + "\n"};
        }
        return MockBehavior{.exit_code = 1, .stderr_data = "ValueError: bad input\n"};
    }
    if (exec.argv.size() > 1 && exec.argv[1] == "-c") return MockBehavior{};   // syntax check
    return MockBehavior{.stdout_data = "Hello, World!\n", .duration = Millis{5}};
}

ExecutionRequest python_request(std::string code) {
    ExecutionRequest request;
    request.code = std::move(code);
    request.language = Language::Python;
    return request;
}

}  // anonymous namespace

class GatewayTest : public ::testing::Test {
protected:
    MockRuntime runtime_;
    std::shared_ptr<CaptureSink::Lines> audit_lines_ = std::make_shared<CaptureSink::Lines>();
    std::unique_ptr<ExecutionGateway> gateway_;

    void SetUp() override { rebuild(test_config()); }

    void rebuild(const Config& config) {
        gateway_ = std::make_unique<ExecutionGateway>(
            config, runtime_,
            std::make_shared<Logger>(std::make_unique<NullSink>(), LogLevel::Error),
            std::make_shared<AuditLog>(std::make_unique<CaptureSink>(audit_lines_)));
        runtime_.set_script(interpreter);
    }

    ExecutionResult run(const ExecutionRequest& request, std::stop_token stop = {}) {
        auto result = gateway_->execute(request, stop);
        EXPECT_TRUE(result.has_value());
        return result ? *result : ExecutionResult{};
    }
};

// ── Reference scenarios ──────────────────────

TEST_F(GatewayTest, HelloWorld) {
    auto result = run(python_request("print('Hello, World!')"));
    EXPECT_EQ(result.status, ExecutionStatus::Success);
    EXPECT_EQ(result.output, "Hello, World!\n");
    EXPECT_TRUE(result.errors.empty());
    EXPECT_FALSE(result.request_id.empty());
    EXPECT_EQ(runtime_.live_count(), 0u);
}

TEST_F(GatewayTest, DangerousCodeIsRejectedWithoutASandbox) {
    auto result = run(python_request("import os; os.system('ls')"));
    EXPECT_EQ(result.status, ExecutionStatus::SecurityRejected);
    EXPECT_EQ(result.output, "");
    EXPECT_TRUE(std::any_of(result.security_violations.begin(), result.security_violations.end(),
        [](const SecurityViolation& v) { return v.severity == Severity::Critical; }));
    EXPECT_EQ(runtime_.provision_calls(), 0u);
    EXPECT_GE(count_containing(*audit_lines_, "\"event\":\"security_violation\""), 1u);
    EXPECT_GE(count_containing(*audit_lines_, ">>> 1: import os"), 1u);
}

TEST_F(GatewayTest, InfiniteLoopTimesOut) {
    runtime_.set_script([](const SandboxHandle&, const ExecSpec&) {
        return MockBehavior{.hang = true};
    });
    auto request = python_request("while True: pass");
    request.limits.timeout_seconds = 2.0;

    const auto started = std::chrono::steady_clock::now();
    auto result = run(request);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(result.status, ExecutionStatus::TimedOut);
    EXPECT_GE(elapsed, std::chrono::milliseconds(1900));
    EXPECT_LT(elapsed, std::chrono::milliseconds(3000));
    EXPECT_EQ(runtime_.live_count(), 0u);
}

TEST_F(GatewayTest, TestCasesRunAgainstTheSubmission) {
    auto request = python_request("def multiply(a, b):\n    return a * b\n");
    request.test_cases.push_back(TestCase{.name = "t1", .input_data = "3,4",
                                          .expected_output = "12"});

    auto result = run(request);
    EXPECT_EQ(result.status, ExecutionStatus::Success);
    ASSERT_EQ(result.test_results.size(), 1u);
    EXPECT_EQ(result.test_results[0].name, "t1");
    EXPECT_TRUE(result.test_results[0].passed);
    EXPECT_TRUE(result.all_tests_passed());
    EXPECT_EQ(result.output, "1/1 tests passed");
    EXPECT_EQ(runtime_.provision_calls(), 1u);
    EXPECT_EQ(runtime_.live_count(), 0u);
}

TEST_F(GatewayTest, ConcurrencyCapIsNeverExceeded) {
    runtime_.set_script([](const SandboxHandle&, const ExecSpec&) {
        return MockBehavior{.stdout_data = "ok\n", .duration = Millis{20}};
    });

    std::atomic<int> terminal{0};
    std::atomic<int> unexpected{0};
    std::vector<std::jthread> clients;
    for (int i = 0; i < 50; ++i) {
        clients.emplace_back([&] {
            auto result = gateway_->execute(python_request("print('ok')"));
            if (!result) {
                unexpected.fetch_add(1);
                return;
            }
            switch (result->status) {
                case ExecutionStatus::Success:
                case ExecutionStatus::RuntimeError:
                case ExecutionStatus::BackpressureRejected:
                    terminal.fetch_add(1);
                    break;
                default:
                    unexpected.fetch_add(1);
            }
        });
    }
    clients.clear();

    EXPECT_EQ(terminal.load(), 50);
    EXPECT_EQ(unexpected.load(), 0);
    EXPECT_LE(runtime_.peak_live(), 10u);
    EXPECT_LE(gateway_->admission().stats().peak_live, 10u);
    EXPECT_EQ(runtime_.live_count(), 0u);
    EXPECT_EQ(gateway_->orchestrator().live_sandboxes(), 0u);
}

// ── Testable properties ──────────────────────

TEST_F(GatewayTest, OversizedInputProvisionsNothing) {
    auto config = test_config();
    config.validator.max_code_length = 10;
    rebuild(config);

    auto result = run(python_request("print('this is far too long')"));
    EXPECT_EQ(result.status, ExecutionStatus::InputTooLarge);
    EXPECT_EQ(runtime_.provision_calls(), 0u);
    ASSERT_FALSE(result.errors.empty());
}

TEST_F(GatewayTest, MemoryOverrunIsResourceExceeded) {
    runtime_.set_script([](const SandboxHandle&, const ExecSpec&) {
        return MockBehavior{.exit_code = 137, .signal = SIGKILL, .oom_killed = true};
    });
    auto result = run(python_request("x = bytearray(1 << 34)"));
    EXPECT_EQ(result.status, ExecutionStatus::ResourceExceeded);
    EXPECT_EQ(runtime_.live_count(), 0u);
}

TEST_F(GatewayTest, WarningsDoNotBlockExecution) {
    auto result = run(python_request("import sys\nprint(sys.version)"));
    EXPECT_EQ(result.status, ExecutionStatus::Success);
    EXPECT_FALSE(result.security_violations.empty());
}

TEST_F(GatewayTest, InfrastructureFailureIsReported) {
    auto config = test_config();
    config.runtime.provisioning.max_attempts = 2;
    rebuild(config);
    runtime_.set_available(false);

    auto result = run(python_request("print(1)"));
    EXPECT_EQ(result.status, ExecutionStatus::InfrastructureError);
    ASSERT_FALSE(result.errors.empty());
    EXPECT_NE(result.errors[0].find("provisioning failed"), std::string::npos);
}

TEST_F(GatewayTest, RejectPolicyReturnsBackpressure) {
    auto config = test_config();
    config.gateway.max_concurrency = 1;
    config.gateway.admission_policy = "reject";
    rebuild(config);

    runtime_.set_script([](const SandboxHandle&, const ExecSpec&) {
        return MockBehavior{.duration = Millis{300}};
    });
    std::jthread first([&] { gateway_->execute(python_request("print(1)")); });
    while (gateway_->admission().stats().live == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }

    auto result = run(python_request("print(2)"));
    EXPECT_EQ(result.status, ExecutionStatus::BackpressureRejected);
}

// ── Request checks ───────────────────────────

TEST_F(GatewayTest, MalformedRequestsAreValidationErrors) {
    auto empty = gateway_->execute(python_request("   \n"));
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().kind, ErrorKind::ValidationError);

    auto java = python_request("class Main {}");
    java.language = Language::Java;
    auto unsupported = gateway_->execute(java);
    ASSERT_FALSE(unsupported);
    EXPECT_EQ(unsupported.error().kind, ErrorKind::ValidationError);

    auto bad_case = python_request("print(1)");
    bad_case.test_cases.push_back(TestCase{.name = "t", .timeout_seconds = 0.0});
    EXPECT_FALSE(gateway_->execute(bad_case));

    EXPECT_EQ(runtime_.provision_calls(), 0u);
}

TEST_F(GatewayTest, ResolveLimits) {
    auto defaults = gateway_->resolve_limits({});
    ASSERT_TRUE(defaults);
    EXPECT_DOUBLE_EQ(defaults->timeout_seconds, 10.0);
    EXPECT_EQ(defaults->memory_limit_bytes, 256ULL << 20);

    auto custom = gateway_->resolve_limits({.timeout_seconds = 5.0, .cpu_quota = 0.5});
    ASSERT_TRUE(custom);
    EXPECT_DOUBLE_EQ(custom->timeout_seconds, 5.0);
    EXPECT_DOUBLE_EQ(custom->cpu_quota, 0.5);

    EXPECT_FALSE(gateway_->resolve_limits({.timeout_seconds = 0.0}));
    EXPECT_FALSE(gateway_->resolve_limits({.timeout_seconds = 31.0}));
    EXPECT_FALSE(gateway_->resolve_limits({.memory_limit_bytes = 1024}));
    EXPECT_FALSE(gateway_->resolve_limits({.memory_limit_bytes = 1024ULL << 20}));
    EXPECT_FALSE(gateway_->resolve_limits({.cpu_quota = 4.0}));
    EXPECT_FALSE(gateway_->resolve_limits({.network_access = true}));
}

// ── Cancellation & introspection ─────────────

TEST_F(GatewayTest, CancelRunningRequest) {
    runtime_.set_script([](const SandboxHandle&, const ExecSpec&) {
        return MockBehavior{.hang = true};
    });

    std::optional<ExecutionResult> outcome;
    std::jthread client([&] {
        auto result = gateway_->execute(python_request("while True: pass"));
        if (result) outcome = *result;
    });

    std::vector<InFlightEntry> entries;
    for (int i = 0; i < 500; ++i) {
        entries = gateway_->in_flight();
        if (!entries.empty() && entries[0].phase == RequestPhase::Running) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].language, Language::Python);

    EXPECT_TRUE(gateway_->cancel(entries[0].request_id));
    client.join();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->status, ExecutionStatus::Cancelled);
    EXPECT_TRUE(gateway_->in_flight().empty());
    EXPECT_EQ(runtime_.live_count(), 0u);
}

TEST_F(GatewayTest, CancelUnknownRequest) {
    EXPECT_FALSE(gateway_->cancel("no-such-request"));
}

TEST_F(GatewayTest, ExternalStopCancels) {
    std::stop_source source;
    source.request_stop();
    auto result = run(python_request("print(1)"), source.get_token());
    EXPECT_EQ(result.status, ExecutionStatus::Cancelled);
}

TEST_F(GatewayTest, ValidateOnlyNeverProvisions) {
    auto report = gateway_->validate_only("import subprocess", Language::Python);
    EXPECT_FALSE(report.safe);
    EXPECT_EQ(runtime_.provision_calls(), 0u);
}

TEST_F(GatewayTest, LanguagesListing) {
    auto infos = gateway_->languages();
    ASSERT_EQ(infos.size(), kAllLanguages.size());
    auto python = std::find_if(infos.begin(), infos.end(),
                               [](const LanguageInfo& l) { return l.language == Language::Python; });
    ASSERT_NE(python, infos.end());
    EXPECT_TRUE(python->supported);
    EXPECT_EQ(python->extension, ".py");

    auto go = std::find_if(infos.begin(), infos.end(),
                           [](const LanguageInfo& l) { return l.language == Language::Go; });
    ASSERT_NE(go, infos.end());
    EXPECT_FALSE(go->supported);
}

TEST_F(GatewayTest, LanguageSupport) {
    EXPECT_TRUE(gateway_->language_supported("JS").supported);
    EXPECT_EQ(gateway_->language_supported("JS").language, "javascript");
    EXPECT_FALSE(gateway_->language_supported("go").supported);
    EXPECT_FALSE(gateway_->language_supported("brainfuck").supported);
}

TEST_F(GatewayTest, HealthReflectsRuntimeAndBreaker) {
    auto healthy = gateway_->health();
    EXPECT_TRUE(healthy.healthy);
    EXPECT_EQ(healthy.runtime, "mock");
    EXPECT_EQ(healthy.supported_languages.size(), 3u);

    runtime_.set_available(false);
    auto degraded = gateway_->health();
    EXPECT_FALSE(degraded.healthy);
    EXPECT_FALSE(degraded.runtime_available);
    EXPECT_TRUE(degraded.runtime_error.has_value());
}

TEST_F(GatewayTest, ExecutionIsAudited) {
    run(python_request("print('Hello, World!')"));
    EXPECT_EQ(count_containing(*audit_lines_, "\"event\":\"execution\""), 1u);
    EXPECT_EQ(count_containing(*audit_lines_, "\"event\":\"sandbox_provisioned\""), 1u);
    EXPECT_EQ(count_containing(*audit_lines_, "\"event\":\"sandbox_destroyed\""), 1u);
}
