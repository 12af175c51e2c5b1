/**
 * @file types.hpp
 * @brief Fundamental types used throughout SandboxGate.
 *
 * Defines the request/result vocabulary shared by the validator, the
 * orchestrator, the test harness and the gateway. All types are plain
 * values; an ExecutionRequest is never mutated after the API boundary.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sandbox_gate {

// ─────────────────────────────────────────────
// Identity & Time
// ─────────────────────────────────────────────

using RequestId = std::string;
using SandboxId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;
using Millis = std::chrono::milliseconds;

// ─────────────────────────────────────────────
// Language
// ─────────────────────────────────────────────

enum class Language : uint8_t {
    Python,
    JavaScript,
    TypeScript,
    Java,
    Go
};

inline constexpr std::array<Language, 5> kAllLanguages = {
    Language::Python, Language::JavaScript, Language::TypeScript,
    Language::Java, Language::Go
};

[[nodiscard]] constexpr std::string_view to_string(Language language) noexcept {
    switch (language) {
        case Language::Python:     return "python";
        case Language::JavaScript: return "javascript";
        case Language::TypeScript: return "typescript";
        case Language::Java:       return "java";
        case Language::Go:         return "go";
    }
    return "unknown";
}

/// Case-insensitive lookup; nullopt for names outside kAllLanguages.
[[nodiscard]] std::optional<Language> parse_language(std::string_view name);

// ─────────────────────────────────────────────
// Severity
// ─────────────────────────────────────────────

/// Ordered: a policy threshold blocks every severity at or above it.
enum class Severity : uint8_t {
    Low,
    Medium,
    High,
    Critical
};

[[nodiscard]] constexpr std::string_view to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Low:      return "low";
        case Severity::Medium:   return "medium";
        case Severity::High:     return "high";
        case Severity::Critical: return "critical";
    }
    return "unknown";
}

[[nodiscard]] std::optional<Severity> parse_severity(std::string_view name);

// ─────────────────────────────────────────────
// Execution Status
// ─────────────────────────────────────────────

enum class ExecutionStatus : uint8_t {
    Success,
    RuntimeError,
    CompilationError,
    TimedOut,
    ResourceExceeded,
    SecurityRejected,
    InputTooLarge,
    InfrastructureError,
    BackpressureRejected,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(ExecutionStatus status) noexcept {
    switch (status) {
        case ExecutionStatus::Success:              return "success";
        case ExecutionStatus::RuntimeError:         return "runtime_error";
        case ExecutionStatus::CompilationError:     return "compilation_error";
        case ExecutionStatus::TimedOut:             return "timed_out";
        case ExecutionStatus::ResourceExceeded:     return "resource_exceeded";
        case ExecutionStatus::SecurityRejected:     return "security_rejected";
        case ExecutionStatus::InputTooLarge:        return "input_too_large";
        case ExecutionStatus::InfrastructureError:  return "infrastructure_error";
        case ExecutionStatus::BackpressureRejected: return "backpressure_rejected";
        case ExecutionStatus::Cancelled:            return "cancelled";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Limits & Usage
// ─────────────────────────────────────────────

/**
 * @brief Resource ceilings applied to one sandbox.
 *
 * Enforced by the isolation layer (cgroups / rlimits) and, for wall time,
 * by the orchestrator's own polling loop.
 */
struct ResourceLimits {
    double timeout_seconds{10.0};
    uint64_t memory_limit_bytes{256ULL * 1024 * 1024};
    double cpu_quota{1.0};                        ///< Fractional cores
    bool network_access{false};

    [[nodiscard]] Millis timeout() const noexcept {
        return Millis{static_cast<int64_t>(timeout_seconds * 1000.0)};
    }

    bool operator==(const ResourceLimits&) const = default;
};

/// Partial override of ResourceLimits as supplied by a caller.
struct LimitOverrides {
    std::optional<double> timeout_seconds;
    std::optional<uint64_t> memory_limit_bytes;
    std::optional<double> cpu_quota;
    std::optional<bool> network_access;
};

/**
 * @brief Measured resource consumption of one or more sandbox steps.
 */
struct ResourceUsage {
    double cpu_time_seconds{0.0};
    uint64_t peak_memory_bytes{0};
    double wall_time_seconds{0.0};

    /// Fold a later step into this one: times add, peak is the maximum.
    void accumulate(const ResourceUsage& other) noexcept {
        cpu_time_seconds += other.cpu_time_seconds;
        wall_time_seconds += other.wall_time_seconds;
        if (other.peak_memory_bytes > peak_memory_bytes) {
            peak_memory_bytes = other.peak_memory_bytes;
        }
    }
};

// ─────────────────────────────────────────────
// Security
// ─────────────────────────────────────────────

struct SecurityViolation {
    std::string pattern_id;
    Severity severity{Severity::Low};
    std::string message;
    std::optional<uint32_t> line;                 ///< 1-based
    std::string pattern;                          ///< Signature source, for audit
};

// ─────────────────────────────────────────────
// Tests
// ─────────────────────────────────────────────

struct TestCase {
    std::string name;
    std::string input_data;
    std::string expected_output;
    std::optional<double> timeout_seconds;
};

enum class TestState : uint8_t {
    Passed,
    Failed,
    Error,
    Timeout,
    NotRun
};

[[nodiscard]] constexpr std::string_view to_string(TestState state) noexcept {
    switch (state) {
        case TestState::Passed:  return "passed";
        case TestState::Failed:  return "failed";
        case TestState::Error:   return "error";
        case TestState::Timeout: return "timeout";
        case TestState::NotRun:  return "not_run";
    }
    return "unknown";
}

struct TestResult {
    std::string name;
    bool passed{false};
    std::string actual_output;
    std::string expected_output;
    std::optional<std::string> error;
    Millis duration{0};
    TestState state{TestState::NotRun};
};

// ─────────────────────────────────────────────
// Request & Result
// ─────────────────────────────────────────────

struct ExecutionRequest {
    std::string code;
    Language language{Language::Python};
    std::vector<TestCase> test_cases;
    LimitOverrides limits;
};

struct ExecutionResult {
    RequestId request_id;
    ExecutionStatus status{ExecutionStatus::Success};
    std::string output;
    std::vector<std::string> errors;
    std::vector<TestResult> test_results;
    ResourceUsage resource_usage;
    std::vector<SecurityViolation> security_violations;
    Millis execution_time{0};
    Timestamp created_at;

    [[nodiscard]] bool success() const noexcept {
        return status == ExecutionStatus::Success;
    }

    /// True only when at least one test ran and every test passed.
    [[nodiscard]] bool all_tests_passed() const noexcept {
        if (test_results.empty()) return false;
        for (const auto& test : test_results) {
            if (!test.passed) return false;
        }
        return true;
    }
};

/**
 * @brief Outcome of a validate-only call.
 */
struct ValidationReport {
    bool safe{true};
    std::vector<SecurityViolation> violations;
    std::vector<std::string> blocked_imports;
    std::string message;
    std::optional<std::string> error;             ///< e.g. "input_too_large"
};

}  // namespace sandbox_gate
