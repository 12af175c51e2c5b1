/**
 * @file aggregator.cpp
 * @brief ResultAggregator implementation.
 */

#include "gateway/aggregator.hpp"
#include "harness/output_compare.hpp"

#include <sstream>

namespace sandbox_gate {

namespace {

std::string format_seconds(double seconds) {
    std::ostringstream oss;
    oss << seconds;
    return oss.str();
}

/// stderr of a failed step, or a description of how it ended.
std::string step_error(const RawExecutionResult& raw, double timeout_seconds) {
    if (raw.error) return *raw.error;

    const std::string stderr_text = normalize_output(raw.stderr_data);
    switch (raw.status) {
        case ExecutionStatus::TimedOut:
            return "Execution timed out after " + format_seconds(timeout_seconds) + " seconds";
        case ExecutionStatus::ResourceExceeded:
            return stderr_text.empty() ? "Resource limit exceeded (memory or CPU)"
                                       : "Resource limit exceeded: " + stderr_text;
        default:
            break;
    }
    if (!stderr_text.empty()) return stderr_text;
    if (raw.exit_signal != 0) return "Process terminated by signal " + std::to_string(raw.exit_signal);
    return "Process exited with code " + std::to_string(raw.exit_code);
}

ExecutionStatus harness_status(const HarnessReport& report) {
    if (report.cancelled) return ExecutionStatus::Cancelled;
    if (report.infrastructure_error) return ExecutionStatus::InfrastructureError;
    if (report.budget_exhausted) return ExecutionStatus::TimedOut;
    if (report.resource_exceeded) return ExecutionStatus::ResourceExceeded;
    if (report.crashed) return ExecutionStatus::RuntimeError;
    return ExecutionStatus::Success;
}

}  // anonymous namespace

ExecutionResult aggregate_result(const AggregationInput& input) {
    ExecutionResult result;
    result.request_id = input.request_id;
    result.created_at = input.created_at;
    result.execution_time = input.wall_time;
    result.security_violations = input.violations;

    // 1. Rejected before anything ran
    if (input.rejection) {
        result.status = *input.rejection;
        if (!input.rejection_message.empty()) result.errors.push_back(input.rejection_message);
        return result;
    }

    bool truncated = false;

    // 2. Build / run step
    if (input.run) {
        const auto& raw = *input.run;
        result.resource_usage.accumulate(raw.usage);
        truncated = raw.output_truncated;
        result.status = raw.status;
        if (!input.harness) result.output = raw.stdout_data;
        if (raw.status != ExecutionStatus::Success) {
            result.output = raw.stdout_data;
            result.errors.push_back(step_error(raw, input.timeout_seconds));
        }
    }

    // 3. Test cases
    if (input.harness && result.status == ExecutionStatus::Success) {
        const auto& report = *input.harness;
        result.test_results = report.results;
        result.resource_usage.accumulate(report.usage);
        truncated = truncated || report.output_truncated;
        result.status = harness_status(report);

        result.output = std::to_string(report.passed_count()) + "/"
                      + std::to_string(report.results.size()) + " tests passed";

        if (report.infrastructure_error) result.errors.push_back(*report.infrastructure_error);
        if (report.budget_exhausted) {
            const size_t ran = report.results.size() - report.count(TestState::NotRun);
            result.errors.push_back("Time budget exhausted after " + std::to_string(ran)
                                    + " of " + std::to_string(report.results.size())
                                    + " test cases");
        }
        for (const auto& test : report.results) {
            if (test.state == TestState::Error && test.error) {
                result.errors.push_back(test.name + ": " + *test.error);
            }
        }
    }

    if (truncated) {
        result.errors.push_back("Output truncated at " + std::to_string(input.output_limit_kb)
                                + " KB");
    }
    return result;
}

}  // namespace sandbox_gate
