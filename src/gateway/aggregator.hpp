/**
 * @file aggregator.hpp
 * @brief ResultAggregator — composes the ExecutionResult envelope.
 *
 * A pure function of what the pipeline produced. Status precedence:
 *   1. pre-run rejection (too large, security, backpressure, cancelled, infra)
 *   2. build/run step status
 *   3. harness: cancelled, infra, budget exhausted, resource, crashed case
 *   4. success
 */

#pragma once

#include "core/types.hpp"
#include "harness/test_harness.hpp"
#include "orchestrator/runner.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sandbox_gate {

struct AggregationInput {
    RequestId request_id;
    Timestamp created_at;
    Millis wall_time{0};
    uint64_t output_limit_kb{0};

    std::vector<SecurityViolation> violations;

    std::optional<ExecutionStatus> rejection;
    std::string rejection_message;

    /// Build step with tests, the whole [compile] + run without.
    std::optional<RawExecutionResult> run;
    std::optional<HarnessReport> harness;
    double timeout_seconds{0.0};
};

[[nodiscard]] ExecutionResult aggregate_result(const AggregationInput& input);

}  // namespace sandbox_gate
