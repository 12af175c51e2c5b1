/**
 * @file test_harness.hpp
 * @brief TestHarness — runs declarative test cases inside an open sandbox.
 *
 * Every case runs the language driver in the same sandbox with the case's
 * input on stdin. Each case gets min(case timeout or request timeout,
 * remaining budget); once the budget is gone the rest are not run.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "orchestrator/runner.hpp"

#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace sandbox_gate {

struct HarnessOptions {
    bool stop_on_first_failure{false};
    Millis min_test_slice{100};
};

/**
 * @brief Per-case results (same order as the input) plus batch flags used
 *        by the aggregator.
 */
struct HarnessReport {
    std::vector<TestResult> results;
    ResourceUsage usage;

    bool budget_exhausted{false};
    bool resource_exceeded{false};
    bool crashed{false};
    bool cancelled{false};
    bool output_truncated{false};
    std::optional<std::string> infrastructure_error;

    [[nodiscard]] size_t passed_count() const noexcept;
    [[nodiscard]] size_t count(TestState state) const noexcept;
};

class TestHarness {
public:
    TestHarness(ContainerOrchestrator& orchestrator, HarnessOptions options,
                std::shared_ptr<Logger> logger);

    /**
     * @param request_timeout  per-case cap for cases without their own timeout
     * @param deadline         end of the whole request's budget
     */
    HarnessReport run(SandboxSession& session,
                      const std::vector<TestCase>& test_cases,
                      Millis request_timeout,
                      SteadyTime deadline,
                      std::stop_token stop);

private:
    ContainerOrchestrator& orchestrator_;
    HarnessOptions options_;
    std::shared_ptr<Logger> logger_;
};

}  // namespace sandbox_gate
