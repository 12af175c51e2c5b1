/**
 * @file gateway.hpp
 * @brief ExecutionGateway — the single entry point for code execution.
 *
 * Wires the pipeline for one request:
 *   validate → admit → provision → build/run → tests → aggregate → destroy
 *
 * Every request is registered in an in-flight table for its whole life so
 * it can be listed and cancelled in any phase, including while queued.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "gateway/admission.hpp"
#include "harness/test_harness.hpp"
#include "orchestrator/languages.hpp"
#include "orchestrator/runner.hpp"
#include "runtime/container_runtime.hpp"
#include "security/validator.hpp"
#include "telemetry/audit_log.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sandbox_gate {

// ─────────────────────────────────────────────
// In-flight requests
// ─────────────────────────────────────────────

enum class RequestPhase : uint8_t {
    Validating,
    Queued,
    Provisioning,
    Running,
    Testing
};

[[nodiscard]] constexpr std::string_view to_string(RequestPhase phase) noexcept {
    switch (phase) {
        case RequestPhase::Validating:   return "validating";
        case RequestPhase::Queued:       return "queued";
        case RequestPhase::Provisioning: return "provisioning";
        case RequestPhase::Running:      return "running";
        case RequestPhase::Testing:      return "testing";
    }
    return "unknown";
}

struct InFlightEntry {
    RequestId request_id;
    Language language{Language::Python};
    RequestPhase phase{RequestPhase::Validating};
    Millis age{0};
    bool cancel_requested{false};
};

// ─────────────────────────────────────────────
// Introspection results
// ─────────────────────────────────────────────

struct LanguageInfo {
    Language language{Language::Python};
    bool supported{false};          ///< false: validated but not executable
    std::string image;
    std::string extension;
    std::string test_framework;
    ResourceLimits default_limits;
};

struct LanguageSupport {
    std::string language;
    bool supported{false};
    std::string message;
};

struct HealthReport {
    bool healthy{false};
    std::string runtime;
    bool runtime_available{false};
    std::optional<std::string> runtime_error;
    BreakerState breaker{BreakerState::Closed};
    uint32_t live_sandboxes{0};
    uint32_t peak_live_sandboxes{0};
    AdmissionStats admission;
    std::vector<Language> supported_languages;
};

// ─────────────────────────────────────────────
// ExecutionGateway
// ─────────────────────────────────────────────

class ExecutionGateway {
public:
    ExecutionGateway(const Config& config,
                     IContainerRuntime& runtime,
                     std::shared_ptr<Logger> logger,
                     std::shared_ptr<AuditLog> audit = nullptr);

    ExecutionGateway(const ExecutionGateway&) = delete;
    ExecutionGateway& operator=(const ExecutionGateway&) = delete;

    /**
     * @brief Run a submission end to end.
     *
     * Malformed requests (empty code, a language without an execution
     * profile, limits outside the configured bounds) are an Error of kind
     * ValidationError. Everything else, including rejection and failures
     * of the submitted program, is an ExecutionResult.
     */
    Result<ExecutionResult> execute(const ExecutionRequest& request, std::stop_token stop = {});

    [[nodiscard]] ValidationReport validate_only(std::string_view code, Language language) const;

    /// Request stop for an in-flight request; false if it is unknown.
    bool cancel(const RequestId& request_id);

    [[nodiscard]] std::vector<InFlightEntry> in_flight() const;

    [[nodiscard]] std::vector<LanguageInfo> languages() const;
    [[nodiscard]] LanguageSupport language_supported(std::string_view name) const;

    [[nodiscard]] HealthReport health();

    /// Request overrides merged onto the configured defaults.
    [[nodiscard]] Result<ResourceLimits> resolve_limits(const LimitOverrides& overrides) const;

    /// Shape checks done before any work: code, language, limits.
    [[nodiscard]] Result<ResourceLimits> check_request(const ExecutionRequest& request) const;

    // ── Accessors (for testing) ─────────────
    ContainerOrchestrator& orchestrator() noexcept { return orchestrator_; }
    AdmissionController& admission() noexcept { return admission_; }
    const SecurityValidator& validator() const noexcept { return validator_; }
    const LanguageRegistry& registry() const noexcept { return registry_; }
    const Config& config() const noexcept { return config_; }

private:
    struct InFlight {
        Language language;
        SteadyTime started;
        std::atomic<RequestPhase> phase{RequestPhase::Validating};
        std::stop_source stop;
    };

    std::shared_ptr<InFlight> register_request(const RequestId& id, Language language);
    void unregister_request(const RequestId& id);

    ExecutionResult run_pipeline(const RequestId& request_id,
                                 const ExecutionRequest& request,
                                 const ResourceLimits& limits,
                                 InFlight& entry);

    void audit_violations(const RequestId& request_id,
                          const ExecutionRequest& request,
                          const std::vector<SecurityViolation>& violations,
                          const ResourceLimits& limits);

    Config config_;
    std::shared_ptr<Logger> logger_;
    std::shared_ptr<AuditLog> audit_;

    SecurityValidator validator_;
    LanguageRegistry registry_;
    ContainerOrchestrator orchestrator_;
    TestHarness harness_;
    AdmissionController admission_;

    mutable std::mutex in_flight_mutex_;
    std::unordered_map<RequestId, std::shared_ptr<InFlight>> in_flight_;
};

}  // namespace sandbox_gate
