/**
 * @file gateway.cpp
 * @brief ExecutionGateway implementation.
 */

#include "gateway/gateway.hpp"
#include "core/request_id.hpp"
#include "gateway/aggregator.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>

namespace sandbox_gate {

namespace {

constexpr uint64_t kMiB = 1024ULL * 1024;
constexpr uint64_t kMinMemoryBytes = 16 * kMiB;

bool is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

HarnessOptions harness_options(const HarnessConfig& config) {
    return HarnessOptions{
        .stop_on_first_failure = config.stop_on_first_failure,
        .min_test_slice = Millis{config.min_test_slice_ms}
    };
}

AdmissionOptions admission_options(const GatewayConfig& config) {
    return AdmissionOptions{
        .max_concurrency = config.max_concurrency,
        .policy = parse_admission_policy(config.admission_policy).value_or(AdmissionPolicy::Queue),
        .max_queue_depth = config.max_queue_depth,
        .queue_timeout = Millis{config.queue_timeout_ms}
    };
}

std::string format_number(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

Millis elapsed_since(SteadyTime start) {
    return std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - start);
}

}  // anonymous namespace

ExecutionGateway::ExecutionGateway(const Config& config,
                                   IContainerRuntime& runtime,
                                   std::shared_ptr<Logger> logger,
                                   std::shared_ptr<AuditLog> audit)
    : config_(config)
    , logger_(std::move(logger))
    , audit_(std::move(audit))
    , validator_(config_.validator)
    , registry_(config_.language_images)
    , orchestrator_(runtime, config_.runtime, logger_, audit_)
    , harness_(orchestrator_, harness_options(config_.harness), logger_)
    , admission_(admission_options(config_.gateway)) {}

// ─────────────────────────────────────────────
// Request checks
// ─────────────────────────────────────────────

Result<ResourceLimits> ExecutionGateway::resolve_limits(const LimitOverrides& overrides) const {
    const auto& bounds = config_.limits;
    ResourceLimits limits = default_limits(bounds);

    if (overrides.timeout_seconds) {
        const double t = *overrides.timeout_seconds;
        if (!(t > 0.0) || t > bounds.max_timeout_seconds) {
            return Error{ErrorKind::ValidationError,
                         "timeout_seconds must be in (0, " + format_number(bounds.max_timeout_seconds)
                         + "]"};
        }
        limits.timeout_seconds = t;
    }
    if (overrides.memory_limit_bytes) {
        const uint64_t m = *overrides.memory_limit_bytes;
        if (m < kMinMemoryBytes || m > bounds.max_memory_mb * kMiB) {
            return Error{ErrorKind::ValidationError,
                         "memory_limit_bytes must be between 16 MiB and "
                         + std::to_string(bounds.max_memory_mb) + " MiB"};
        }
        limits.memory_limit_bytes = m;
    }
    if (overrides.cpu_quota) {
        const double c = *overrides.cpu_quota;
        if (!(c > 0.0) || c > bounds.max_cpu_quota) {
            return Error{ErrorKind::ValidationError,
                         "cpu_quota must be in (0, " + format_number(bounds.max_cpu_quota) + "]"};
        }
        limits.cpu_quota = c;
    }
    if (overrides.network_access.value_or(false)) {
        if (!bounds.allow_network) {
            return Error{ErrorKind::ValidationError, "network_access is not permitted"};
        }
        limits.network_access = true;
    }
    return limits;
}

Result<ResourceLimits> ExecutionGateway::check_request(const ExecutionRequest& request) const {
    if (is_blank(request.code)) {
        return Error{ErrorKind::ValidationError, "code must not be empty"};
    }
    if (!registry_.supported(request.language)) {
        return Error{ErrorKind::ValidationError,
                     "Language '" + std::string{to_string(request.language)}
                     + "' is not supported for execution"};
    }
    for (const auto& test : request.test_cases) {
        if (test.timeout_seconds && !(*test.timeout_seconds > 0.0)) {
            return Error{ErrorKind::ValidationError,
                         "test case '" + test.name + "' has a non-positive timeout"};
        }
    }
    return resolve_limits(request.limits);
}

// ─────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────

Result<ExecutionResult> ExecutionGateway::execute(const ExecutionRequest& request,
                                                  std::stop_token stop) {
    auto limits = check_request(request);
    if (!limits) return limits.error();

    const RequestId request_id = generate_request_id();
    auto entry = register_request(request_id, request.language);
    std::stop_callback forward(stop, [entry] { entry->stop.request_stop(); });

    ExecutionResult result;
    try {
        result = run_pipeline(request_id, request, *limits, *entry);
    } catch (const std::exception& e) {
        logger_->error(std::string{"Execution pipeline failed: "} + e.what(),
                       {{"request_id", request_id}});
        result = aggregate_result(AggregationInput{
            .request_id = request_id,
            .created_at = std::chrono::system_clock::now(),
            .wall_time = elapsed_since(entry->started),
            .rejection = ExecutionStatus::InfrastructureError,
            .rejection_message = std::string{"Internal error: "} + e.what()
        });
    }
    unregister_request(request_id);

    logger_->info("Execution finished", {
        {"request_id", request_id},
        {"language", std::string{to_string(request.language)}},
        {"status", std::string{to_string(result.status)}},
        {"duration_ms", std::to_string(result.execution_time.count())},
        {"tests", std::to_string(result.test_results.size())}
    });
    if (audit_) audit_->record_execution(result, request.language);
    return result;
}

ExecutionResult ExecutionGateway::run_pipeline(const RequestId& request_id,
                                               const ExecutionRequest& request,
                                               const ResourceLimits& limits,
                                               InFlight& entry) {
    const auto token = entry.stop.get_token();

    AggregationInput input{
        .request_id = request_id,
        .created_at = std::chrono::system_clock::now(),
        .output_limit_kb = config_.runtime.output_limit_kb,
        .timeout_seconds = limits.timeout_seconds
    };
    auto finish = [&]() {
        input.wall_time = elapsed_since(entry.started);
        return aggregate_result(input);
    };

    // 1. Static screening; nothing is provisioned for rejected code
    auto violations = validator_.validate(request.code, request.language);
    if (!violations) {
        logger_->warn("Submission too large", {
            {"request_id", request_id},
            {"error", violations.error().message}
        });
        input.rejection = ExecutionStatus::InputTooLarge;
        input.rejection_message = violations.error().message;
        return finish();
    }
    input.violations = *violations;
    audit_violations(request_id, request, input.violations, limits);

    if (validator_.blocks(input.violations)) {
        const auto blocking = std::count_if(input.violations.begin(), input.violations.end(),
            [this](const SecurityViolation& v) { return v.severity >= validator_.block_severity(); });
        logger_->warn("Submission rejected by security validator", {
            {"request_id", request_id},
            {"blocking", std::to_string(blocking)}
        });
        input.rejection = ExecutionStatus::SecurityRejected;
        input.rejection_message = "Code rejected: " + std::to_string(blocking)
                                + " blocking security violation(s)";
        return finish();
    }

    // 2. Admission
    entry.phase = RequestPhase::Queued;
    auto slot = admission_.acquire(token);
    if (!slot) {
        input.rejection = slot.error().kind == ErrorKind::Cancelled
            ? ExecutionStatus::Cancelled : ExecutionStatus::BackpressureRejected;
        input.rejection_message = slot.error().message;
        return finish();
    }

    const LanguageProfile* profile = registry_.find(request.language);
    if (!profile) {
        input.rejection = ExecutionStatus::InfrastructureError;
        input.rejection_message = "No execution profile for " + std::string{to_string(request.language)};
        return finish();
    }

    // 3. Without tests: [compile] → run
    if (request.test_cases.empty()) {
        entry.phase = RequestPhase::Running;
        input.run = orchestrator_.run(request_id, request.code, *profile, limits, token);
        return finish();
    }

    // 4. With tests: check|compile, then every case in the same sandbox
    entry.phase = RequestPhase::Provisioning;
    auto session = orchestrator_.open_session(request_id, *profile, request.code, limits,
                                              true, token);
    if (!session) {
        input.rejection = session.error().kind == ErrorKind::Cancelled
            ? ExecutionStatus::Cancelled : ExecutionStatus::InfrastructureError;
        input.rejection_message = session.error().message;
        return finish();
    }

    entry.phase = RequestPhase::Running;
    const auto deadline = std::chrono::steady_clock::now() + limits.timeout();
    input.run = orchestrator_.prepare(*session, true, deadline, token);

    if (input.run->status == ExecutionStatus::Success) {
        entry.phase = RequestPhase::Testing;
        input.harness = harness_.run(*session, request.test_cases, limits.timeout(),
                                     deadline, token);
    }

    auto result = finish();
    session->conclude(result.status);
    return result;
}

void ExecutionGateway::audit_violations(const RequestId& request_id,
                                        const ExecutionRequest& request,
                                        const std::vector<SecurityViolation>& violations,
                                        const ResourceLimits& limits) {
    if (!audit_) return;
    for (const auto& violation : violations) {
        audit_->record_security_violation(request_id, request.language, violation,
                                          request.code, limits);
    }
}

ValidationReport ExecutionGateway::validate_only(std::string_view code, Language language) const {
    return validator_.report(code, language);
}

// ─────────────────────────────────────────────
// In-flight registry
// ─────────────────────────────────────────────

std::shared_ptr<ExecutionGateway::InFlight>
ExecutionGateway::register_request(const RequestId& id, Language language) {
    auto entry = std::make_shared<InFlight>();
    entry->language = language;
    entry->started = std::chrono::steady_clock::now();

    std::lock_guard lock(in_flight_mutex_);
    in_flight_.emplace(id, entry);
    return entry;
}

void ExecutionGateway::unregister_request(const RequestId& id) {
    std::lock_guard lock(in_flight_mutex_);
    in_flight_.erase(id);
}

bool ExecutionGateway::cancel(const RequestId& request_id) {
    std::shared_ptr<InFlight> entry;
    {
        std::lock_guard lock(in_flight_mutex_);
        auto it = in_flight_.find(request_id);
        if (it == in_flight_.end()) return false;
        entry = it->second;
    }
    entry->stop.request_stop();
    logger_->info("Cancellation requested", {
        {"request_id", request_id},
        {"phase", std::string{to_string(entry->phase.load())}}
    });
    return true;
}

std::vector<InFlightEntry> ExecutionGateway::in_flight() const {
    std::vector<InFlightEntry> entries;
    std::lock_guard lock(in_flight_mutex_);
    entries.reserve(in_flight_.size());
    for (const auto& [id, entry] : in_flight_) {
        entries.push_back(InFlightEntry{
            .request_id = id,
            .language = entry->language,
            .phase = entry->phase.load(),
            .age = elapsed_since(entry->started),
            .cancel_requested = entry->stop.stop_requested()
        });
    }
    std::sort(entries.begin(), entries.end(),
              [](const InFlightEntry& a, const InFlightEntry& b) { return a.age > b.age; });
    return entries;
}

// ─────────────────────────────────────────────
// Introspection
// ─────────────────────────────────────────────

std::vector<LanguageInfo> ExecutionGateway::languages() const {
    std::vector<LanguageInfo> infos;
    const ResourceLimits defaults = default_limits(config_.limits);
    for (auto language : kAllLanguages) {
        LanguageInfo info;
        info.language = language;
        info.default_limits = defaults;
        if (const auto* profile = registry_.find(language)) {
            info.supported = true;
            info.image = profile->image;
            info.extension = profile->extension;
            info.test_framework = profile->test_framework;
        }
        infos.push_back(std::move(info));
    }
    return infos;
}

LanguageSupport ExecutionGateway::language_supported(std::string_view name) const {
    LanguageSupport support;
    support.language = std::string{name};

    auto language = parse_language(name);
    if (!language) {
        support.message = "Language '" + support.language + "' is not supported";
        return support;
    }
    support.language = std::string{to_string(*language)};
    support.supported = registry_.supported(*language);
    support.message = support.supported
        ? "Language '" + support.language + "' is supported"
        : "Language '" + support.language + "' is recognized for validation only";
    return support;
}

HealthReport ExecutionGateway::health() {
    HealthReport report;
    auto& runtime = orchestrator_.runtime();
    report.runtime = std::string{runtime.name()};

    auto ping = runtime.ping();
    report.runtime_available = static_cast<bool>(ping);
    if (!ping) report.runtime_error = ping.error().message;

    report.breaker = orchestrator_.breaker().state();
    report.live_sandboxes = orchestrator_.live_sandboxes();
    report.peak_live_sandboxes = orchestrator_.peak_live_sandboxes();
    report.admission = admission_.stats();
    report.supported_languages = registry_.supported_languages();
    report.healthy = report.runtime_available && report.breaker != BreakerState::Open;
    return report;
}

}  // namespace sandbox_gate
