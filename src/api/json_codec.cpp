/**
 * @file json_codec.cpp
 * @brief jsoncpp-based request decoding and response encoding.
 */

#include "api/json_codec.hpp"
#include "core/request_id.hpp"

#include <json/reader.h>
#include <json/writer.h>

#include <chrono>
#include <cmath>
#include <cstring>
#include <initializer_list>
#include <limits>
#include <memory>

namespace sandbox_gate {

namespace {

constexpr uint64_t kMiB = 1024ULL * 1024;

Error field_error(std::string_view field, std::string_view expectation) {
    return Error{ErrorKind::ValidationError,
                 "Field '" + std::string{field} + "' " + std::string{expectation}};
}

/// First present member among the given aliases, or null.
const Json::Value* member(const Json::Value& object, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        if (const Json::Value* found = object.find(name, name + std::strlen(name))) {
            if (!found->isNull()) return found;
        }
    }
    return nullptr;
}

Result<std::string> required_string(const Json::Value& object, const char* name) {
    const Json::Value* value = member(object, {name});
    if (!value) return field_error(name, "is required");
    if (!value->isString()) return field_error(name, "must be a string");
    return value->asString();
}

Result<Language> decode_language(const Json::Value& object) {
    auto name = required_string(object, "language");
    if (!name) return name.error();
    auto language = parse_language(*name);
    if (!language) {
        return Error{ErrorKind::ValidationError, "Unknown language: " + *name};
    }
    return *language;
}

Result<double> positive_seconds(const Json::Value& value, const char* name) {
    if (!value.isNumeric()) return field_error(name, "must be a number");
    const double seconds = value.asDouble();
    if (!std::isfinite(seconds) || seconds <= 0.0) return field_error(name, "must be positive");
    return seconds;
}

Result<LimitOverrides> decode_limits(const Json::Value& object) {
    LimitOverrides limits;
    if (!object.isObject()) return field_error("limits", "must be an object");

    if (const auto* t = member(object, {"timeout_seconds", "timeout"})) {
        auto seconds = positive_seconds(*t, "limits.timeout_seconds");
        if (!seconds) return seconds.error();
        limits.timeout_seconds = *seconds;
    }
    if (const auto* m = member(object, {"memory_limit_bytes"})) {
        if (!m->isUInt64() || m->asUInt64() == 0) {
            return field_error("limits.memory_limit_bytes", "must be a positive integer");
        }
        limits.memory_limit_bytes = m->asUInt64();
    } else if (const auto* mb = member(object, {"memory_limit_mb", "memory_limit"})) {
        if (!mb->isUInt64() || mb->asUInt64() == 0) {
            return field_error("limits.memory_limit_mb", "must be a positive integer");
        }
        if (mb->asUInt64() > std::numeric_limits<uint64_t>::max() / kMiB) {
            return field_error("limits.memory_limit_mb", "is out of range");
        }
        limits.memory_limit_bytes = mb->asUInt64() * kMiB;
    }
    if (const auto* c = member(object, {"cpu_quota", "cpu_limit"})) {
        if (!c->isNumeric()) return field_error("limits.cpu_quota", "must be a number");
        limits.cpu_quota = c->asDouble();
    }
    if (const auto* n = member(object, {"network_access"})) {
        if (!n->isBool()) return field_error("limits.network_access", "must be a boolean");
        limits.network_access = n->asBool();
    }
    return limits;
}

Result<TestCase> decode_test_case(const Json::Value& object, size_t index) {
    const std::string where = "test_cases[" + std::to_string(index) + "]";
    if (!object.isObject()) return field_error(where, "must be an object");

    TestCase test;
    const auto* name = member(object, {"name"});
    test.name = name && name->isString() ? name->asString() : "test_" + std::to_string(index + 1);

    const auto* input = member(object, {"input_data", "input"});
    if (input && !input->isString()) return field_error(where + ".input_data", "must be a string");
    if (input) test.input_data = input->asString();

    const auto* expected = member(object, {"expected_output", "expected"});
    if (!expected || !expected->isString()) {
        return field_error(where + ".expected_output", "is required and must be a string");
    }
    test.expected_output = expected->asString();

    if (const auto* t = member(object, {"timeout_seconds", "timeout"})) {
        auto seconds = positive_seconds(*t, "test_cases.timeout_seconds");
        if (!seconds) return seconds.error();
        test.timeout_seconds = *seconds;
    }
    return test;
}

double to_seconds(Millis duration) {
    return static_cast<double>(duration.count()) / 1000.0;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Decoding
// ─────────────────────────────────────────────

Result<Json::Value> parse_json_body(std::string_view body) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["failIfExtra"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors)) {
        return Error{ErrorKind::ValidationError, "Malformed JSON: " + errors};
    }
    if (!root.isObject()) {
        return Error{ErrorKind::ValidationError, "Request body must be a JSON object"};
    }
    return root;
}

Result<ExecutionRequest> decode_execution_request(std::string_view body) {
    auto root = parse_json_body(body);
    if (!root) return root.error();

    ExecutionRequest request;
    auto code = required_string(*root, "code");
    if (!code) return code.error();
    request.code = std::move(*code);

    auto language = decode_language(*root);
    if (!language) return language.error();
    request.language = *language;

    if (const auto* tests = member(*root, {"test_cases"})) {
        if (!tests->isArray()) return field_error("test_cases", "must be an array");
        for (Json::ArrayIndex i = 0; i < tests->size(); ++i) {
            auto test = decode_test_case((*tests)[i], i);
            if (!test) return test.error();
            request.test_cases.push_back(std::move(*test));
        }
    }

    if (const auto* limits = member(*root, {"limits"})) {
        auto overrides = decode_limits(*limits);
        if (!overrides) return overrides.error();
        request.limits = *overrides;
    }
    return request;
}

Result<ValidateRequest> decode_validate_request(std::string_view body) {
    auto root = parse_json_body(body);
    if (!root) return root.error();

    auto code = required_string(*root, "code");
    if (!code) return code.error();
    auto language = decode_language(*root);
    if (!language) return language.error();
    return ValidateRequest{.code = std::move(*code), .language = *language};
}

// ─────────────────────────────────────────────
// Encoding
// ─────────────────────────────────────────────

Json::Value to_json(const ResourceLimits& limits) {
    Json::Value out(Json::objectValue);
    out["timeout_seconds"] = limits.timeout_seconds;
    out["memory_limit_bytes"] = Json::UInt64{limits.memory_limit_bytes};
    out["cpu_quota"] = limits.cpu_quota;
    out["network_access"] = limits.network_access;
    return out;
}

Json::Value to_json(const ResourceUsage& usage) {
    Json::Value out(Json::objectValue);
    out["cpu_time"] = usage.cpu_time_seconds;
    out["peak_memory_bytes"] = Json::UInt64{usage.peak_memory_bytes};
    out["wall_time"] = usage.wall_time_seconds;
    return out;
}

Json::Value to_json(const SecurityViolation& violation) {
    Json::Value out(Json::objectValue);
    out["pattern_id"] = violation.pattern_id;
    out["severity"] = std::string{to_string(violation.severity)};
    out["message"] = violation.message;
    out["line"] = violation.line ? Json::Value{*violation.line} : Json::Value{};
    out["pattern"] = violation.pattern;
    return out;
}

Json::Value to_json(const TestResult& result) {
    Json::Value out(Json::objectValue);
    out["name"] = result.name;
    out["passed"] = result.passed;
    out["state"] = std::string{to_string(result.state)};
    out["actual_output"] = result.actual_output;
    out["expected_output"] = result.expected_output;
    out["error"] = result.error ? Json::Value{*result.error} : Json::Value{};
    out["duration"] = to_seconds(result.duration);
    return out;
}

Json::Value to_json(const ExecutionResult& result) {
    Json::Value out(Json::objectValue);
    out["request_id"] = result.request_id;
    out["status"] = std::string{to_string(result.status)};
    out["success"] = result.success();
    out["output"] = result.output;

    Json::Value errors(Json::arrayValue);
    for (const auto& e : result.errors) errors.append(e);
    out["errors"] = errors;

    Json::Value tests(Json::arrayValue);
    for (const auto& t : result.test_results) tests.append(to_json(t));
    out["test_results"] = tests;
    out["all_tests_passed"] = result.all_tests_passed();

    out["resource_usage"] = to_json(result.resource_usage);

    Json::Value violations(Json::arrayValue);
    for (const auto& v : result.security_violations) violations.append(to_json(v));
    out["security_violations"] = violations;
    out["has_security_violations"] = !result.security_violations.empty();

    out["execution_time"] = to_seconds(result.execution_time);
    out["created_at"] = format_timestamp(result.created_at);
    return out;
}

Json::Value to_json(const ValidationReport& report) {
    Json::Value out(Json::objectValue);
    out["safe"] = report.safe;

    Json::Value violations(Json::arrayValue);
    for (const auto& v : report.violations) violations.append(to_json(v));
    out["violations"] = violations;

    Json::Value blocked(Json::arrayValue);
    for (const auto& b : report.blocked_imports) blocked.append(b);
    out["blocked_imports"] = blocked;

    out["message"] = report.message;
    if (report.error) out["error"] = *report.error;
    return out;
}

Json::Value to_json(const LanguageInfo& info) {
    Json::Value out(Json::objectValue);
    out["name"] = std::string{to_string(info.language)};
    out["supported"] = info.supported;
    out["image"] = info.image;
    out["extension"] = info.extension;
    out["test_framework"] = info.test_framework.empty() ? Json::Value{}
                                                        : Json::Value{info.test_framework};
    out["default_limits"] = to_json(info.default_limits);
    return out;
}

Json::Value to_json(const LanguageSupport& support) {
    Json::Value out(Json::objectValue);
    out["language"] = support.language;
    out["supported"] = support.supported;
    out["message"] = support.message;
    return out;
}

Json::Value to_json(const InFlightEntry& entry) {
    Json::Value out(Json::objectValue);
    out["request_id"] = entry.request_id;
    out["language"] = std::string{to_string(entry.language)};
    out["state"] = std::string{to_string(entry.phase)};
    out["age_seconds"] = to_seconds(entry.age);
    out["cancel_requested"] = entry.cancel_requested;
    return out;
}

Json::Value to_json(const HealthReport& report, std::string_view service,
                    std::string_view version) {
    Json::Value out(Json::objectValue);
    out["status"] = report.healthy ? "healthy" : "degraded";
    out["service"] = std::string{service};
    out["version"] = std::string{version};
    out["timestamp"] = format_timestamp(std::chrono::system_clock::now());
    out["runtime"] = report.runtime;
    out["runtime_available"] = report.runtime_available;
    if (report.runtime_error) out["runtime_error"] = *report.runtime_error;
    out["circuit_breaker"] = std::string{to_string(report.breaker)};
    out["live_sandboxes"] = report.live_sandboxes;
    out["peak_live_sandboxes"] = report.peak_live_sandboxes;

    Json::Value admission(Json::objectValue);
    admission["policy"] = std::string{to_string(report.admission.policy)};
    admission["capacity"] = report.admission.capacity;
    admission["live"] = report.admission.live;
    admission["peak_live"] = report.admission.peak_live;
    admission["queued"] = report.admission.queued;
    admission["admitted"] = Json::UInt64{report.admission.admitted};
    admission["rejected"] = Json::UInt64{report.admission.rejected};
    out["admission"] = admission;

    Json::Value languages(Json::arrayValue);
    for (auto language : report.supported_languages) {
        languages.append(std::string{to_string(language)});
    }
    out["supported_languages"] = languages;
    return out;
}

std::string write_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

}  // namespace sandbox_gate
