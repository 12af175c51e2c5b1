/**
 * @file json_codec.hpp
 * @brief JSON encoding of the service vocabulary using jsoncpp.
 *
 * Decoders return ValidationError for anything the API must answer with
 * 400; encoders are total.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "gateway/gateway.hpp"

#include <json/value.h>

#include <string>
#include <string_view>
#include <vector>

namespace sandbox_gate {

struct ValidateRequest {
    std::string code;
    Language language{Language::Python};
};

// ── Decoding ─────────────────────────────────
[[nodiscard]] Result<Json::Value> parse_json_body(std::string_view body);
[[nodiscard]] Result<ExecutionRequest> decode_execution_request(std::string_view body);
[[nodiscard]] Result<ValidateRequest> decode_validate_request(std::string_view body);

// ── Encoding ─────────────────────────────────
[[nodiscard]] Json::Value to_json(const ResourceLimits& limits);
[[nodiscard]] Json::Value to_json(const ResourceUsage& usage);
[[nodiscard]] Json::Value to_json(const SecurityViolation& violation);
[[nodiscard]] Json::Value to_json(const TestResult& result);
[[nodiscard]] Json::Value to_json(const ExecutionResult& result);
[[nodiscard]] Json::Value to_json(const ValidationReport& report);
[[nodiscard]] Json::Value to_json(const LanguageInfo& info);
[[nodiscard]] Json::Value to_json(const LanguageSupport& support);
[[nodiscard]] Json::Value to_json(const InFlightEntry& entry);
[[nodiscard]] Json::Value to_json(const HealthReport& report, std::string_view service,
                                  std::string_view version);

/// Compact single-line serialization.
[[nodiscard]] std::string write_json(const Json::Value& value);

}  // namespace sandbox_gate
