/**
 * @file test_json_codec.cpp
 * @brief Unit tests for JSON request decoding and response encoding.
 */

#include "api/json_codec.hpp"

#include <gtest/gtest.h>

using namespace sandbox_gate;

// ── Decoding ─────────────────────────────────

TEST(JsonCodecTest, DecodeMinimalRequest) {
    auto request = decode_execution_request(R"json({"code": "print(1)", "language": "python"})json");
    ASSERT_TRUE(request);
    EXPECT_EQ(request->code, "print(1)");
    EXPECT_EQ(request->language, Language::Python);
    EXPECT_TRUE(request->test_cases.empty());
    EXPECT_FALSE(request->limits.timeout_seconds.has_value());
}

TEST(JsonCodecTest, DecodeFullRequest) {
    auto request = decode_execution_request(R"({
        "code": "def multiply(a, b): return a * b",
        "language": "PY",
        "test_cases": [
            {"name": "t1", "input_data": "3,4", "expected_output": "12", "timeout": 2},
            {"input": "1,1", "expected": "1"}
        ],
        "limits": {"timeout_seconds": 5, "memory_limit_mb": 128, "cpu_limit": 0.5,
                   "network_access": false}
    })");
    ASSERT_TRUE(request) << request.error().message;
    EXPECT_EQ(request->language, Language::Python);
    ASSERT_EQ(request->test_cases.size(), 2u);
    EXPECT_EQ(request->test_cases[0].name, "t1");
    EXPECT_EQ(request->test_cases[0].input_data, "3,4");
    EXPECT_DOUBLE_EQ(request->test_cases[0].timeout_seconds.value_or(0), 2.0);
    EXPECT_EQ(request->test_cases[1].name, "test_2");
    EXPECT_EQ(request->test_cases[1].expected_output, "1");

    EXPECT_DOUBLE_EQ(request->limits.timeout_seconds.value_or(0), 5.0);
    EXPECT_EQ(request->limits.memory_limit_bytes.value_or(0), 128ULL * 1024 * 1024);
    EXPECT_DOUBLE_EQ(request->limits.cpu_quota.value_or(0), 0.5);
    EXPECT_EQ(request->limits.network_access, std::optional<bool>{false});
}

TEST(JsonCodecTest, ExactBytesWinOverMegabytes) {
    auto request = decode_execution_request(
        R"({"code": "x", "language": "js",
            "limits": {"memory_limit_bytes": 1048576, "memory_limit_mb": 512}})");
    ASSERT_TRUE(request);
    EXPECT_EQ(request->language, Language::JavaScript);
    EXPECT_EQ(request->limits.memory_limit_bytes.value_or(0), 1048576u);
}

TEST(JsonCodecTest, MalformedBodies) {
    const char* bodies[] = {
        "",
        "not json",
        "[1, 2]",
        R"({"code": "x"} trailing)",
        R"({"language": "python"})",
        R"({"code": 42, "language": "python"})",
        R"({"code": "x", "language": "cobol"})",
        R"({"code": "x", "language": "python", "test_cases": {}})",
        R"({"code": "x", "language": "python", "test_cases": [{"name": "t"}]})",
        R"({"code": "x", "language": "python", "test_cases": [{"expected_output": 3}]})",
        R"({"code": "x", "language": "python", "limits": {"timeout_seconds": -1}})",
        R"({"code": "x", "language": "python", "limits": {"memory_limit_mb": "big"}})",
        R"({"code": "x", "language": "python", "limits": {"network_access": "yes"}})",
        R"({"code": "x", "language": "python", "limits": []})",
    };
    for (const char* body : bodies) {
        auto request = decode_execution_request(body);
        ASSERT_FALSE(request) << body;
        EXPECT_EQ(request.error().kind, ErrorKind::ValidationError) << body;
    }
}

TEST(JsonCodecTest, OutOfRangeMemoryLimitsAreRejected) {
    const char* bodies[] = {
        // 2^44 + 256 MiB would wrap to 256 MiB
        R"({"code": "x", "language": "python", "limits": {"memory_limit_mb": 17592186044672}})",
        R"({"code": "x", "language": "python", "limits": {"memory_limit_mb": -5}})",
        R"({"code": "x", "language": "python", "limits": {"memory_limit_bytes": 1e30}})",
        R"({"code": "x", "language": "python", "limits": {"memory_limit_bytes": 0}})",
        R"({"code": "x", "language": "python", "limits": {"memory_limit_bytes": 1.5}})",
    };
    for (const char* body : bodies) {
        auto request = decode_execution_request(body);
        ASSERT_FALSE(request) << body;
        EXPECT_EQ(request.error().kind, ErrorKind::ValidationError) << body;
    }
}

TEST(JsonCodecTest, MemoryLimitAboveInt64DecodesWithoutThrowing) {
    auto request = decode_execution_request(
        R"({"code": "x", "language": "python",
            "limits": {"memory_limit_bytes": 18446744073709551615}})");
    ASSERT_TRUE(request) << request.error().message;
    EXPECT_EQ(request->limits.memory_limit_bytes.value_or(0), 18446744073709551615ULL);
}

TEST(JsonCodecTest, ErrorNamesTheField) {
    auto request = decode_execution_request(R"({"code": "x", "language": "python",
        "test_cases": [{"name": "ok", "expected_output": "1"}, {"name": "bad"}]})");
    ASSERT_FALSE(request);
    EXPECT_NE(request.error().message.find("test_cases[1]"), std::string::npos);
}

TEST(JsonCodecTest, DecodeValidateRequest) {
    auto request = decode_validate_request(R"({"code": "import os", "language": "Go"})");
    ASSERT_TRUE(request);
    EXPECT_EQ(request->code, "import os");
    EXPECT_EQ(request->language, Language::Go);

    EXPECT_FALSE(decode_validate_request(R"({"code": "import os"})"));
}

// ── Encoding ─────────────────────────────────

TEST(JsonCodecTest, EncodeExecutionResult) {
    ExecutionResult result;
    result.request_id = "req-1";
    result.status = ExecutionStatus::Success;
    result.output = "1/1 tests passed";
    result.execution_time = Millis{1500};
    result.resource_usage = {.cpu_time_seconds = 0.25, .peak_memory_bytes = 4096,
                             .wall_time_seconds = 1.5};
    result.test_results.push_back(TestResult{.name = "t1", .passed = true,
                                             .actual_output = "12", .expected_output = "12",
                                             .duration = Millis{20},
                                             .state = TestState::Passed});
    result.security_violations.push_back(SecurityViolation{
        .pattern_id = "py.sys", .severity = Severity::Low, .message = "sys import",
        .line = 3, .pattern = "import sys"});

    auto json = to_json(result);
    EXPECT_EQ(json["request_id"].asString(), "req-1");
    EXPECT_EQ(json["status"].asString(), "success");
    EXPECT_TRUE(json["success"].asBool());
    EXPECT_TRUE(json["all_tests_passed"].asBool());
    EXPECT_TRUE(json["has_security_violations"].asBool());
    EXPECT_DOUBLE_EQ(json["execution_time"].asDouble(), 1.5);
    EXPECT_EQ(json["resource_usage"]["peak_memory_bytes"].asUInt64(), 4096u);
    ASSERT_EQ(json["test_results"].size(), 1u);
    EXPECT_EQ(json["test_results"][0]["state"].asString(), "passed");
    EXPECT_TRUE(json["test_results"][0]["error"].isNull());
    EXPECT_EQ(json["security_violations"][0]["severity"].asString(), "low");
    EXPECT_EQ(json["security_violations"][0]["line"].asUInt(), 3u);
    EXPECT_TRUE(json["created_at"].isString());
}

TEST(JsonCodecTest, EncodeRejection) {
    ExecutionResult result;
    result.status = ExecutionStatus::SecurityRejected;
    result.errors = {"Code rejected"};
    auto json = to_json(result);
    EXPECT_FALSE(json["success"].asBool());
    EXPECT_FALSE(json["all_tests_passed"].asBool());
    EXPECT_EQ(json["status"].asString(), "security_rejected");
    EXPECT_EQ(json["errors"][0].asString(), "Code rejected");
    EXPECT_TRUE(json["test_results"].isArray());
}

TEST(JsonCodecTest, EncodeValidationReport) {
    ValidationReport report{.safe = false, .blocked_imports = {"os"},
                            .message = "blocked", .error = "input_too_large"};
    auto json = to_json(report);
    EXPECT_FALSE(json["safe"].asBool());
    EXPECT_EQ(json["blocked_imports"][0].asString(), "os");
    EXPECT_EQ(json["error"].asString(), "input_too_large");

    auto clean = to_json(ValidationReport{});
    EXPECT_FALSE(clean.isMember("error"));
}

TEST(JsonCodecTest, EncodeHealth) {
    HealthReport report;
    report.healthy = false;
    report.runtime = "docker";
    report.runtime_error = "daemon not running";
    report.supported_languages = {Language::Python, Language::TypeScript};

    auto json = to_json(report, "sandbox_gate", "1.0.0");
    EXPECT_EQ(json["status"].asString(), "degraded");
    EXPECT_EQ(json["service"].asString(), "sandbox_gate");
    EXPECT_EQ(json["runtime_error"].asString(), "daemon not running");
    EXPECT_EQ(json["circuit_breaker"].asString(), "closed");
    EXPECT_EQ(json["supported_languages"][1].asString(), "typescript");
}

TEST(JsonCodecTest, EncodeInFlightEntry) {
    InFlightEntry entry{.request_id = "r", .language = Language::JavaScript,
                        .phase = RequestPhase::Queued, .age = Millis{250}};
    auto json = to_json(entry);
    EXPECT_EQ(json["state"].asString(), "queued");
    EXPECT_EQ(json["language"].asString(), "javascript");
    EXPECT_DOUBLE_EQ(json["age_seconds"].asDouble(), 0.25);
}

TEST(JsonCodecTest, WriteJsonIsSingleLine) {
    Json::Value value(Json::objectValue);
    value["a"] = "line\nbreak";
    value["b"] = 1;
    auto text = write_json(value);
    EXPECT_EQ(text.find('\n'), std::string::npos);
    EXPECT_NE(text.find("\\n"), std::string::npos);
}
