/**
 * @file test_telemetry.cpp
 * @brief Unit tests for log sinks, the Logger front-end and the audit trail.
 */

#include "core/logger.hpp"
#include "telemetry/audit_log.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <json/reader.h>
#include <json/value.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

using namespace sandbox_gate;
namespace fs = std::filesystem;

namespace {

class MemorySink : public ILogSink {
public:
    explicit MemorySink(std::vector<std::string>& lines) : lines_(lines) {}
    void write(std::string_view json_line) override { lines_.emplace_back(json_line); }
    void flush() override { ++flushes; }
    int flushes{0};

private:
    std::vector<std::string>& lines_;
};

Json::Value parse(const std::string& line) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    EXPECT_TRUE(reader->parse(line.data(), line.data() + line.size(), &root, &errors))
        << errors << " in " << line;
    return root;
}

size_t line_count(const fs::path& path) {
    std::ifstream in(path);
    size_t count = 0;
    for (std::string line; std::getline(in, line);) ++count;
    return count;
}

}  // anonymous namespace

// ── Logger ───────────────────────────────────

TEST(LoggerTest, EmitsOneJsonObjectPerLine) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<MemorySink>(lines), LogLevel::Debug);
    logger.info("Sandbox \"ready\"\n", {{"request_id", "req-1"}, {"path", "C:\\tmp"}});

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].find('\n'), std::string::npos);
    auto json = parse(lines[0]);
    EXPECT_EQ(json["level"].asString(), "info");
    EXPECT_EQ(json["msg"].asString(), "Sandbox \"ready\"\n");
    EXPECT_EQ(json["request_id"].asString(), "req-1");
    EXPECT_EQ(json["path"].asString(), "C:\\tmp");
    EXPECT_TRUE(json["ts"].asString().ends_with("Z"));
}

TEST(LoggerTest, LevelFiltering) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<MemorySink>(lines), LogLevel::Warn);
    logger.debug("d");
    logger.info("i");
    logger.warn("w");
    logger.error("e");
    EXPECT_EQ(lines.size(), 2u);

    logger.set_level(LogLevel::Debug);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
    logger.debug("d");
    EXPECT_EQ(lines.size(), 3u);
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("WARN"), LogLevel::Warn);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

// ── JsonFileSink ─────────────────────────────

class JsonFileSinkTest : public ::testing::Test {
protected:
    fs::path dir_;

    void SetUp() override {
        dir_ = fs::temp_directory_path() / "sg_test_sink";
        fs::remove_all(dir_);
    }
    void TearDown() override { fs::remove_all(dir_); }
};

TEST_F(JsonFileSinkTest, CreatesDirectoryAndAppends) {
    {
        JsonFileSink sink(dir_ / "nested", "app");
        sink.write(R"({"a":1})");
        sink.write(R"({"a":2})");
        sink.flush();
        EXPECT_EQ(sink.current_path(), dir_ / "nested" / "app.ndjson");
    }
    {
        JsonFileSink sink(dir_ / "nested", "app");
        sink.write(R"({"a":3})");
    }
    EXPECT_EQ(line_count(dir_ / "nested" / "app.ndjson"), 3u);
}

TEST_F(JsonFileSinkTest, RotatesAndCapsHistory) {
    JsonFileSink sink(dir_, "audit", 50, 2);
    sink.set_max_file_size_bytes(20);

    // Each line is 10 bytes with its newline; a rotation happens every second write.
    for (int i = 0; i < 8; ++i) {
        sink.write(R"({"n":)" + std::to_string(i) + "  }");
    }
    sink.flush();

    EXPECT_TRUE(fs::exists(sink.current_path()));
    EXPECT_TRUE(fs::exists(sink.rotated_path(1)));
    EXPECT_TRUE(fs::exists(sink.rotated_path(2)));
    EXPECT_FALSE(fs::exists(sink.rotated_path(3)));
    EXPECT_EQ(line_count(sink.current_path()), 2u);
    EXPECT_EQ(line_count(sink.rotated_path(1)), 2u);
}

// ── AuditLog ─────────────────────────────────

TEST(CodeSnippetTest, MarksTargetLine) {
    const std::string code = "a\nb\nc\nd\ne\nf";
    EXPECT_EQ(code_snippet(code, 3), "    1: a\n    2: b\n>>> 3: c\n    4: d\n    5: e");
    EXPECT_EQ(code_snippet(code, 1, 1), ">>> 1: a\n    2: b");
    EXPECT_EQ(code_snippet(code, 6, 1), "    5: e\n>>> 6: f");
    EXPECT_EQ(code_snippet(code, 0), "");
}

TEST(AuditLogTest, SecurityViolationEvent) {
    std::vector<std::string> lines;
    AuditLog audit(std::make_unique<MemorySink>(lines));

    SecurityViolation violation{.pattern_id = "py.os_system", .severity = Severity::Critical,
                                .message = "Shell command execution", .line = 2,
                                .pattern = R"(os\.system\s*\()"};
    audit.record_security_violation("req-7", Language::Python, violation,
                                    "import os\nos.system('ls')\n", ResourceLimits{});

    ASSERT_EQ(lines.size(), 1u);
    auto json = parse(lines[0]);
    EXPECT_EQ(json["event"].asString(), "security_violation");
    EXPECT_EQ(json["request_id"].asString(), "req-7");
    EXPECT_EQ(json["language"].asString(), "python");
    EXPECT_EQ(json["severity"].asString(), "critical");
    EXPECT_EQ(json["pattern"].asString(), R"(os\.system\s*\()");
    EXPECT_EQ(json["line"].asUInt(), 2u);
    EXPECT_NE(json["code_snippet"].asString().find(">>> 2: os.system('ls')"), std::string::npos);
    EXPECT_FALSE(json["limits"]["network_access"].asBool());
    EXPECT_EQ(json["limits"]["memory_limit_bytes"].asUInt64(), 256ULL * 1024 * 1024);
}

TEST(AuditLogTest, SandboxAndExecutionEvents) {
    std::vector<std::string> lines;
    auto sink = std::make_unique<MemorySink>(lines);
    auto* raw = sink.get();
    AuditLog audit(std::move(sink));

    audit.record_sandbox_event("sg-1", "provisioned", "req-1");
    audit.record_sandbox_event("sg-2", "reaped");

    ExecutionResult result;
    result.request_id = "req-1";
    result.status = ExecutionStatus::Success;
    result.execution_time = Millis{42};
    result.test_results = {TestResult{.name = "a", .passed = true},
                           TestResult{.name = "b", .passed = false}};
    audit.record_execution(result, Language::TypeScript);
    audit.flush();

    ASSERT_EQ(lines.size(), 3u);
    auto provisioned = parse(lines[0]);
    EXPECT_EQ(provisioned["event"].asString(), "sandbox_provisioned");
    EXPECT_EQ(provisioned["sandbox"].asString(), "sg-1");
    EXPECT_EQ(provisioned["request_id"].asString(), "req-1");

    auto reaped = parse(lines[1]);
    EXPECT_EQ(reaped["event"].asString(), "sandbox_reaped");
    EXPECT_FALSE(reaped.isMember("request_id"));

    auto execution = parse(lines[2]);
    EXPECT_EQ(execution["event"].asString(), "execution");
    EXPECT_EQ(execution["language"].asString(), "typescript");
    EXPECT_EQ(execution["duration_ms"].asInt(), 42);
    EXPECT_EQ(execution["tests_total"].asInt(), 2);
    EXPECT_EQ(execution["tests_passed"].asInt(), 1);
    EXPECT_EQ(raw->flushes, 1);
}
