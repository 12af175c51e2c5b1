/**
 * @file audit_log.cpp
 * @brief AuditLog implementation.
 */

#include "telemetry/audit_log.hpp"
#include "core/request_id.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <vector>

namespace sandbox_gate {

namespace {

std::string now_iso() {
    return format_timestamp(std::chrono::system_clock::now());
}

}  // anonymous namespace

std::string code_snippet(std::string_view code, uint32_t line, uint32_t context_lines) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (true) {
        auto nl = code.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.push_back(code.substr(start));
            break;
        }
        lines.push_back(code.substr(start, nl - start));
        start = nl + 1;
    }

    if (line == 0) return {};
    const int64_t target = static_cast<int64_t>(line) - 1;
    const int64_t first = std::max<int64_t>(0, target - context_lines);
    const int64_t last = std::min<int64_t>(static_cast<int64_t>(lines.size()) - 1,
                                           target + context_lines);

    std::ostringstream oss;
    for (int64_t i = first; i <= last; ++i) {
        if (i != first) oss << '\n';
        oss << (i == target ? ">>>" : "   ") << ' ' << (i + 1) << ": " << lines[i];
    }
    return oss.str();
}

AuditLog::AuditLog(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void AuditLog::record_security_violation(const RequestId& request_id,
                                         Language language,
                                         const SecurityViolation& violation,
                                         std::string_view code,
                                         const ResourceLimits& limits) {
    std::ostringstream oss;
    oss << R"({"event":"security_violation")"
        << R"(,"ts":")" << now_iso() << '"'
        << R"(,"request_id":)" << json_quote(request_id)
        << R"(,"language":")" << to_string(language) << '"'
        << R"(,"pattern_id":)" << json_quote(violation.pattern_id)
        << R"(,"severity":")" << to_string(violation.severity) << '"'
        << R"(,"message":)" << json_quote(violation.message)
        << R"(,"pattern":)" << json_quote(violation.pattern);
    if (violation.line) {
        oss << R"(,"line":)" << *violation.line
            << R"(,"code_snippet":)" << json_quote(code_snippet(code, *violation.line));
    }
    oss << R"(,"limits":{"timeout_seconds":)" << limits.timeout_seconds
        << R"(,"memory_limit_bytes":)" << limits.memory_limit_bytes
        << R"(,"network_access":)" << (limits.network_access ? "true" : "false")
        << "}}";
    emit(oss.str());
}

void AuditLog::record_sandbox_event(const SandboxId& sandbox_id,
                                    std::string_view event,
                                    const RequestId& request_id) {
    std::ostringstream oss;
    oss << R"({"event":"sandbox_)" << event << '"'
        << R"(,"ts":")" << now_iso() << '"'
        << R"(,"sandbox":)" << json_quote(sandbox_id);
    if (!request_id.empty()) {
        oss << R"(,"request_id":)" << json_quote(request_id);
    }
    oss << '}';
    emit(oss.str());
}

void AuditLog::record_execution(const ExecutionResult& result, Language language) {
    const auto passed = std::count_if(result.test_results.begin(), result.test_results.end(),
                                      [](const TestResult& t) { return t.passed; });
    std::ostringstream oss;
    oss << R"({"event":"execution")"
        << R"(,"ts":")" << now_iso() << '"'
        << R"(,"request_id":)" << json_quote(result.request_id)
        << R"(,"language":")" << to_string(language) << '"'
        << R"(,"status":")" << to_string(result.status) << '"'
        << R"(,"duration_ms":)" << result.execution_time.count()
        << R"(,"tests_total":)" << result.test_results.size()
        << R"(,"tests_passed":)" << passed
        << R"(,"violations":)" << result.security_violations.size()
        << '}';
    emit(oss.str());
}

void AuditLog::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void AuditLog::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace sandbox_gate
