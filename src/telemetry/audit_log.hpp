/**
 * @file audit_log.hpp
 * @brief Structured audit trail for security and sandbox lifecycle events.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace sandbox_gate {

/**
 * @brief Emits one NDJSON event per security violation, sandbox lifecycle
 *        transition and finished execution.
 */
class AuditLog {
public:
    explicit AuditLog(std::unique_ptr<ILogSink> sink);

    void record_security_violation(const RequestId& request_id,
                                   Language language,
                                   const SecurityViolation& violation,
                                   std::string_view code,
                                   const ResourceLimits& limits);

    /// event is one of "provisioned", "destroyed", "reaped", "destroy_failed".
    void record_sandbox_event(const SandboxId& sandbox_id,
                              std::string_view event,
                              const RequestId& request_id = {});

    void record_execution(const ExecutionResult& result, Language language);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

/**
 * @brief Source lines around a 1-based line, the target marked with ">>>".
 *
 * Each line renders as "<marker> <n>: <text>" where marker is ">>>" for the
 * target and three spaces otherwise.
 */
[[nodiscard]] std::string code_snippet(std::string_view code, uint32_t line,
                                       uint32_t context_lines = 2);

}  // namespace sandbox_gate
