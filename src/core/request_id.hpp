/**
 * @file request_id.hpp
 * @brief Opaque identifiers for requests and sandboxes.
 */

#pragma once

#include "core/types.hpp"

#include <string_view>

namespace sandbox_gate {

/**
 * @brief Generate a random RFC 4122 version-4 UUID string.
 *
 * Thread-safe. Every request gets a fresh id; ids are never recycled.
 */
[[nodiscard]] RequestId generate_request_id();

/**
 * @brief Short sandbox name derived from a request id, e.g. "sg-1f3a9c0e2b7d".
 *
 * The suffix is random so two sandboxes never share a name even if a caller
 * replays the same request id.
 */
[[nodiscard]] SandboxId generate_sandbox_id(std::string_view prefix = "sg");

/// Format a wall-clock time as ISO 8601 with millisecond precision, UTC.
[[nodiscard]] std::string format_timestamp(Timestamp ts);

}  // namespace sandbox_gate
