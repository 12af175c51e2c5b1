/**
 * @file signatures.hpp
 * @brief Per-language danger signature registry.
 *
 * Every signature is plain data: an identifier, a severity, a message and a
 * matcher. A matcher is a tagged variant so the validator can dispatch on
 * the kind of check without ever interpreting the submitted code.
 */

#pragma once

#include "core/types.hpp"

#include <string>
#include <variant>
#include <vector>

namespace sandbox_gate {

// ─────────────────────────────────────────────
// Matchers
// ─────────────────────────────────────────────

/// Regex evaluated against each source line independently.
struct LinePattern {
    std::string regex;
    bool ignore_case{false};
};

/// How a loop body is delimited.
enum class BlockSyntax : uint8_t {
    Indentation,    ///< Python: deeper-indented lines, or the rest of the header line
    Braces          ///< C-like: balanced { } block, or a single statement
};

/**
 * @brief A loop whose condition is constant-true and whose visible body
 *        contains no `break`.
 *
 * `header` matches the loop head on one line. For Braces syntax the body
 * starts at the first non-space character after the match.
 */
struct UnboundedLoop {
    std::string header;
    BlockSyntax syntax{BlockSyntax::Braces};
};

using SignatureMatcher = std::variant<LinePattern, UnboundedLoop>;

struct Signature {
    std::string id;
    Severity severity{Severity::Low};
    std::string message;
    SignatureMatcher matcher;
};

// ─────────────────────────────────────────────
// Registry
// ─────────────────────────────────────────────

/// Signature table for a language, in evaluation order.
[[nodiscard]] const std::vector<Signature>& signatures_for(Language language);

/// Module deny list reported to callers of the validate endpoint.
[[nodiscard]] const std::vector<std::string>& blocked_imports(Language language);

/// Human-readable source of a matcher, recorded with each violation.
[[nodiscard]] std::string matcher_source(const SignatureMatcher& matcher);

}  // namespace sandbox_gate
