/**
 * @file validator.hpp
 * @brief Static, non-executing security screening of submitted code.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "security/signatures.hpp"

#include <map>
#include <regex>
#include <string_view>
#include <vector>

namespace sandbox_gate {

/**
 * @brief Scans source text against the per-language signature registry.
 *
 * Regexes are compiled once at construction; validate() is const and safe
 * to call from any number of threads. The validator never compiles, imports
 * or runs the submission.
 */
class SecurityValidator {
public:
    explicit SecurityValidator(const ValidatorConfig& config);

    /**
     * @brief All violations in table order, then line order.
     * @return Error{InputTooLarge} if the code exceeds the configured length.
     */
    [[nodiscard]] Result<std::vector<SecurityViolation>>
    validate(std::string_view code, Language language) const;

    /// True if any violation is at or above the blocking severity.
    [[nodiscard]] bool blocks(const std::vector<SecurityViolation>& violations) const noexcept;

    /// Full report for the validate-only endpoint.
    [[nodiscard]] ValidationReport report(std::string_view code, Language language) const;

    [[nodiscard]] Severity block_severity() const noexcept { return block_severity_; }
    [[nodiscard]] uint64_t max_code_length() const noexcept { return max_code_length_; }

private:
    struct CompiledSignature {
        const Signature* signature;
        std::regex regex;
    };

    void scan_lines(const CompiledSignature& sig,
                    const std::vector<std::string_view>& lines,
                    std::vector<SecurityViolation>& out) const;

    void scan_loops(const CompiledSignature& sig,
                    const std::vector<std::string_view>& lines,
                    std::vector<SecurityViolation>& out) const;

    uint64_t max_code_length_;
    Severity block_severity_;
    std::map<Language, std::vector<CompiledSignature>> compiled_;
};

/// Length in Unicode code points of UTF-8 text.
[[nodiscard]] uint64_t code_point_count(std::string_view text) noexcept;

}  // namespace sandbox_gate
