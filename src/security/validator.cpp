/**
 * @file validator.cpp
 * @brief SecurityValidator implementation.
 */

#include "security/validator.hpp"

#include <algorithm>
#include <optional>
#include <sstream>

namespace sandbox_gate {

namespace {

std::vector<std::string_view> split_lines(std::string_view code) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start <= code.size()) {
        auto nl = code.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.push_back(code.substr(start));
            break;
        }
        auto line = code.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.push_back(line);
        start = nl + 1;
    }
    return lines;
}

size_t indentation(std::string_view line) {
    size_t n = 0;
    while (n < line.size() && (line[n] == ' ' || line[n] == '\t')) ++n;
    return n;
}

bool is_blank_or_comment(std::string_view line) {
    auto indent = indentation(line);
    return indent == line.size() || line[indent] == '#';
}

// std::regex recurses once per matched character, so a single match attempt
// must never see more than a window of the line. Windows overlap so any match
// shorter than the overlap is still found whole.
constexpr size_t kScanWindow = 2048;
constexpr size_t kScanOverlap = 512;

/// End offset (within line) of the first match, searching window by window.
std::optional<size_t> search_line(std::string_view line, const std::regex& regex) {
    size_t start = 0;
    while (true) {
        const size_t len = std::min(kScanWindow, line.size() - start);
        const bool at_end = start + len == line.size();

        auto flags = std::regex_constants::match_default;
        if (start > 0) {
            flags |= std::regex_constants::match_prev_avail | std::regex_constants::match_not_bol;
        }
        if (!at_end) {
            flags |= std::regex_constants::match_not_eol | std::regex_constants::match_not_eow;
        }

        const auto first = line.begin() + start;
        std::match_results<std::string_view::const_iterator> match;
        if (std::regex_search(first, first + len, match, regex, flags)) {
            return start + static_cast<size_t>(match.position(0) + match.length(0));
        }
        if (at_end) return std::nullopt;
        start += kScanWindow - kScanOverlap;
    }
}

bool has_break(std::string_view text) {
    static const std::regex kBreak(R"(\bbreak\b)");
    return search_line(text, kBreak).has_value();
}

/**
 * Body of a brace-delimited loop starting at (line_idx, col). Spans lines
 * until the braces balance; a body without '{' runs to the first ';'.
 */
std::string brace_body(const std::vector<std::string_view>& lines, size_t line_idx, size_t col) {
    std::string body;
    int depth = 0;
    bool opened = false;

    for (size_t i = line_idx; i < lines.size(); ++i) {
        auto text = lines[i];
        for (size_t c = (i == line_idx ? col : 0); c < text.size(); ++c) {
            char ch = text[c];
            if (!opened) {
                if (ch == ' ' || ch == '\t') continue;
                if (ch != '{') {
                    // Single statement body
                    auto end = text.find(';', c);
                    return std::string{text.substr(c, end == std::string_view::npos
                                                          ? std::string_view::npos
                                                          : end - c)};
                }
                opened = true;
                depth = 1;
                continue;
            }
            if (ch == '{') ++depth;
            if (ch == '}' && --depth == 0) return body;
            body.push_back(ch);
        }
        body.push_back('\n');
    }
    return body;
}

}  // anonymous namespace

uint64_t code_point_count(std::string_view text) noexcept {
    uint64_t count = 0;
    for (unsigned char ch : text) {
        if ((ch & 0xC0) != 0x80) ++count;
    }
    return count;
}

SecurityValidator::SecurityValidator(const ValidatorConfig& config)
    : max_code_length_(config.max_code_length)
    , block_severity_(parse_severity(config.block_severity).value_or(Severity::Critical)) {
    for (auto language : kAllLanguages) {
        auto& table = compiled_[language];
        for (const auto& sig : signatures_for(language)) {
            auto flags = std::regex::ECMAScript | std::regex::optimize;
            if (const auto* p = std::get_if<LinePattern>(&sig.matcher); p && p->ignore_case) {
                flags |= std::regex::icase;
            }
            table.push_back(CompiledSignature{&sig, std::regex(matcher_source(sig.matcher), flags)});
        }
    }
}

Result<std::vector<SecurityViolation>>
SecurityValidator::validate(std::string_view code, Language language) const {
    auto length = code_point_count(code);
    if (length > max_code_length_) {
        return Error{ErrorKind::InputTooLarge,
                     "Code length " + std::to_string(length) + " exceeds maximum of " +
                         std::to_string(max_code_length_) + " characters"};
    }

    const auto lines = split_lines(code);
    std::vector<SecurityViolation> violations;

    for (const auto& sig : compiled_.at(language)) {
        if (std::holds_alternative<LinePattern>(sig.signature->matcher)) {
            scan_lines(sig, lines, violations);
        } else {
            scan_loops(sig, lines, violations);
        }
    }
    return violations;
}

void SecurityValidator::scan_lines(const CompiledSignature& sig,
                                   const std::vector<std::string_view>& lines,
                                   std::vector<SecurityViolation>& out) const {
    for (size_t i = 0; i < lines.size(); ++i) {
        if (search_line(lines[i], sig.regex)) {
            out.push_back(SecurityViolation{
                .pattern_id = sig.signature->id,
                .severity = sig.signature->severity,
                .message = sig.signature->message,
                .line = static_cast<uint32_t>(i + 1),
                .pattern = matcher_source(sig.signature->matcher)
            });
        }
    }
}

void SecurityValidator::scan_loops(const CompiledSignature& sig,
                                   const std::vector<std::string_view>& lines,
                                   std::vector<SecurityViolation>& out) const {
    const auto& loop = std::get<UnboundedLoop>(sig.signature->matcher);

    for (size_t i = 0; i < lines.size(); ++i) {
        const auto matched = search_line(lines[i], sig.regex);
        if (!matched) continue;

        const size_t header_end = *matched;
        std::string body;

        if (loop.syntax == BlockSyntax::Indentation) {
            auto rest = lines[i].substr(header_end);
            if (indentation(rest) < rest.size() && rest[indentation(rest)] != '#') {
                body = std::string{rest};
            } else {
                const auto base = indentation(lines[i]);
                for (size_t j = i + 1; j < lines.size(); ++j) {
                    if (is_blank_or_comment(lines[j])) continue;
                    if (indentation(lines[j]) <= base) break;
                    body.append(lines[j]).push_back('\n');
                }
            }
        } else {
            body = brace_body(lines, i, header_end);
        }

        if (!has_break(body)) {
            out.push_back(SecurityViolation{
                .pattern_id = sig.signature->id,
                .severity = sig.signature->severity,
                .message = sig.signature->message,
                .line = static_cast<uint32_t>(i + 1),
                .pattern = loop.header
            });
        }
    }
}

bool SecurityValidator::blocks(const std::vector<SecurityViolation>& violations) const noexcept {
    for (const auto& v : violations) {
        if (v.severity >= block_severity_) return true;
    }
    return false;
}

ValidationReport SecurityValidator::report(std::string_view code, Language language) const {
    ValidationReport report;
    const auto& imports = blocked_imports(language);
    report.blocked_imports.assign(imports.begin(), imports.end());

    auto result = validate(code, language);
    if (!result) {
        report.safe = false;
        report.error = std::string{to_string(result.error().kind)};
        report.message = result.error().message;
        return report;
    }

    report.violations = std::move(*result);
    report.safe = !blocks(report.violations);

    std::ostringstream msg;
    if (report.safe && report.violations.empty()) {
        msg << "Code passed security validation";
    } else if (report.safe) {
        msg << "Code passed security validation with " << report.violations.size()
            << " warning(s)";
    } else {
        size_t blocking = 0;
        for (const auto& v : report.violations) {
            if (v.severity >= block_severity_) ++blocking;
        }
        msg << "Code blocked: " << blocking << " violation(s) at or above "
            << to_string(block_severity_) << " severity";
    }
    report.message = msg.str();
    return report;
}

}  // namespace sandbox_gate
