/**
 * @file types.cpp
 * @brief Name lookups for the shared enums.
 */

#include "core/types.hpp"

#include <algorithm>
#include <cctype>

namespace sandbox_gate {

namespace {

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // anonymous namespace

std::optional<Language> parse_language(std::string_view name) {
    auto lowered = lowercase(name);
    for (auto language : kAllLanguages) {
        if (to_string(language) == lowered) return language;
    }
    // Common aliases used by editors and the frontend
    if (lowered == "py" || lowered == "python3") return Language::Python;
    if (lowered == "js" || lowered == "node") return Language::JavaScript;
    if (lowered == "ts") return Language::TypeScript;
    if (lowered == "golang") return Language::Go;
    return std::nullopt;
}

std::optional<Severity> parse_severity(std::string_view name) {
    auto lowered = lowercase(name);
    for (auto severity : {Severity::Low, Severity::Medium, Severity::High, Severity::Critical}) {
        if (to_string(severity) == lowered) return severity;
    }
    return std::nullopt;
}

}  // namespace sandbox_gate
