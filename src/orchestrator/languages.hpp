/**
 * @file languages.hpp
 * @brief Per-language execution profiles.
 *
 * Command templates may contain placeholders expanded per sandbox:
 *   {src}       submission path inside the sandbox
 *   {workdir}   read-only code directory
 *   {scratch}   writable scratch directory
 *   {driver}    test driver path
 *   {heap_mb}   managed-heap ceiling in MiB (3/4 of the memory limit)
 */

#pragma once

#include "core/types.hpp"
#include "runtime/container_runtime.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sandbox_gate {

using CommandTemplate = std::vector<std::string>;

struct LanguageProfile {
    Language language{Language::Python};
    std::string image;
    std::string extension;
    std::string source_file;
    std::string test_framework;

    std::optional<CommandTemplate> compile;   ///< Build step; doubles as the check step
    std::optional<CommandTemplate> check;     ///< Syntax-only check, never runs user code
    CommandTemplate run;
    CommandTemplate test;                     ///< Driver invocation for one test case

    std::string driver_file;
    std::string_view driver_source;

    std::vector<std::string> oom_markers;     ///< stderr text meaning "out of memory"
    std::vector<std::pair<std::string, std::string>> env;
    bool limit_address_space{true};

    /// Files written into the sandbox code directory.
    [[nodiscard]] std::vector<SandboxFile> files_for(const std::string& code,
                                                     bool with_driver) const;
};

/**
 * @brief Values substituted into command templates.
 */
struct CommandContext {
    std::string src;
    std::string workdir;
    std::string scratch;
    std::string driver;
    uint64_t heap_mb{0};
};

[[nodiscard]] std::vector<std::string> expand_command(const CommandTemplate& command,
                                                      const CommandContext& context);

/**
 * @brief Profiles of the executable languages. Java and Go are recognized
 *        by the validator but have no profile.
 */
class LanguageRegistry {
public:
    /// image_overrides is keyed by language name, e.g. "python".
    explicit LanguageRegistry(const std::map<std::string, std::string>& image_overrides = {});

    [[nodiscard]] const LanguageProfile* find(Language language) const noexcept;
    [[nodiscard]] bool supported(Language language) const noexcept;
    [[nodiscard]] std::vector<Language> supported_languages() const;

private:
    std::map<Language, LanguageProfile> profiles_;
};

}  // namespace sandbox_gate
