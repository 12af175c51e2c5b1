/**
 * @file languages.cpp
 * @brief Built-in language profiles.
 */

#include "orchestrator/languages.hpp"
#include "harness/drivers.hpp"

namespace sandbox_gate {

namespace {

LanguageProfile python_profile() {
    LanguageProfile p;
    p.language = Language::Python;
    p.image = "python:3.11-alpine";
    p.extension = ".py";
    p.source_file = "solution.py";
    p.test_framework = "unittest";
    p.check = CommandTemplate{
        "python3", "-c",
        "import sys; compile(open(sys.argv[1]).read(), sys.argv[1], 'exec', dont_inherit=True)",
        "{src}"
    };
    p.run = {"python3", "{src}"};
    p.test = {"python3", "{driver}", "{src}"};
    p.driver_file = std::string{kPythonDriverFile};
    p.driver_source = python_driver_source();
    p.oom_markers = {"MemoryError"};
    p.env = {{"PYTHONDONTWRITEBYTECODE", "1"}, {"PYTHONIOENCODING", "utf-8"}};
    return p;
}

LanguageProfile javascript_profile() {
    LanguageProfile p;
    p.language = Language::JavaScript;
    p.image = "node:18-alpine";
    p.extension = ".js";
    p.source_file = "solution.js";
    p.test_framework = "jest";
    p.check = CommandTemplate{"node", "--check", "{src}"};
    p.run = {"node", "--max-old-space-size={heap_mb}", "{src}"};
    p.test = {"node", "--max-old-space-size={heap_mb}", "{driver}", "{src}"};
    p.driver_file = std::string{kJavaScriptDriverFile};
    p.driver_source = javascript_driver_source();
    p.oom_markers = {"JavaScript heap out of memory", "Allocation failed"};
    p.limit_address_space = false;
    return p;
}

LanguageProfile typescript_profile() {
    auto p = javascript_profile();
    p.language = Language::TypeScript;
    p.extension = ".ts";
    p.source_file = "solution.ts";
    p.compile = CommandTemplate{
        "tsc", "--outDir", "{scratch}", "--target", "ES2020", "--module", "commonjs",
        "--noEmitOnError", "--pretty", "false", "{src}"
    };
    p.check.reset();
    p.run = {"node", "--max-old-space-size={heap_mb}", "{scratch}/solution.js"};
    p.test = {"node", "--max-old-space-size={heap_mb}", "{driver}", "{scratch}/solution.js"};
    return p;
}

void replace_all(std::string& text, std::string_view from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

}  // anonymous namespace

std::vector<SandboxFile> LanguageProfile::files_for(const std::string& code,
                                                    bool with_driver) const {
    std::vector<SandboxFile> files;
    files.push_back(SandboxFile{source_file, code});
    if (with_driver && !driver_file.empty()) {
        files.push_back(SandboxFile{driver_file, std::string{driver_source}});
    }
    return files;
}

std::vector<std::string> expand_command(const CommandTemplate& command,
                                        const CommandContext& context) {
    const std::string heap = std::to_string(context.heap_mb);
    std::vector<std::string> out;
    out.reserve(command.size());
    for (auto arg : command) {
        replace_all(arg, "{src}", context.src);
        replace_all(arg, "{workdir}", context.workdir);
        replace_all(arg, "{scratch}", context.scratch);
        replace_all(arg, "{driver}", context.driver);
        replace_all(arg, "{heap_mb}", heap);
        out.push_back(std::move(arg));
    }
    return out;
}

LanguageRegistry::LanguageRegistry(const std::map<std::string, std::string>& image_overrides) {
    for (auto profile : {python_profile(), javascript_profile(), typescript_profile()}) {
        auto name = std::string{to_string(profile.language)};
        if (auto it = image_overrides.find(name); it != image_overrides.end()) {
            profile.image = it->second;
        }
        profiles_.emplace(profile.language, std::move(profile));
    }
}

const LanguageProfile* LanguageRegistry::find(Language language) const noexcept {
    auto it = profiles_.find(language);
    return it == profiles_.end() ? nullptr : &it->second;
}

bool LanguageRegistry::supported(Language language) const noexcept {
    return profiles_.contains(language);
}

std::vector<Language> LanguageRegistry::supported_languages() const {
    std::vector<Language> out;
    for (const auto& [language, profile] : profiles_) out.push_back(language);
    return out;
}

}  // namespace sandbox_gate
