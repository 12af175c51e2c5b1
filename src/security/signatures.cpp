/**
 * @file signatures.cpp
 * @brief Built-in signature tables.
 */

#include "security/signatures.hpp"

namespace sandbox_gate {

namespace {

Signature line(std::string id, Severity severity, std::string message, std::string regex) {
    return Signature{
        .id = std::move(id),
        .severity = severity,
        .message = std::move(message),
        .matcher = LinePattern{.regex = std::move(regex)}
    };
}

Signature loop(std::string id, std::string header, BlockSyntax syntax) {
    return Signature{
        .id = std::move(id),
        .severity = Severity::Medium,
        .message = "Infinite loop without break - potential denial of service",
        .matcher = UnboundedLoop{.header = std::move(header), .syntax = syntax}
    };
}

// Quote class shared by the JavaScript require/import patterns.
constexpr const char* kQ = R"(['"`])";

std::string js_module(const std::string& modules) {
    return std::string{kQ} + "(node:)?(" + modules + ")" + kQ;
}

std::vector<Signature> python_table() {
    return {
        line("py.eval", Severity::Critical,
             "Use of eval() - can execute arbitrary code",
             R"(\beval\s*\()"),
        line("py.exec", Severity::Critical,
             "Use of exec() - can execute arbitrary code",
             R"(\bexec\s*\()"),
        line("py.import_os", Severity::Critical,
             "Import of os module - system access",
             R"(\bimport\s+os\b|\bfrom\s+os(\.\w+)?\s+import\b)"),
        line("py.import_subprocess", Severity::Critical,
             "Import of subprocess module - command execution",
             R"(\bimport\s+subprocess\b|\bfrom\s+subprocess\s+import\b)"),
        line("py.dunder_import", Severity::High,
             "Direct use of __import__ - dynamic module loading",
             R"(__import__\s*\()"),
        line("py.network_import", Severity::High,
             "Network library import - external access",
             R"(\b(import|from)\s+(socket|urllib|requests|http)\b)"),
        line("py.ctypes", Severity::High,
             "Import of ctypes - native memory access",
             R"(\b(import|from)\s+ctypes\b)"),
        line("py.import_sys", Severity::Medium,
             "Import of sys module - interpreter access",
             R"(\bimport\s+sys\b|\bfrom\s+sys\s+import\b)"),
        line("py.open_file", Severity::Medium,
             "File operation - potential file system access",
             R"(\bopen\s*\(\s*['"][^'"]*['"])"),
        loop("py.unbounded_loop", R"(^\s*while\s+(True|1)\s*:)", BlockSyntax::Indentation),
        line("py.large_range", Severity::Medium,
             "Very large range loop - potential denial of service",
             R"(\brange\s*\(\s*(\d{7,}|10\s*\*\*\s*([7-9]|\d{2,})))"),
    };
}

std::vector<Signature> javascript_table() {
    return {
        line("js.eval", Severity::Critical,
             "Use of eval() - can execute arbitrary code",
             R"(\beval\s*\()"),
        line("js.function_constructor", Severity::Critical,
             "Function constructor - can execute arbitrary code",
             R"(\bFunction\s*\()"),
        line("js.child_process", Severity::Critical,
             "Child process module - command execution",
             R"(\brequire\s*\(\s*)" + js_module("child_process")),
        line("js.fs", Severity::Critical,
             "File system module - file access",
             R"(\brequire\s*\(\s*)" + js_module("fs|fs/promises")),
        line("js.network_require", Severity::High,
             "Network or process module - external access",
             R"(\brequire\s*\(\s*)" + js_module("net|http|https|dgram|cluster|worker_threads")),
        line("js.proto", Severity::High,
             "Prototype pollution attempt",
             R"(__proto__)"),
        line("js.constructor_chain", Severity::High,
             "Constructor chain access - potential code execution",
             R"(constructor\s*\.\s*constructor)"),
        line("js.process_exit", Severity::Medium,
             "Process exit - potential disruption",
             R"(\bprocess\s*\.\s*exit\b)"),
        loop("js.unbounded_loop", R"(\bwhile\s*\(\s*true\s*\)|\bfor\s*\(\s*;\s*;\s*\))",
             BlockSyntax::Braces),
    };
}

std::vector<Signature> typescript_table() {
    auto table = javascript_table();
    for (auto& sig : table) {
        sig.id.replace(0, 2, "ts");
    }
    table.push_back(line("ts.import_child_process", Severity::Critical,
                         "Child process import - command execution",
                         R"(\bimport\b.*\bfrom\s*)" + js_module("child_process")));
    table.push_back(line("ts.import_fs", Severity::Critical,
                         "File system import - file access",
                         R"(\bimport\b.*\bfrom\s*)" + js_module("fs|fs/promises")));
    table.push_back(line("ts.import_network", Severity::High,
                         "Network or process module import - external access",
                         R"(\bimport\b.*\bfrom\s*)" +
                             js_module("net|http|https|dgram|cluster|worker_threads")));
    return table;
}

std::vector<Signature> java_table() {
    return {
        line("java.runtime_exec", Severity::Critical,
             "Runtime.exec - command execution",
             R"(Runtime\s*\.\s*getRuntime\s*\(\s*\)\s*\.\s*exec\b)"),
        line("java.process_builder", Severity::Critical,
             "ProcessBuilder - command execution",
             R"(\bProcessBuilder\b)"),
        line("java.net", Severity::High,
             "java.net usage - external access",
             R"(\bjava\.net\.)"),
        loop("java.unbounded_loop", R"(\bwhile\s*\(\s*true\s*\)|\bfor\s*\(\s*;\s*;\s*\))",
             BlockSyntax::Braces),
    };
}

std::vector<Signature> go_table() {
    return {
        line("go.os_exec", Severity::Critical,
             "os/exec import - command execution",
             R"("os/exec")"),
        line("go.syscall", Severity::Critical,
             "syscall import - raw system calls",
             R"("syscall")"),
        line("go.unsafe", Severity::Critical,
             "unsafe import - raw memory access",
             R"("unsafe")"),
        line("go.net", Severity::High,
             "net import - external access",
             R"("net(/[a-z/]+)?")"),
        loop("go.unbounded_loop", R"(\bfor\s*(?=\{))", BlockSyntax::Braces),
    };
}

}  // anonymous namespace

const std::vector<Signature>& signatures_for(Language language) {
    static const std::vector<Signature> python = python_table();
    static const std::vector<Signature> javascript = javascript_table();
    static const std::vector<Signature> typescript = typescript_table();
    static const std::vector<Signature> java = java_table();
    static const std::vector<Signature> go = go_table();

    switch (language) {
        case Language::Python:     return python;
        case Language::JavaScript: return javascript;
        case Language::TypeScript: return typescript;
        case Language::Java:       return java;
        case Language::Go:         return go;
    }
    return python;
}

const std::vector<std::string>& blocked_imports(Language language) {
    static const std::vector<std::string> python = {
        "os", "subprocess", "sys", "socket", "urllib", "requests",
        "http", "ftplib", "smtplib", "telnetlib", "multiprocessing",
        "threading", "ctypes", "importlib"
    };
    static const std::vector<std::string> node = {
        "child_process", "fs", "net", "http", "https", "cluster",
        "worker_threads", "dgram", "tls", "crypto"
    };
    static const std::vector<std::string> java = {
        "java.lang.ProcessBuilder", "java.lang.Runtime", "java.net",
        "java.io.File", "java.nio.file"
    };
    static const std::vector<std::string> go = {
        "os/exec", "syscall", "unsafe", "net", "net/http"
    };

    switch (language) {
        case Language::Python:     return python;
        case Language::JavaScript:
        case Language::TypeScript: return node;
        case Language::Java:       return java;
        case Language::Go:         return go;
    }
    return python;
}

std::string matcher_source(const SignatureMatcher& matcher) {
    if (const auto* pattern = std::get_if<LinePattern>(&matcher)) {
        return pattern->regex;
    }
    return std::get<UnboundedLoop>(matcher).header;
}

}  // namespace sandbox_gate
