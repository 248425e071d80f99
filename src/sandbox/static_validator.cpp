#include "sandbox/static_validator.hpp"

#include <set>

#include "utils/common.hpp"

namespace snipguard::sandbox {
namespace {

constexpr std::size_t kMaxSnippetBytes = 64 * 1024;
constexpr std::size_t kMaxQuotedMatch = 60;

const std::vector<std::string>& StandardDenylist() {
    static const std::vector<std::string> kPatterns = {
        // host escape
        "import os", "import sys", "import subprocess", "import socket",
        "import urllib", "import requests", "import http",
        "import ctypes", "import shutil", "import multiprocessing", "import threading",
        "import signal", "import resource",
        "from os", "from sys", "from subprocess",
        "open(", "file(",
        // dynamic code
        "exec(", "eval(", "compile(",
        // introspection
        "__import__", "__builtins__", "__globals__", "__locals__",
        "globals()", "locals()", "vars(", "dir(",
        "getattr(", "setattr(", "delattr(",
        "__class__", "__subclasses__", "__bases__", "__mro__", "__code__",
        "__closure__", "__dict__", "__getattribute__", "__reduce__",
        "__loader__", "__spec__",
        // interactive and process control
        "input(", "raw_input(", "breakpoint(",
        "exit(", "quit(", "sys.exit",
        // namespace access
        "os.", "sys.", "subprocess.", "socket.",
        "urllib.", "requests.", "http.",
        "__file__", "__name__", "__doc__", "__package__",
        "reload(", "importlib",
        "pickle", "cPickle", "marshal", "shelve",
        "code.", "ast.", "compile",
    };
    return kPatterns;
}

const std::vector<std::string>& StrictDenylist() {
    static const std::vector<std::string> kPatterns = {
        ".format(", ".join(", "%s", "%d", "%r", "%f", "% (",
    };
    return kPatterns;
}

// Callables that turn data into code or into a name lookup.
constexpr const char* kDynamicCalls =
    "(eval|exec|compile|getattr|setattr|delattr|open|vars|breakpoint|input|__import__|import_module)";

std::string Quote(const std::string& text) {
    if (text.size() <= kMaxQuotedMatch) {
        return text;
    }
    return text.substr(0, kMaxQuotedMatch) + "...";
}

std::string DangerReason(const std::string& what) {
    return "Code contains potentially dangerous operation: " + what;
}

}  // namespace

StaticValidator::StaticValidator(config::DenylistPolicy policy)
    : policy_(policy) {
    for (const auto& text : StandardDenylist()) {
        patterns_.push_back({text, utils::ToLower(text)});
    }
    if (policy_ == config::DenylistPolicy::kStrict) {
        for (const auto& text : StrictDenylist()) {
            patterns_.push_back({text, utils::ToLower(text)});
        }
    }

    const auto flags = std::regex::ECMAScript | std::regex::icase;
    const std::string calls = kDynamicCalls;
    rules_.push_back({"dynamic call with detached parenthesis",
                      std::regex("\\b" + calls + "\\s+\\(", flags)});
    rules_.push_back({"alias of a dynamic execution primitive",
                      std::regex("=\\s*" + calls + "(?![\\w(])", flags)});
    rules_.push_back({"string concatenation feeding a dynamic call",
                      std::regex("\\b" + calls + "\\s*\\([^)\\n]{0,200}[\"'][^\"'\\n]{0,200}[\"']\\s*\\+", flags)});
    rules_.push_back({"joined string feeding a dynamic call",
                      std::regex("\\b" + calls + "\\s*\\(\\s*[\"'][^\"'\\n]{0,200}[\"']\\s*\\.\\s*join", flags)});
    rules_.push_back({"character-code string building",
                      std::regex("chr\\s*\\(\\s*\\d+\\s*\\)\\s*\\+\\s*chr\\s*\\(", flags)});
    if (policy_ == config::DenylistPolicy::kStrict) {
        rules_.push_back({"formatted string literal",
                          std::regex("(^|[^\\w])[rb]?f[r]?[\"']", flags)});
        rules_.push_back({"string concatenation",
                          std::regex("[\"']\\s*\\+|\\+\\s*[rbuf]?[\"']", flags)});
        rules_.push_back({"escaped string literal",
                          std::regex("(\\\\x[0-9a-f]{2}){3,}|(\\\\u[0-9a-f]{4}){3,}|(\\\\[0-7]{3}){3,}", flags)});
    }
}

ValidationResult StaticValidator::Validate(const std::string& snippet) const {
    if (snippet.find('\0') != std::string::npos) {
        return ValidationResult::Rejected("\\0", "Code contains a NUL byte");
    }
    if (snippet.size() > kMaxSnippetBytes) {
        return ValidationResult::Rejected(
            "size", "Code exceeds the maximum length of " + std::to_string(kMaxSnippetBytes) + " bytes");
    }

    const auto lowered = utils::ToLower(snippet);
    for (const auto& pattern : patterns_) {
        if (lowered.find(pattern.lowered) != std::string::npos) {
            return ValidationResult::Rejected(pattern.text, DangerReason(pattern.text));
        }
    }

    for (const auto& rule : rules_) {
        std::smatch match;
        if (std::regex_search(snippet, match, rule.pattern)) {
            return ValidationResult::Rejected(
                rule.label, DangerReason(rule.label + " (" + Quote(match.str(0)) + ")"));
        }
    }

    return CheckAssignedLiteralRouting(snippet);
}

// name = "..." followed later by eval(name) / getattr(obj, name).
ValidationResult StaticValidator::CheckAssignedLiteralRouting(const std::string& snippet) const {
    static const std::regex kLiteralAssignment(
        "\\b([A-Za-z_][A-Za-z0-9_]*)\\s*=\\s*[rbuf]{0,2}[\"']",
        std::regex::ECMAScript | std::regex::icase);

    std::set<std::string> names;
    for (auto it = std::sregex_iterator(snippet.begin(), snippet.end(), kLiteralAssignment);
         it != std::sregex_iterator(); ++it) {
        names.insert((*it)[1].str());
    }

    const std::string calls = kDynamicCalls;
    for (const auto& name : names) {
        const std::regex routed(
            "\\b" + calls + "\\s*\\(\\s*([^)\\n]{0,200},\\s*)?" + name + "\\b",
            std::regex::ECMAScript | std::regex::icase);
        std::smatch match;
        if (std::regex_search(snippet, match, routed)) {
            return ValidationResult::Rejected(
                "literal routed into a dynamic call",
                DangerReason("literal routed into a dynamic call (" + Quote(match.str(0)) + ")"));
        }
    }
    return ValidationResult::Ok();
}

}  // namespace snipguard::sandbox
