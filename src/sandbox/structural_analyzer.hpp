#pragma once

#include <map>
#include <string>
#include <vector>

#include "sandbox/capability_allowlist.hpp"
#include "sandbox/static_validator.hpp"

namespace snipguard::sandbox {

// Allowlist pass over the snippet's syntax tree. Parses with the interpreter's own
// parser and never evaluates anything. Attributes read off a namespace must be one of
// its approved members; str.format and format_map only run on literal templates whose
// fields do not traverse attributes.
class StructuralAnalyzer {
public:
    explicit StructuralAnalyzer(CapabilitySet capabilities);

    ValidationResult Analyze(const std::string& snippet,
                             const std::vector<std::string>& context_names) const;

    static bool IsForbiddenAttribute(const std::string& name);

private:
    std::string UnavailableModule(const std::string& name) const;

    CapabilitySet capabilities_;
};

}  // namespace snipguard::sandbox
