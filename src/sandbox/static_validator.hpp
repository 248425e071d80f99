#pragma once

#include <regex>
#include <string>
#include <vector>

#include "config/config_schema.hpp"

namespace snipguard::sandbox {

struct ValidationResult {
    bool ok = true;
    std::string pattern;
    std::string reason;

    static ValidationResult Ok() { return {}; }
    static ValidationResult Rejected(std::string pattern, std::string reason) {
        return ValidationResult{false, std::move(pattern), std::move(reason)};
    }
};

// Text-level denylist. Known to be bypassable; StructuralAnalyzer is the second line.
class StaticValidator {
public:
    explicit StaticValidator(config::DenylistPolicy policy = config::DenylistPolicy::kStandard);

    ValidationResult Validate(const std::string& snippet) const;

    config::DenylistPolicy Policy() const { return policy_; }

private:
    struct DenyPattern {
        std::string text;
        std::string lowered;
    };

    struct ObfuscationRule {
        std::string label;
        std::regex pattern;
    };

    ValidationResult CheckAssignedLiteralRouting(const std::string& snippet) const;

    config::DenylistPolicy policy_;
    std::vector<DenyPattern> patterns_;
    std::vector<ObfuscationRule> rules_;
};

}  // namespace snipguard::sandbox
