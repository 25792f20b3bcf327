#pragma once

#include "tutorgate/gateway/core.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace tutorgate {
namespace gateway {

// Violation categories
constexpr const char* kFilesystemEscape = "filesystem_escape";
constexpr const char* kNetworking = "networking";
constexpr const char* kProcessControl = "process_control";
constexpr const char* kNotAllowed = "not_allowed";
constexpr const char* kTooLarge = "too_large";
constexpr const char* kEmptySource = "empty_source";

// Deny/allow rules for one language
struct PolicyRule {
    std::unordered_map<std::string, std::string> denied;  // symbol -> category
    std::unordered_set<std::string> allowed;              // empty = no allowlist
    size_t max_source_chars = 10000;
};

/**
 * Immutable set of per-language rules.
 *
 * Policy file format (each language section is optional and replaces the
 * built-in rule for that language):
 *
 *   {
 *     "python": {
 *       "max_source_chars": 10000,
 *       "deny": { "networking": ["socket", "requests"] },
 *       "allow": []
 *     }
 *   }
 */
class PolicyRuleSet {
public:
    static PolicyRuleSet defaults(size_t max_source_chars = 10000, bool strict_allowlist = false);
    static caf::expected<PolicyRuleSet> from_json(const nlohmann::json& document, const PolicyRuleSet& base);
    static caf::expected<PolicyRuleSet> load_file(const std::string& path, const PolicyRuleSet& base);

    const PolicyRule& rule_for(Language language) const;

private:
    std::map<Language, PolicyRule> rules_;
};

/**
 * Policy Validator
 *
 * Static pre-execution screening. Each language gets a small lexer that
 * skips comments and string literals, so a denied name inside a string or a
 * comment is not a violation, while imports, module loaders and bare calls
 * are resolved to the symbol they name. Pure and thread-safe.
 */
class PolicyValidator {
public:
    explicit PolicyValidator(std::shared_ptr<const PolicyRuleSet> rules);

    PolicyVerdict validate(Language language, const std::string& source) const;

    const PolicyRuleSet& rules() const { return *rules_; }

private:
    std::shared_ptr<const PolicyRuleSet> rules_;
};

} // namespace gateway
} // namespace tutorgate
