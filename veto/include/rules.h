#pragma once
#include <string>
#include <vector>

#include "risk.h"

namespace veto {

/*
Rule set
========

Plain data, built once at startup from the built-in defaults with the user's
rules.toml appended, then treated as read-only.

Evaluation order is fixed:
  whitelist -> CRITICAL -> HIGH -> MEDIUM -> LOW -> default ALLOW

Within a tier rules are tried in declaration order (built-ins first), and
within a rule its patterns in order. The first match wins.

`patterns` apply to command strings; `paths` apply to file paths
(classify_path / `gate --file-op`). A rule may carry either or both.
*/

struct Rule {
    std::string category;
    std::vector<std::string> patterns;
    std::vector<std::string> paths;
    std::string reason;          // empty => verdict carries no reason
    bool challenge = false;
};

struct Whitelist {
    std::vector<std::string> commands;
    std::vector<std::string> paths;
};

struct RuleSet {
    Whitelist whitelist;
    std::vector<Rule> critical;
    std::vector<Rule> high;
    std::vector<Rule> medium;
    std::vector<Rule> low;

    // ALLOW has no tier: the const overload returns an empty list, the
    // mutable one throws std::invalid_argument.
    const std::vector<Rule>& tier(RiskLevel r) const;
    std::vector<Rule>& tier(RiskLevel r);
};

// Built-in rules shipped with veto.
RuleSet default_rules();

// Append custom tiers after `base` tiers; whitelist entries are unioned.
void merge_rules(RuleSet& base, const RuleSet& custom);

/*
Check every pattern and rule for things that would silently weaken gating:
- empty or control-character patterns
- a whitelist entry that matches everything
- rules without a category, or without any patterns and paths

Fails on the first problem (never skips a rule).
*/
bool validate_rule_set(const RuleSet& rs, std::string* err);

class RulesEngine {
public:
    explicit RulesEngine(RuleSet rules);

    // Pure: same input and rules => same verdict.
    Verdict classify(const std::string& command) const;
    Verdict classify_path(const std::string& path) const;

    const RuleSet& rules() const { return rules_; }

private:
    RuleSet rules_;
};

} // namespace veto
