#include "rules.h"
#include "glob_match.h"

#include <set>
#include <stdexcept>

namespace veto {

static const std::vector<Rule> kNoRules;

const std::vector<Rule>& RuleSet::tier(RiskLevel r) const {
    switch (r) {
        case RiskLevel::CRITICAL: return critical;
        case RiskLevel::HIGH:     return high;
        case RiskLevel::MEDIUM:   return medium;
        case RiskLevel::LOW:      return low;
        case RiskLevel::ALLOW:    break;
    }
    return kNoRules;
}

std::vector<Rule>& RuleSet::tier(RiskLevel r) {
    switch (r) {
        case RiskLevel::CRITICAL: return critical;
        case RiskLevel::HIGH:     return high;
        case RiskLevel::MEDIUM:   return medium;
        case RiskLevel::LOW:      return low;
        case RiskLevel::ALLOW:    break;
    }
    throw std::invalid_argument("ALLOW has no rule tier");
}

static void union_into(std::vector<std::string>& dst, const std::vector<std::string>& src) {
    std::set<std::string> seen(dst.begin(), dst.end());
    for (const auto& s : src) {
        if (seen.insert(s).second) dst.push_back(s);
    }
}

void merge_rules(RuleSet& base, const RuleSet& custom) {
    union_into(base.whitelist.commands, custom.whitelist.commands);
    union_into(base.whitelist.paths, custom.whitelist.paths);

    for (RiskLevel r : {RiskLevel::CRITICAL, RiskLevel::HIGH, RiskLevel::MEDIUM, RiskLevel::LOW}) {
        auto& dst = base.tier(r);
        const auto& src = custom.tier(r);
        dst.insert(dst.end(), src.begin(), src.end());
    }
}

bool validate_rule_set(const RuleSet& rs, std::string* err) {
    std::string e;

    auto check_whitelist = [&](const std::vector<std::string>& pats, const char* what) -> bool {
        for (const auto& p : pats) {
            if (!validate_pattern(p, &e)) {
                if (err) *err = std::string("whitelist ") + what + ": " + e;
                return false;
            }
            if (pattern_matches_everything(p)) {
                if (err) *err = std::string("whitelist ") + what + ": pattern '" + p + "' matches everything";
                return false;
            }
        }
        return true;
    };

    if (!check_whitelist(rs.whitelist.commands, "commands")) return false;
    if (!check_whitelist(rs.whitelist.paths, "paths")) return false;

    for (RiskLevel r : {RiskLevel::CRITICAL, RiskLevel::HIGH, RiskLevel::MEDIUM, RiskLevel::LOW}) {
        const std::string tier_name = risk_config_key(r);
        for (const auto& rule : rs.tier(r)) {
            if (rule.category.empty()) {
                if (err) *err = tier_name + ": rule without category";
                return false;
            }
            if (rule.patterns.empty() && rule.paths.empty()) {
                if (err) *err = tier_name + "/" + rule.category + ": rule has no patterns or paths";
                return false;
            }
            for (const auto* list : {&rule.patterns, &rule.paths}) {
                for (const auto& p : *list) {
                    if (!validate_pattern(p, &e)) {
                        if (err) *err = tier_name + "/" + rule.category + ": " + e;
                        return false;
                    }
                }
            }
        }
    }
    return true;
}

RulesEngine::RulesEngine(RuleSet rules) : rules_(std::move(rules)) {}

// Shared by command and path classification; only the pattern lists differ.
template <typename PatternsOf>
static Verdict evaluate(const RuleSet& rs,
                        const std::vector<std::string>& whitelist,
                        PatternsOf patterns_of,
                        const std::string& subject) {
    for (const auto& w : whitelist) {
        if (glob_match(w, subject)) {
            Verdict v;
            v.risk = RiskLevel::ALLOW;
            v.category = "whitelist";
            v.reason = "Command is whitelisted";
            return v;
        }
    }

    for (RiskLevel r : {RiskLevel::CRITICAL, RiskLevel::HIGH, RiskLevel::MEDIUM, RiskLevel::LOW}) {
        for (const auto& rule : rs.tier(r)) {
            for (const auto& p : patterns_of(rule)) {
                if (!glob_match(p, subject)) continue;

                Verdict v;
                v.risk = r;
                v.category = rule.category;
                if (!rule.reason.empty()) v.reason = rule.reason;
                v.matched_pattern = p;
                v.challenge = rule.challenge;
                return v;
            }
        }
    }

    Verdict v;
    v.risk = RiskLevel::ALLOW;
    v.reason = "No matching rules";
    return v;
}

Verdict RulesEngine::classify(const std::string& command) const {
    return evaluate(rules_, rules_.whitelist.commands,
                    [](const Rule& r) -> const std::vector<std::string>& { return r.patterns; },
                    command);
}

Verdict RulesEngine::classify_path(const std::string& path) const {
    return evaluate(rules_, rules_.whitelist.paths,
                    [](const Rule& r) -> const std::vector<std::string>& { return r.paths; },
                    path);
}

} // namespace veto
