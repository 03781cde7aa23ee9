#pragma once
#include <optional>
#include <string>

namespace veto {

// Totally ordered; the ordinal is also the `veto check` exit status.
enum class RiskLevel : int {
    ALLOW    = 0,
    LOW      = 1,
    MEDIUM   = 2,
    HIGH     = 3,
    CRITICAL = 4,
};

std::string risk_to_string(RiskLevel r);          // "ALLOW" .. "CRITICAL"
std::string risk_config_key(RiskLevel r);         // "allow" .. "critical"
std::optional<RiskLevel> risk_from_string(const std::string& s); // case-insensitive

/*
Verdict
=======

Result of classifying one command (or file path). Produced fresh per
evaluation; only ever persisted through the audit log.

For ALLOW verdicts category/reason describe why (whitelist vs. no match);
matched_pattern is set only when a tiered rule matched.
*/
struct Verdict {
    RiskLevel risk = RiskLevel::ALLOW;
    std::optional<std::string> category;
    std::optional<std::string> reason;
    std::optional<std::string> matched_pattern;

    // Matched rule demands challenge-response before method verification.
    bool challenge = false;
};

} // namespace veto
