#include "risk.h"
#include "veto_util.h"

namespace veto {

std::string risk_to_string(RiskLevel r) {
    switch (r) {
        case RiskLevel::ALLOW:    return "ALLOW";
        case RiskLevel::LOW:      return "LOW";
        case RiskLevel::MEDIUM:   return "MEDIUM";
        case RiskLevel::HIGH:     return "HIGH";
        case RiskLevel::CRITICAL: return "CRITICAL";
    }
    return "CRITICAL";
}

std::string risk_config_key(RiskLevel r) {
    return lower_ascii(risk_to_string(r));
}

std::optional<RiskLevel> risk_from_string(const std::string& s) {
    const std::string u = upper_ascii(trim_ws(s));
    if (u == "ALLOW")    return RiskLevel::ALLOW;
    if (u == "LOW")      return RiskLevel::LOW;
    if (u == "MEDIUM")   return RiskLevel::MEDIUM;
    if (u == "HIGH")     return RiskLevel::HIGH;
    if (u == "CRITICAL") return RiskLevel::CRITICAL;
    return std::nullopt;
}

} // namespace veto
