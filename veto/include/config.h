#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "risk.h"
#include "rules.h"

namespace veto {

/*
Configuration
=============

Everything persistent lives under one root (see VetoPaths):

  <root>/config.toml     auth policy, fallbacks, per-method settings
  <root>/rules.toml      custom rules appended to the built-ins
  <root>/audit.log       one line per gate decision
  <root>/secrets/        encrypted secret files (only if no system keyring)
  <root>/sessions/       denied-command memory per gating session
  <root>/challenges/     pending challenge codes, one file per command hash

Missing config.toml / rules.toml means "defaults". A file that exists but
cannot be parsed, or that names an unknown auth method, is a hard error:
callers must deny rather than fall back to defaults.
*/

enum class AuthMethod : int {
    Confirm  = 0,
    Pin      = 1,
    Totp     = 2,
    TouchId  = 3,
    Telegram = 4,
    Dialog   = 5,
};

std::string auth_method_name(AuthMethod m); // "confirm", "pin", ...
std::optional<AuthMethod> auth_method_from_string(const std::string& s);

/*
AuthPolicy
----------
levels:   risk level -> ordered chain; every method must approve (AND).
fallback: method -> substitute, used when a method is unavailable or times out.
default_method: used for a level with no entry in `levels`.
*/
struct AuthPolicy {
    AuthMethod default_method = AuthMethod::Confirm;
    std::map<RiskLevel, std::vector<AuthMethod>> levels;
    std::map<AuthMethod, AuthMethod> fallback;

    // Chain for a risk level (never empty for a level > ALLOW).
    std::vector<AuthMethod> chain_for(RiskLevel r) const;
};

struct TouchIdConfig {
    bool enabled = false;
    std::string prompt = "veto: approve running this command?";
};

struct TelegramConfig {
    bool enabled = false;
    std::string chat_id;
    int timeout_seconds = 60;
};

struct TotpConfig {
    bool enabled = false;
    std::string issuer = "veto";
};

struct VetoConfig {
    AuthPolicy policy;
    TouchIdConfig touchid;
    TelegramConfig telegram;
    TotpConfig totp;
};

struct VetoPaths {
    std::string root;
    std::string config_toml;
    std::string rules_toml;
    std::string audit_log;
    std::string secrets_dir;
    std::string sessions_dir;
    std::string challenges_dir;

    static VetoPaths from_root(const std::string& root);
    static VetoPaths from_env(); // veto_home_dir()
};

enum class ConfigRc : int {
    OK = 0,

    IO = 10,

    PARSE = 20,
    SCHEMA = 21,
    UNKNOWN_METHOD = 22,
    UNKNOWN_LEVEL = 23,

    BAD_PATTERN = 30,

    INTERNAL = 99,
};

struct ConfigResult {
    bool ok = false;
    ConfigRc rc = ConfigRc::INTERNAL;
    std::string detail; // includes file name / key, never secret values
};

ConfigResult parse_config_toml(const std::string& text, VetoConfig& out);
ConfigResult load_config_file(const std::string& path, VetoConfig& out);

// Custom rules only (no built-ins, not validated).
ConfigResult parse_rules_toml(const std::string& text, RuleSet& out);

// Built-ins + rules.toml (if present), validated.
ConfigResult load_rules_file(const std::string& path, RuleSet& out);

} // namespace veto
