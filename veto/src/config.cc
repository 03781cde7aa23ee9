#include "config.h"
#include "veto_util.h"

#include <filesystem>
#include <string_view>

#include <toml++/toml.hpp>

namespace veto {

using NodeView = toml::node_view<const toml::node>;

static ConfigResult fail(ConfigRc rc, std::string detail) {
    ConfigResult r;
    r.ok = false;
    r.rc = rc;
    r.detail = std::move(detail);
    return r;
}

static ConfigResult ok_result() {
    ConfigResult r;
    r.ok = true;
    r.rc = ConfigRc::OK;
    return r;
}

std::string auth_method_name(AuthMethod m) {
    switch (m) {
        case AuthMethod::Confirm:  return "confirm";
        case AuthMethod::Pin:      return "pin";
        case AuthMethod::Totp:     return "totp";
        case AuthMethod::TouchId:  return "touchid";
        case AuthMethod::Telegram: return "telegram";
        case AuthMethod::Dialog:   return "dialog";
    }
    return "confirm";
}

std::optional<AuthMethod> auth_method_from_string(const std::string& s) {
    const std::string k = lower_ascii(trim_ws(s));
    if (k == "confirm")  return AuthMethod::Confirm;
    if (k == "pin")      return AuthMethod::Pin;
    if (k == "totp")     return AuthMethod::Totp;
    if (k == "touchid")  return AuthMethod::TouchId;
    if (k == "telegram") return AuthMethod::Telegram;
    if (k == "dialog")   return AuthMethod::Dialog;
    return std::nullopt;
}

std::vector<AuthMethod> AuthPolicy::chain_for(RiskLevel r) const {
    auto it = levels.find(r);
    if (it != levels.end() && !it->second.empty()) return it->second;
    return {default_method};
}

VetoPaths VetoPaths::from_root(const std::string& root) {
    namespace fs = std::filesystem;
    const fs::path p(root);
    VetoPaths v;
    v.root           = root;
    v.config_toml    = (p / "config.toml").string();
    v.rules_toml     = (p / "rules.toml").string();
    v.audit_log      = (p / "audit.log").string();
    v.secrets_dir    = (p / "secrets").string();
    v.sessions_dir   = (p / "sessions").string();
    v.challenges_dir = (p / "challenges").string();
    return v;
}

VetoPaths VetoPaths::from_env() {
    return from_root(veto_home_dir());
}

// -----------------------------------------------------------------------------
// config.toml
// -----------------------------------------------------------------------------

static ConfigResult parse_method(const toml::node& n, const std::string& key, AuthMethod& out) {
    auto s = n.value<std::string>();
    if (!s) return fail(ConfigRc::SCHEMA, key + ": expected a method name string");
    auto m = auth_method_from_string(*s);
    if (!m) return fail(ConfigRc::UNKNOWN_METHOD, key + ": unknown auth method '" + *s + "'");
    out = *m;
    return ok_result();
}

// A level accepts a single method or an array (AND-chain).
static ConfigResult parse_chain(const toml::node& n, const std::string& key, std::vector<AuthMethod>& out) {
    out.clear();
    if (n.is_string()) {
        AuthMethod m{};
        ConfigResult r = parse_method(n, key, m);
        if (!r.ok) return r;
        out.push_back(m);
        return ok_result();
    }
    const toml::array* arr = n.as_array();
    if (!arr) return fail(ConfigRc::SCHEMA, key + ": expected string or array of strings");
    if (arr->empty()) return fail(ConfigRc::SCHEMA, key + ": empty method chain");

    size_t i = 0;
    for (const toml::node& el : *arr) {
        AuthMethod m{};
        ConfigResult r = parse_method(el, key + "[" + std::to_string(i++) + "]", m);
        if (!r.ok) return r;
        out.push_back(m);
    }
    return ok_result();
}

static ConfigResult read_bool(NodeView v, const std::string& key, bool& out) {
    if (!v) return ok_result();
    auto b = v.value<bool>();
    if (!v.is_boolean() || !b) return fail(ConfigRc::SCHEMA, key + ": expected boolean");
    out = *b;
    return ok_result();
}

static ConfigResult read_string(NodeView v, const std::string& key, std::string& out) {
    if (!v) return ok_result();
    if (!v.is_string()) return fail(ConfigRc::SCHEMA, key + ": expected string");
    out = v.value<std::string>().value_or("");
    return ok_result();
}

static ConfigResult parse_auth(const toml::table& auth, VetoConfig& cfg) {
    ConfigResult r;

    if (auto d = auth["default"]; d) {
        r = parse_method(*d.node(), "auth.default", cfg.policy.default_method);
        if (!r.ok) return r;
    }

    if (auto lv = auth["levels"]; lv) {
        const toml::table* t = lv.as_table();
        if (!t) return fail(ConfigRc::SCHEMA, "auth.levels: expected table");
        for (auto&& [k, node] : *t) {
            const std::string level_key(k.str());
            auto level = risk_from_string(level_key);
            if (!level || *level == RiskLevel::ALLOW) {
                return fail(ConfigRc::UNKNOWN_LEVEL, "auth.levels: unknown risk level '" + level_key + "'");
            }
            std::vector<AuthMethod> chain;
            r = parse_chain(node, "auth.levels." + level_key, chain);
            if (!r.ok) return r;
            cfg.policy.levels[*level] = std::move(chain);
        }
    }

    if (auto fb = auth["fallback"]; fb) {
        const toml::table* t = fb.as_table();
        if (!t) return fail(ConfigRc::SCHEMA, "auth.fallback: expected table");
        for (auto&& [k, node] : *t) {
            const std::string from_key(k.str());
            auto from = auth_method_from_string(from_key);
            if (!from) return fail(ConfigRc::UNKNOWN_METHOD, "auth.fallback: unknown auth method '" + from_key + "'");
            AuthMethod to{};
            r = parse_method(node, "auth.fallback." + from_key, to);
            if (!r.ok) return r;
            if (to == *from) return fail(ConfigRc::SCHEMA, "auth.fallback." + from_key + ": falls back to itself");
            cfg.policy.fallback[*from] = to;
        }
    }

    if (auto ti = auth["touchid"]; ti) {
        if (!ti.is_table()) return fail(ConfigRc::SCHEMA, "auth.touchid: expected table");
        if (!(r = read_bool(ti["enabled"], "auth.touchid.enabled", cfg.touchid.enabled)).ok) return r;
        if (!(r = read_string(ti["prompt"], "auth.touchid.prompt", cfg.touchid.prompt)).ok) return r;
    }

    if (auto tg = auth["telegram"]; tg) {
        if (!tg.is_table()) return fail(ConfigRc::SCHEMA, "auth.telegram: expected table");
        if (!(r = read_bool(tg["enabled"], "auth.telegram.enabled", cfg.telegram.enabled)).ok) return r;

        // chat ids are numeric in the Bot API but people write them either way.
        if (auto cid = tg["chat_id"]; cid) {
            if (cid.is_string()) cfg.telegram.chat_id = cid.value<std::string>().value_or("");
            else if (cid.is_integer()) cfg.telegram.chat_id = std::to_string(cid.value<int64_t>().value_or(0));
            else return fail(ConfigRc::SCHEMA, "auth.telegram.chat_id: expected string or integer");
        }

        if (auto to = tg["timeout_seconds"]; to) {
            auto n = to.value<int64_t>();
            if (!to.is_integer() || !n) return fail(ConfigRc::SCHEMA, "auth.telegram.timeout_seconds: expected integer");
            if (*n <= 0 || *n > 3600) return fail(ConfigRc::SCHEMA, "auth.telegram.timeout_seconds: out of range (1..3600)");
            cfg.telegram.timeout_seconds = (int)*n;
        }
    }

    if (auto tp = auth["totp"]; tp) {
        if (!tp.is_table()) return fail(ConfigRc::SCHEMA, "auth.totp: expected table");
        if (!(r = read_bool(tp["enabled"], "auth.totp.enabled", cfg.totp.enabled)).ok) return r;
        if (!(r = read_string(tp["issuer"], "auth.totp.issuer", cfg.totp.issuer)).ok) return r;
    }

    return ok_result();
}

ConfigResult parse_config_toml(const std::string& text, VetoConfig& out) {
    toml::table parsed;
    try {
        parsed = toml::parse(std::string_view(text));
    } catch (const toml::parse_error& e) {
        return fail(ConfigRc::PARSE,
                    std::string(e.description()) + " (line " + std::to_string(e.source().begin.line) + ")");
    }

    const toml::table& root = parsed;
    VetoConfig cfg;
    if (auto a = root["auth"]; a) {
        const toml::table* t = a.as_table();
        if (!t) return fail(ConfigRc::SCHEMA, "auth: expected table");
        ConfigResult r = parse_auth(*t, cfg);
        if (!r.ok) return r;
    }

    out = std::move(cfg);
    return ok_result();
}

static bool file_exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

ConfigResult load_config_file(const std::string& path, VetoConfig& out) {
    if (!file_exists(path)) {
        out = VetoConfig{};
        return ok_result();
    }

    std::string text;
    if (!read_file(path, text)) return fail(ConfigRc::IO, "cannot read " + path);

    ConfigResult r = parse_config_toml(text, out);
    if (!r.ok) r.detail = path + ": " + r.detail;
    return r;
}

// -----------------------------------------------------------------------------
// rules.toml
// -----------------------------------------------------------------------------

static ConfigResult read_string_list(NodeView v, const std::string& key, std::vector<std::string>& out) {
    out.clear();
    if (!v) return ok_result();
    const toml::array* arr = v.as_array();
    if (!arr) return fail(ConfigRc::SCHEMA, key + ": expected array of strings");
    for (const toml::node& el : *arr) {
        auto s = el.value<std::string>();
        if (!el.is_string() || !s) return fail(ConfigRc::SCHEMA, key + ": expected array of strings");
        out.push_back(*s);
    }
    return ok_result();
}

static ConfigResult parse_rule_tier(const toml::table& root, RiskLevel level, std::vector<Rule>& out) {
    const std::string tier = risk_config_key(level);
    auto v = root[tier];
    if (!v) return ok_result();

    const toml::array* arr = v.as_array();
    if (!arr) return fail(ConfigRc::SCHEMA, tier + ": expected array of tables ([[" + tier + "]])");

    size_t i = 0;
    for (const toml::node& el : *arr) {
        const std::string key = tier + "[" + std::to_string(i++) + "]";
        const toml::table* t = el.as_table();
        if (!t) return fail(ConfigRc::SCHEMA, key + ": expected table");

        Rule rule;
        ConfigResult r;
        if (!(r = read_string((*t)["category"], key + ".category", rule.category)).ok) return r;
        if (!(r = read_string_list((*t)["patterns"], key + ".patterns", rule.patterns)).ok) return r;
        if (!(r = read_string_list((*t)["paths"], key + ".paths", rule.paths)).ok) return r;
        if (!(r = read_string((*t)["reason"], key + ".reason", rule.reason)).ok) return r;
        if (!(r = read_bool((*t)["challenge"], key + ".challenge", rule.challenge)).ok) return r;
        out.push_back(std::move(rule));
    }
    return ok_result();
}

ConfigResult parse_rules_toml(const std::string& text, RuleSet& out) {
    toml::table parsed;
    try {
        parsed = toml::parse(std::string_view(text));
    } catch (const toml::parse_error& e) {
        return fail(ConfigRc::PARSE,
                    std::string(e.description()) + " (line " + std::to_string(e.source().begin.line) + ")");
    }

    const toml::table& root = parsed;
    RuleSet rs;
    ConfigResult r;

    if (auto wl = root["whitelist"]; wl) {
        if (!wl.is_table()) return fail(ConfigRc::SCHEMA, "whitelist: expected table");
        if (!(r = read_string_list(wl["commands"], "whitelist.commands", rs.whitelist.commands)).ok) return r;
        if (!(r = read_string_list(wl["paths"], "whitelist.paths", rs.whitelist.paths)).ok) return r;
    }

    for (RiskLevel lvl : {RiskLevel::CRITICAL, RiskLevel::HIGH, RiskLevel::MEDIUM, RiskLevel::LOW}) {
        if (!(r = parse_rule_tier(root, lvl, rs.tier(lvl))).ok) return r;
    }

    out = std::move(rs);
    return ok_result();
}

ConfigResult load_rules_file(const std::string& path, RuleSet& out) {
    RuleSet merged = default_rules();

    if (file_exists(path)) {
        std::string text;
        if (!read_file(path, text)) return fail(ConfigRc::IO, "cannot read " + path);

        RuleSet custom;
        ConfigResult r = parse_rules_toml(text, custom);
        if (!r.ok) {
            r.detail = path + ": " + r.detail;
            return r;
        }
        merge_rules(merged, custom);
    }

    std::string err;
    if (!validate_rule_set(merged, &err)) {
        return fail(ConfigRc::BAD_PATTERN, path + ": " + err);
    }

    out = std::move(merged);
    return ok_result();
}

} // namespace veto
