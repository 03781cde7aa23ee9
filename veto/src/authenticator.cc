#include "authenticator.h"
#include "pin.h"
#include "totp.h"
#include "veto_util.h"

#include <iostream>
#include <set>

#include <sodium.h>

namespace veto {

AuthOutcome AuthOutcome::approved(AuthMethod m) {
    AuthOutcome o;
    o.kind = AuthOutcomeKind::Approved;
    o.method = m;
    return o;
}

AuthOutcome AuthOutcome::denied(std::optional<AuthMethod> m, AuthFailure f, std::string reason) {
    AuthOutcome o;
    o.kind = AuthOutcomeKind::Denied;
    o.method = m;
    o.failure = f;
    o.explicit_denial = (f == AuthFailure::USER_DECLINED || f == AuthFailure::BAD_CREDENTIAL ||
                         f == AuthFailure::CHALLENGE_FAILED || f == AuthFailure::REMOTE_DENIED);
    o.reason = std::move(reason);
    return o;
}

AuthOutcome AuthOutcome::needs_input(AuthMethod m, std::string reason) {
    AuthOutcome o;
    o.kind = AuthOutcomeKind::NeedsInput;
    o.method = m;
    o.reason = std::move(reason);
    return o;
}

bool failure_allows_fallback(AuthFailure f) {
    return f == AuthFailure::METHOD_UNAVAILABLE ||
           f == AuthFailure::NOT_CONFIGURED ||
           f == AuthFailure::TIMEOUT;
}

static void wipe(std::string& s) {
    sodium_memzero(s.data(), s.size());
    s.clear();
}

Authenticator::Authenticator(const VetoConfig& cfg,
                             SecretStore& secrets,
                             AuthPrompter& prompter,
                             ChallengeManager* challenges)
    : cfg_(cfg), secrets_(secrets), prompter_(prompter), challenges_(challenges) {}

AuthOutcome Authenticator::authenticate(RiskLevel level, const CommandContext& ctx) {
    return authenticate(level, cfg_.policy, ctx);
}

// PIN + code when any step is a pin step, else the code alone.
static std::optional<AuthMethod> challenge_method_for(const std::vector<AuthMethod>& chain) {
    std::optional<AuthMethod> m;
    for (AuthMethod c : chain) {
        if (c == AuthMethod::Pin) return c;
        if (!m && challenge_applies(c)) m = c;
    }
    return m;
}

AuthOutcome Authenticator::authenticate(RiskLevel level, const AuthPolicy& policy, const CommandContext& ctx) {
    if (ctx.denied && !ctx.force && ctx.denied->is_denied(ctx.command)) {
        return AuthOutcome::denied(std::nullopt, AuthFailure::PREVIOUSLY_DENIED,
                                   "Command was already denied in this session");
    }

    const std::vector<AuthMethod> chain =
        ctx.method_override ? std::vector<AuthMethod>{*ctx.method_override} : policy.chain_for(level);

    auto finish_denied = [&](AuthOutcome o) {
        if (o.explicit_denial && ctx.denied) {
            std::string err;
            if (!ctx.denied->remember(ctx.command, &err)) {
                std::cerr << "[auth] WARNING: cannot record denial: " << err << std::endl;
            }
        }
        return o;
    };

    ChallengeState cs;
    if (ctx.verdict.challenge) {
        if (auto cm = challenge_method_for(chain)) {
            AuthOutcome o = verify_challenge_(*cm, ctx);
            if (o.kind == AuthOutcomeKind::Approved) {
                cs.answered_by = *cm;
            } else if (o.kind != AuthOutcomeKind::Denied || !failure_allows_fallback(o.failure)) {
                return finish_denied(std::move(o));
            }
            // Otherwise (e.g. no PIN set) the chain's fallbacks take over.
        }
    }

    AuthOutcome last;
    for (AuthMethod m : chain) {
        last = run_with_fallback_(m, policy, ctx, cs);
        if (last.kind == AuthOutcomeKind::Approved) continue;
        return finish_denied(std::move(last));
    }

    if (ctx.force && ctx.denied) {
        std::string err;
        if (!ctx.denied->forget(ctx.command, &err)) {
            std::cerr << "[auth] WARNING: cannot clear denial: " << err << std::endl;
        }
    }
    return last;
}

AuthOutcome Authenticator::run_with_fallback_(AuthMethod first, const AuthPolicy& policy, const CommandContext& ctx,
                                              ChallengeState& cs) {
    std::set<AuthMethod> visited;
    AuthMethod m = first;

    for (;;) {
        visited.insert(m);
        AuthOutcome o = verify_method_(m, ctx, cs);
        if (o.kind != AuthOutcomeKind::Denied || !failure_allows_fallback(o.failure)) return o;

        auto fb = policy.fallback.find(m);
        if (fb == policy.fallback.end() || visited.count(fb->second)) return o;

        std::cerr << "[auth] " << auth_method_name(m) << ": " << o.reason
                  << "; falling back to " << auth_method_name(fb->second) << std::endl;
        m = fb->second;
    }
}

bool Authenticator::method_available(AuthMethod m, std::string* why) {
    auto no = [&](const std::string& w) {
        if (why) *why = w;
        return false;
    };
    switch (m) {
        case AuthMethod::Confirm:
            return true;
        case AuthMethod::Pin:
            return secrets_.has(kSecretPin) || no("PIN is not set (run: veto auth set-pin)");
        case AuthMethod::Totp:
            if (!cfg_.totp.enabled) return no("TOTP is disabled in config");
            return secrets_.has(kSecretTotpSeed) || no("TOTP is not set up (run: veto auth setup-totp)");
        case AuthMethod::TouchId:
            if (!cfg_.touchid.enabled) return no("Touch ID is disabled in config");
            return prompter_.touchid_available() || no("Touch ID is not available on this host");
        case AuthMethod::Telegram:
            if (!cfg_.telegram.enabled) return no("Telegram is disabled in config");
            if (cfg_.telegram.chat_id.empty()) return no("Telegram chat_id is not configured");
            return secrets_.has(kSecretTelegramToken) || no("Telegram bot token is not set (run: veto auth setup-telegram)");
        case AuthMethod::Dialog:
            return prompter_.dialog_available() || no("No dialog facility on this host");
    }
    return no("unknown method");
}

AuthOutcome Authenticator::verify_method_(AuthMethod m, const CommandContext& ctx, ChallengeState& cs) {
    if (ctx.verdict.challenge && challenge_applies(m)) {
        if (!cs.answered_by) {
            // Not answered before the chain: reached through a fallback.
            AuthOutcome o = verify_challenge_(m, ctx);
            if (o.kind == AuthOutcomeKind::Approved) cs.answered_by = m;
            return o;
        }
        // Relaying the code is the confirmation; a PIN + code answer also proved the PIN.
        if (m == AuthMethod::Confirm || *cs.answered_by == AuthMethod::Pin) return AuthOutcome::approved(m);
    }

    switch (m) {
        case AuthMethod::Confirm:  return verify_confirm_(ctx);
        case AuthMethod::Pin:      return verify_pin_(ctx);
        case AuthMethod::Totp:     return verify_totp_(ctx);
        case AuthMethod::TouchId:  return verify_touchid_(ctx);
        case AuthMethod::Telegram: return verify_telegram_(ctx);
        case AuthMethod::Dialog:   return verify_dialog_(ctx);
    }
    return AuthOutcome::denied(m, AuthFailure::INTERNAL, "unknown auth method");
}

static std::string risk_line(const CommandContext& ctx) {
    std::string s = risk_to_string(ctx.verdict.risk);
    if (ctx.verdict.reason) s += ": " + *ctx.verdict.reason;
    return s;
}

AuthOutcome Authenticator::verify_confirm_(const CommandContext& ctx) {
    if (ctx.confirm) return AuthOutcome::approved(AuthMethod::Confirm);

    if (ctx.interactive) {
        auto yes = prompter_.confirm("[" + risk_line(ctx) + "] Run `" + ctx.command + "`? [y/N] ");
        if (yes) {
            if (*yes) return AuthOutcome::approved(AuthMethod::Confirm);
            return AuthOutcome::denied(AuthMethod::Confirm, AuthFailure::USER_DECLINED, "Declined by user");
        }
        return AuthOutcome::denied(AuthMethod::Confirm, AuthFailure::NO_TERMINAL, "No terminal to confirm on");
    }
    return AuthOutcome::needs_input(AuthMethod::Confirm, "Confirmation required");
}

AuthOutcome Authenticator::verify_pin_(const CommandContext& ctx) {
    PinRecord rec;
    SecretResult sr = pin_load(secrets_, rec);
    if (sr.rc == SecretRc::NOT_FOUND) {
        return AuthOutcome::denied(AuthMethod::Pin, AuthFailure::NOT_CONFIGURED, "PIN is not set");
    }
    if (!sr.ok) {
        std::cerr << "[auth] PIN record: " << secret_rc_name(sr.rc) << ": " << sr.detail << std::endl;
        return AuthOutcome::denied(AuthMethod::Pin, AuthFailure::SECRET_ERROR, "PIN record unreadable");
    }

    std::string candidate;
    if (ctx.pin) {
        candidate = *ctx.pin;
    } else if (ctx.interactive) {
        auto entered = prompter_.read_secret("Enter PIN: ");
        if (!entered) return AuthOutcome::denied(AuthMethod::Pin, AuthFailure::NO_TERMINAL, "No terminal to read PIN from");
        candidate = std::move(*entered);
    } else {
        return AuthOutcome::needs_input(AuthMethod::Pin, "PIN required");
    }

    const bool ok = pin_verify(candidate, rec);
    wipe(candidate);
    if (ok) return AuthOutcome::approved(AuthMethod::Pin);
    return AuthOutcome::denied(AuthMethod::Pin, AuthFailure::BAD_CREDENTIAL, "Incorrect PIN");
}

AuthOutcome Authenticator::verify_totp_(const CommandContext& ctx) {
    if (!cfg_.totp.enabled) {
        return AuthOutcome::denied(AuthMethod::Totp, AuthFailure::NOT_CONFIGURED, "TOTP is disabled in config");
    }
    std::vector<unsigned char> key;
    SecretResult sr = totp_load_seed(secrets_, key);
    if (sr.rc == SecretRc::NOT_FOUND) {
        return AuthOutcome::denied(AuthMethod::Totp, AuthFailure::NOT_CONFIGURED, "TOTP is not set up");
    }
    if (!sr.ok) {
        std::cerr << "[auth] TOTP seed: " << secret_rc_name(sr.rc) << ": " << sr.detail << std::endl;
        return AuthOutcome::denied(AuthMethod::Totp, AuthFailure::SECRET_ERROR, "TOTP seed unreadable");
    }

    std::string code;
    if (ctx.totp) {
        code = *ctx.totp;
    } else if (ctx.interactive) {
        auto entered = prompter_.read_secret("Enter TOTP code: ");
        if (!entered) {
            sodium_memzero(key.data(), key.size());
            return AuthOutcome::denied(AuthMethod::Totp, AuthFailure::NO_TERMINAL, "No terminal to read TOTP code from");
        }
        code = std::move(*entered);
    } else {
        sodium_memzero(key.data(), key.size());
        return AuthOutcome::needs_input(AuthMethod::Totp, "TOTP code required");
    }

    const std::int64_t now = now_unix_sec > 0 ? now_unix_sec : (std::int64_t)now_epoch();
    const bool ok = totp_verify(key, code, now, 1);
    sodium_memzero(key.data(), key.size());
    if (ok) return AuthOutcome::approved(AuthMethod::Totp);
    return AuthOutcome::denied(AuthMethod::Totp, AuthFailure::BAD_CREDENTIAL, "Invalid TOTP code");
}

AuthOutcome Authenticator::from_interaction_(AuthMethod m, const InteractionResult& r) {
    const std::string name = auth_method_name(m);
    switch (r.status) {
        case Interaction::Approved:
            return AuthOutcome::approved(m);
        case Interaction::Denied:
            return AuthOutcome::denied(m, m == AuthMethod::Telegram ? AuthFailure::REMOTE_DENIED : AuthFailure::USER_DECLINED,
                                       r.detail.empty() ? "Denied via " + name : r.detail);
        case Interaction::TimedOut:
            return AuthOutcome::denied(m, AuthFailure::TIMEOUT,
                                       r.detail.empty() ? name + " timed out" : r.detail);
        case Interaction::Unavailable:
            return AuthOutcome::denied(m, AuthFailure::METHOD_UNAVAILABLE,
                                       r.detail.empty() ? name + " unavailable" : r.detail);
        case Interaction::Error:
            break;
    }
    return AuthOutcome::denied(m, AuthFailure::INTERNAL, name + " failed: " + r.detail);
}

AuthOutcome Authenticator::verify_touchid_(const CommandContext& ctx) {
    std::string why;
    if (!method_available(AuthMethod::TouchId, &why)) {
        return AuthOutcome::denied(AuthMethod::TouchId, AuthFailure::METHOD_UNAVAILABLE, why);
    }
    return from_interaction_(AuthMethod::TouchId,
                             prompter_.touchid(cfg_.touchid.prompt + "\n" + shorten(ctx.command, 120)));
}

AuthOutcome Authenticator::verify_telegram_(const CommandContext& ctx) {
    if (!cfg_.telegram.enabled || cfg_.telegram.chat_id.empty()) {
        return AuthOutcome::denied(AuthMethod::Telegram, AuthFailure::NOT_CONFIGURED, "Telegram is not configured");
    }

    std::string token;
    SecretResult sr = secrets_.load(kSecretTelegramToken, token);
    if (sr.rc == SecretRc::NOT_FOUND) {
        return AuthOutcome::denied(AuthMethod::Telegram, AuthFailure::NOT_CONFIGURED, "Telegram bot token is not set");
    }
    if (!sr.ok) {
        std::cerr << "[auth] Telegram token: " << secret_rc_name(sr.rc) << ": " << sr.detail << std::endl;
        return AuthOutcome::denied(AuthMethod::Telegram, AuthFailure::SECRET_ERROR, "Telegram token unreadable");
    }

    InteractionResult r = prompter_.telegram(token, cfg_.telegram.chat_id, ctx.command, ctx.verdict,
                                             cfg_.telegram.timeout_seconds);
    wipe(token);
    return from_interaction_(AuthMethod::Telegram, r);
}

AuthOutcome Authenticator::verify_dialog_(const CommandContext& ctx) {
    if (!prompter_.dialog_available()) {
        return AuthOutcome::denied(AuthMethod::Dialog, AuthFailure::METHOD_UNAVAILABLE, "No dialog facility on this host");
    }
    const std::string msg = risk_line(ctx) + "\n\n" + shorten(ctx.command, 200) + "\n\nAllow this command?";
    return from_interaction_(AuthMethod::Dialog, prompter_.dialog("veto", msg));
}

AuthOutcome Authenticator::verify_challenge_(AuthMethod m, const CommandContext& ctx) {
    if (!challenges_) {
        return AuthOutcome::denied(m, AuthFailure::INTERNAL, "Challenge-response is required but unavailable");
    }

    PinRecord rec;
    if (m == AuthMethod::Pin) {
        SecretResult sr = pin_load(secrets_, rec);
        if (sr.rc == SecretRc::NOT_FOUND) {
            return AuthOutcome::denied(m, AuthFailure::NOT_CONFIGURED, "PIN is not set");
        }
        if (!sr.ok) {
            std::cerr << "[auth] PIN record: " << secret_rc_name(sr.rc) << ": " << sr.detail << std::endl;
            return AuthOutcome::denied(m, AuthFailure::SECRET_ERROR, "PIN record unreadable");
        }
    }

    std::string response;
    if (ctx.response) {
        response = *ctx.response;
    } else {
        ChallengeResult issued = challenges_->issue(ctx.command);
        if (!issued.ok) {
            std::cerr << "[challenge] " << issued.detail << std::endl;
            return AuthOutcome::denied(m, AuthFailure::CHALLENGE_DELIVERY,
                                       "Could not deliver challenge code: " + issued.detail);
        }

        const std::string ask = (m == AuthMethod::Pin)
            ? "Challenge code sent. Enter PIN followed by the code: "
            : "Challenge code sent. Enter the code: ";

        if (!ctx.interactive) {
            AuthOutcome o = AuthOutcome::needs_input(m, m == AuthMethod::Pin
                ? "PIN and challenge code required"
                : "Challenge code required");
            o.challenge_issued = true;
            return o;
        }
        auto entered = prompter_.read_secret(ask);
        if (!entered) return AuthOutcome::denied(m, AuthFailure::NO_TERMINAL, "No terminal to read response from");
        response = std::move(*entered);
    }

    ChallengeResult v = challenges_->verify(ctx.command, response, m, m == AuthMethod::Pin ? &rec : nullptr);
    wipe(response);

    if (v.ok) return AuthOutcome::approved(m);

    switch (v.rc) {
        case ChallengeRc::PIN_MISMATCH:
        case ChallengeRc::CODE_MISMATCH:
        case ChallengeRc::BAD_FORMAT:
            return AuthOutcome::denied(m, AuthFailure::CHALLENGE_FAILED, "Challenge failed: " + v.detail);
        case ChallengeRc::NOT_FOUND:
        case ChallengeRc::EXPIRED:
        case ChallengeRc::USED:
            return AuthOutcome::denied(m, AuthFailure::CHALLENGE_STALE, "Challenge failed: " + v.detail);
        case ChallengeRc::PIN_UNAVAILABLE:
            return AuthOutcome::denied(m, AuthFailure::NOT_CONFIGURED, v.detail);
        default:
            break;
    }
    return AuthOutcome::denied(m, AuthFailure::INTERNAL, "Challenge error: " + v.detail);
}

} // namespace veto
