#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "challenge.h"
#include "config.h"
#include "denied_memory.h"
#include "risk.h"
#include "secret_store.h"

namespace veto {

/*
CommandContext
==============

Everything the authenticator needs to know about one gating request.
Inputs arrive out of band: environment (VETO_PIN=...), inline assignments
stripped from a hook command, or `gate --pin/--totp` flags.
*/
struct CommandContext {
    std::string command;  // exactly as classified
    Verdict verdict;

    // A human is at a terminal and may be prompted synchronously.
    bool interactive = false;

    std::optional<std::string> pin;
    std::optional<std::string> totp;
    std::optional<std::string> response; // challenge response
    bool confirm = false;                // VETO_CONFIRM=yes
    bool force = false;                  // VETO_FORCE=yes

    // `exec --auth <method>` replaces the configured chain with this method.
    std::optional<AuthMethod> method_override;

    // Session memory of explicit denials; null => no memory.
    DeniedMemory* denied = nullptr;
};

enum class AuthOutcomeKind : int {
    Approved = 0,
    Denied = 1,
    NeedsInput = 2,
};

enum class AuthFailure : int {
    NONE = 0,

    // A human or credential check said no (remembered for the session).
    USER_DECLINED = 10,
    BAD_CREDENTIAL = 11,
    CHALLENGE_FAILED = 12,
    REMOTE_DENIED = 13,

    PREVIOUSLY_DENIED = 14,
    CHALLENGE_STALE = 15, // expired / already used / never issued

    // No human decision was made.
    TIMEOUT = 20,
    METHOD_UNAVAILABLE = 21,
    NOT_CONFIGURED = 22,
    NO_TERMINAL = 23,

    SECRET_ERROR = 30,
    CHALLENGE_DELIVERY = 31,
    CONFIG_ERROR = 32,

    INTERNAL = 99,
};

struct AuthOutcome {
    AuthOutcomeKind kind = AuthOutcomeKind::Denied;

    // Approved: last method in the chain (after fallback).
    // Denied: the method that failed.
    // NeedsInput: the method waiting for input.
    std::optional<AuthMethod> method;

    AuthFailure failure = AuthFailure::NONE;
    bool explicit_denial = false;
    bool challenge_issued = false;
    std::string reason;

    static AuthOutcome approved(AuthMethod m);
    static AuthOutcome denied(std::optional<AuthMethod> m, AuthFailure f, std::string reason);
    static AuthOutcome needs_input(AuthMethod m, std::string reason);
};

// Failures that allow trying the configured fallback method.
bool failure_allows_fallback(AuthFailure f);

enum class Interaction : int {
    Approved = 0,
    Denied = 1,
    TimedOut = 2,
    Unavailable = 3,
    Error = 4,
};

struct InteractionResult {
    Interaction status = Interaction::Error;
    std::string detail;
};

/*
AuthPrompter
============

Every side effect of authentication (terminal, biometric helper, desktop
dialog, Telegram round trip) goes through this interface. The platform
implementation lives in platform_prompter.cc; tests provide fakes.
*/
class AuthPrompter {
public:
    virtual ~AuthPrompter() = default;

    // nullopt => no terminal to ask on.
    virtual std::optional<bool> confirm(const std::string& prompt) = 0;
    virtual std::optional<std::string> read_secret(const std::string& prompt) = 0;

    virtual bool touchid_available() = 0;
    virtual InteractionResult touchid(const std::string& reason) = 0;

    virtual bool dialog_available() = 0;
    virtual InteractionResult dialog(const std::string& title, const std::string& message) = 0;

    // Blocks for at most timeout_sec.
    virtual InteractionResult telegram(const std::string& bot_token,
                                       const std::string& chat_id,
                                       const std::string& command,
                                       const Verdict& verdict,
                                       int timeout_sec) = 0;
};

/*
Authenticator
=============

authenticate(level, policy, ctx):

  0. A command explicitly denied earlier in this session is denied again
     without running any method, unless ctx.force.
  1. chain = ctx.method_override, else policy.chain_for(level).
  2. Each method in order; all must approve (AND). A method whose
     preconditions are unmet (or that timed out) is replaced by its fallback,
     following fallbacks transitively but never revisiting a method.
  3. The first non-approval ends the chain. Explicit denials are recorded in
     ctx.denied.

For rules with challenge=true, one challenge is issued (or ctx.response
verified) before the chain runs: PIN + code when the chain has a pin step,
otherwise the code alone. Later pin and confirm steps of the same chain are
satisfied by that answer; a pin step after a code-only challenge still asks
for the plain PIN (see challenge.h).
*/
class Authenticator {
public:
    Authenticator(const VetoConfig& cfg,
                  SecretStore& secrets,
                  AuthPrompter& prompter,
                  ChallengeManager* challenges);

    // 0 => use now_epoch() (TOTP window).
    std::int64_t now_unix_sec = 0;

    AuthOutcome authenticate(RiskLevel level, const AuthPolicy& policy, const CommandContext& ctx);
    AuthOutcome authenticate(RiskLevel level, const CommandContext& ctx);

    // Preconditions of one method, without prompting anyone.
    bool method_available(AuthMethod m, std::string* why);

private:
    const VetoConfig& cfg_;
    SecretStore& secrets_;
    AuthPrompter& prompter_;
    ChallengeManager* challenges_;

    // Per-authenticate() challenge bookkeeping.
    struct ChallengeState {
        std::optional<AuthMethod> answered_by;
    };

    AuthOutcome run_with_fallback_(AuthMethod m, const AuthPolicy& policy, const CommandContext& ctx,
                                   ChallengeState& cs);
    AuthOutcome verify_method_(AuthMethod m, const CommandContext& ctx, ChallengeState& cs);

    AuthOutcome verify_confirm_(const CommandContext& ctx);
    AuthOutcome verify_pin_(const CommandContext& ctx);
    AuthOutcome verify_totp_(const CommandContext& ctx);
    AuthOutcome verify_touchid_(const CommandContext& ctx);
    AuthOutcome verify_telegram_(const CommandContext& ctx);
    AuthOutcome verify_dialog_(const CommandContext& ctx);
    AuthOutcome verify_challenge_(AuthMethod m, const CommandContext& ctx);

    AuthOutcome from_interaction_(AuthMethod m, const InteractionResult& r);
};

} // namespace veto
