#pragma once
#include <optional>
#include <string>
#include <vector>

#include "audit_log.h"
#include "authenticator.h"
#include "rules.h"

namespace veto {

/*
Gate
====

One decision, end to end:

  Received -> Classified -> ShortCircuitAllow                  -> Logged -> Terminal
                         -> AuthPending [-> Challenge] -> Approved   -> Logged -> Terminal
                                                       -> Denied
                                                       -> NeedsInput

Every path ends in exactly one audit append. The trail of visited states is
returned so callers (and tests) can see which path was taken.

Fail closed: a configuration error, a missing authenticator or anything else
unexpected yields Denied, never an allow.
*/

enum class GateState : int {
    Received = 0,
    Classified,
    ShortCircuitAllow,
    AuthPending,
    Challenge,
    Approved,
    Denied,
    NeedsInput,
    Logged,
    Terminal,
};

std::string gate_state_name(GateState s);

struct GateRequest {
    std::string subject;      // command, or file path when file_op
    bool file_op = false;
    bool interactive = false;

    std::optional<std::string> pin;
    std::optional<std::string> totp;
    std::optional<std::string> response;
    bool confirm = false;
    bool force = false;
    std::optional<AuthMethod> method_override;

    DeniedMemory* denied = nullptr;
};

struct GateResult {
    Verdict verdict;
    AuthOutcome outcome;
    AuditResult audit_result = AuditResult::BLOCKED;
    bool short_circuit = false;
    bool logged = false;
    std::vector<GateState> trail;

    bool approved() const { return outcome.kind == AuthOutcomeKind::Approved; }

    // 0 approved, 1 denied, 2 needs input.
    int exit_status() const;
};

// Approved -> ALLOWED; explicit / session denials -> DENIED; the rest -> BLOCKED.
AuditResult audit_result_for(const AuthOutcome& o);

class Gate {
public:
    // auth may be null only when every request is expected to short-circuit
    // (a non-ALLOW verdict without one is denied). audit may be null (tests).
    Gate(const RulesEngine& engine, Authenticator* auth, AuditLog* audit);

    // Once set, every evaluation is denied with this reason.
    void set_config_error(std::string detail) { config_error_ = std::move(detail); }
    bool has_config_error() const { return !config_error_.empty(); }

    GateResult evaluate(const GateRequest& req);

private:
    const RulesEngine& engine_;
    Authenticator* auth_;
    AuditLog* audit_;
    std::string config_error_;

    void log_(const GateRequest& req, GateResult& r);
};

} // namespace veto
