#include "gate.h"

#include <iostream>

namespace veto {

std::string gate_state_name(GateState s) {
    switch (s) {
        case GateState::Received:          return "Received";
        case GateState::Classified:        return "Classified";
        case GateState::ShortCircuitAllow: return "ShortCircuitAllow";
        case GateState::AuthPending:       return "AuthPending";
        case GateState::Challenge:         return "Challenge";
        case GateState::Approved:          return "Approved";
        case GateState::Denied:            return "Denied";
        case GateState::NeedsInput:        return "NeedsInput";
        case GateState::Logged:            return "Logged";
        case GateState::Terminal:          return "Terminal";
    }
    return "Unknown";
}

int GateResult::exit_status() const {
    switch (outcome.kind) {
        case AuthOutcomeKind::Approved:   return 0;
        case AuthOutcomeKind::NeedsInput: return 2;
        case AuthOutcomeKind::Denied:     break;
    }
    return 1;
}

AuditResult audit_result_for(const AuthOutcome& o) {
    if (o.kind == AuthOutcomeKind::Approved) return AuditResult::ALLOWED;
    if (o.kind == AuthOutcomeKind::NeedsInput) return AuditResult::BLOCKED;
    if (o.explicit_denial ||
        o.failure == AuthFailure::PREVIOUSLY_DENIED ||
        o.failure == AuthFailure::CHALLENGE_STALE) {
        return AuditResult::DENIED;
    }
    return AuditResult::BLOCKED;
}

Gate::Gate(const RulesEngine& engine, Authenticator* auth, AuditLog* audit)
    : engine_(engine), auth_(auth), audit_(audit) {}

GateResult Gate::evaluate(const GateRequest& req) {
    GateResult r;
    r.trail.push_back(GateState::Received);

    r.verdict = req.file_op ? engine_.classify_path(req.subject) : engine_.classify(req.subject);
    r.trail.push_back(GateState::Classified);

    if (!config_error_.empty()) {
        r.trail.push_back(GateState::AuthPending);
        r.outcome = AuthOutcome::denied(std::nullopt, AuthFailure::CONFIG_ERROR,
                                        "Configuration error: " + config_error_);
    } else if (r.verdict.risk == RiskLevel::ALLOW) {
        r.trail.push_back(GateState::ShortCircuitAllow);
        r.short_circuit = true;
        r.outcome.kind = AuthOutcomeKind::Approved;
    } else if (!auth_) {
        r.trail.push_back(GateState::AuthPending);
        r.outcome = AuthOutcome::denied(std::nullopt, AuthFailure::INTERNAL, "No authenticator available");
    } else {
        r.trail.push_back(GateState::AuthPending);
        if (r.verdict.challenge) r.trail.push_back(GateState::Challenge);

        CommandContext ctx;
        ctx.command = req.subject;
        ctx.verdict = r.verdict;
        ctx.interactive = req.interactive;
        ctx.pin = req.pin;
        ctx.totp = req.totp;
        ctx.response = req.response;
        ctx.confirm = req.confirm;
        ctx.force = req.force;
        ctx.method_override = req.method_override;
        ctx.denied = req.denied;

        r.outcome = auth_->authenticate(r.verdict.risk, ctx);

        // A caller that can prompt never gets NeedsInput back.
        if (req.interactive && r.outcome.kind == AuthOutcomeKind::NeedsInput) {
            r.outcome = AuthOutcome::denied(r.outcome.method, AuthFailure::NO_TERMINAL, r.outcome.reason);
        }
    }

    if (!r.short_circuit) {
        switch (r.outcome.kind) {
            case AuthOutcomeKind::Approved:   r.trail.push_back(GateState::Approved); break;
            case AuthOutcomeKind::Denied:     r.trail.push_back(GateState::Denied); break;
            case AuthOutcomeKind::NeedsInput: r.trail.push_back(GateState::NeedsInput); break;
        }
    }

    r.audit_result = audit_result_for(r.outcome);
    log_(req, r);
    r.trail.push_back(GateState::Terminal);
    return r;
}

void Gate::log_(const GateRequest& req, GateResult& r) {
    if (!audit_) return;

    AuditEntry e;
    e.result = r.audit_result;
    e.risk = r.verdict.risk;
    if (r.outcome.method) e.auth_method = auth_method_name(*r.outcome.method);
    e.command = req.subject;

    AuditStatus st = audit_->append(e);
    if (!st.ok) {
        std::cerr << "[audit] WARNING: failed to append: " << st.detail << std::endl;
        return;
    }
    r.logged = true;
    r.trail.push_back(GateState::Logged);
}

} // namespace veto
