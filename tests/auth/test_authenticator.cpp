// tests/auth/test_authenticator.cpp
//
// Chains, fallbacks, session denial memory and challenge handling against a
// scripted prompter and an in-memory secret store.

#include <string>
#include <vector>

#include <sodium.h>

#include "authenticator.h"
#include "pin.h"
#include "totp.h"
#include "test_support.h"

using namespace veto;
using veto_test::check;

namespace {

constexpr std::int64_t kNow = 1111111111;

std::vector<unsigned char> rfc_key() {
    const std::string s = "12345678901234567890";
    return std::vector<unsigned char>(s.begin(), s.end());
}

CommandContext context(const std::string& cmd, RiskLevel risk) {
    CommandContext ctx;
    ctx.command = cmd;
    ctx.verdict.risk = risk;
    ctx.verdict.reason = std::string("test rule");
    return ctx;
}

struct Fixture {
    veto_test::MemorySecretBackend* raw = nullptr;
    std::unique_ptr<SecretStore> store = veto_test::memory_store(&raw);
    veto_test::FakePrompter prompter;
    VetoConfig cfg;

    void set_pin(const std::string& pin) {
        std::string err;
        PinRecord rec;
        check(pin_make_record(pin, rec, &err), "make pin: " + err);
        check(pin_store(*store, rec).ok, "store pin");
    }
    void set_totp() {
        cfg.totp.enabled = true;
        const auto k = rfc_key();
        raw->values[kSecretTotpSeed] = base32_encode(k.data(), k.size());
    }
    void set_telegram() {
        cfg.telegram.enabled = true;
        cfg.telegram.chat_id = "42";
        raw->values[kSecretTelegramToken] = "123:abc";
    }
};

void chain_with_timeout() {
    Fixture f;
    f.set_totp();
    f.set_telegram();
    f.cfg.policy.levels[RiskLevel::CRITICAL] = {AuthMethod::Totp, AuthMethod::Telegram};
    f.prompter.telegram_result = {Interaction::TimedOut, ""};

    Authenticator auth(f.cfg, *f.store, f.prompter, nullptr);
    auth.now_unix_sec = kNow;

    CommandContext ctx = context("rm -rf /", RiskLevel::CRITICAL);
    ctx.totp = totp_code(rfc_key(), kNow);

    AuthOutcome o = auth.authenticate(RiskLevel::CRITICAL, ctx);
    check(o.kind == AuthOutcomeKind::Denied, "telegram timeout denies the chain");
    check(o.failure == AuthFailure::TIMEOUT, "failure is TIMEOUT");
    check(o.method == AuthMethod::Telegram, "failing method is telegram");
    check(!o.explicit_denial, "timeout is not an explicit denial");
    check(f.prompter.telegrams == 1, "telegram asked once");

    f.prompter.telegram_result = {Interaction::Approved, ""};
    o = auth.authenticate(RiskLevel::CRITICAL, ctx);
    check(o.kind == AuthOutcomeKind::Approved && o.method == AuthMethod::Telegram, "both steps approve");

    ctx.totp = std::string("000000");
    f.prompter.telegrams = 0;
    o = auth.authenticate(RiskLevel::CRITICAL, ctx);
    check(o.kind == AuthOutcomeKind::Denied && o.failure == AuthFailure::BAD_CREDENTIAL, "bad TOTP denies");
    check(f.prompter.telegrams == 0, "chain stops at the first failure");

    // Telegram timeout with a configured fallback moves on.
    f.cfg.policy.fallback[AuthMethod::Telegram] = AuthMethod::Confirm;
    f.prompter.telegram_result = {Interaction::TimedOut, ""};
    ctx.totp = totp_code(rfc_key(), kNow);
    ctx.confirm = true;
    o = auth.authenticate(RiskLevel::CRITICAL, ctx);
    check(o.kind == AuthOutcomeKind::Approved && o.method == AuthMethod::Confirm, "timeout falls back");

    // A stored seed is not enough while [auth.totp] is disabled.
    f.cfg.totp.enabled = false;
    std::string why;
    check(!auth.method_available(AuthMethod::Totp, &why) && why.find("disabled") != std::string::npos,
          "disabled TOTP is unavailable");
    o = auth.authenticate(RiskLevel::CRITICAL, ctx);
    check(o.kind == AuthOutcomeKind::Denied && o.failure == AuthFailure::NOT_CONFIGURED && o.method == AuthMethod::Totp,
          "disabled TOTP is not configured even with a valid code");
    f.cfg.totp.enabled = true;
}

void remembered_denial(const veto_test::TempDir& td) {
    Fixture f;
    f.set_pin("2468");
    f.cfg.policy.levels[RiskLevel::HIGH] = {AuthMethod::Pin};
    Authenticator auth(f.cfg, *f.store, f.prompter, nullptr);

    DeniedMemory mem(td.sub("sessions"), "session-a");
    CommandContext ctx = context("git push -f", RiskLevel::HIGH);
    ctx.denied = &mem;
    ctx.pin = std::string("1111");

    AuthOutcome o = auth.authenticate(RiskLevel::HIGH, ctx);
    check(o.kind == AuthOutcomeKind::Denied && o.failure == AuthFailure::BAD_CREDENTIAL, "wrong PIN denied");
    check(o.explicit_denial, "wrong PIN is explicit");
    check(mem.is_denied("git push -f"), "denial remembered");

    // The right PIN no longer helps, and nothing is asked.
    ctx.pin = std::string("2468");
    ctx.interactive = true;
    o = auth.authenticate(RiskLevel::HIGH, ctx);
    check(o.kind == AuthOutcomeKind::Denied && o.failure == AuthFailure::PREVIOUSLY_DENIED, "retry is denied");
    check(f.prompter.calls() == 0, "no method ran for a remembered denial");

    DeniedMemory other(td.sub("sessions"), "session-b");
    ctx.denied = &other;
    o = auth.authenticate(RiskLevel::HIGH, ctx);
    check(o.kind == AuthOutcomeKind::Approved, "other session is unaffected");

    ctx.denied = &mem;
    ctx.force = true;
    o = auth.authenticate(RiskLevel::HIGH, ctx);
    check(o.kind == AuthOutcomeKind::Approved, "force re-runs authentication");
    check(!mem.is_denied("git push -f"), "approval with force clears the denial");

    ctx.force = false;
    ctx.pin.reset();
    f.prompter.confirm_answer = false;
    f.cfg.policy.levels[RiskLevel::MEDIUM] = {AuthMethod::Confirm};
    CommandContext c2 = context("rm -rf build", RiskLevel::MEDIUM);
    c2.interactive = true;
    c2.denied = &mem;
    o = auth.authenticate(RiskLevel::MEDIUM, c2);
    check(o.kind == AuthOutcomeKind::Denied && o.failure == AuthFailure::USER_DECLINED, "declined at terminal");
    check(mem.is_denied("rm -rf build"), "declined command remembered");
}

void touchid_fallback() {
    Fixture f;
    f.set_pin("1357");
    f.cfg.touchid.enabled = true;
    f.prompter.touchid_ok = false;
    f.cfg.policy.levels[RiskLevel::HIGH] = {AuthMethod::TouchId};
    f.cfg.policy.fallback[AuthMethod::TouchId] = AuthMethod::Pin;

    Authenticator auth(f.cfg, *f.store, f.prompter, nullptr);
    CommandContext ctx = context("git reset --hard", RiskLevel::HIGH);
    ctx.pin = std::string("1357");

    AuthOutcome o = auth.authenticate(RiskLevel::HIGH, ctx);
    check(o.kind == AuthOutcomeKind::Approved && o.method == AuthMethod::Pin, "unavailable touchid falls back to pin");
    check(f.prompter.touchids == 0, "touchid never prompted");

    f.prompter.touchid_ok = true;
    f.prompter.touchid_result = {Interaction::Denied, ""};
    o = auth.authenticate(RiskLevel::HIGH, ctx);
    check(o.kind == AuthOutcomeKind::Denied && o.failure == AuthFailure::USER_DECLINED, "touchid denial is final");
    check(o.method == AuthMethod::TouchId, "no fallback after an explicit denial");

    // Fallback loops stop instead of spinning.
    Fixture g;
    g.cfg.policy.levels[RiskLevel::HIGH] = {AuthMethod::Totp};
    g.cfg.policy.fallback[AuthMethod::Totp] = AuthMethod::Pin;
    g.cfg.policy.fallback[AuthMethod::Pin] = AuthMethod::Totp;
    Authenticator a2(g.cfg, *g.store, g.prompter, nullptr);
    o = a2.authenticate(RiskLevel::HIGH, context("x", RiskLevel::HIGH));
    check(o.kind == AuthOutcomeKind::Denied && o.failure == AuthFailure::NOT_CONFIGURED, "fallback cycle ends");

    std::string why;
    check(!a2.method_available(AuthMethod::Telegram, &why) && !why.empty(), "telegram unavailable explains why");
    check(a2.method_available(AuthMethod::Confirm, &why), "confirm always available");
}

void needs_input(const veto_test::TempDir& td) {
    Fixture f;
    f.set_pin("8642");
    f.cfg.policy.levels[RiskLevel::MEDIUM] = {AuthMethod::Confirm};
    f.cfg.policy.levels[RiskLevel::HIGH] = {AuthMethod::Pin};

    std::vector<std::string> codes;
    std::vector<std::unique_ptr<ChallengeNotifier>> ns;
    ns.push_back(std::make_unique<veto_test::FakeNotifier>(&codes));
    ChallengeConfig ccfg;
    ccfg.state_dir = td.sub("challenges");
    ChallengeManager challenges(ccfg, std::move(ns));

    Authenticator auth(f.cfg, *f.store, f.prompter, &challenges);

    AuthOutcome o = auth.authenticate(RiskLevel::MEDIUM, context("rm -rf build", RiskLevel::MEDIUM));
    check(o.kind == AuthOutcomeKind::NeedsInput && o.method == AuthMethod::Confirm, "confirm needs input");

    CommandContext yes = context("rm -rf build", RiskLevel::MEDIUM);
    yes.confirm = true;
    check(auth.authenticate(RiskLevel::MEDIUM, yes).kind == AuthOutcomeKind::Approved, "VETO_CONFIRM approves");

    o = auth.authenticate(RiskLevel::HIGH, context("git push -f", RiskLevel::HIGH));
    check(o.kind == AuthOutcomeKind::NeedsInput && o.method == AuthMethod::Pin, "pin needs input");
    check(f.prompter.calls() == 0, "non-interactive never prompts");

    // Challenge rule: first call issues, second call answers.
    CommandContext ch = context("kubectl delete ns prod", RiskLevel::HIGH);
    ch.verdict.challenge = true;
    o = auth.authenticate(RiskLevel::HIGH, ch);
    check(o.kind == AuthOutcomeKind::NeedsInput && o.challenge_issued, "challenge issued");
    check(codes.size() == 1, "code delivered out of band");
    check(o.reason.find(codes.empty() ? "----" : codes[0]) == std::string::npos, "code not in the reason");

    ch.pin = std::string("8642");
    o = auth.authenticate(RiskLevel::HIGH, ch);
    check(o.kind == AuthOutcomeKind::NeedsInput, "plain PIN is not enough for a challenge rule");

    ch.response = std::string("8642") + (codes.empty() ? "" : codes.back());
    o = auth.authenticate(RiskLevel::HIGH, ch);
    check(o.kind == AuthOutcomeKind::Approved, "PIN + code approves");

    o = auth.authenticate(RiskLevel::HIGH, ch);
    check(o.kind == AuthOutcomeKind::Denied && o.failure == AuthFailure::CHALLENGE_STALE, "replayed response is stale");

    // Interactive: the code is read from the terminal.
    CommandContext ia = context("kubectl delete ns prod", RiskLevel::MEDIUM);
    ia.verdict.challenge = true;
    ia.interactive = true;
    f.prompter.secret_answer = std::string("0000");
    o = auth.authenticate(RiskLevel::MEDIUM, ia);
    check(f.prompter.secrets == 1, "interactive challenge reads the code");
    // Codes are 1000..9999, so "0000" never matches.
    check(o.kind == AuthOutcomeKind::Denied && o.failure == AuthFailure::CHALLENGE_FAILED,
          "wrong code at the terminal fails the challenge");
}

// One challenge covers every pin/confirm step of an AND chain.
void challenge_chain(const veto_test::TempDir& td) {
    Fixture f;
    f.set_pin("8642");
    f.cfg.policy.levels[RiskLevel::CRITICAL] = {AuthMethod::Pin, AuthMethod::Confirm};

    std::vector<std::string> codes;
    std::vector<std::unique_ptr<ChallengeNotifier>> ns;
    ns.push_back(std::make_unique<veto_test::FakeNotifier>(&codes));
    ChallengeConfig ccfg;
    ccfg.state_dir = td.sub("chain-challenges");
    ChallengeManager challenges(ccfg, std::move(ns));

    Authenticator auth(f.cfg, *f.store, f.prompter, &challenges);
    DeniedMemory mem(td.sub("chain-sessions"), "chain");

    CommandContext ctx = context("terraform destroy", RiskLevel::CRITICAL);
    ctx.verdict.challenge = true;
    ctx.denied = &mem;

    AuthOutcome o = auth.authenticate(RiskLevel::CRITICAL, ctx);
    check(o.kind == AuthOutcomeKind::NeedsInput && o.challenge_issued, "chain issues a challenge");
    check(o.method == AuthMethod::Pin, "pin in the chain asks for PIN + code");
    check(codes.size() == 1, "one code for the whole chain");

    ctx.response = std::string("8642") + (codes.empty() ? "" : codes.back());
    o = auth.authenticate(RiskLevel::CRITICAL, ctx);
    check(o.kind == AuthOutcomeKind::Approved, "PIN + code approves pin and confirm: " + o.reason);
    check(!mem.is_denied("terraform destroy"), "approved chain leaves no denial behind");
    check(f.prompter.calls() == 0, "confirm step asks nothing further");

    // Wrong PIN in the response is one explicit denial.
    ctx.response.reset();
    o = auth.authenticate(RiskLevel::CRITICAL, ctx);
    check(o.challenge_issued && codes.size() == 2, "second challenge issued");
    ctx.response = std::string("1111") + (codes.empty() ? "" : codes.back());
    o = auth.authenticate(RiskLevel::CRITICAL, ctx);
    check(o.kind == AuthOutcomeKind::Denied && o.failure == AuthFailure::CHALLENGE_FAILED, "wrong PIN fails");
    check(mem.is_denied("terraform destroy"), "failed challenge remembered");

    // Interactive: one code sent, one answer read.
    CommandContext ia = context("terraform apply", RiskLevel::CRITICAL);
    ia.verdict.challenge = true;
    ia.interactive = true;
    ia.denied = &mem;
    f.prompter.secret_source = [&]() -> std::optional<std::string> {
        return std::string("8642") + (codes.empty() ? "" : codes.back());
    };
    const std::size_t before = codes.size();
    o = auth.authenticate(RiskLevel::CRITICAL, ia);
    check(o.kind == AuthOutcomeKind::Approved, "interactive PIN + code approves the chain: " + o.reason);
    check(codes.size() == before + 1, "interactive chain sends a single code");
    check(f.prompter.secrets == 1 && f.prompter.confirms == 0, "one read, no separate confirm prompt");
    f.prompter.secret_source = nullptr;

    // Confirm-only chain: the code alone, then a plain PIN step after it.
    f.cfg.policy.levels[RiskLevel::HIGH] = {AuthMethod::Confirm};
    CommandContext c = context("kubectl drain node-1", RiskLevel::HIGH);
    c.verdict.challenge = true;
    o = auth.authenticate(RiskLevel::HIGH, c);
    check(o.kind == AuthOutcomeKind::NeedsInput && o.method == AuthMethod::Confirm, "confirm chain wants the code");
    c.response = codes.empty() ? std::string() : codes.back();
    o = auth.authenticate(RiskLevel::HIGH, c);
    check(o.kind == AuthOutcomeKind::Approved && o.method == AuthMethod::Confirm, "code alone approves confirm");

    // No PIN set: the pin step falls back to confirm, which takes the challenge.
    Fixture g;
    g.cfg.policy.levels[RiskLevel::HIGH] = {AuthMethod::Pin};
    g.cfg.policy.fallback[AuthMethod::Pin] = AuthMethod::Confirm;
    Authenticator a2(g.cfg, *g.store, g.prompter, &challenges);
    CommandContext fb = context("kubectl delete ns staging", RiskLevel::HIGH);
    fb.verdict.challenge = true;
    o = a2.authenticate(RiskLevel::HIGH, fb);
    check(o.kind == AuthOutcomeKind::NeedsInput && o.method == AuthMethod::Confirm && o.challenge_issued,
          "fallback method takes the challenge");
    fb.response = codes.empty() ? std::string() : codes.back();
    o = a2.authenticate(RiskLevel::HIGH, fb);
    check(o.kind == AuthOutcomeKind::Approved && o.method == AuthMethod::Confirm, "code approves the fallback");
}

} // namespace

int main() {
    if (sodium_init() < 0) {
        std::cerr << "sodium_init failed\n";
        return 2;
    }
    veto_test::TempDir td;
    if (!td.ok()) {
        std::cerr << "FAIL: mkdtemp\n";
        return 2;
    }

    chain_with_timeout();
    remembered_denial(td);
    touchid_fallback();
    needs_input(td);
    challenge_chain(td);
    return veto_test::finish("test_authenticator");
}
