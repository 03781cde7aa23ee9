// tests/hooks/test_hook_adapter.cpp
//
// Per-adapter payload parsing, inline VETO_* extraction and the rendered
// decision for each agent.

#include <string>

#include <nlohmann/json.hpp>

#include "hook_adapter.h"
#include "test_support.h"

using json = nlohmann::json;
using namespace veto;
using veto_test::check;

static GateResult result(AuthOutcome o, RiskLevel risk, const char* category) {
    GateResult r;
    r.verdict.risk = risk;
    if (category) r.verdict.category = std::string(category);
    r.outcome = std::move(o);
    return r;
}

static void parsing() {
    HookInput in;
    std::string err;

    check(parse_hook_input(HookAdapter::Claude,
                           R"({"session_id":"s1","tool_name":"Bash","tool_input":{"command":"rm -rf /"}})", in, &err),
          "claude bash payload");
    check(in.subject == "rm -rf /" && !in.file_op, "claude command");
    check(in.session_id == "s1" && in.tool_name == "Bash", "claude session and tool");

    check(parse_hook_input(HookAdapter::Claude,
                           R"({"session_id":"s1","tool_name":"Write","tool_input":{"file_path":"/r/.env","content":"x"}})",
                           in, &err),
          "claude write payload");
    check(in.subject == "/r/.env" && in.file_op, "claude file path");

    check(parse_hook_input(HookAdapter::Gemini,
                           R"({"session_id":"g","tool_name":"read_file","tool_input":{"path":"/home/u/.ssh/id_rsa"}})",
                           in, &err),
          "gemini payload");
    check(in.subject == "/home/u/.ssh/id_rsa" && in.file_op, "gemini 'path' field");

    check(parse_hook_input(HookAdapter::Cursor, R"({"conversation_id":"c9","command":"git push -f"})", in, &err),
          "cursor payload");
    check(in.subject == "git push -f" && in.session_id == "c9", "cursor command and conversation");

    check(parse_hook_input(HookAdapter::Claude, R"({"session_id":"s","tool_name":"WebFetch","tool_input":{"url":"x"}})",
                           in, &err),
          "payload without a subject");
    check(in.nothing_to_gate, "nothing to gate");
    check(parse_hook_input(HookAdapter::Claude, R"({"session_id":"s"})", in, &err) && in.nothing_to_gate,
          "missing tool_input");

    check(!parse_hook_input(HookAdapter::Claude, "not json", in, &err) && !err.empty(), "malformed JSON");
    check(!parse_hook_input(HookAdapter::Claude, "[1,2]", in, &err), "array payload");
    check(!parse_hook_input(HookAdapter::Cursor, "", in, &err), "empty payload");

    check(hook_reads_stdin(HookAdapter::Claude) && !hook_reads_stdin(HookAdapter::OpenCode), "stdin adapters");
    check(hook_adapter_name(HookAdapter::Gemini) == "gemini", "adapter name");
}

static void inline_inputs() {
    InlineInputs in;
    std::string rest = strip_inline_inputs("VETO_PIN=1234 git push -f origin main", in);
    check(rest == "git push -f origin main", "PIN stripped: " + rest);
    check(in.pin && *in.pin == "1234", "PIN value");

    in = InlineInputs{};
    rest = strip_inline_inputs("  VETO_CONFIRM=yes VETO_FORCE=true rm -rf build", in);
    check(rest == "rm -rf build", "two flags stripped");
    check(in.confirm && in.force, "confirm and force set");

    in = InlineInputs{};
    rest = strip_inline_inputs("VETO_RESPONSE='1234 5678' VETO_TOTP=\"287082\" make", in);
    check(rest == "make", "quoted values stripped");
    check(in.response && *in.response == "1234 5678", "single-quoted value");
    check(in.totp && *in.totp == "287082", "double-quoted value");

    in = InlineInputs{};
    rest = strip_inline_inputs("VETO_CONFIRM=no rm a", in);
    check(rest == "rm a" && !in.confirm, "non-affirmative confirm");

    in = InlineInputs{};
    const std::string unknown = "VETO_OTHER=1 rm -rf /";
    check(strip_inline_inputs(unknown, in) == unknown, "unknown VETO_ name left alone");

    in = InlineInputs{};
    const std::string later = "rm -rf / VETO_PIN=1234";
    check(strip_inline_inputs(later, in) == later && !in.pin, "only leading assignments count");

    in = InlineInputs{};
    rest = strip_inline_inputs("VETO_PIN=1 FOO=bar rm x", in);
    check(rest == "FOO=bar rm x", "extraction stops at an unrecognized token");

    in = InlineInputs{};
    const std::string unterminated = "VETO_PIN='12 rm x";
    check(strip_inline_inputs(unterminated, in) == unterminated, "unterminated quote is not stripped");
}

static json payload(const HookOutput& o) {
    json j = json::parse(o.out_text, nullptr, false);
    check(!j.is_discarded(), "payload is JSON: " + o.out_text);
    return j;
}

static void rendering() {
    GateResult allow;
    allow.short_circuit = true;
    allow.outcome.kind = AuthOutcomeKind::Approved;

    GateResult approved = result(AuthOutcome::approved(AuthMethod::Pin), RiskLevel::HIGH, "git-destructive");
    GateResult denied = result(AuthOutcome::denied(AuthMethod::Pin, AuthFailure::BAD_CREDENTIAL, "Incorrect PIN"),
                               RiskLevel::HIGH, "git-destructive");
    GateResult pin_needed = result(AuthOutcome::needs_input(AuthMethod::Pin, "PIN required"),
                                   RiskLevel::HIGH, "git-destructive");
    GateResult timeout = result(AuthOutcome::denied(AuthMethod::Telegram, AuthFailure::TIMEOUT, "telegram timed out"),
                                RiskLevel::CRITICAL, "destructive");

    check(hook_message(HookAdapter::None, allow) == "veto: ALLOW", "allow message");
    check(hook_message(HookAdapter::None, approved) == "veto: HIGH (git-destructive) approved", "approved message");
    const std::string dm = hook_message(HookAdapter::None, denied);
    check(dm == "veto: denied HIGH (git-destructive): Incorrect PIN. Do not retry this command.", "denied: " + dm);
    const std::string tm = hook_message(HookAdapter::None, timeout);
    check(tm.rfind("veto: blocked CRITICAL", 0) == 0 && tm.find("Do not retry") == std::string::npos, "timeout: " + tm);
    check(hook_message(HookAdapter::Claude, pin_needed).find("VETO_PIN=<pin>") != std::string::npos, "PIN hint");

    AuthOutcome ch = AuthOutcome::needs_input(AuthMethod::Pin, "PIN and challenge code required");
    ch.challenge_issued = true;
    GateResult challenged = result(ch, RiskLevel::CRITICAL, "prod");
    check(hook_message(HookAdapter::Claude, challenged).find("VETO_RESPONSE=<PIN><code>") != std::string::npos,
          "challenge hint");

    const std::string oc = hook_message(HookAdapter::OpenCode, pin_needed);
    check(oc.find("VETO_") == std::string::npos, "opencode gets no env hint");
    check(oc.find("dialog or touchid") != std::string::npos, "opencode suggests an interactive method");

    // Claude
    HookOutput o = render_hook_output(HookAdapter::Claude, approved);
    json j = payload(o);
    check(o.exit_code == 0 && o.err_text.empty(), "claude exits 0");
    check(j["hookSpecificOutput"]["hookEventName"] == "PreToolUse", "claude event name");
    check(j["hookSpecificOutput"]["permissionDecision"] == "allow", "claude allow");
    j = payload(render_hook_output(HookAdapter::Claude, pin_needed));
    check(j["hookSpecificOutput"]["permissionDecision"] == "deny", "claude needs-input is deny");

    // Gemini
    o = render_hook_output(HookAdapter::Gemini, denied);
    j = payload(o);
    check(o.exit_code == 0 && j["decision"] == "deny" && j["reason"].get<std::string>().find("Incorrect PIN") != std::string::npos,
          "gemini deny");

    // Cursor never asks: "ask" would hand the decision back to the agent UI.
    o = render_hook_output(HookAdapter::Cursor, pin_needed);
    j = payload(o);
    check(o.exit_code == 0 && j["permission"] == "deny", "cursor needs-input is deny");
    check(j.contains("userMessage") && j.contains("agentMessage"), "cursor messages");
    check(payload(render_hook_output(HookAdapter::Cursor, allow))["permission"] == "allow", "cursor allow");

    // OpenCode and plain text use exit codes.
    o = render_hook_output(HookAdapter::OpenCode, denied);
    check(o.out_text.empty() && !o.err_text.empty() && o.exit_code == 1, "opencode denied on stderr, exit 1");
    o = render_hook_output(HookAdapter::OpenCode, pin_needed);
    check(o.exit_code == 2, "opencode needs input exit 2");
    o = render_hook_output(HookAdapter::None, approved);
    check(o.exit_code == 0 && o.out_text == "veto: HIGH (git-destructive) approved\n", "plain approved");

    o = render_hook_passthrough(HookAdapter::Claude);
    check(payload(o)["hookSpecificOutput"]["permissionDecision"] == "allow", "passthrough allows");
    o = render_hook_error(HookAdapter::Claude, "hook payload is not a JSON object");
    j = payload(o);
    check(j["hookSpecificOutput"]["permissionDecision"] == "deny", "error payload denies");
    o = render_hook_error(HookAdapter::None, "bad");
    check(o.exit_code == 1, "error exits 1 in plain mode");
}

int main() {
    parsing();
    inline_inputs();
    rendering();
    return veto_test::finish("test_hook_adapter");
}
