#include "hook_adapter.h"
#include "veto_util.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace veto {

std::string hook_adapter_name(HookAdapter a) {
    switch (a) {
        case HookAdapter::None:     return "none";
        case HookAdapter::Claude:   return "claude";
        case HookAdapter::Gemini:   return "gemini";
        case HookAdapter::Cursor:   return "cursor";
        case HookAdapter::OpenCode: return "opencode";
    }
    return "unknown";
}

bool hook_reads_stdin(HookAdapter a) {
    return a == HookAdapter::Claude || a == HookAdapter::Gemini || a == HookAdapter::Cursor;
}

static std::string str_field(const json& j, const char* key) {
    if (!j.is_object() || !j.contains(key) || !j[key].is_string()) return {};
    return j[key].get<std::string>();
}

bool parse_hook_input(HookAdapter a, const std::string& stdin_text, HookInput& out, std::string* err) {
    out = HookInput{};

    json in = json::parse(stdin_text, nullptr, false);
    if (in.is_discarded() || !in.is_object()) {
        if (err) *err = "hook payload is not a JSON object";
        return false;
    }

    const json* source = &in;
    if (a == HookAdapter::Cursor) {
        out.session_id = str_field(in, "conversation_id");
    } else {
        out.session_id = str_field(in, "session_id");
        out.tool_name = str_field(in, "tool_name");
        if (!in.contains("tool_input") || !in["tool_input"].is_object()) {
            out.nothing_to_gate = true;
            return true;
        }
        source = &in["tool_input"];
    }

    std::string cmd = str_field(*source, "command");
    if (!cmd.empty()) {
        out.subject = std::move(cmd);
        return true;
    }
    std::string path = str_field(*source, "file_path");
    if (path.empty()) path = str_field(*source, "path");
    if (!path.empty()) {
        out.subject = std::move(path);
        out.file_op = true;
        return true;
    }

    out.nothing_to_gate = true;
    return true;
}

static bool is_space(char c) {
    return c == ' ' || c == '\t';
}

static bool affirmative(const std::string& v) {
    const std::string s = lower_ascii(v);
    return s == "yes" || s == "y" || s == "true" || s == "1";
}

std::string strip_inline_inputs(const std::string& command, InlineInputs& out) {
    size_t i = 0;
    size_t rest = 0;
    bool stripped = false;

    for (;;) {
        while (i < command.size() && is_space(command[i])) ++i;
        if (command.compare(i, 5, "VETO_") != 0) break;

        const size_t eq = command.find('=', i);
        if (eq == std::string::npos) break;
        const std::string name = command.substr(i, eq - i);
        if (name != "VETO_PIN" && name != "VETO_TOTP" && name != "VETO_RESPONSE" &&
            name != "VETO_CONFIRM" && name != "VETO_FORCE") {
            break;
        }

        size_t j = eq + 1;
        std::string value;
        if (j < command.size() && (command[j] == '\'' || command[j] == '"')) {
            const char q = command[j];
            const size_t close = command.find(q, j + 1);
            if (close == std::string::npos) break;
            value = command.substr(j + 1, close - j - 1);
            j = close + 1;
        } else {
            const size_t start = j;
            while (j < command.size() && !is_space(command[j])) ++j;
            value = command.substr(start, j - start);
        }
        if (j < command.size() && !is_space(command[j])) break;

        if (name == "VETO_PIN")           out.pin = value;
        else if (name == "VETO_TOTP")     out.totp = value;
        else if (name == "VETO_RESPONSE") out.response = value;
        else if (name == "VETO_CONFIRM")  out.confirm = affirmative(value);
        else                              out.force = affirmative(value);

        stripped = true;
        i = j;
        rest = j;
    }

    if (!stripped) return command;
    while (rest < command.size() && is_space(command[rest])) ++rest;
    return command.substr(rest);
}

static std::string label(const GateResult& r) {
    std::string s = risk_to_string(r.verdict.risk);
    if (r.verdict.category) s += " (" + *r.verdict.category + ")";
    return s;
}

static std::string needs_input_hint(const GateResult& r) {
    const auto m = r.outcome.method.value_or(AuthMethod::Confirm);
    if (r.outcome.challenge_issued) {
        if (m == AuthMethod::Pin) {
            return "A challenge code was sent to the user out of band. Ask them for their PIN and that code, "
                   "then re-run the command prefixed with VETO_RESPONSE=<PIN><code>.";
        }
        return "A challenge code was sent to the user out of band. Ask them for it, "
               "then re-run the command prefixed with VETO_RESPONSE=<code>.";
    }
    switch (m) {
        case AuthMethod::Pin:
            return "Ask the user for their PIN and re-run the command prefixed with VETO_PIN=<pin>.";
        case AuthMethod::Totp:
            return "Ask the user for their current authenticator code and re-run the command prefixed with VETO_TOTP=<code>.";
        default:
            break;
    }
    return "Ask the user to approve this command, then re-run it prefixed with VETO_CONFIRM=yes.";
}

std::string hook_message(HookAdapter a, const GateResult& r) {
    switch (r.outcome.kind) {
        case AuthOutcomeKind::Approved:
            if (r.short_circuit) return "veto: " + risk_to_string(r.verdict.risk);
            return "veto: " + label(r) + " approved";

        case AuthOutcomeKind::NeedsInput: {
            const std::string method = r.outcome.method ? auth_method_name(*r.outcome.method) : "confirm";
            if (a == HookAdapter::OpenCode) {
                return "veto: " + label(r) + " requires " + method +
                       " approval, which cannot be given from here. Configure dialog or touchid for this risk level.";
            }
            return "veto: " + label(r) + " requires " + method + " approval. " + needs_input_hint(r);
        }

        case AuthOutcomeKind::Denied:
            break;
    }

    std::string msg = (audit_result_for(r.outcome) == AuditResult::DENIED ? "veto: denied " : "veto: blocked ") +
                      label(r);
    if (!r.outcome.reason.empty()) msg += ": " + r.outcome.reason;
    if (r.outcome.explicit_denial || r.outcome.failure == AuthFailure::PREVIOUSLY_DENIED) {
        msg += ". Do not retry this command.";
    }
    return msg;
}

HookOutput render_hook_output(HookAdapter a, const GateResult& r) {
    HookOutput o;
    const std::string msg = hook_message(a, r);
    const bool allow = r.approved();

    switch (a) {
        case HookAdapter::Claude: {
            json j = {
                {"hookSpecificOutput", {
                    {"hookEventName", "PreToolUse"},
                    {"permissionDecision", allow ? "allow" : "deny"},
                    {"permissionDecisionReason", msg},
                }},
            };
            o.out_text = j.dump() + "\n";
            o.exit_code = 0;
            break;
        }
        case HookAdapter::Gemini: {
            json j = {{"decision", allow ? "allow" : "deny"}, {"reason", msg}};
            o.out_text = j.dump() + "\n";
            o.exit_code = 0;
            break;
        }
        case HookAdapter::Cursor: {
            json j = {
                {"permission", allow ? "allow" : "deny"},
                {"userMessage", msg},
                {"agentMessage", msg},
            };
            o.out_text = j.dump() + "\n";
            o.exit_code = 0;
            break;
        }
        case HookAdapter::OpenCode:
            o.err_text = msg + "\n";
            o.exit_code = r.exit_status();
            break;
        case HookAdapter::None:
            o.out_text = msg + "\n";
            o.exit_code = r.exit_status();
            break;
    }
    return o;
}

HookOutput render_hook_passthrough(HookAdapter a) {
    GateResult r;
    r.short_circuit = true;
    r.outcome.kind = AuthOutcomeKind::Approved;
    return render_hook_output(a, r);
}

HookOutput render_hook_error(HookAdapter a, const std::string& detail) {
    GateResult r;
    r.verdict.risk = RiskLevel::CRITICAL;
    r.outcome = AuthOutcome::denied(std::nullopt, AuthFailure::INTERNAL, detail);
    return render_hook_output(a, r);
}

} // namespace veto
