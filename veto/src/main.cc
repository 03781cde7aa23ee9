#include "audit_log.h"
#include "authenticator.h"
#include "challenge.h"
#include "cli.h"
#include "config.h"
#include "denied_memory.h"
#include "executor.h"
#include "gate.h"
#include "hook_adapter.h"
#include "rules.h"
#include "secret_store.h"
#include "veto_util.h"

#include "platform/platform_prompter.h"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sodium.h>

using namespace veto;

static constexpr const char* kVersion = "0.4.0";

static void usage() {
    std::cerr <<
        "veto " << kVersion << " - risk gate for AI agent commands\n"
        "\n"
        "usage:\n"
        "  veto check <command> [-v|--verbose] [-q|--quiet]\n"
        "  veto exec <command> [--auth <method>]\n"
        "  veto shell\n"
        "  veto gate [<command>] [--claude|--gemini|--cursor|--opencode]\n"
        "            [--pin <code>] [--totp <code>] [--auth <method>] [--file-op]\n"
        "  veto log [-n N] [-f] [--filter ALLOWED|DENIED|BLOCKED] [--clear]\n"
        "  veto auth <set-pin|setup-totp|setup-telegram|list|remove|test> ...\n"
        "\n"
        "environment: VETO_HOME VETO_PIN VETO_TOTP VETO_CONFIRM VETO_RESPONSE VETO_FORCE VETO_SESSION\n";
}

static std::optional<std::string> env_str(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

namespace veto {

bool load_config_or_report(const VetoPaths& paths, VetoConfig& cfg) {
    ConfigResult cr = load_config_file(paths.config_toml, cfg);
    if (!cr.ok) {
        std::cerr << "[config] " << cr.detail << std::endl;
        return false;
    }
    return true;
}

void GateRuntime::load(const VetoPaths& p) {
    paths = p;

    ConfigResult cr = load_config_file(paths.config_toml, cfg);
    if (!cr.ok) config_error = cr.detail;

    RuleSet rules;
    ConfigResult rr = load_rules_file(paths.rules_toml, rules);
    if (!rr.ok) {
        if (!config_error.empty()) config_error += "; ";
        config_error += rr.detail;
        rules = default_rules();
    }
    if (!config_error.empty()) std::cerr << "[config] " << config_error << std::endl;

    engine = std::make_unique<RulesEngine>(std::move(rules));
    audit = std::make_unique<AuditLog>(paths.audit_log);
}

void GateRuntime::open_auth() {
    if (auth) return;
    secrets = SecretStore::open_default(paths.secrets_dir);

    ChallengeConfig cc;
    cc.state_dir = paths.challenges_dir;
    challenges = std::make_unique<ChallengeManager>(cc, platform::make_challenge_notifiers(cfg, *secrets));

    prompter = std::make_unique<platform::PlatformPrompter>();
    auth = std::make_unique<Authenticator>(cfg, *secrets, *prompter, challenges.get());
}

GateResult GateRuntime::evaluate(const GateRequest& req) {
    const Verdict pre = req.file_op ? engine->classify_path(req.subject) : engine->classify(req.subject);
    if (config_error.empty() && pre.risk != RiskLevel::ALLOW) open_auth();

    gate = std::make_unique<Gate>(*engine, auth.get(), audit.get());
    if (!config_error.empty()) gate->set_config_error(config_error);
    return gate->evaluate(req);
}

} // namespace veto

static void apply_env_inputs(GateRequest& req) {
    req.pin = env_str("VETO_PIN");
    req.totp = env_str("VETO_TOTP");
    req.response = env_str("VETO_RESPONSE");
    req.confirm = env_is_yes("VETO_CONFIRM");
    req.force = env_is_yes("VETO_FORCE");
}

static bool parse_method_flag(const std::string& v, std::optional<AuthMethod>& out) {
    auto m = auth_method_from_string(v);
    if (!m) {
        std::cerr << "unknown auth method: " << v
                  << " (expected confirm, pin, totp, touchid, telegram or dialog)" << std::endl;
        return false;
    }
    out = *m;
    return true;
}

// ---- check ------------------------------------------------------------------

static int cmd_check(const std::vector<std::string>& args, const VetoPaths& paths) {
    bool verbose = false, quiet = false, file_op = false;
    std::optional<std::string> command;

    for (const auto& a : args) {
        if (a == "-v" || a == "--verbose") verbose = true;
        else if (a == "-q" || a == "--quiet") quiet = true;
        else if (a == "--file-op") file_op = true;
        else if (!command) command = a;
        else {
            std::cerr << "check: unexpected argument: " << a << std::endl;
            return 64;
        }
    }
    if (!command) {
        usage();
        return 64;
    }

    RuleSet rules;
    ConfigResult rr = load_rules_file(paths.rules_toml, rules);
    if (!rr.ok) {
        // Cannot classify safely: report the highest level.
        if (!quiet) std::cerr << "[config] " << rr.detail << std::endl;
        return static_cast<int>(RiskLevel::CRITICAL);
    }

    RulesEngine engine(std::move(rules));
    const Verdict v = file_op ? engine.classify_path(*command) : engine.classify(*command);

    if (!quiet) {
        std::cout << risk_to_string(v.risk);
        if (v.category && v.risk != RiskLevel::ALLOW) std::cout << " (" << *v.category << ")";
        std::cout << "\n";
        if (verbose) {
            std::cout << "  category: " << v.category.value_or("-") << "\n"
                      << "  reason:   " << v.reason.value_or("-") << "\n"
                      << "  pattern:  " << v.matched_pattern.value_or("-") << "\n";
            if (v.challenge) std::cout << "  challenge: required\n";
        }
    }
    return static_cast<int>(v.risk);
}

// ---- exec -------------------------------------------------------------------

static int cmd_exec(const std::vector<std::string>& args, const VetoPaths& paths) {
    GateRequest req;
    std::optional<std::string> command;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "--auth") {
            if (i + 1 >= args.size()) { std::cerr << "exec: --auth needs a method" << std::endl; return 64; }
            if (!parse_method_flag(args[++i], req.method_override)) return 64;
        } else if (!command) {
            command = a;
        } else {
            std::cerr << "exec: unexpected argument: " << a << std::endl;
            return 64;
        }
    }
    if (!command) {
        usage();
        return 64;
    }

    apply_env_inputs(req);
    req.subject = *command;
    req.interactive = true;

    DeniedMemory denied(paths.sessions_dir, default_session_key(""));
    req.denied = &denied;

    GateRuntime rt;
    rt.load(paths);
    GateResult r = rt.evaluate(req);

    if (!r.approved()) {
        std::cerr << hook_message(HookAdapter::None, r) << std::endl;
        return 1;
    }

    ExecResult x = exec_shell(*command, default_shell());
    if (!x.started) {
        std::cerr << "[exec] " << x.detail << std::endl;
        return 1;
    }
    return x.exit_code;
}

// ---- gate -------------------------------------------------------------------

static std::string read_all_stdin() {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

static int emit(const HookOutput& o) {
    if (!o.out_text.empty()) std::cout << o.out_text << std::flush;
    if (!o.err_text.empty()) std::cerr << o.err_text << std::flush;
    return o.exit_code;
}

static int cmd_gate(const std::vector<std::string>& args, const VetoPaths& paths) {
    HookAdapter adapter = HookAdapter::None;
    GateRequest req;
    std::optional<std::string> command;
    std::optional<std::string> flag_pin, flag_totp;
    bool flag_file_op = false;
    int adapters = 0;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "--claude")        { adapter = HookAdapter::Claude;   ++adapters; }
        else if (a == "--gemini")   { adapter = HookAdapter::Gemini;   ++adapters; }
        else if (a == "--cursor")   { adapter = HookAdapter::Cursor;   ++adapters; }
        else if (a == "--opencode") { adapter = HookAdapter::OpenCode; ++adapters; }
        else if (a == "--file-op")  flag_file_op = true;
        else if (a == "--pin" || a == "--totp" || a == "--auth") {
            if (i + 1 >= args.size()) { std::cerr << "gate: " << a << " needs a value" << std::endl; return 64; }
            const std::string& v = args[++i];
            if (a == "--pin") flag_pin = v;
            else if (a == "--totp") flag_totp = v;
            else if (!parse_method_flag(v, req.method_override)) return 64;
        } else if (!command) {
            command = a;
        } else {
            std::cerr << "gate: unexpected argument: " << a << std::endl;
            return 64;
        }
    }
    if (adapters > 1) {
        std::cerr << "gate: choose at most one of --claude, --gemini, --cursor, --opencode" << std::endl;
        return 64;
    }

    std::string hook_session;
    if (hook_reads_stdin(adapter)) {
        if (command) {
            std::cerr << "gate: --" << hook_adapter_name(adapter) << " reads the command from stdin" << std::endl;
            return 64;
        }
        HookInput in;
        std::string err;
        if (!parse_hook_input(adapter, read_all_stdin(), in, &err)) {
            std::cerr << "[hook] " << err << std::endl;
            return emit(render_hook_error(adapter, "unreadable hook payload: " + err));
        }
        if (in.nothing_to_gate) return emit(render_hook_passthrough(adapter));
        req.subject = in.subject;
        req.file_op = in.file_op;
        hook_session = in.session_id;
    } else {
        if (!command) {
            usage();
            return 64;
        }
        req.subject = *command;
        req.file_op = flag_file_op;
    }

    apply_env_inputs(req);

    if (adapter != HookAdapter::None && !req.file_op) {
        InlineInputs inl;
        req.subject = strip_inline_inputs(req.subject, inl);
        if (inl.pin) req.pin = inl.pin;
        if (inl.totp) req.totp = inl.totp;
        if (inl.response) req.response = inl.response;
        req.confirm = req.confirm || inl.confirm;
        req.force = req.force || inl.force;
    }
    if (flag_pin) req.pin = flag_pin;
    if (flag_totp) req.totp = flag_totp;

    DeniedMemory denied(paths.sessions_dir, default_session_key(hook_session));
    req.denied = &denied;

    GateRuntime rt;
    rt.load(paths);
    return emit(render_hook_output(adapter, rt.evaluate(req)));
}

int main(int argc, char** argv) {
    // run_cmd writes to child stdin pipes; a child that exits early must not kill us.
    std::signal(SIGPIPE, SIG_IGN);

    if (sodium_init() < 0) {
        std::cerr << "sodium_init failed" << std::endl;
        return 1;
    }

    if (argc < 2) {
        usage();
        return 64;
    }

    const std::string sub = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);

    if (sub == "-h" || sub == "--help" || sub == "help") {
        usage();
        return 0;
    }
    if (sub == "--version" || sub == "-V") {
        std::cout << "veto " << kVersion << "\n";
        return 0;
    }

    const VetoPaths paths = VetoPaths::from_env();

    if (sub == "check") return cmd_check(args, paths);
    if (sub == "exec")  return cmd_exec(args, paths);
    if (sub == "shell") return run_shell_command(args, paths);
    if (sub == "gate")  return cmd_gate(args, paths);
    if (sub == "log")   return run_log_command(args, paths);
    if (sub == "auth")  return run_auth_command(args, paths);

    std::cerr << "unknown command: " << sub << std::endl;
    usage();
    return 64;
}
