#include "shell_session.h"
#include "veto_util.h"

#include <filesystem>
#include <istream>
#include <ostream>

namespace veto {

namespace fs = std::filesystem;

ShellLine parse_shell_line(const std::string& line) {
    ShellLine out;
    out.text = trim_ws(line);
    if (out.text.empty()) return out;

    const size_t sp = out.text.find_first_of(" \t");
    const std::string word = out.text.substr(0, sp);
    const std::string rest = (sp == std::string::npos) ? std::string() : trim_ws(out.text.substr(sp));

    if (word == "exit" || word == "quit") {
        out.kind = ShellLineKind::Exit;
    } else if (word == "cd") {
        out.kind = ShellLineKind::Cd;
        out.text = rest;
    } else if (word == "pwd") {
        out.kind = ShellLineKind::Pwd;
    } else if (word == "help") {
        out.kind = ShellLineKind::Help;
    } else {
        out.kind = ShellLineKind::Command;
    }
    return out;
}

std::string expand_home(const std::string& target, const std::string& home) {
    if (home.empty()) return target;
    if (target.empty() || target == "~") return home;
    if (target.rfind("~/", 0) == 0) return (fs::path(home) / target.substr(2)).string();
    return target;
}

std::string shorten_home(const std::string& path, const std::string& home) {
    if (home.empty() || path.rfind(home, 0) != 0) return path;
    if (path.size() == home.size()) return "~";
    if (path[home.size()] != '/') return path;
    return "~" + path.substr(home.size());
}

static void print_help(std::ostream& out) {
    out << "veto shell builtins:\n"
           "  cd <dir>   change directory\n"
           "  pwd        print working directory\n"
           "  help       show this help\n"
           "  exit       leave the shell (also Ctrl+D)\n"
           "\n"
           "Every other line is risk-evaluated before it runs.\n";
}

static void print_refusal(std::ostream& out, const GateResult& r) {
    if (r.verdict.risk != RiskLevel::ALLOW) {
        out << "Risk: " << risk_to_string(r.verdict.risk);
        if (r.verdict.category) out << " (" << *r.verdict.category << ")";
        out << "\n";
        if (r.verdict.reason) out << "Reason: " << *r.verdict.reason << "\n";
    }
    if (r.outcome.failure == AuthFailure::USER_DECLINED) {
        out << "Cancelled.\n";
    } else {
        out << "Denied: " << (r.outcome.reason.empty() ? "not approved" : r.outcome.reason) << "\n";
    }
}

int run_shell_session(std::istream& in, std::ostream& out, const ShellHooks& hooks,
                      const std::string& home, bool prompt) {
    std::string line;
    for (;;) {
        if (prompt) {
            std::error_code ec;
            const fs::path cwd = fs::current_path(ec);
            out << "veto " << (ec ? std::string("?") : shorten_home(cwd.string(), home)) << " > " << std::flush;
        }
        if (!std::getline(in, line)) {
            if (prompt) out << "\n";
            break;
        }

        const ShellLine sl = parse_shell_line(line);
        switch (sl.kind) {
            case ShellLineKind::Empty:
                continue;
            case ShellLineKind::Exit:
                out << "Goodbye!\n";
                return 0;
            case ShellLineKind::Pwd: {
                std::error_code ec;
                const fs::path cwd = fs::current_path(ec);
                if (ec) out << "pwd: " << ec.message() << "\n";
                else out << cwd.string() << "\n";
                continue;
            }
            case ShellLineKind::Help:
                print_help(out);
                continue;
            case ShellLineKind::Cd: {
                const std::string target = expand_home(sl.text, home);
                std::error_code ec;
                fs::current_path(target, ec);
                if (ec) out << "cd: " << target << ": " << ec.message() << "\n";
                continue;
            }
            case ShellLineKind::Command:
                break;
        }

        const GateResult r = hooks.gate(sl.text);
        if (!r.approved()) {
            print_refusal(out, r);
            continue;
        }

        out << std::flush;
        const ExecResult x = hooks.run(sl.text);
        if (!x.started) out << "Error: " << x.detail << "\n";
        else if (x.exit_code != 0) out << "Exit: " << x.exit_code << "\n";
    }
    return 0;
}

} // namespace veto
