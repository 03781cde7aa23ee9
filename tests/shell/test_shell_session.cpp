// tests/shell/test_shell_session.cpp
//
// Line parsing, builtins and the gate-then-run loop of the protected shell,
// with a scripted gate and runner in place of the real ones.

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include "shell_session.h"
#include "test_support.h"

using namespace veto;
using veto_test::check;

static void parsing() {
    check(parse_shell_line("   ").kind == ShellLineKind::Empty, "blank line");
    check(parse_shell_line("exit").kind == ShellLineKind::Exit, "exit");
    check(parse_shell_line(" quit ").kind == ShellLineKind::Exit, "quit");
    check(parse_shell_line("pwd").kind == ShellLineKind::Pwd, "pwd");
    check(parse_shell_line("help").kind == ShellLineKind::Help, "help");

    ShellLine cd = parse_shell_line("cd   /tmp ");
    check(cd.kind == ShellLineKind::Cd && cd.text == "/tmp", "cd target trimmed");
    cd = parse_shell_line("cd");
    check(cd.kind == ShellLineKind::Cd && cd.text.empty(), "bare cd");

    ShellLine cmd = parse_shell_line("  rm -rf build  ");
    check(cmd.kind == ShellLineKind::Command && cmd.text == "rm -rf build", "command trimmed");
    check(parse_shell_line("cdrom-eject").kind == ShellLineKind::Command, "builtin needs a whole word");
    check(parse_shell_line("exit_code_report").kind == ShellLineKind::Command, "exit prefix is a command");

    check(expand_home("", "/home/u") == "/home/u", "empty => home");
    check(expand_home("~", "/home/u") == "/home/u", "~ => home");
    check(expand_home("~/src", "/home/u") == "/home/u/src", "~/x");
    check(expand_home("/etc", "/home/u") == "/etc", "absolute unchanged");
    check(expand_home("~other", "/home/u") == "~other", "~user unchanged");

    check(shorten_home("/home/u/src", "/home/u") == "~/src", "shorten under home");
    check(shorten_home("/home/u", "/home/u") == "~", "home itself");
    check(shorten_home("/home/user2", "/home/u") == "/home/user2", "prefix is not a parent");
    check(shorten_home("/usr/bin", "/home/u") == "/usr/bin", "outside home");
}

struct Script {
    std::vector<std::string> gated;
    std::vector<std::string> ran;

    ShellHooks hooks() {
        ShellHooks h;
        h.gate = [this](const std::string& command) {
            gated.push_back(command);
            GateResult r;
            if (command.rfind("rm ", 0) == 0) {
                r.verdict.risk = RiskLevel::CRITICAL;
                r.verdict.category = std::string("destructive");
                r.verdict.reason = std::string("Recursive delete");
                r.outcome = AuthOutcome::denied(AuthMethod::Pin, AuthFailure::BAD_CREDENTIAL, "Incorrect PIN");
            } else if (command.rfind("git push", 0) == 0) {
                r.verdict.risk = RiskLevel::HIGH;
                r.outcome = AuthOutcome::denied(AuthMethod::Confirm, AuthFailure::USER_DECLINED, "Declined by user");
            } else {
                r.short_circuit = true;
                r.outcome.kind = AuthOutcomeKind::Approved;
            }
            return r;
        };
        h.run = [this](const std::string& command) {
            ran.push_back(command);
            ExecResult x;
            x.started = true;
            x.exit_code = (command == "false") ? 1 : 0;
            return x;
        };
        return h;
    }
};

static void session(const veto_test::TempDir& td) {
    std::error_code ec;
    const std::filesystem::path start = std::filesystem::current_path(ec);
    const std::string target = std::filesystem::canonical(td.path(), ec).string();

    Script s;
    std::istringstream in(
        "\n"
        "ls -la\n"
        "rm -rf /\n"
        "git push -f\n"
        "false\n"
        "cd " + target + "\n"
        "pwd\n"
        "cd /definitely/not/here\n"
        "help\n"
        "exit\n"
        "echo after exit\n");
    std::ostringstream out;
    const int rc = run_shell_session(in, out, s.hooks(), "/home/nobody", false);
    const std::string text = out.str();

    check(rc == 0, "exit returns 0");
    check(s.gated.size() == 4, "every non-builtin line is gated");
    check(s.ran.size() == 2 && s.ran[0] == "ls -la" && s.ran[1] == "false", "only approved lines run");
    check(text.find("Risk: CRITICAL (destructive)") != std::string::npos, "refusal shows the risk");
    check(text.find("Reason: Recursive delete") != std::string::npos, "refusal shows the reason");
    check(text.find("Denied: Incorrect PIN") != std::string::npos, "refusal shows why");
    check(text.find("Cancelled.") != std::string::npos, "declined prompt reads as cancelled");
    check(text.find("Exit: 1") != std::string::npos, "non-zero exit reported");
    check(text.find(target + "\n") != std::string::npos, "cd then pwd");
    check(text.find("cd: /definitely/not/here:") != std::string::npos, "cd failure reported");
    check(text.find("Every other line is risk-evaluated") != std::string::npos, "help text");
    check(text.find("Goodbye!") != std::string::npos, "exit says goodbye");
    for (const auto& g : s.gated) check(g != "echo after exit", "nothing runs after exit");

    // EOF ends the session like exit.
    Script eof;
    std::istringstream in2("ls\n");
    std::ostringstream out2;
    check(run_shell_session(in2, out2, eof.hooks(), "", false) == 0 && eof.ran.size() == 1, "EOF ends the session");

    std::filesystem::current_path(start, ec);
}

int main() {
    veto_test::TempDir td;
    if (!td.ok()) {
        std::cerr << "FAIL: mkdtemp\n";
        return 2;
    }
    parsing();
    session(td);
    return veto_test::finish("test_shell_session");
}
