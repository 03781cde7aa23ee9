// tests/exec/test_executor.cpp
//
// Approved commands run through the shell with their exit status preserved.

#include <csignal>
#include <string>

#include "executor.h"
#include "platform/run_cmd.h"
#include "veto_util.h"
#include "test_support.h"

using namespace veto;
using veto_test::check;

int main() {
    ExecResult r = exec_shell("exit 3", "/bin/sh");
    check(r.started && r.exit_code == 3, "exit status passes through");

    r = exec_shell("true", "/bin/sh");
    check(r.started && r.exit_code == 0, "success is 0");

    r = exec_shell("kill -TERM $$", "/bin/sh");
    check(r.started && r.exit_code == 128 + 15, "signal death is 128+N");

    r = exec_shell("true", "/nonexistent/shell");
    check(r.exit_code == 127, "missing shell exits 127");

    veto_test::TempDir td;
    check(td.ok(), "mkdtemp");
    const std::string marker = td.sub("ran");
    r = exec_shell("echo ok > '" + marker + "'", "/bin/sh");
    std::string text;
    check(r.exit_code == 0 && read_file(marker, text) && text == "ok\n", "command ran in a real shell");

    check(!default_shell().empty(), "default shell resolved");

    // The veto process ignores SIGPIPE; children must not inherit that.
    std::signal(SIGPIPE, SIG_IGN);
    r = exec_shell("kill -PIPE $$; echo survived", "/bin/sh");
    check(r.started && r.exit_code == 128 + SIGPIPE, "exec child dies of SIGPIPE by default");

    platform::CmdResult c = platform::run_cmd({"/bin/sh", "-c", "kill -PIPE $$; echo survived"});
    check(!c.ok && c.out.find("survived") == std::string::npos, "helper child dies of SIGPIPE by default");
    std::signal(SIGPIPE, SIG_DFL);
    return veto_test::finish("test_executor");
}
