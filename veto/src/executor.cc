#include "executor.h"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>

#include <sys/wait.h>
#include <unistd.h>

namespace veto {

std::string default_shell() {
    const char* s = std::getenv("SHELL");
    if (s && *s) return s;
    return "/bin/sh";
}

ExecResult exec_shell(const std::string& command, const std::string& shell) {
    ExecResult res;

    pid_t pid = ::fork();
    if (pid < 0) {
        res.detail = std::string("fork: ") + std::strerror(errno);
        return res;
    }
    if (pid == 0) {
        // veto itself ignores SIGPIPE; the command gets the default back.
        std::signal(SIGPIPE, SIG_DFL);
        ::execl(shell.c_str(), shell.c_str(), "-c", command.c_str(), (char*)nullptr);
        _exit(127);
    }

    int st = 0;
    for (;;) {
        pid_t w = ::waitpid(pid, &st, 0);
        if (w == pid) break;
        if (w < 0 && errno == EINTR) continue;
        res.detail = std::string("waitpid: ") + std::strerror(errno);
        return res;
    }

    res.started = true;
    if (WIFEXITED(st)) {
        res.exit_code = WEXITSTATUS(st);
        if (res.exit_code == 127) res.detail = "shell exited 127 (not found?)";
    } else if (WIFSIGNALED(st)) {
        res.exit_code = 128 + WTERMSIG(st);
    }
    return res;
}

} // namespace veto
