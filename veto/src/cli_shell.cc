#include "cli.h"
#include "denied_memory.h"
#include "executor.h"
#include "shell_session.h"

#include <csignal>
#include <cstdlib>
#include <iostream>

#include <unistd.h>

namespace veto {

// Ctrl+C belongs to the running command; the shell itself keeps going.
// A handler (unlike SIG_IGN) is reset to the default across exec.
static void on_sigint(int) {}

int run_shell_command(const std::vector<std::string>& args, const VetoPaths& paths) {
    if (!args.empty()) {
        std::cerr << "shell: unexpected argument: " << args[0] << std::endl;
        return 64;
    }

    GateRuntime rt;
    rt.load(paths);

    // One denial memory per shell session.
    DeniedMemory denied(paths.sessions_dir, "shell-" + std::to_string((long)::getpid()));
    const std::string shell = default_shell();

    ShellHooks hooks;
    hooks.gate = [&](const std::string& command) {
        GateRequest req;
        req.subject = command;
        req.interactive = true;
        req.denied = &denied;
        return rt.evaluate(req);
    };
    hooks.run = [&](const std::string& command) {
        return exec_shell(command, shell);
    };

    struct sigaction sa{};
    sa.sa_handler = on_sigint;
    sa.sa_flags = SA_RESTART;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);

    const bool interactive = ::isatty(STDIN_FILENO) == 1;
    if (interactive) {
        std::cout << "veto protected shell: every command is risk-evaluated.\n"
                     "Type 'help' for builtins, 'exit' or Ctrl+D to quit.\n\n";
    }

    const char* home = std::getenv("HOME");
    return run_shell_session(std::cin, std::cout, hooks, home ? home : "", interactive);
}

} // namespace veto
