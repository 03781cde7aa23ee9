#pragma once
#include <string>

namespace veto {

    struct ExecResult {
        bool started = false;
        int exit_code = 1;  // child status; 128+N if killed by signal N
        std::string detail; // why it did not start
    };

    // $SHELL, else /bin/sh.
    std::string default_shell();

    // Run `command` via <shell> -c with inherited stdio and wait for it.
    ExecResult exec_shell(const std::string& command, const std::string& shell);

} // namespace veto
