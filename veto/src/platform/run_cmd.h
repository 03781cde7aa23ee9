#pragma once
#include <string>
#include <vector>

namespace veto::platform {

    struct CmdResult {
        bool ok = false;        // exited normally with status 0
        bool timed_out = false;
        int exit_code = -1;     // -1 if killed / not started
        std::string out;        // stdout
        std::string err;        // stderr, shortened
    };

    /*
    Run argv[0] (PATH lookup) without a shell.

    - stdin_data: written to the child's stdin, then closed (nullptr => /dev/null)
    - timeout_sec: 0 => wait forever; otherwise SIGKILL after the deadline

    Never throws. A missing executable shows up as exit_code 127.
    */
    CmdResult run_cmd(const std::vector<std::string>& argv,
                      const std::string* stdin_data = nullptr,
                      int timeout_sec = 0);

    // True if `name` resolves to an executable file on $PATH (or is one, if it has a '/').
    bool have_executable(const std::string& name);

} // namespace veto::platform
