#pragma once
#include <functional>
#include <iosfwd>
#include <string>

#include "executor.h"
#include "gate.h"

namespace veto {

/*
Protected shell
===============

`veto shell` reads one command per line and sends every line that is not a
builtin through the gate; only approved lines run (via exec_shell).

Builtins run in the veto process itself:
  cd [dir]     change directory (no argument or "~" => $HOME, "~/x" => $HOME/x)
  pwd          print the working directory
  help         list builtins
  exit, quit   leave (EOF does the same)

A builtin is recognized by its first word only, so `cd` never reaches the
gate. Anything else, including shell syntax such as `cd a && rm b`, does.
*/

enum class ShellLineKind {
    Empty,
    Exit,
    Cd,
    Pwd,
    Help,
    Command,
};

struct ShellLine {
    ShellLineKind kind = ShellLineKind::Empty;
    std::string text; // trimmed line (Command) or cd target ("" => home)
};

ShellLine parse_shell_line(const std::string& line);

// "~" and "~/..." against `home`; other targets are returned unchanged.
std::string expand_home(const std::string& target, const std::string& home);

// "/home/u/src" -> "~/src" for the prompt.
std::string shorten_home(const std::string& path, const std::string& home);

struct ShellHooks {
    std::function<GateResult(const std::string& command)> gate;
    std::function<ExecResult(const std::string& command)> run;
};

// Returns 0 on exit/EOF. `prompt` prints "veto <cwd> > " before each read.
int run_shell_session(std::istream& in, std::ostream& out, const ShellHooks& hooks,
                      const std::string& home, bool prompt);

} // namespace veto
