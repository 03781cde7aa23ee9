#pragma once
#include <optional>
#include <string>

#include "gate.h"

namespace veto {

/*
Hook adapters
=============

Serialization only: every adapter feeds the same Gate and only changes how
the request is read and how the decision is written back.

  adapter   input                                       output
  -------   -----                                       ------
  none      command argument                            text on stdout, exit 0/1/2
  claude    stdin {session_id, tool_name, tool_input}   hookSpecificOutput JSON, exit 0
  gemini    stdin {session_id, tool_name, tool_input}   {decision, reason}, exit 0
  cursor    stdin {conversation_id, command|file_path}  {permission, userMessage, agentMessage}, exit 0
  opencode  command argument                            text on stderr, exit 0/1/2

In hook modes stdout carries only the payload.
*/

enum class HookAdapter : int {
    None = 0,
    Claude,
    Gemini,
    Cursor,
    OpenCode,
};

std::string hook_adapter_name(HookAdapter a);

// True for adapters that read their request from stdin JSON.
bool hook_reads_stdin(HookAdapter a);

struct HookInput {
    std::string subject;
    bool file_op = false;
    std::string session_id;
    std::string tool_name;

    // Payload had no command or file path (e.g. a web fetch tool).
    bool nothing_to_gate = false;
};

// Malformed JSON or a non-object payload => false (*err); callers must deny.
bool parse_hook_input(HookAdapter a, const std::string& stdin_text, HookInput& out, std::string* err);

/*
Inline inputs
-------------
Leading assignments in the command text, as an agent would write them:

  VETO_PIN=1234 VETO_FORCE=yes git push -f origin main

Recognized names: VETO_PIN, VETO_TOTP, VETO_RESPONSE, VETO_CONFIRM, VETO_FORCE.
Values may be single- or double-quoted. Extraction stops at the first token
that is not a recognized assignment; the remainder is what gets classified.
*/
struct InlineInputs {
    std::optional<std::string> pin;
    std::optional<std::string> totp;
    std::optional<std::string> response;
    bool confirm = false;
    bool force = false;
};

std::string strip_inline_inputs(const std::string& command, InlineInputs& out);

struct HookOutput {
    std::string out_text; // stdout
    std::string err_text; // stderr
    int exit_code = 1;
};

// Human/agent-facing one-liner for a decision (adapter-specific wording).
std::string hook_message(HookAdapter a, const GateResult& r);

HookOutput render_hook_output(HookAdapter a, const GateResult& r);

// Payload that allows a tool call veto has nothing to say about.
HookOutput render_hook_passthrough(HookAdapter a);

// Fail-closed payload for a request that could not even be read.
HookOutput render_hook_error(HookAdapter a, const std::string& detail);

} // namespace veto
