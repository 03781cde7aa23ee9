#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "risk.h"

namespace veto {

/*
AuditEntry
==========

One gate decision. Rendered as exactly one line:

  [2026-10-19 14:03:12] DENIED HIGH pin "git push -f origin main"

  [<local time>] <RESULT> <RISK> <auth method | -> "<command>"

RESULT:
  ALLOWED  approved (or ALLOW risk, no auth needed)
  DENIED   a human or a credential check said no
  BLOCKED  stopped without a human decision (needs input, config error,
           method unavailable)

The command is quoted with \\ \" \n \r \t escaped, so an entry can never
span lines. Nothing secret is ever part of an entry.
*/

enum class AuditResult : int {
    ALLOWED = 0,
    DENIED  = 1,
    BLOCKED = 2,
};

std::string audit_result_name(AuditResult r);
std::optional<AuditResult> audit_result_from_string(const std::string& s); // case-insensitive

struct AuditEntry {
    std::string timestamp; // empty => stamped by append()
    AuditResult result = AuditResult::BLOCKED;
    RiskLevel risk = RiskLevel::ALLOW;
    std::optional<std::string> auth_method;
    std::string command;
};

std::string format_audit_line(const AuditEntry& e); // without trailing '\n'
bool parse_audit_line(const std::string& line, AuditEntry& out);

enum class AuditRc : int {
    OK = 0,
    IO = 10,
    LOCK = 11,
    INTERNAL = 99,
};

struct AuditStatus {
    bool ok = false;
    AuditRc rc = AuditRc::INTERNAL;
    std::string detail;
};

/*
AuditLog
========

Append-only text log shared by every veto process on the machine.

Append:
- exclusive flock on the log file (concurrent hooks interleave by whole lines)
- if the file does not end in '\n' (a writer died mid-line), start on a fresh
  line so the torn fragment cannot swallow this entry
- one write(2) of the full line on an O_APPEND descriptor, then fsync

Readers only consider '\n'-terminated lines and skip lines that do not
parse, so a crash leaves every earlier entry readable.
*/
class AuditLog {
public:
    explicit AuditLog(std::string path);

    AuditStatus append(const AuditEntry& e);

    // Visit entries in file order (streaming, no full materialization).
    // *end_offset: byte offset just past the last complete line read.
    AuditStatus scan(std::optional<AuditResult> filter,
                     const std::function<void(const AuditEntry&)>& visit,
                     std::uintmax_t* end_offset = nullptr) const;

    // Last `tail_n` matching entries, oldest first. tail_n == 0 => all.
    AuditStatus read(std::optional<AuditResult> filter,
                     size_t tail_n,
                     std::vector<AuditEntry>& out,
                     std::uintmax_t* end_offset = nullptr) const;

    /*
    Block and report entries appended after `from_offset` (default: the size
    of the file at the call), until `stop` becomes true. Pass the end_offset
    of a preceding read() to continue it without a gap. Polls every `poll_ms`.
    Truncation (log --clear from another process) restarts from the
    beginning. The file handle is scoped to the call.
    */
    AuditStatus follow(std::optional<AuditResult> filter,
                       const std::atomic<bool>& stop,
                       const std::function<void(const AuditEntry&)>& on_entry,
                       int poll_ms = 200,
                       std::optional<std::uintmax_t> from_offset = std::nullopt) const;

    // Truncate to zero length. Confirmation is the caller's job.
    AuditStatus clear();

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace veto
