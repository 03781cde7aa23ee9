#pragma once
#include <cstdint>
#include <string>

namespace veto {

/*
Denied-command memory
=====================

Hook processes are short-lived (one per tool call), so "this session already
denied that command" must live on disk:

  <root>/sessions/<sha256(session key)>.json
  { "updated_at": 1760000000, "denied": ["<sha256(command)>", ...] }

Only hashes are stored. Updates hold an flock on <sessions_dir>/.lock, so
concurrent hooks never drop each other's entries. The whole file expires 1 hour after its last update.
Session key: VETO_SESSION, else the hook payload's session/conversation id,
else the parent pid (one interactive shell).
*/

constexpr int kDeniedMemoryTtlSec = 3600;

std::string default_session_key(const std::string& hook_session_id);

class DeniedMemory {
public:
    DeniedMemory(std::string sessions_dir, std::string session_key);

    // 0 => use now_epoch()
    std::int64_t now_unix_sec = 0;

    bool is_denied(const std::string& command) const;

    // Both return false (with *err) only on I/O failure.
    bool remember(const std::string& command, std::string* err);
    bool forget(const std::string& command, std::string* err);

    const std::string& session_key() const { return key_; }

private:
    std::string dir_;
    std::string key_;

    std::string path_() const;
    std::int64_t now_() const;
    bool update_(const std::string& command, bool deny, std::string* err);
};

} // namespace veto
