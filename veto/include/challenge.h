#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "config.h"
#include "pin.h"

namespace veto {

/*
Challenge-response
==================

For rules marked `challenge = true`, a static credential is not enough: the
human must also relay a fresh 4-digit code that was delivered out of band
(desktop notification, Telegram). An agent that learned the PIN once cannot
replay it, because the code changes per command and expires after 60 s.

State
-----
One JSON file per command under <root>/challenges/, named by the command's
SHA-256, so the latest issue for a command replaces any earlier one:

  { "code": "4827", "created_at": 1760000000, "expires_at": 1760000060, "used": false }

Files are written tmp + rename with mode 0600 and swept on every issue/verify
once expired. Issue and verify serialize on an flock'd lock file.

Response formats
----------------
  pin:     <PIN><code>     e.g. PIN 1234, code 4827 -> "12344827"
  confirm: <code>
  totp, touchid, telegram, dialog: no challenge (the method itself is fresh
  per request and bound to a human action on another channel)

Any verification attempt that reaches a live challenge consumes it, whether
or not it succeeds; a second attempt with the same code always fails.
*/

constexpr int kChallengeTtlSec = 60;
constexpr size_t kChallengeCodeLen = 4;

struct Challenge {
    std::string code;
    std::int64_t created_at = 0;
    std::int64_t expires_at = 0;
    bool used = false;
};

enum class ChallengeRc : int {
    OK = 0,

    NOT_FOUND = 10,
    EXPIRED = 11,
    USED = 12,

    BAD_FORMAT = 20,
    CODE_MISMATCH = 21,
    PIN_MISMATCH = 22,
    PIN_UNAVAILABLE = 23,
    METHOD_UNSUPPORTED = 24,

    DELIVERY = 30,
    IO = 40,

    INTERNAL = 99,
};

struct ChallengeResult {
    bool ok = false;
    ChallengeRc rc = ChallengeRc::INTERNAL;
    std::string detail; // never contains the code
};

// True if a challenge step is required when `m` guards a challenge rule.
bool challenge_applies(AuthMethod m);

// Out-of-band channel for challenge codes. Must not write the code to the
// agent-visible stdout/stderr.
class ChallengeNotifier {
public:
    virtual ~ChallengeNotifier() = default;
    virtual std::string name() const = 0;
    virtual bool deliver(const std::string& code, const std::string& command, std::string* err) = 0;
};

struct ChallengeConfig {
    std::string state_dir;

    // 0 => use now_epoch()
    std::int64_t now_unix_sec = 0;
};

class ChallengeManager {
public:
    ChallengeManager(ChallengeConfig cfg,
                     std::vector<std::unique_ptr<ChallengeNotifier>> notifiers);

    // Mutable so callers (and tests) can move the clock.
    ChallengeConfig& config() { return cfg_; }

    /*
    Generate a code (1000..9999 from libsodium's CSPRNG), persist it, and
    deliver it to every notifier. Fails with DELIVERY if no notifier took it,
    in which case nothing stays on disk.
    */
    ChallengeResult issue(const std::string& command, Challenge* out = nullptr);

    ChallengeResult verify(const std::string& command,
                           const std::string& response,
                           AuthMethod method,
                           const PinRecord* pin);

    // Delete expired challenge files. Returns the number removed.
    int sweep();

private:
    ChallengeConfig cfg_;
    std::vector<std::unique_ptr<ChallengeNotifier>> notifiers_;

    std::int64_t now_() const;
    std::string path_for_(const std::string& command) const;
    bool load_(const std::string& path, Challenge& out) const;
    bool save_(const std::string& path, const Challenge& c, std::string* err) const;
};

} // namespace veto
