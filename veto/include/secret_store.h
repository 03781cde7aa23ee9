#pragma once
#include <memory>
#include <string>

namespace veto {

/*
Secret store
============

Keyed storage for the few long-lived secrets veto needs:

  veto.pin.hash        Argon2id hash of the PIN (base64)
  veto.pin.salt        its salt (base64)
  veto.totp.secret     TOTP seed (base32)
  veto.telegram.token  Telegram bot token

Backends:
- system keyring (secret-tool on Linux, `security` on macOS), used only if a
  live store/load/remove self-test passes
- encrypted files under <root>/secrets/ otherwise

Error kinds are kept apart on purpose: NOT_FOUND means "never configured",
INTEGRITY means "present but unreadable" and must never be treated as absent.
Values never appear in diagnostics.
*/

// "argon2id$<salt b64>$<hash b64>": salt and hash change together.
inline constexpr const char* kSecretPin           = "veto.pin";
inline constexpr const char* kSecretTotpSeed      = "veto.totp.secret";
inline constexpr const char* kSecretTelegramToken = "veto.telegram.token";

enum class SecretRc : int {
    OK = 0,
    NOT_FOUND = 10,
    BACKEND_UNAVAILABLE = 20,
    INTEGRITY = 30,
    IO = 40,
    INTERNAL = 99,
};

struct SecretResult {
    bool ok = false;
    SecretRc rc = SecretRc::INTERNAL;
    std::string detail; // short, never the value
};

std::string secret_rc_name(SecretRc rc);

class SecretBackend {
public:
    virtual ~SecretBackend() = default;

    virtual std::string name() const = 0;
    virtual SecretResult store(const std::string& key, const std::string& value) = 0;
    virtual SecretResult load(const std::string& key, std::string& out) = 0;

    // Removing a missing key is OK.
    virtual SecretResult remove(const std::string& key) = 0;
};

/*
Encrypted file backend.

One file per key: <dir>/<key with '.' -> '_'>.enc, mode 0600, dir 0700.

File layout:
  "VSE1" | salt[16] | nonce[12] | ciphertext | tag[16]

key = PBKDF2-HMAC-SHA256(passphrase, salt, 100000) -> 32 bytes
AES-256-GCM, AAD = logical key name (a blob copied to another key's file fails).
Writes go through tmp + rename.
*/
std::unique_ptr<SecretBackend> make_file_secret_backend(const std::string& dir,
                                                        const std::string& passphrase);

// Machine-bound passphrase for the file backend (machine id + "-veto").
std::string machine_passphrase();

// store/load/remove of a probe key; false (with *err) if any step misbehaves.
bool secret_backend_self_test(SecretBackend& b, std::string* err);

class SecretStore {
public:
    /*
    primary may be null (no system keyring on this platform).
    fallback must not be null.
    Backend choice happens once, here.
    */
    SecretStore(std::unique_ptr<SecretBackend> primary,
                std::unique_ptr<SecretBackend> fallback);

    // System keyring if it passes the self-test, else files under secrets_dir.
    static std::unique_ptr<SecretStore> open_default(const std::string& secrets_dir);

    SecretResult store(const std::string& key, const std::string& value);
    SecretResult load(const std::string& key, std::string& out);
    SecretResult remove(const std::string& key);

    // Convenience: true only on OK (INTEGRITY etc. are reported by load()).
    bool has(const std::string& key);

    std::string backend_name() const;

private:
    std::unique_ptr<SecretBackend> primary_;
    std::unique_ptr<SecretBackend> fallback_;
    SecretBackend* active_ = nullptr;
};

} // namespace veto
