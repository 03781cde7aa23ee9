#pragma once
#include <string>
#include <vector>

#include "secret_store.h"

namespace veto {

/*
PIN
===

Stored as Argon2id(pin, salt) with libsodium's INTERACTIVE limits; the raw PIN
is never stored. Salt and hash are one secret under kSecretPin
("argon2id$<salt b64>$<hash b64>"), so a reader never pairs a new salt with
an old hash.

Verification recomputes the hash and compares the fixed-length digests with
sodium_memcmp, so timing does not depend on the candidate.
*/

constexpr size_t kPinMinLength = 4;

struct PinRecord {
    std::vector<unsigned char> hash; // 32 bytes
    std::vector<unsigned char> salt; // crypto_pwhash_SALTBYTES
};

bool pin_validate_format(const std::string& pin, std::string* err);

bool pin_hash(const std::string& pin,
              const std::vector<unsigned char>& salt,
              std::vector<unsigned char>& out,
              std::string* err);

// Fresh random salt.
bool pin_make_record(const std::string& pin, PinRecord& out, std::string* err);

bool pin_verify(const std::string& candidate, const PinRecord& rec);

SecretResult pin_store(SecretStore& store, const PinRecord& rec);
SecretResult pin_load(SecretStore& store, PinRecord& out);
SecretResult pin_remove(SecretStore& store);

} // namespace veto
