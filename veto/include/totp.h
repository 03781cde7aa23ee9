#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "secret_store.h"

namespace veto {

// RFC 6238 with the parameters every authenticator app defaults to.
constexpr int kTotpDigits = 6;
constexpr int kTotpPeriod = 30;
constexpr size_t kTotpSeedBytes = 20; // 160 bits

// RFC 4648 base32, uppercase, no padding on output.
std::string base32_encode(const unsigned char* data, size_t len);

// Accepts lower/upper case, ignores spaces and '=' padding.
bool base32_decode(const std::string& in, std::vector<unsigned char>& out);

// HMAC-SHA1 TOTP for the step containing `unix_time`.
std::string totp_code(const std::vector<unsigned char>& key, std::int64_t unix_time);

/*
Accepts the code for the current step and `skew_steps` steps either side.
Every candidate is compared in constant time; all windows are always checked.
*/
bool totp_verify(const std::vector<unsigned char>& key,
                 const std::string& code,
                 std::int64_t unix_time,
                 int skew_steps = 1);

// New random seed, base32-encoded.
std::string totp_generate_seed_b32();

// otpauth://totp/<issuer>:<account>?secret=...&issuer=...&algorithm=SHA1&digits=6&period=30
std::string totp_otpauth_url(const std::string& seed_b32,
                             const std::string& account,
                             const std::string& issuer);

SecretResult totp_load_seed(SecretStore& store, std::vector<unsigned char>& key);

} // namespace veto
