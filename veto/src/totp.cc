#include "totp.h"
#include "veto_util.h"

#include <cstdio>

#include <sodium.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace veto {

static const char* kB32Alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

std::string base32_encode(const unsigned char* data, size_t len) {
    std::string out;
    out.reserve((len * 8 + 4) / 5);
    unsigned buffer = 0;
    int bits = 0;
    for (size_t i = 0; i < len; i++) {
        buffer = (buffer << 8) | data[i];
        bits += 8;
        while (bits >= 5) {
            out.push_back(kB32Alphabet[(buffer >> (bits - 5)) & 0x1F]);
            bits -= 5;
        }
    }
    if (bits > 0) out.push_back(kB32Alphabet[(buffer << (5 - bits)) & 0x1F]);
    return out;
}

bool base32_decode(const std::string& in, std::vector<unsigned char>& out) {
    out.clear();
    unsigned buffer = 0;
    int bits = 0;
    for (char c : in) {
        if (c == ' ' || c == '=' || c == '-') continue;
        int v;
        if (c >= 'A' && c <= 'Z') v = c - 'A';
        else if (c >= 'a' && c <= 'z') v = c - 'a';
        else if (c >= '2' && c <= '7') v = c - '2' + 26;
        else return false;

        buffer = (buffer << 5) | (unsigned)v;
        bits += 5;
        if (bits >= 8) {
            out.push_back((unsigned char)((buffer >> (bits - 8)) & 0xFF));
            bits -= 8;
        }
    }
    return !out.empty();
}

// RFC 4226 dynamic truncation over HMAC-SHA1(key, counter_be64).
static std::string hotp(const std::vector<unsigned char>& key, std::uint64_t counter) {
    unsigned char msg[8];
    for (int i = 7; i >= 0; i--) {
        msg[i] = (unsigned char)(counter & 0xFF);
        counter >>= 8;
    }

    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    if (!HMAC(EVP_sha1(), key.data(), (int)key.size(), msg, sizeof(msg), mac, &mac_len) || mac_len < 20) {
        return {};
    }

    const int off = mac[mac_len - 1] & 0x0F;
    const std::uint32_t bin = ((std::uint32_t)(mac[off]     & 0x7F) << 24) |
                              ((std::uint32_t)(mac[off + 1] & 0xFF) << 16) |
                              ((std::uint32_t)(mac[off + 2] & 0xFF) << 8)  |
                              ((std::uint32_t)(mac[off + 3] & 0xFF));

    std::uint32_t mod = 1;
    for (int i = 0; i < kTotpDigits; i++) mod *= 10;

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%0*u", kTotpDigits, (unsigned)(bin % mod));
    return buf;
}

std::string totp_code(const std::vector<unsigned char>& key, std::int64_t unix_time) {
    if (unix_time < 0) return {};
    return hotp(key, (std::uint64_t)unix_time / kTotpPeriod);
}

bool totp_verify(const std::vector<unsigned char>& key,
                 const std::string& code,
                 std::int64_t unix_time,
                 int skew_steps) {
    if (key.empty() || unix_time < 0) return false;

    const std::string c = trim_ws(code);
    const std::int64_t step = unix_time / kTotpPeriod;

    bool match = false;
    for (int d = -skew_steps; d <= skew_steps; d++) {
        if (step + d < 0) continue;
        const std::string expect = hotp(key, (std::uint64_t)(step + d));
        if (expect.empty()) return false;
        match = ct_equal(expect, c) || match;
    }
    return match;
}

std::string totp_generate_seed_b32() {
    unsigned char seed[kTotpSeedBytes];
    randombytes_buf(seed, sizeof(seed));
    std::string s = base32_encode(seed, sizeof(seed));
    sodium_memzero(seed, sizeof(seed));
    return s;
}

static std::string url_encode(const std::string& s) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : s) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~' || c == '@') {
            out.push_back((char)c);
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0xF]);
        }
    }
    return out;
}

std::string totp_otpauth_url(const std::string& seed_b32,
                             const std::string& account,
                             const std::string& issuer) {
    return "otpauth://totp/" + url_encode(issuer) + ":" + url_encode(account) +
           "?secret=" + seed_b32 +
           "&issuer=" + url_encode(issuer) +
           "&algorithm=SHA1&digits=" + std::to_string(kTotpDigits) +
           "&period=" + std::to_string(kTotpPeriod);
}

SecretResult totp_load_seed(SecretStore& store, std::vector<unsigned char>& key) {
    std::string b32;
    SecretResult r = store.load(kSecretTotpSeed, b32);
    if (!r.ok) return r;

    const bool decoded = base32_decode(b32, key);
    sodium_memzero(b32.data(), b32.size());
    if (!decoded) {
        r.ok = false;
        r.rc = SecretRc::INTEGRITY;
        r.detail = "TOTP seed is not valid base32";
    }
    return r;
}

} // namespace veto
