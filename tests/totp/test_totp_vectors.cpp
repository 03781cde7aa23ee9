// tests/totp/test_totp_vectors.cpp
//
// RFC 6238 appendix B vectors (SHA1 seed, truncated to 6 digits) plus the
// +-1 step window and seed handling.

#include <string>
#include <vector>

#include <sodium.h>

#include "totp.h"
#include "test_support.h"

using namespace veto;
using veto_test::check;

struct Vector {
    std::int64_t t;
    const char* code;
};

static const Vector kRfc6238[] = {
    {59,          "287082"},
    {1111111109,  "081804"},
    {1111111111,  "050471"},
    {1234567890,  "005924"},
    {2000000000,  "279037"},
    {20000000000, "353130"},
};

static std::vector<unsigned char> rfc_key() {
    const std::string s = "12345678901234567890";
    return std::vector<unsigned char>(s.begin(), s.end());
}

static void vectors() {
    const auto key = rfc_key();
    for (const auto& v : kRfc6238) {
        const std::string got = totp_code(key, v.t);
        check(got == v.code, "T=" + std::to_string(v.t) + " expected " + v.code + " got " + got);
        check(totp_verify(key, v.code, v.t, 0), "verify exact step T=" + std::to_string(v.t));
    }
}

static void window() {
    const auto key = rfc_key();
    const std::int64_t t = 1111111111;
    const std::string prev = totp_code(key, t - 30);
    const std::string next = totp_code(key, t + 30);
    const std::string far = totp_code(key, t + 90);

    check(totp_verify(key, prev, t, 1), "previous step accepted");
    check(totp_verify(key, next, t, 1), "next step accepted");
    check(!totp_verify(key, far, t, 1), "three steps ahead rejected");
    check(!totp_verify(key, prev, t, 0), "no skew => previous step rejected");
    check(totp_verify(key, " 050471 ", t, 1), "surrounding whitespace ignored");
    check(!totp_verify(key, "05047", t, 1), "short code rejected");
    check(!totp_verify(key, "0504710", t, 1), "long code rejected");
    check(!totp_verify(key, "", t, 1), "empty code rejected");
    check(!totp_verify({}, "050471", t, 1), "empty key never verifies");
}

static void base32() {
    const std::string s = "12345678901234567890";
    const std::string b32 = base32_encode(reinterpret_cast<const unsigned char*>(s.data()), s.size());
    check(b32 == "GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQ", "base32 of RFC seed");

    std::vector<unsigned char> out;
    check(base32_decode("gezd gnbv gy3t qojq gezd gnbv gy3t qojq", out), "lowercase with spaces decodes");
    check(std::string(out.begin(), out.end()) == s, "decoded bytes");
    check(!base32_decode("GEZD1", out), "'1' is not base32");
    check(!base32_decode("", out), "empty is not a seed");
}

static void seeds() {
    const std::string a = totp_generate_seed_b32();
    const std::string b = totp_generate_seed_b32();
    check(a.size() == 32, "160-bit seed is 32 base32 chars");
    check(a != b, "seeds are random");

    std::vector<unsigned char> key;
    check(base32_decode(a, key) && key.size() == kTotpSeedBytes, "seed decodes to 20 bytes");

    const std::string url = totp_otpauth_url("JBSWY3DPEHPK3PXP", "me@host", "veto");
    check(url == "otpauth://totp/veto:me@host?secret=JBSWY3DPEHPK3PXP&issuer=veto&algorithm=SHA1&digits=6&period=30",
          "otpauth url: " + url);
    check(totp_otpauth_url("S", "a b", "x").find("a%20b") != std::string::npos, "account is url-encoded");
}

static void stored_seed() {
    veto_test::MemorySecretBackend* raw = nullptr;
    auto store = veto_test::memory_store(&raw);

    std::vector<unsigned char> key;
    SecretResult r = totp_load_seed(*store, key);
    check(r.rc == SecretRc::NOT_FOUND, "no seed => NOT_FOUND");

    raw->values[kSecretTotpSeed] = "GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQ";
    r = totp_load_seed(*store, key);
    check(r.ok && key == rfc_key(), "stored seed loads");

    raw->values[kSecretTotpSeed] = "not base32!";
    r = totp_load_seed(*store, key);
    check(!r.ok && r.rc == SecretRc::INTEGRITY, "garbage seed is INTEGRITY");
}

int main() {
    if (sodium_init() < 0) {
        std::cerr << "sodium_init failed\n";
        return 2;
    }
    vectors();
    window();
    base32();
    seeds();
    stored_seed();
    return veto_test::finish("test_totp_vectors");
}
