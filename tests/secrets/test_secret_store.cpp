// tests/secrets/test_secret_store.cpp
//
// Encrypted file backend (AES-256-GCM, PBKDF2) and SecretStore backend
// selection. Integrity failures must never look like "not found".

#include <filesystem>
#include <fstream>
#include <string>

#include <sodium.h>
#include <sys/stat.h>

#include "secret_store.h"
#include "veto_util.h"
#include "test_support.h"

using namespace veto;
using veto_test::check;

namespace {

// Keyring stand-in whose store works but whose load never returns what was stored.
class BrokenKeyring final : public SecretBackend {
public:
    int stores = 0;
    std::string name() const override { return "broken-keyring"; }
    SecretResult store(const std::string&, const std::string&) override {
        ++stores;
        return {true, SecretRc::OK, ""};
    }
    SecretResult load(const std::string&, std::string& out) override {
        out = "garbage";
        return {true, SecretRc::OK, ""};
    }
    SecretResult remove(const std::string&) override { return {true, SecretRc::OK, ""}; }
};

std::string enc_path(const std::string& dir, const std::string& key) {
    std::string f = key;
    for (char& c : f) {
        if (c == '.') c = '_';
    }
    return dir + "/" + f + ".enc";
}

void file_backend(const veto_test::TempDir& td) {
    const std::string dir = td.sub("secrets");
    auto b = make_file_secret_backend(dir, "machine-a-veto");

    std::string out;
    SecretResult r = b->load(kSecretTotpSeed, out);
    check(!r.ok && r.rc == SecretRc::NOT_FOUND, "missing key is NOT_FOUND");

    r = b->store(kSecretTotpSeed, "JBSWY3DPEHPK3PXP");
    check(r.ok, "store ok: " + r.detail);
    r = b->load(kSecretTotpSeed, out);
    check(r.ok && out == "JBSWY3DPEHPK3PXP", "load returns stored value");

    const std::string path = enc_path(dir, kSecretTotpSeed);
    struct stat st{};
    check(::stat(path.c_str(), &st) == 0 && (st.st_mode & 0777) == 0600, "secret file is 0600");
    check(::stat(dir.c_str(), &st) == 0 && (st.st_mode & 0777) == 0700, "secret dir is 0700");

    std::string raw;
    check(read_file(path, raw), "read raw blob");
    check(raw.compare(0, 4, "VSE1") == 0, "blob starts with magic");
    check(raw.find("JBSWY3DPEHPK3PXP") == std::string::npos, "plaintext not on disk");

    // Wrong passphrase.
    auto other = make_file_secret_backend(dir, "machine-b-veto");
    r = other->load(kSecretTotpSeed, out);
    check(!r.ok && r.rc == SecretRc::INTEGRITY, "wrong passphrase is INTEGRITY");

    // Flip one ciphertext byte.
    std::string tampered = raw;
    tampered[4 + 16 + 12] ^= 0x01;
    check(write_file_atomic(path, tampered, 0600, nullptr), "write tampered blob");
    r = b->load(kSecretTotpSeed, out);
    check(!r.ok && r.rc == SecretRc::INTEGRITY, "tampered blob is INTEGRITY");

    // Truncated file.
    check(write_file_atomic(path, raw.substr(0, 10), 0600, nullptr), "write truncated blob");
    r = b->load(kSecretTotpSeed, out);
    check(!r.ok && r.rc == SecretRc::INTEGRITY, "truncated blob is INTEGRITY");

    // A blob copied under another key name fails (key name is AAD).
    check(write_file_atomic(enc_path(dir, kSecretTelegramToken), raw, 0600, nullptr), "copy blob");
    r = b->load(kSecretTelegramToken, out);
    check(!r.ok && r.rc == SecretRc::INTEGRITY, "blob moved to another key is INTEGRITY");

    r = b->remove(kSecretTelegramToken);
    check(r.ok, "remove ok");
    r = b->remove(kSecretTelegramToken);
    check(r.ok, "removing a missing key is ok");
    r = b->load(kSecretTelegramToken, out);
    check(r.rc == SecretRc::NOT_FOUND, "removed key is NOT_FOUND");

    std::string err;
    check(secret_backend_self_test(*b, &err), "file backend passes self-test: " + err);
}

void store_selection(const veto_test::TempDir& td) {
    // Keyring that fails its self-test => file store.
    auto broken = std::make_unique<BrokenKeyring>();
    SecretStore s1(std::move(broken), make_file_secret_backend(td.sub("s1"), "p"));
    check(s1.backend_name() == "encrypted-file", "broken keyring falls back to file store (got " + s1.backend_name() + ")");

    // No keyring at all.
    SecretStore s2(nullptr, make_file_secret_backend(td.sub("s2"), "p"));
    check(s2.backend_name() == "encrypted-file", "null primary uses file store");
    check(!s2.has(kSecretPin), "has() false when missing");
    check(s2.store(kSecretPin, "h").ok, "store via SecretStore");
    check(s2.has(kSecretPin), "has() true after store");

    // Working keyring => primary; NOT_FOUND there consults the file store.
    auto fallback = make_file_secret_backend(td.sub("s3"), "p");
    check(fallback->store(kSecretTelegramToken, "123:abc").ok, "seed file store");
    auto mem = std::make_unique<veto_test::MemorySecretBackend>();
    SecretStore s3(std::move(mem), std::move(fallback));
    check(s3.backend_name() == "memory", "passing keyring becomes active");

    std::string out;
    SecretResult r = s3.load(kSecretTelegramToken, out);
    check(r.ok && out == "123:abc", "file copy found when keyring says NOT_FOUND");

    check(s3.remove(kSecretTelegramToken).ok, "remove through store");
    r = s3.load(kSecretTelegramToken, out);
    check(r.rc == SecretRc::NOT_FOUND, "remove clears both backends");

    // INTEGRITY from the active backend is never turned into NOT_FOUND.
    veto_test::MemorySecretBackend* raw = nullptr;
    auto s4 = veto_test::memory_store(&raw);
    raw->fail_load = true;
    r = s4->load(kSecretPin, out);
    check(r.rc == SecretRc::INTEGRITY, "integrity error surfaces");
    check(!s4->has(kSecretPin), "has() false on integrity error");
}

} // namespace

int main() {
    if (sodium_init() < 0) {
        std::cerr << "sodium_init failed\n";
        return 2;
    }
    veto_test::TempDir td;
    if (!td.ok()) {
        std::cerr << "FAIL: mkdtemp\n";
        return 2;
    }

    file_backend(td);
    store_selection(td);

    check(!machine_passphrase().empty(), "machine passphrase is never empty");
    check(secret_rc_name(SecretRc::INTEGRITY) == "integrity", "rc name");

    return veto_test::finish("test_secret_store");
}
