#include "secret_store.h"
#include "platform/system_secret_backend.h"

#include <fstream>
#include <iostream>

#include <sodium.h>
#include <unistd.h>

namespace veto {

std::string secret_rc_name(SecretRc rc) {
    switch (rc) {
        case SecretRc::OK:                  return "ok";
        case SecretRc::NOT_FOUND:           return "not_found";
        case SecretRc::BACKEND_UNAVAILABLE: return "backend_unavailable";
        case SecretRc::INTEGRITY:           return "integrity";
        case SecretRc::IO:                  return "io";
        case SecretRc::INTERNAL:            return "internal";
    }
    return "internal";
}

std::string machine_passphrase() {
    for (const char* p : {"/etc/machine-id", "/var/lib/dbus/machine-id"}) {
        std::ifstream f(p);
        std::string id;
        if (f.good() && std::getline(f, id) && !id.empty()) return id + "-veto";
    }
    char host[256] = {0};
    if (::gethostname(host, sizeof(host) - 1) == 0 && host[0]) return std::string(host) + "-veto";
    return "veto";
}

bool secret_backend_self_test(SecretBackend& b, std::string* err) {
    static const std::string kProbeKey = "veto.backend.test";

    unsigned char rnd[16];
    randombytes_buf(rnd, sizeof(rnd));
    std::string probe;
    for (unsigned char c : rnd) probe.push_back("0123456789abcdef"[c & 0xF]);

    SecretResult r = b.store(kProbeKey, probe);
    if (!r.ok) {
        if (err) *err = "store: " + r.detail;
        return false;
    }

    std::string got;
    r = b.load(kProbeKey, got);
    const bool round_trip = r.ok && got == probe;

    SecretResult rm = b.remove(kProbeKey);
    if (!round_trip) {
        if (err) *err = r.ok ? "load returned a different value" : "load: " + r.detail;
        return false;
    }
    if (!rm.ok) {
        if (err) *err = "remove: " + rm.detail;
        return false;
    }
    return true;
}

SecretStore::SecretStore(std::unique_ptr<SecretBackend> primary,
                         std::unique_ptr<SecretBackend> fallback)
    : primary_(std::move(primary)), fallback_(std::move(fallback)) {
    if (primary_) {
        std::string err;
        if (secret_backend_self_test(*primary_, &err)) {
            active_ = primary_.get();
            return;
        }
        std::cerr << "[secrets] " << primary_->name() << " unavailable (" << err
                  << "), using encrypted file store" << std::endl;
    }
    active_ = fallback_.get();
}

std::unique_ptr<SecretStore> SecretStore::open_default(const std::string& secrets_dir) {
    return std::make_unique<SecretStore>(platform::make_system_secret_backend(),
                                         make_file_secret_backend(secrets_dir, machine_passphrase()));
}

static SecretResult no_backend() {
    SecretResult r;
    r.rc = SecretRc::BACKEND_UNAVAILABLE;
    r.detail = "no secret backend";
    return r;
}

SecretResult SecretStore::store(const std::string& key, const std::string& value) {
    if (!active_) return no_backend();
    return active_->store(key, value);
}

/*
A secret written while the keyring was down lives in the file store. If the
keyring is active now and says NOT_FOUND, look there too. Any other keyring
error is returned as is.
*/
SecretResult SecretStore::load(const std::string& key, std::string& out) {
    if (!active_) return no_backend();
    SecretResult r = active_->load(key, out);
    if (r.rc == SecretRc::NOT_FOUND && active_ != fallback_.get() && fallback_) {
        return fallback_->load(key, out);
    }
    return r;
}

// Remove from both so a stale file copy cannot resurface later.
SecretResult SecretStore::remove(const std::string& key) {
    if (!active_) return no_backend();
    SecretResult r = active_->remove(key);
    if (!r.ok) return r;
    if (active_ != fallback_.get() && fallback_) {
        return fallback_->remove(key);
    }
    return r;
}

bool SecretStore::has(const std::string& key) {
    std::string v;
    SecretResult r = load(key, v);
    sodium_memzero(v.data(), v.size());
    return r.ok;
}

std::string SecretStore::backend_name() const {
    return active_ ? active_->name() : "none";
}

} // namespace veto
