#include "platform/system_secret_backend.h"
#include "platform/run_cmd.h"

#include <sodium.h>

namespace veto::platform {

static constexpr const char* kService = "veto";

static SecretResult res(SecretRc rc, std::string detail = {}) {
    SecretResult r;
    r.ok = (rc == SecretRc::OK);
    r.rc = rc;
    r.detail = std::move(detail);
    return r;
}

static void wipe(std::string& s) {
    sodium_memzero(s.data(), s.size());
    s.clear();
}

#if defined(__APPLE__)

/*
macOS keychain via /usr/bin/security.

Values are passed through `security -i` on stdin so they never show up in
the process table. Exit status 44 = item not found.
*/
class KeychainBackend final : public SecretBackend {
public:
    std::string name() const override { return "macos-keychain"; }

    SecretResult store(const std::string& key, const std::string& value) override {
        for (char c : value) {
            if (c == '"' || c == '\\' || c == '\n') return res(SecretRc::INTERNAL, "value not storable in keychain");
        }
        std::string script = "add-generic-password -U -s " + std::string(kService) +
                             " -a \"" + key + "\" -w \"" + value + "\"\n";
        CmdResult r = run_cmd({"security", "-i"}, &script, 15);
        wipe(script);
        if (!r.ok) return res(SecretRc::BACKEND_UNAVAILABLE, "security add-generic-password: " + r.err);
        return res(SecretRc::OK);
    }

    SecretResult load(const std::string& key, std::string& out) override {
        CmdResult r = run_cmd({"security", "find-generic-password", "-s", kService, "-a", key, "-w"}, nullptr, 15);
        if (r.exit_code == 44) return res(SecretRc::NOT_FOUND, key);
        if (!r.ok) {
            wipe(r.out);
            return res(SecretRc::BACKEND_UNAVAILABLE, "security find-generic-password: " + r.err);
        }
        while (!r.out.empty() && (r.out.back() == '\n' || r.out.back() == '\r')) r.out.pop_back();
        out = r.out;
        wipe(r.out);
        return res(SecretRc::OK);
    }

    SecretResult remove(const std::string& key) override {
        CmdResult r = run_cmd({"security", "delete-generic-password", "-s", kService, "-a", key}, nullptr, 15);
        if (r.ok || r.exit_code == 44) return res(SecretRc::OK);
        return res(SecretRc::BACKEND_UNAVAILABLE, "security delete-generic-password: " + r.err);
    }
};

std::unique_ptr<SecretBackend> make_system_secret_backend() {
    if (!have_executable("security")) return nullptr;
    return std::make_unique<KeychainBackend>();
}

#else

/*
Secret Service (GNOME keyring, KWallet bridge, ...) via secret-tool.

Attributes: service=veto key=<name>. `lookup` exits 1 with empty output when
the item does not exist; any stderr output means the service itself failed.
*/
class SecretToolBackend final : public SecretBackend {
public:
    std::string name() const override { return "secret-service"; }

    SecretResult store(const std::string& key, const std::string& value) override {
        std::string v = value;
        CmdResult r = run_cmd({"secret-tool", "store", "--label=veto: " + key,
                               "service", kService, "key", key}, &v, 15);
        wipe(v);
        if (!r.ok) return res(SecretRc::BACKEND_UNAVAILABLE, "secret-tool store: " + r.err);
        return res(SecretRc::OK);
    }

    SecretResult load(const std::string& key, std::string& out) override {
        CmdResult r = run_cmd({"secret-tool", "lookup", "service", kService, "key", key}, nullptr, 15);
        if (!r.ok) {
            wipe(r.out);
            if (r.exit_code == 1 && r.err.empty()) return res(SecretRc::NOT_FOUND, key);
            return res(SecretRc::BACKEND_UNAVAILABLE, "secret-tool lookup: " + r.err);
        }
        out = r.out;
        wipe(r.out);
        return res(SecretRc::OK);
    }

    SecretResult remove(const std::string& key) override {
        CmdResult r = run_cmd({"secret-tool", "clear", "service", kService, "key", key}, nullptr, 15);
        // clear exits 1 when nothing matched.
        if (r.ok || (r.exit_code == 1 && r.err.empty())) return res(SecretRc::OK);
        return res(SecretRc::BACKEND_UNAVAILABLE, "secret-tool clear: " + r.err);
    }
};

std::unique_ptr<SecretBackend> make_system_secret_backend() {
    if (!have_executable("secret-tool")) return nullptr;
    return std::make_unique<SecretToolBackend>();
}

#endif

} // namespace veto::platform
