#include "pin.h"
#include "veto_util.h"

#include <stdexcept>

#include <sodium.h>

namespace veto {

static constexpr size_t kPinHashLen = 32;

bool pin_validate_format(const std::string& pin, std::string* err) {
    if (pin.size() < kPinMinLength) {
        if (err) *err = "PIN must be at least " + std::to_string(kPinMinLength) + " characters";
        return false;
    }
    for (char c : pin) {
        if ((unsigned char)c < 0x20 || c == 0x7f) {
            if (err) *err = "PIN must not contain control characters";
            return false;
        }
    }
    return true;
}

bool pin_hash(const std::string& pin,
              const std::vector<unsigned char>& salt,
              std::vector<unsigned char>& out,
              std::string* err) {
    if (salt.size() != crypto_pwhash_SALTBYTES) {
        if (err) *err = "bad salt length";
        return false;
    }
    out.assign(kPinHashLen, 0);
    if (crypto_pwhash(out.data(), out.size(),
                      pin.data(), pin.size(),
                      salt.data(),
                      crypto_pwhash_OPSLIMIT_INTERACTIVE,
                      crypto_pwhash_MEMLIMIT_INTERACTIVE,
                      crypto_pwhash_ALG_ARGON2ID13) != 0) {
        if (err) *err = "argon2id failed (out of memory)";
        out.clear();
        return false;
    }
    return true;
}

bool pin_make_record(const std::string& pin, PinRecord& out, std::string* err) {
    if (!pin_validate_format(pin, err)) return false;
    PinRecord rec;
    rec.salt.resize(crypto_pwhash_SALTBYTES);
    randombytes_buf(rec.salt.data(), rec.salt.size());
    if (!pin_hash(pin, rec.salt, rec.hash, err)) return false;
    out = std::move(rec);
    return true;
}

bool pin_verify(const std::string& candidate, const PinRecord& rec) {
    if (rec.hash.size() != kPinHashLen) return false;

    std::vector<unsigned char> h;
    std::string err;
    if (!pin_hash(candidate, rec.salt, h, &err)) return false;

    return sodium_memcmp(h.data(), rec.hash.data(), kPinHashLen) == 0;
}

static constexpr const char* kPinRecordTag = "argon2id";

SecretResult pin_store(SecretStore& store, const PinRecord& rec) {
    std::string blob = std::string(kPinRecordTag) + "$" +
                       b64_std(rec.salt.data(), rec.salt.size()) + "$" +
                       b64_std(rec.hash.data(), rec.hash.size());
    return store.store(kSecretPin, blob);
}

SecretResult pin_load(SecretStore& store, PinRecord& out) {
    std::string blob;
    SecretResult r = store.load(kSecretPin, blob);
    if (!r.ok) return r;

    auto broken = [&](const std::string& why) {
        r.ok = false;
        r.rc = SecretRc::INTEGRITY;
        r.detail = "PIN record: " + why;
        return r;
    };

    const size_t d1 = blob.find('$');
    const size_t d2 = (d1 == std::string::npos) ? std::string::npos : blob.find('$', d1 + 1);
    if (d2 == std::string::npos || blob.compare(0, d1, kPinRecordTag) != 0) return broken("unrecognized format");

    PinRecord rec;
    try {
        rec.salt = b64decode_loose(blob.substr(d1 + 1, d2 - d1 - 1));
        rec.hash = b64decode_loose(blob.substr(d2 + 1));
    } catch (const std::exception& e) {
        return broken(e.what());
    }
    if (rec.hash.size() != kPinHashLen || rec.salt.size() != crypto_pwhash_SALTBYTES) {
        return broken("wrong length");
    }
    out = std::move(rec);
    return r;
}

SecretResult pin_remove(SecretStore& store) {
    return store.remove(kSecretPin);
}

} // namespace veto
