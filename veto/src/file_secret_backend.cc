#include "secret_store.h"
#include "veto_util.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

#include <sodium.h>
#include <openssl/evp.h>

namespace veto {

namespace {

constexpr char   kMagic[4]   = {'V', 'S', 'E', '1'};
constexpr size_t kSaltLen    = 16;
constexpr size_t kNonceLen   = 12;
constexpr size_t kTagLen     = 16;
constexpr size_t kKeyLen     = 32;
constexpr int    kPbkdf2Iter = 100000;

SecretResult res(SecretRc rc, std::string detail = {}) {
    SecretResult r;
    r.ok = (rc == SecretRc::OK);
    r.rc = rc;
    r.detail = std::move(detail);
    return r;
}

// EVP_CIPHER_CTX owner.
struct CipherCtx {
    EVP_CIPHER_CTX* p = EVP_CIPHER_CTX_new();
    ~CipherCtx() { if (p) EVP_CIPHER_CTX_free(p); }
    CipherCtx(const CipherCtx&) = delete;
    CipherCtx& operator=(const CipherCtx&) = delete;
    CipherCtx() = default;
};

bool derive_key(const std::string& passphrase, const unsigned char* salt, unsigned char out[kKeyLen]) {
    return PKCS5_PBKDF2_HMAC(passphrase.data(), (int)passphrase.size(),
                             salt, (int)kSaltLen,
                             kPbkdf2Iter, EVP_sha256(),
                             (int)kKeyLen, out) == 1;
}

class FileSecretBackend final : public SecretBackend {
public:
    FileSecretBackend(std::string dir, std::string passphrase)
        : dir_(std::move(dir)), passphrase_(std::move(passphrase)) {}

    ~FileSecretBackend() override {
        sodium_memzero(passphrase_.data(), passphrase_.size());
    }

    std::string name() const override { return "encrypted-file"; }

    SecretResult store(const std::string& key, const std::string& value) override {
        SecretResult d = ensure_dir_();
        if (!d.ok) return d;

        unsigned char salt[kSaltLen];
        unsigned char nonce[kNonceLen];
        randombytes_buf(salt, sizeof(salt));
        randombytes_buf(nonce, sizeof(nonce));

        unsigned char k[kKeyLen];
        if (!derive_key(passphrase_, salt, k)) return res(SecretRc::INTERNAL, "key derivation failed");

        std::vector<unsigned char> ct(value.size() + kTagLen);
        unsigned char tag[kTagLen];
        int len = 0, total = 0;

        CipherCtx ctx;
        bool ok = ctx.p
            && EVP_EncryptInit_ex(ctx.p, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1
            && EVP_CIPHER_CTX_ctrl(ctx.p, EVP_CTRL_GCM_SET_IVLEN, (int)kNonceLen, nullptr) == 1
            && EVP_EncryptInit_ex(ctx.p, nullptr, nullptr, k, nonce) == 1
            && EVP_EncryptUpdate(ctx.p, nullptr, &len,
                                 reinterpret_cast<const unsigned char*>(key.data()), (int)key.size()) == 1
            && EVP_EncryptUpdate(ctx.p, ct.data(), &len,
                                 reinterpret_cast<const unsigned char*>(value.data()), (int)value.size()) == 1;
        if (ok) {
            total = len;
            ok = EVP_EncryptFinal_ex(ctx.p, ct.data() + total, &len) == 1
              && EVP_CIPHER_CTX_ctrl(ctx.p, EVP_CTRL_GCM_GET_TAG, (int)kTagLen, tag) == 1;
            total += len;
        }
        sodium_memzero(k, sizeof(k));
        if (!ok) return res(SecretRc::INTERNAL, "encryption failed");

        std::string blob;
        blob.reserve(sizeof(kMagic) + kSaltLen + kNonceLen + (size_t)total + kTagLen);
        blob.append(kMagic, sizeof(kMagic));
        blob.append(reinterpret_cast<const char*>(salt), kSaltLen);
        blob.append(reinterpret_cast<const char*>(nonce), kNonceLen);
        blob.append(reinterpret_cast<const char*>(ct.data()), (size_t)total);
        blob.append(reinterpret_cast<const char*>(tag), kTagLen);

        std::string err;
        if (!write_file_atomic(path_for_(key), blob, 0600, &err)) {
            return res(SecretRc::IO, err);
        }
        return res(SecretRc::OK);
    }

    SecretResult load(const std::string& key, std::string& out) override {
        const std::string p = path_for_(key);
        std::error_code ec;
        if (!std::filesystem::exists(p, ec)) return res(SecretRc::NOT_FOUND, key);

        std::string blob;
        if (!read_file(p, blob)) return res(SecretRc::IO, "cannot read " + p);

        const size_t hdr = sizeof(kMagic) + kSaltLen + kNonceLen;
        if (blob.size() < hdr + kTagLen || std::memcmp(blob.data(), kMagic, sizeof(kMagic)) != 0) {
            return res(SecretRc::INTEGRITY, "malformed secret file for " + key);
        }

        const auto* base  = reinterpret_cast<const unsigned char*>(blob.data());
        const auto* salt  = base + sizeof(kMagic);
        const auto* nonce = salt + kSaltLen;
        const auto* ct    = nonce + kNonceLen;
        const size_t ct_len = blob.size() - hdr - kTagLen;
        unsigned char tag[kTagLen];
        std::memcpy(tag, ct + ct_len, kTagLen);

        unsigned char k[kKeyLen];
        if (!derive_key(passphrase_, salt, k)) return res(SecretRc::INTERNAL, "key derivation failed");

        std::vector<unsigned char> pt(ct_len + 16);
        int len = 0, total = 0;

        CipherCtx ctx;
        bool ok = ctx.p
            && EVP_DecryptInit_ex(ctx.p, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1
            && EVP_CIPHER_CTX_ctrl(ctx.p, EVP_CTRL_GCM_SET_IVLEN, (int)kNonceLen, nullptr) == 1
            && EVP_DecryptInit_ex(ctx.p, nullptr, nullptr, k, nonce) == 1
            && EVP_DecryptUpdate(ctx.p, nullptr, &len,
                                 reinterpret_cast<const unsigned char*>(key.data()), (int)key.size()) == 1
            && EVP_DecryptUpdate(ctx.p, pt.data(), &len, ct, (int)ct_len) == 1;
        if (ok) {
            total = len;
            ok = EVP_CIPHER_CTX_ctrl(ctx.p, EVP_CTRL_GCM_SET_TAG, (int)kTagLen, tag) == 1
              && EVP_DecryptFinal_ex(ctx.p, pt.data() + total, &len) == 1;
            total += len;
        }
        sodium_memzero(k, sizeof(k));

        if (!ok) {
            sodium_memzero(pt.data(), pt.size());
            return res(SecretRc::INTEGRITY, "authentication failed for " + key);
        }

        out.assign(reinterpret_cast<const char*>(pt.data()), (size_t)total);
        sodium_memzero(pt.data(), pt.size());
        return res(SecretRc::OK);
    }

    SecretResult remove(const std::string& key) override {
        const std::string p = path_for_(key);
        if (::unlink(p.c_str()) != 0 && errno != ENOENT) {
            return res(SecretRc::IO, "unlink " + p + ": " + std::strerror(errno));
        }
        return res(SecretRc::OK);
    }

private:
    std::string dir_;
    std::string passphrase_;

    std::string path_for_(const std::string& key) const {
        std::string f = key;
        for (char& c : f) {
            if (c == '.' || c == '/') c = '_';
        }
        return (std::filesystem::path(dir_) / (f + ".enc")).string();
    }

    SecretResult ensure_dir_() const {
        std::error_code ec;
        std::filesystem::create_directories(dir_, ec);
        if (ec) return res(SecretRc::IO, "create " + dir_ + ": " + ec.message());
        if (::chmod(dir_.c_str(), 0700) != 0) {
            return res(SecretRc::IO, "chmod " + dir_ + ": " + std::strerror(errno));
        }
        return res(SecretRc::OK);
    }
};

} // namespace

std::unique_ptr<SecretBackend> make_file_secret_backend(const std::string& dir,
                                                        const std::string& passphrase) {
    return std::make_unique<FileSecretBackend>(dir, passphrase);
}

} // namespace veto
