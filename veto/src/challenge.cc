#include "challenge.h"
#include "veto_util.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <nlohmann/json.hpp>
#include <sodium.h>

using json = nlohmann::json;

namespace veto {

namespace fs = std::filesystem;

static ChallengeResult fail(ChallengeRc rc, std::string detail) {
    ChallengeResult r;
    r.ok = false;
    r.rc = rc;
    r.detail = std::move(detail);
    return r;
}

static ChallengeResult ok_result() {
    ChallengeResult r;
    r.ok = true;
    r.rc = ChallengeRc::OK;
    return r;
}

bool challenge_applies(AuthMethod m) {
    return m == AuthMethod::Pin || m == AuthMethod::Confirm;
}

static bool ensure_dir(const std::string& dir, std::string* err) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        if (err) *err = "create " + dir + ": " + ec.message();
        return false;
    }
    if (::chmod(dir.c_str(), 0700) != 0) {
        if (err) *err = "chmod " + dir + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

ChallengeManager::ChallengeManager(ChallengeConfig cfg,
                                   std::vector<std::unique_ptr<ChallengeNotifier>> notifiers)
    : cfg_(std::move(cfg)), notifiers_(std::move(notifiers)) {}

std::int64_t ChallengeManager::now_() const {
    return cfg_.now_unix_sec > 0 ? cfg_.now_unix_sec : (std::int64_t)now_epoch();
}

std::string ChallengeManager::path_for_(const std::string& command) const {
    return (fs::path(cfg_.state_dir) / (sha256_hex(command) + ".json")).string();
}

bool ChallengeManager::load_(const std::string& path, Challenge& out) const {
    std::string text;
    if (!read_file(path, text)) return false;
    try {
        json j = json::parse(text);
        out.code = j.at("code").get<std::string>();
        out.created_at = j.at("created_at").get<std::int64_t>();
        out.expires_at = j.at("expires_at").get<std::int64_t>();
        out.used = j.value("used", true);
    } catch (const std::exception& e) {
        std::cerr << "[challenge] WARNING: unreadable state file " << path << ": " << e.what() << std::endl;
        return false;
    }
    return true;
}

bool ChallengeManager::save_(const std::string& path, const Challenge& c, std::string* err) const {
    json j = {
        {"code", c.code},
        {"created_at", c.created_at},
        {"expires_at", c.expires_at},
        {"used", c.used},
    };
    return write_file_atomic(path, j.dump(), 0600, err);
}

int ChallengeManager::sweep() {
    std::error_code ec;
    if (!fs::is_directory(cfg_.state_dir, ec)) return 0;

    const std::int64_t now = now_();
    int removed = 0;
    for (fs::directory_iterator it(cfg_.state_dir, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path& p = it->path();
        if (p.extension() != ".json") continue;

        Challenge c;
        // Unreadable files are stale by definition.
        if (load_(p.string(), c) && now < c.expires_at) continue;

        std::error_code rm_ec;
        if (fs::remove(p, rm_ec)) removed++;
        else if (rm_ec) std::cerr << "[challenge] WARNING: cannot remove " << p << ": " << rm_ec.message() << std::endl;
    }
    return removed;
}

ChallengeResult ChallengeManager::issue(const std::string& command, Challenge* out) {
    std::string err;
    if (!ensure_dir(cfg_.state_dir, &err)) return fail(ChallengeRc::IO, err);

    DirLock lock(cfg_.state_dir);
    if (!lock.ok()) return fail(ChallengeRc::IO, lock.err());

    sweep();

    Challenge c;
    c.code = std::to_string(1000 + randombytes_uniform(9000));
    c.created_at = now_();
    c.expires_at = c.created_at + kChallengeTtlSec;
    c.used = false;

    const std::string path = path_for_(command);
    if (!save_(path, c, &err)) return fail(ChallengeRc::IO, err);

    // Best effort to every channel; at least one must succeed.
    int delivered = 0;
    std::string failures;
    for (auto& n : notifiers_) {
        std::string nerr;
        if (n->deliver(c.code, command, &nerr)) {
            delivered++;
        } else {
            if (!failures.empty()) failures += "; ";
            failures += n->name() + ": " + nerr;
        }
    }

    if (delivered == 0) {
        std::error_code ec;
        fs::remove(path, ec);
        return fail(ChallengeRc::DELIVERY,
                    failures.empty() ? "no notification channel available" : failures);
    }

    if (out) *out = c;
    return ok_result();
}

ChallengeResult ChallengeManager::verify(const std::string& command,
                                         const std::string& response_in,
                                         AuthMethod method,
                                         const PinRecord* pin) {
    if (!challenge_applies(method)) {
        return fail(ChallengeRc::METHOD_UNSUPPORTED,
                    "challenge is not used with " + auth_method_name(method));
    }

    const std::string response = trim_ws(response_in);
    std::string pin_part, code_part;

    if (method == AuthMethod::Pin) {
        if (!pin) return fail(ChallengeRc::PIN_UNAVAILABLE, "PIN is not configured");
        if (response.size() <= kChallengeCodeLen) {
            return fail(ChallengeRc::BAD_FORMAT, "response must be PIN followed by the 4-digit code");
        }
        pin_part  = response.substr(0, response.size() - kChallengeCodeLen);
        code_part = response.substr(response.size() - kChallengeCodeLen);
    } else {
        code_part = response;
    }
    if (code_part.size() != kChallengeCodeLen) {
        return fail(ChallengeRc::BAD_FORMAT, "challenge code must be 4 digits");
    }

    std::error_code ec;
    if (!fs::is_directory(cfg_.state_dir, ec)) return fail(ChallengeRc::NOT_FOUND, "no pending challenge");

    DirLock lock(cfg_.state_dir);
    if (!lock.ok()) return fail(ChallengeRc::IO, lock.err());

    const std::string path = path_for_(command);
    Challenge c;
    if (!load_(path, c)) {
        sweep();
        return fail(ChallengeRc::NOT_FOUND, "no pending challenge for this command");
    }
    if (c.used) return fail(ChallengeRc::USED, "challenge already used");
    if (now_() >= c.expires_at) {
        sweep();
        return fail(ChallengeRc::EXPIRED, "challenge expired");
    }

    // Consume before judging the answer: one attempt per code.
    c.used = true;
    std::string err;
    if (!save_(path, c, &err)) return fail(ChallengeRc::IO, err);

    const bool code_ok = ct_equal(code_part, c.code);
    const bool pin_ok = (method != AuthMethod::Pin) || pin_verify(pin_part, *pin);
    sodium_memzero(pin_part.data(), pin_part.size());

    sweep();

    if (!pin_ok) return fail(ChallengeRc::PIN_MISMATCH, "incorrect PIN");
    if (!code_ok) return fail(ChallengeRc::CODE_MISMATCH, "incorrect challenge code");
    return ok_result();
}

} // namespace veto
