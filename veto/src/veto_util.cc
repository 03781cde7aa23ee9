#include "veto_util.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <sodium.h>
#include <openssl/sha.h>

namespace veto {

long now_epoch() {
    return (long)std::time(nullptr);
}

std::string lower_ascii(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::string upper_ascii(std::string s) {
    for (char& c : s) c = (char)std::toupper((unsigned char)c);
    return s;
}

std::string trim_ws(std::string s) {
    // ASCII whitespace only; no locale-dependent rules.
    auto is_ws = [](unsigned char c){ return c==' '||c=='\t'||c=='\r'||c=='\n'; };
    while (!s.empty() && is_ws((unsigned char)s.front())) s.erase(s.begin());
    while (!s.empty() && is_ws((unsigned char)s.back()))  s.pop_back();
    return s;
}

std::string now_local_timestamp() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::string hex_lower(const unsigned char* p, size_t n) {
    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.resize(n * 2);
    for (size_t i = 0; i < n; i++) {
        out[i*2+0] = kHex[(p[i] >> 4) & 0xF];
        out[i*2+1] = kHex[(p[i] >> 0) & 0xF];
    }
    return out;
}

/*
SHA-256 helper returning lowercase hex.

Used for:
- binding challenges to the exact command string
- keying denied-command memory without storing the raw command

Not a password hash.
*/
std::string sha256_hex(const std::string& s) {
    unsigned char h[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(s.data()), s.size(), h);
    return hex_lower(h, sizeof(h));
}

std::string b64_std(const unsigned char* data, size_t len) {
    size_t outLen = sodium_base64_encoded_len(len, sodium_base64_VARIANT_ORIGINAL);
    std::string out(outLen, '\0');
    sodium_bin2base64(out.data(), out.size(), data, len, sodium_base64_VARIANT_ORIGINAL);
    out.resize(std::strlen(out.c_str()));
    return out;
}

std::vector<unsigned char> b64decode_loose(const std::string& in) {
    std::string s;
    s.reserve(in.size());
    for (char c : in) {
        if (c != '\n' && c != '\r' && c != ' ' && c != '\t') s.push_back(c);
    }

    std::vector<unsigned char> out(s.size() + 8);
    size_t out_len = 0;

    auto try_variant = [&](int variant) -> bool {
        out_len = 0;
        return sodium_base642bin(out.data(), out.size(),
                                 s.c_str(), s.size(),
                                 nullptr, &out_len, nullptr,
                                 variant) == 0;
    };

    if (try_variant(sodium_base64_VARIANT_ORIGINAL) ||
        try_variant(sodium_base64_VARIANT_URLSAFE) ||
        try_variant(sodium_base64_VARIANT_URLSAFE_NO_PADDING)) {
        out.resize(out_len);
        return out;
    }

    throw std::runtime_error("invalid base64");
}

std::string shorten(const std::string& s, size_t maxlen) {
    if (s.size() <= maxlen) return s;
    return s.substr(0, maxlen) + "...";
}

std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default:  out += c;
        }
    }
    return out;
}

bool ct_equal(const std::string& a, const std::string& b) {
    const size_t n = std::max(a.size(), b.size());
    volatile unsigned char diff = (unsigned char)(a.size() != b.size());
    for (size_t i = 0; i < n; i++) {
        const unsigned char ca = i < a.size() ? (unsigned char)a[i] : 0;
        const unsigned char cb = i < b.size() ? (unsigned char)b[i] : 0;
        diff = diff | (unsigned char)(ca ^ cb);
    }
    return diff == 0;
}

std::string veto_home_dir() {
    if (const char* v = std::getenv("VETO_HOME")) {
        if (*v) return v;
    }
    if (const char* h = std::getenv("HOME")) {
        if (*h) return (std::filesystem::path(h) / ".veto").string();
    }
    return ".veto";
}

/*
Atomic replace: write <path>.tmp.<pid>, fsync, rename over <path>.

Readers either see the old complete file or the new complete file; a crash
mid-write leaves at most a stray tmp file, never a torn target. rename() is
atomic only within one filesystem, which holds because tmp sits beside target.
*/
bool write_file_atomic(const std::string& path,
                       const std::string& bytes,
                       unsigned mode,
                       std::string* err) {
    std::filesystem::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);
    if (ec) {
        if (err) *err = "create_directories failed: " + ec.message();
        return false;
    }

    const std::string tmp = path + ".tmp." + std::to_string((long)::getpid());

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, (mode_t)mode);
    if (fd < 0) {
        if (err) *err = "open tmp failed: " + std::string(std::strerror(errno));
        return false;
    }

    size_t off = 0;
    while (off < bytes.size()) {
        ssize_t n = ::write(fd, bytes.data() + off, bytes.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (err) *err = "write tmp failed: " + std::string(std::strerror(errno));
            ::close(fd);
            ::unlink(tmp.c_str());
            return false;
        }
        off += (size_t)n;
    }

    if (::fsync(fd) != 0) {
        if (err) *err = "fsync tmp failed: " + std::string(std::strerror(errno));
        ::close(fd);
        ::unlink(tmp.c_str());
        return false;
    }
    ::close(fd);

    // open() honours umask; force the requested mode.
    if (::chmod(tmp.c_str(), (mode_t)mode) != 0) {
        if (err) *err = "chmod tmp failed: " + std::string(std::strerror(errno));
        ::unlink(tmp.c_str());
        return false;
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        if (err) *err = "rename failed: " + std::string(std::strerror(errno));
        ::unlink(tmp.c_str());
        return false;
    }
    return true;
}

bool read_file(const std::string& path, std::string& out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.good()) return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    return true;
}

bool env_is_yes(const char* name) {
    const char* v = std::getenv(name);
    if (!v) return false;
    const std::string s = lower_ascii(trim_ws(v));
    return s == "yes" || s == "y" || s == "true" || s == "1";
}

DirLock::DirLock(const std::string& dir) {
    const std::string p = (std::filesystem::path(dir) / ".lock").string();
    fd_ = ::open(p.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd_ < 0) {
        err_ = std::string("open lock: ") + std::strerror(errno);
        return;
    }
    while (::flock(fd_, LOCK_EX) != 0) {
        if (errno == EINTR) continue;
        err_ = std::string("flock: ") + std::strerror(errno);
        ::close(fd_);
        fd_ = -1;
        return;
    }
}

DirLock::~DirLock() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

} // namespace veto
