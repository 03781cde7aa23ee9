#include "audit_log.h"
#include "veto_util.h"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <deque>
#include <filesystem>
#include <fstream>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace veto {

/*
Audit log (line-oriented)
=========================

This file is the security record of veto: every gate decision ends up here,
including ALLOW short-circuits. It is plain text so `tail -f` and grep work,
and stable so `veto log --filter` can parse it back.

Crash model
-----------
- A process can die between any two syscalls. The only multi-step write is
  the single write(2) of one line; if it is cut short, the file ends without
  '\n'. The next append notices and terminates the fragment first.
- Readers never trust an unterminated last line.
- Nothing is ever rewritten in place; clear() is the only destructive call.
*/

static AuditStatus fail(AuditRc rc, std::string detail) {
    AuditStatus s;
    s.ok = false;
    s.rc = rc;
    s.detail = std::move(detail);
    return s;
}

static AuditStatus ok_status() {
    AuditStatus s;
    s.ok = true;
    s.rc = AuditRc::OK;
    return s;
}

std::string audit_result_name(AuditResult r) {
    switch (r) {
        case AuditResult::ALLOWED: return "ALLOWED";
        case AuditResult::DENIED:  return "DENIED";
        case AuditResult::BLOCKED: return "BLOCKED";
    }
    return "BLOCKED";
}

std::optional<AuditResult> audit_result_from_string(const std::string& s) {
    const std::string u = upper_ascii(trim_ws(s));
    if (u == "ALLOWED") return AuditResult::ALLOWED;
    if (u == "DENIED")  return AuditResult::DENIED;
    if (u == "BLOCKED") return AuditResult::BLOCKED;
    return std::nullopt;
}

static std::string escape_command(const std::string& s) {
    std::string o;
    o.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '\\': o += "\\\\"; break;
            case '"':  o += "\\\""; break;
            case '\n': o += "\\n"; break;
            case '\r': o += "\\r"; break;
            case '\t': o += "\\t"; break;
            default:   o += c;
        }
    }
    return o;
}

static bool unescape_command(const std::string& s, std::string& out) {
    out.clear();
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] != '\\') { out += s[i]; continue; }
        if (++i >= s.size()) return false;
        switch (s[i]) {
            case '\\': out += '\\'; break;
            case '"':  out += '"'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case 't':  out += '\t'; break;
            default:   return false;
        }
    }
    return true;
}

std::string format_audit_line(const AuditEntry& e) {
    std::string line;
    line += "[" + e.timestamp + "] ";
    line += audit_result_name(e.result) + " ";
    line += risk_to_string(e.risk) + " ";
    line += (e.auth_method && !e.auth_method->empty()) ? *e.auth_method : std::string("-");
    line += " \"" + escape_command(e.command) + "\"";
    return line;
}

bool parse_audit_line(const std::string& line, AuditEntry& out) {
    if (line.size() < 2 || line[0] != '[') return false;
    const size_t close = line.find("] ");
    if (close == std::string::npos) return false;

    AuditEntry e;
    e.timestamp = line.substr(1, close - 1);

    size_t pos = close + 2;
    auto next_word = [&](std::string& w) -> bool {
        const size_t sp = line.find(' ', pos);
        if (sp == std::string::npos || sp == pos) return false;
        w = line.substr(pos, sp - pos);
        pos = sp + 1;
        return true;
    };

    std::string result_s, risk_s, method_s;
    if (!next_word(result_s) || !next_word(risk_s) || !next_word(method_s)) return false;

    auto result = audit_result_from_string(result_s);
    auto risk = risk_from_string(risk_s);
    if (!result || !risk) return false;

    if (pos >= line.size() || line[pos] != '"' || line.back() != '"' || line.size() - pos < 2) return false;
    if (!unescape_command(line.substr(pos + 1, line.size() - pos - 2), e.command)) return false;

    e.result = *result;
    e.risk = *risk;
    if (method_s != "-") e.auth_method = method_s;

    out = std::move(e);
    return true;
}

AuditLog::AuditLog(std::string path) : path_(std::move(path)) {}

AuditStatus AuditLog::append(const AuditEntry& e_in) {
    AuditEntry e = e_in;
    if (e.timestamp.empty()) e.timestamp = now_local_timestamp();
    std::string line = format_audit_line(e) + "\n";

    std::error_code ec;
    const std::filesystem::path p(path_);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);
    if (ec) return fail(AuditRc::IO, "create_directories: " + ec.message());

    int fd = ::open(path_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) return fail(AuditRc::IO, "open " + path_ + ": " + std::strerror(errno));

    while (::flock(fd, LOCK_EX) != 0) {
        if (errno == EINTR) continue;
        const std::string why = std::strerror(errno);
        ::close(fd);
        return fail(AuditRc::LOCK, "flock: " + why);
    }

    // Under the lock the tail cannot move; check it for a torn previous write.
    struct stat sb{};
    if (::fstat(fd, &sb) == 0 && sb.st_size > 0) {
        int rfd = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
        if (rfd >= 0) {
            char last = '\n';
            if (::pread(rfd, &last, 1, sb.st_size - 1) == 1 && last != '\n') line.insert(line.begin(), '\n');
            ::close(rfd);
        }
    }

    AuditStatus st = ok_status();
    for (;;) {
        ssize_t n = ::write(fd, line.data(), line.size());
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) st = fail(AuditRc::IO, std::string("write: ") + std::strerror(errno));
        else if ((size_t)n != line.size()) st = fail(AuditRc::IO, "short write");
        break;
    }
    if (st.ok && ::fsync(fd) != 0) st = fail(AuditRc::IO, std::string("fsync: ") + std::strerror(errno));

    ::flock(fd, LOCK_UN);
    ::close(fd);
    return st;
}

AuditStatus AuditLog::scan(std::optional<AuditResult> filter,
                           const std::function<void(const AuditEntry&)>& visit,
                           std::uintmax_t* end_offset) const {
    if (end_offset) *end_offset = 0;
    std::ifstream f(path_, std::ios::binary);
    if (!f.good()) {
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec)) return ok_status(); // no log yet
        return fail(AuditRc::IO, "cannot open " + path_);
    }

    std::string line;
    std::uintmax_t consumed = 0;
    while (std::getline(f, line)) {
        if (f.eof()) break; // last line had no '\n'
        consumed += line.size() + 1;
        if (end_offset) *end_offset = consumed;
        AuditEntry e;
        if (!parse_audit_line(line, e)) continue;
        if (filter && e.result != *filter) continue;
        visit(e);
    }
    if (f.bad()) return fail(AuditRc::IO, "read error on " + path_);
    return ok_status();
}

AuditStatus AuditLog::read(std::optional<AuditResult> filter,
                           size_t tail_n,
                           std::vector<AuditEntry>& out,
                           std::uintmax_t* end_offset) const {
    std::deque<AuditEntry> window;
    AuditStatus st = scan(filter, [&](const AuditEntry& e) {
        window.push_back(e);
        if (tail_n > 0 && window.size() > tail_n) window.pop_front();
    }, end_offset);
    if (!st.ok) return st;
    out.assign(window.begin(), window.end());
    return st;
}

AuditStatus AuditLog::follow(std::optional<AuditResult> filter,
                             const std::atomic<bool>& stop,
                             const std::function<void(const AuditEntry&)>& on_entry,
                             int poll_ms,
                             std::optional<std::uintmax_t> from_offset) const {
    if (poll_ms <= 0) poll_ms = 200;

    std::error_code ec;
    std::uintmax_t offset = 0;
    if (from_offset) {
        offset = *from_offset;
    } else {
        offset = std::filesystem::exists(path_, ec) ? std::filesystem::file_size(path_, ec) : 0;
        if (ec) offset = 0;
    }

    std::string pending;
    while (!stop.load()) {
        std::uintmax_t size = 0;
        if (std::filesystem::exists(path_, ec)) size = std::filesystem::file_size(path_, ec);
        if (ec) size = 0;

        if (size < offset) {
            // Truncated underneath us.
            offset = 0;
            pending.clear();
        }

        if (size > offset) {
            std::ifstream f(path_, std::ios::binary);
            if (!f.good()) return fail(AuditRc::IO, "cannot open " + path_);
            f.seekg((std::streamoff)offset);
            std::string chunk((size_t)(size - offset), '\0');
            f.read(chunk.data(), (std::streamsize)chunk.size());
            const size_t got = (size_t)f.gcount();
            chunk.resize(got);
            offset += got;
            pending += chunk;

            size_t nl;
            while ((nl = pending.find('\n')) != std::string::npos) {
                const std::string line = pending.substr(0, nl);
                pending.erase(0, nl + 1);
                AuditEntry e;
                if (!parse_audit_line(line, e)) continue;
                if (filter && e.result != *filter) continue;
                on_entry(e);
            }
        }

        // Sleep in short slices so cancellation is prompt.
        for (int waited = 0; waited < poll_ms && !stop.load(); waited += 50) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
    return ok_status();
}

AuditStatus AuditLog::clear() {
    int fd = ::open(path_.c_str(), O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) return ok_status();
        return fail(AuditRc::IO, "open " + path_ + ": " + std::strerror(errno));
    }
    while (::flock(fd, LOCK_EX) != 0) {
        if (errno == EINTR) continue;
        const std::string why = std::strerror(errno);
        ::close(fd);
        return fail(AuditRc::LOCK, "flock: " + why);
    }
    AuditStatus st = ok_status();
    if (::ftruncate(fd, 0) != 0) st = fail(AuditRc::IO, std::string("ftruncate: ") + std::strerror(errno));
    else if (::fsync(fd) != 0) st = fail(AuditRc::IO, std::string("fsync: ") + std::strerror(errno));
    ::flock(fd, LOCK_UN);
    ::close(fd);
    return st;
}

} // namespace veto
