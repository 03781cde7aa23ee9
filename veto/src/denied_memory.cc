#include "denied_memory.h"
#include "veto_util.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <vector>

#include <unistd.h>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace veto {

std::string default_session_key(const std::string& hook_session_id) {
    if (const char* s = std::getenv("VETO_SESSION")) {
        if (*s) return s;
    }
    if (!hook_session_id.empty()) return hook_session_id;
    return "ppid-" + std::to_string((long)::getppid());
}

DeniedMemory::DeniedMemory(std::string sessions_dir, std::string session_key)
    : dir_(std::move(sessions_dir)), key_(std::move(session_key)) {}

std::string DeniedMemory::path_() const {
    return (std::filesystem::path(dir_) / (sha256_hex(key_) + ".json")).string();
}

std::int64_t DeniedMemory::now_() const {
    return now_unix_sec > 0 ? now_unix_sec : (std::int64_t)now_epoch();
}

struct SessionFile {
    std::int64_t updated_at = 0;
    std::vector<std::string> denied;
};

// Missing, expired or unreadable => empty session.
static SessionFile read_session(const std::string& path, std::int64_t now) {
    SessionFile sf;
    std::string text;
    if (!read_file(path, text)) return sf;
    try {
        json j = json::parse(text);
        sf.updated_at = j.value("updated_at", (std::int64_t)0);
        if (now - sf.updated_at >= kDeniedMemoryTtlSec) return SessionFile{};
        for (const auto& h : j.value("denied", json::array())) {
            if (h.is_string()) sf.denied.push_back(h.get<std::string>());
        }
    } catch (const std::exception& e) {
        std::cerr << "[session] WARNING: ignoring unreadable " << path << ": " << e.what() << std::endl;
        return SessionFile{};
    }
    return sf;
}

bool DeniedMemory::is_denied(const std::string& command) const {
    const SessionFile sf = read_session(path_(), now_());
    const std::string h = sha256_hex(command);
    return std::find(sf.denied.begin(), sf.denied.end(), h) != sf.denied.end();
}

// Read-modify-write of the session file under <sessions_dir>/.lock.
bool DeniedMemory::update_(const std::string& command, bool deny, std::string* err) {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        if (err) *err = "create " + dir_ + ": " + ec.message();
        return false;
    }
    DirLock lock(dir_);
    if (!lock.ok()) {
        if (err) *err = lock.err();
        return false;
    }

    const std::int64_t now = now_();
    SessionFile sf = read_session(path_(), now);
    const std::string h = sha256_hex(command);
    auto it = std::find(sf.denied.begin(), sf.denied.end(), h);
    if (deny) {
        if (it == sf.denied.end()) sf.denied.push_back(h);
    } else {
        if (it == sf.denied.end()) return true;
        sf.denied.erase(it);
    }
    sf.updated_at = now;

    json j = {{"updated_at", sf.updated_at}, {"denied", sf.denied}};
    return write_file_atomic(path_(), j.dump(), 0600, err);
}

bool DeniedMemory::remember(const std::string& command, std::string* err) {
    return update_(command, true, err);
}

bool DeniedMemory::forget(const std::string& command, std::string* err) {
    return update_(command, false, err);
}

} // namespace veto
