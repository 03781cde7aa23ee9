#pragma once
// Shared helpers for the per-component test executables.

#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "authenticator.h"
#include "challenge.h"
#include "secret_store.h"

namespace veto_test {

inline int failures = 0;

inline void check(bool cond, const std::string& what) {
    if (!cond) {
        std::cerr << "FAIL: " << what << "\n";
        ++failures;
    }
}

inline int finish(const char* name) {
    if (failures) {
        std::cerr << "[" << name << "] " << failures << " failure(s)\n";
        return 1;
    }
    std::cout << "[" << name << "] ALL OK\n";
    return 0;
}

// Fresh directory under $TMPDIR, removed on scope exit.
class TempDir {
public:
    TempDir() {
        const char* base = std::getenv("TMPDIR");
        std::string tmpl = std::string(base && *base ? base : "/tmp") + "/veto-test-XXXXXX";
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (::mkdtemp(buf.data())) path_ = buf.data();
    }
    ~TempDir() {
        if (path_.empty()) return;
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    bool ok() const { return !path_.empty(); }
    const std::string& path() const { return path_; }
    std::string sub(const std::string& name) const { return path_ + "/" + name; }

private:
    std::string path_;
};

class MemorySecretBackend final : public veto::SecretBackend {
public:
    std::map<std::string, std::string> values;
    bool fail_load = false;

    std::string name() const override { return "memory"; }

    veto::SecretResult store(const std::string& key, const std::string& value) override {
        values[key] = value;
        return {true, veto::SecretRc::OK, ""};
    }
    veto::SecretResult load(const std::string& key, std::string& out) override {
        if (fail_load) return {false, veto::SecretRc::INTEGRITY, "corrupt"};
        auto it = values.find(key);
        if (it == values.end()) return {false, veto::SecretRc::NOT_FOUND, key};
        out = it->second;
        return {true, veto::SecretRc::OK, ""};
    }
    veto::SecretResult remove(const std::string& key) override {
        values.erase(key);
        return {true, veto::SecretRc::OK, ""};
    }
};

// Secret store whose only backend is a MemorySecretBackend (exposed for inspection).
inline std::unique_ptr<veto::SecretStore> memory_store(MemorySecretBackend** raw = nullptr) {
    auto b = std::make_unique<MemorySecretBackend>();
    if (raw) *raw = b.get();
    return std::make_unique<veto::SecretStore>(nullptr, std::move(b));
}

class FakeNotifier final : public veto::ChallengeNotifier {
public:
    explicit FakeNotifier(std::vector<std::string>* sink, bool works = true)
        : sink_(sink), works_(works) {}

    std::string name() const override { return "fake"; }
    bool deliver(const std::string& code, const std::string&, std::string* err) override {
        if (!works_) {
            if (err) *err = "fake channel down";
            return false;
        }
        sink_->push_back(code);
        return true;
    }

private:
    std::vector<std::string>* sink_;
    bool works_;
};

// Scripted AuthPrompter; counts every interaction.
class FakePrompter final : public veto::AuthPrompter {
public:
    std::optional<bool> confirm_answer = true;
    std::optional<std::string> secret_answer;
    // When set, read_secret answers from here (e.g. to echo a delivered code).
    std::function<std::optional<std::string>()> secret_source;
    bool touchid_ok = false;
    veto::InteractionResult touchid_result{veto::Interaction::Approved, ""};
    bool dialog_ok = false;
    veto::InteractionResult dialog_result{veto::Interaction::Approved, ""};
    veto::InteractionResult telegram_result{veto::Interaction::Approved, ""};

    int confirms = 0;
    int secrets = 0;
    int touchids = 0;
    int dialogs = 0;
    int telegrams = 0;

    int calls() const { return confirms + secrets + touchids + dialogs + telegrams; }

    std::optional<bool> confirm(const std::string&) override {
        ++confirms;
        return confirm_answer;
    }
    std::optional<std::string> read_secret(const std::string&) override {
        ++secrets;
        if (secret_source) return secret_source();
        return secret_answer;
    }
    bool touchid_available() override { return touchid_ok; }
    veto::InteractionResult touchid(const std::string&) override {
        ++touchids;
        return touchid_result;
    }
    bool dialog_available() override { return dialog_ok; }
    veto::InteractionResult dialog(const std::string&, const std::string&) override {
        ++dialogs;
        return dialog_result;
    }
    veto::InteractionResult telegram(const std::string&, const std::string&, const std::string&,
                                     const veto::Verdict&, int) override {
        ++telegrams;
        return telegram_result;
    }
};

} // namespace veto_test
