#pragma once
#include <string>
#include <vector>

namespace veto {

    long now_epoch();
    std::string lower_ascii(std::string s);
    std::string upper_ascii(std::string s);
    std::string trim_ws(std::string s);

    // Local time "YYYY-MM-DD HH:MM:SS" (audit log timestamps).
    std::string now_local_timestamp();

    std::string hex_lower(const unsigned char* p, size_t n);
    std::string sha256_hex(const std::string& s);

    std::string b64_std(const unsigned char* data, size_t len);
    std::vector<unsigned char> b64decode_loose(const std::string& in);

    // Keep this tight: only non-secret metadata in diagnostics.
    std::string shorten(const std::string& s, size_t maxlen = 64);

    std::string html_escape(const std::string& s);

    // Constant-time string equality. Runtime depends only on max(|a|, |b|),
    // never on where the first difference is or whether the lengths differ.
    bool ct_equal(const std::string& a, const std::string& b);

    // Root of all persisted state: $VETO_HOME, else $HOME/.veto.
    std::string veto_home_dir();

    // Write a whole file as tmp + fsync + rename. Mode applies to the new file.
    bool write_file_atomic(const std::string& path,
                           const std::string& bytes,
                           unsigned mode,
                           std::string* err);

    bool read_file(const std::string& path, std::string& out);

    // True if env var `name` is set to an affirmative value (yes/y/true/1).
    bool env_is_yes(const char* name);

    // Exclusive flock on <dir>/.lock for the lifetime of the object.
    // The directory must exist.
    class DirLock {
    public:
        explicit DirLock(const std::string& dir);
        ~DirLock();
        DirLock(const DirLock&) = delete;
        DirLock& operator=(const DirLock&) = delete;

        bool ok() const { return fd_ >= 0; }
        const std::string& err() const { return err_; }

    private:
        int fd_ = -1;
        std::string err_;
    };

} // namespace veto
