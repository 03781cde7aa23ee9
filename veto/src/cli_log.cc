#include "audit_log.h"
#include "cli.h"
#include "platform/terminal.h"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>

namespace veto {

static std::atomic<bool> g_follow_stop{false};

static void on_sigint(int) {
    g_follow_stop.store(true);
}

static void print_entry(const AuditEntry& e) {
    std::cout << format_audit_line(e) << "\n";
}

int run_log_command(const std::vector<std::string>& args, const VetoPaths& paths) {
    size_t tail_n = 0;
    bool follow = false;
    bool clear = false;
    std::optional<AuditResult> filter;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "-f" || a == "--follow") {
            follow = true;
        } else if (a == "--clear") {
            clear = true;
        } else if (a == "-n" || a == "--tail" || a == "--filter") {
            if (i + 1 >= args.size()) {
                std::cerr << "log: " << a << " needs a value" << std::endl;
                return 64;
            }
            const std::string& v = args[++i];
            if (a == "--filter") {
                filter = audit_result_from_string(v);
                if (!filter) {
                    std::cerr << "log: --filter expects ALLOWED, DENIED or BLOCKED" << std::endl;
                    return 64;
                }
            } else {
                char* end = nullptr;
                const long n = std::strtol(v.c_str(), &end, 10);
                if (v.empty() || *end != '\0' || n <= 0) {
                    std::cerr << "log: -n expects a positive number" << std::endl;
                    return 64;
                }
                tail_n = (size_t)n;
            }
        } else {
            std::cerr << "log: unexpected argument: " << a << std::endl;
            return 64;
        }
    }

    AuditLog log(paths.audit_log);

    if (clear) {
        auto yes = platform::tty_confirm("Clear the audit log at " + log.path() + "? [y/N] ");
        if (!yes) {
            std::cerr << "log: --clear needs a terminal to confirm on" << std::endl;
            return 1;
        }
        if (!*yes) {
            std::cerr << "Cancelled." << std::endl;
            return 1;
        }
        AuditStatus st = log.clear();
        if (!st.ok) {
            std::cerr << "[audit] clear failed: " << st.detail << std::endl;
            return 1;
        }
        std::cout << "Audit log cleared.\n";
        return 0;
    }

    // With -n and -f together, follow picks up exactly where the tail ended.
    std::optional<std::uintmax_t> resume_at;
    if (!follow || tail_n > 0) {
        std::vector<AuditEntry> entries;
        std::uintmax_t end = 0;
        AuditStatus st = log.read(filter, tail_n, entries, &end);
        if (!st.ok) {
            std::cerr << "[audit] " << st.detail << std::endl;
            return 1;
        }
        for (const auto& e : entries) print_entry(e);
        std::cout << std::flush;
        resume_at = end;
    }
    if (!follow) return 0;

    struct sigaction sa{};
    sa.sa_handler = on_sigint;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    AuditStatus st = log.follow(filter, g_follow_stop, [](const AuditEntry& e) {
        print_entry(e);
        std::cout << std::flush;
    }, 200, resume_at);
    if (!st.ok) {
        std::cerr << "[audit] " << st.detail << std::endl;
        return 1;
    }
    return 0;
}

} // namespace veto
