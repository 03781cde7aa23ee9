#include "authenticator.h"
#include "challenge.h"
#include "cli.h"
#include "pin.h"
#include "secret_store.h"
#include "totp.h"
#include "veto_util.h"

#include "platform/platform_prompter.h"
#include "platform/telegram_client.h"
#include "platform/terminal.h"

#include <cstdlib>
#include <iostream>
#include <memory>

#include <qrencode.h>
#include <sodium.h>
#include <unistd.h>

namespace veto {

namespace {

void wipe(std::string& s) {
    sodium_memzero(s.data(), s.size());
    s.clear();
}

std::unique_ptr<SecretStore> open_secrets(const VetoPaths& paths) {
    auto store = SecretStore::open_default(paths.secrets_dir);
    std::cerr << "[secrets] backend: " << store->backend_name() << std::endl;
    return store;
}

// Two QR modules per character cell vertically, with a 2-module quiet zone.
void print_qr(const std::string& text) {
    QRcode* qr = QRcode_encodeString(text.c_str(), 0, QR_ECLEVEL_L, QR_MODE_8, 1);
    if (!qr) {
        std::cerr << "[qr] encode failed; use the URL above" << std::endl;
        return;
    }

    const int w = qr->width;
    const int q = 2;
    auto dark = [&](int x, int y) {
        if (x < 0 || y < 0 || x >= w || y >= w) return false;
        return (qr->data[y * w + x] & 1) != 0;
    };

    for (int y = -q; y < w + q; y += 2) {
        std::string line;
        for (int x = -q; x < w + q; ++x) {
            const bool top = dark(x, y);
            const bool bottom = dark(x, y + 1);
            // Light-on-dark terminals: print light modules as blocks.
            if (!top && !bottom) line += "█";
            else if (!top)       line += "▀";
            else if (!bottom)    line += "▄";
            else                 line += " ";
        }
        std::cout << line << "\n";
    }
    QRcode_free(qr);
}

std::string default_account() {
    std::string user = "user";
    if (const char* u = std::getenv("USER")) {
        if (*u) user = u;
    }
    char host[256] = {0};
    if (::gethostname(host, sizeof(host) - 1) == 0 && host[0]) return user + "@" + host;
    return user;
}

int auth_set_pin(const VetoPaths& paths) {
    auto first = platform::tty_read_secret("New PIN (min " + std::to_string(kPinMinLength) + " characters): ");
    if (!first) {
        std::cerr << "set-pin: needs a terminal" << std::endl;
        return 1;
    }
    std::string err;
    if (!pin_validate_format(*first, &err)) {
        wipe(*first);
        std::cerr << "set-pin: " << err << std::endl;
        return 1;
    }
    auto second = platform::tty_read_secret("Repeat PIN: ");
    const bool same = second && second->size() == first->size() &&
                      sodium_memcmp(second->data(), first->data(), first->size()) == 0;
    if (second) wipe(*second);
    if (!same) {
        wipe(*first);
        std::cerr << "set-pin: PINs do not match" << std::endl;
        return 1;
    }

    PinRecord rec;
    const bool made = pin_make_record(*first, rec, &err);
    wipe(*first);
    if (!made) {
        std::cerr << "set-pin: " << err << std::endl;
        return 1;
    }

    auto store = open_secrets(paths);
    SecretResult sr = pin_store(*store, rec);
    if (!sr.ok) {
        std::cerr << "set-pin: " << secret_rc_name(sr.rc) << ": " << sr.detail << std::endl;
        return 1;
    }
    std::cout << "PIN set.\n";
    return 0;
}

int auth_setup_totp(const std::vector<std::string>& args, const VetoPaths& paths) {
    std::string account = default_account();
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--account" && i + 1 < args.size()) {
            account = args[++i];
        } else {
            std::cerr << "setup-totp: unexpected argument: " << args[i] << std::endl;
            return 64;
        }
    }

    VetoConfig cfg;
    if (!load_config_or_report(paths, cfg)) return 1;

    std::string seed = totp_generate_seed_b32();
    const std::string url = totp_otpauth_url(seed, account, cfg.totp.issuer);

    std::cout << "Scan this with your authenticator app:\n\n";
    print_qr(url);
    std::cout << "\n" << url << "\n\n";

    std::vector<unsigned char> key;
    if (!base32_decode(seed, key)) {
        wipe(seed);
        std::cerr << "setup-totp: internal seed encoding error" << std::endl;
        return 1;
    }

    auto code = platform::tty_read_line("Enter the 6-digit code to confirm: ");
    const bool ok = code && totp_verify(key, trim_ws(*code), now_epoch(), 1);
    sodium_memzero(key.data(), key.size());
    if (!ok) {
        wipe(seed);
        std::cerr << "setup-totp: code did not verify; seed discarded" << std::endl;
        return 1;
    }

    auto store = open_secrets(paths);
    SecretResult sr = store->store(kSecretTotpSeed, seed);
    wipe(seed);
    if (!sr.ok) {
        std::cerr << "setup-totp: " << secret_rc_name(sr.rc) << ": " << sr.detail << std::endl;
        return 1;
    }
    std::cout << "TOTP enabled.\n";
    if (!cfg.totp.enabled) std::cout << "Set [auth.totp] enabled = true and map a level to \"totp\" in " << paths.config_toml << "\n";
    return 0;
}

int auth_setup_telegram(const VetoPaths& paths) {
    VetoConfig cfg;
    if (!load_config_or_report(paths, cfg)) return 1;

    auto token = platform::tty_read_secret("Telegram bot token (from @BotFather): ");
    if (!token) {
        std::cerr << "setup-telegram: needs a terminal" << std::endl;
        return 1;
    }
    *token = trim_ws(*token);
    if (token->find(':') == std::string::npos) {
        wipe(*token);
        std::cerr << "setup-telegram: that does not look like a bot token (<id>:<secret>)" << std::endl;
        return 1;
    }

    auto store = open_secrets(paths);
    SecretResult sr = store->store(kSecretTelegramToken, *token);
    if (!sr.ok) {
        wipe(*token);
        std::cerr << "setup-telegram: " << secret_rc_name(sr.rc) << ": " << sr.detail << std::endl;
        return 1;
    }
    std::cout << "Bot token stored.\n";

    if (cfg.telegram.chat_id.empty()) {
        wipe(*token);
        std::cout << "Now set [auth.telegram] chat_id (and enabled = true) in " << paths.config_toml << "\n";
        return 0;
    }

    platform::TelegramClient client(*token, cfg.telegram.chat_id);
    wipe(*token);
    std::string err;
    if (!client.send_message("veto is connected to this chat.", &err)) {
        std::cerr << "setup-telegram: test message failed: " << err << std::endl;
        return 1;
    }
    std::cout << "Test message sent to chat " << cfg.telegram.chat_id << ".\n";
    return 0;
}

int auth_list(const VetoPaths& paths) {
    VetoConfig cfg;
    if (!load_config_or_report(paths, cfg)) return 1;

    auto store = open_secrets(paths);
    platform::PlatformPrompter prompter;
    Authenticator auth(cfg, *store, prompter, nullptr);

    std::cout << "Methods:\n";
    for (AuthMethod m : {AuthMethod::Confirm, AuthMethod::Pin, AuthMethod::Totp,
                         AuthMethod::TouchId, AuthMethod::Telegram, AuthMethod::Dialog}) {
        std::string why;
        const bool ok = auth.method_available(m, &why);
        std::cout << "  " << auth_method_name(m) << std::string(10 - auth_method_name(m).size(), ' ')
                  << (ok ? "ready" : why) << "\n";
    }

    std::cout << "\nDefault: " << auth_method_name(cfg.policy.default_method) << "\n";
    std::cout << "Levels:\n";
    for (RiskLevel r : {RiskLevel::LOW, RiskLevel::MEDIUM, RiskLevel::HIGH, RiskLevel::CRITICAL}) {
        std::string chain;
        for (AuthMethod m : cfg.policy.chain_for(r)) {
            if (!chain.empty()) chain += " + ";
            chain += auth_method_name(m);
        }
        std::cout << "  " << risk_config_key(r) << std::string(10 - risk_config_key(r).size(), ' ') << chain
                  << (cfg.policy.levels.count(r) ? "" : " (default)") << "\n";
    }
    if (!cfg.policy.fallback.empty()) {
        std::cout << "Fallbacks:\n";
        for (const auto& kv : cfg.policy.fallback) {
            std::cout << "  " << auth_method_name(kv.first) << " -> " << auth_method_name(kv.second) << "\n";
        }
    }
    std::cout << "\nSecret backend: " << store->backend_name() << "\n";
    return 0;
}

int auth_remove(const std::vector<std::string>& args, const VetoPaths& paths) {
    if (args.size() != 1) {
        std::cerr << "usage: veto auth remove <pin|totp|telegram>" << std::endl;
        return 64;
    }
    const std::string what = lower_ascii(args[0]);
    if (what != "pin" && what != "totp" && what != "telegram") {
        std::cerr << "remove: expected pin, totp or telegram" << std::endl;
        return 64;
    }

    auto yes = platform::tty_confirm("Remove the stored " + what + " secret? [y/N] ");
    if (!yes) {
        std::cerr << "remove: needs a terminal to confirm on" << std::endl;
        return 1;
    }
    if (!*yes) {
        std::cerr << "Cancelled." << std::endl;
        return 1;
    }

    auto store = open_secrets(paths);
    SecretResult sr;
    if (what == "pin") sr = pin_remove(*store);
    else if (what == "totp") sr = store->remove(kSecretTotpSeed);
    else sr = store->remove(kSecretTelegramToken);

    if (!sr.ok) {
        std::cerr << "remove: " << secret_rc_name(sr.rc) << ": " << sr.detail << std::endl;
        return 1;
    }
    std::cout << "Removed " << what << ".\n";
    return 0;
}

int auth_test(const std::vector<std::string>& args, const VetoPaths& paths) {
    if (args.size() != 1) {
        std::cerr << "usage: veto auth test <method>" << std::endl;
        return 64;
    }
    auto m = auth_method_from_string(args[0]);
    if (!m) {
        std::cerr << "test: unknown method: " << args[0] << std::endl;
        return 64;
    }

    VetoConfig cfg;
    if (!load_config_or_report(paths, cfg)) return 1;

    auto store = open_secrets(paths);
    platform::PlatformPrompter prompter;
    Authenticator auth(cfg, *store, prompter, nullptr);

    CommandContext ctx;
    ctx.command = "echo 'veto auth test'";
    ctx.verdict.risk = RiskLevel::MEDIUM;
    ctx.verdict.category = "test";
    ctx.verdict.reason = "Authentication method test";
    ctx.interactive = true;
    ctx.method_override = *m;

    AuthOutcome o = auth.authenticate(RiskLevel::MEDIUM, ctx);
    if (o.kind == AuthOutcomeKind::Approved) {
        std::cout << auth_method_name(*m) << ": approved\n";
        return 0;
    }
    std::cout << auth_method_name(*m) << ": " << (o.reason.empty() ? "not approved" : o.reason) << "\n";
    return 1;
}

void auth_usage() {
    std::cerr <<
        "usage:\n"
        "  veto auth set-pin\n"
        "  veto auth setup-totp [--account NAME]\n"
        "  veto auth setup-telegram\n"
        "  veto auth list\n"
        "  veto auth remove <pin|totp|telegram>\n"
        "  veto auth test <method>\n";
}

} // namespace

int run_auth_command(const std::vector<std::string>& args, const VetoPaths& paths) {
    if (args.empty()) {
        auth_usage();
        return 64;
    }
    const std::string& sub = args[0];
    const std::vector<std::string> rest(args.begin() + 1, args.end());

    if (sub == "set-pin")        return auth_set_pin(paths);
    if (sub == "setup-totp")     return auth_setup_totp(rest, paths);
    if (sub == "setup-telegram") return auth_setup_telegram(paths);
    if (sub == "list")           return auth_list(paths);
    if (sub == "remove")         return auth_remove(rest, paths);
    if (sub == "test")           return auth_test(rest, paths);

    std::cerr << "auth: unknown subcommand: " << sub << std::endl;
    auth_usage();
    return 64;
}

} // namespace veto
