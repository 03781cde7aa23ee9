#include "platform/platform_prompter.h"
#include "platform/desktop.h"
#include "platform/telegram_client.h"
#include "platform/terminal.h"

#include <iostream>

namespace veto::platform {

PlatformPrompter::PlatformPrompter(int dialog_timeout_sec)
    : dialog_timeout_sec_(dialog_timeout_sec) {}

std::optional<bool> PlatformPrompter::confirm(const std::string& prompt) {
    return tty_confirm(prompt);
}

std::optional<std::string> PlatformPrompter::read_secret(const std::string& prompt) {
    return tty_read_secret(prompt);
}

bool PlatformPrompter::touchid_available() {
    return !touchid_helper_path().empty();
}

InteractionResult PlatformPrompter::touchid(const std::string& reason) {
    return touchid_ask(reason);
}

bool PlatformPrompter::dialog_available() {
    return platform::dialog_available();
}

InteractionResult PlatformPrompter::dialog(const std::string& title, const std::string& message) {
    return dialog_ask(title, message, dialog_timeout_sec_);
}

InteractionResult PlatformPrompter::telegram(const std::string& bot_token,
                                             const std::string& chat_id,
                                             const std::string& command,
                                             const Verdict& verdict,
                                             int timeout_sec) {
    TelegramClient client(bot_token, chat_id);
    return client.request_approval(command, verdict, timeout_sec);
}

std::vector<std::unique_ptr<ChallengeNotifier>> make_challenge_notifiers(const VetoConfig& cfg,
                                                                         SecretStore& secrets) {
    std::vector<std::unique_ptr<ChallengeNotifier>> out;
    out.push_back(std::make_unique<DesktopNotifier>());

    if (cfg.telegram.enabled && !cfg.telegram.chat_id.empty()) {
        std::string token;
        SecretResult sr = secrets.load(kSecretTelegramToken, token);
        if (sr.ok) {
            out.push_back(std::make_unique<TelegramNotifier>(std::move(token), cfg.telegram.chat_id));
        } else if (sr.rc != SecretRc::NOT_FOUND) {
            std::cerr << "[challenge] Telegram token: " << secret_rc_name(sr.rc) << ": " << sr.detail << std::endl;
        }
    }
    return out;
}

} // namespace veto::platform
