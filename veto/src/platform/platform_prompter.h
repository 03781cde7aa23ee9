#pragma once
#include <memory>
#include <vector>

#include "authenticator.h"
#include "challenge.h"
#include "config.h"
#include "secret_store.h"

namespace veto::platform {

    // AuthPrompter over /dev/tty, the desktop helpers and the Telegram Bot API.
    class PlatformPrompter final : public AuthPrompter {
    public:
        explicit PlatformPrompter(int dialog_timeout_sec = 60);

        std::optional<bool> confirm(const std::string& prompt) override;
        std::optional<std::string> read_secret(const std::string& prompt) override;

        bool touchid_available() override;
        InteractionResult touchid(const std::string& reason) override;

        bool dialog_available() override;
        InteractionResult dialog(const std::string& title, const std::string& message) override;

        InteractionResult telegram(const std::string& bot_token,
                                   const std::string& chat_id,
                                   const std::string& command,
                                   const Verdict& verdict,
                                   int timeout_sec) override;

    private:
        int dialog_timeout_sec_;
    };

    /*
    Out-of-band channels for challenge codes:
      - desktop notification, always attempted
      - Telegram, when enabled with a chat id and a stored bot token
    Never a terminal or stdout channel: the agent can read those.
    */
    std::vector<std::unique_ptr<ChallengeNotifier>> make_challenge_notifiers(const VetoConfig& cfg,
                                                                             SecretStore& secrets);

} // namespace veto::platform
