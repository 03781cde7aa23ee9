#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "authenticator.h"
#include "challenge.h"

namespace veto::platform {

    struct TelegramMessage {
        std::int64_t update_id = 0;
        std::string chat_id;
        std::int64_t date = 0;
        std::string text;
    };

    /*
    Reply vocabulary (case-insensitive, surrounding whitespace ignored):
      approve: /allow allow yes y
      deny:    /deny deny no n
    Anything else => nullopt (keep waiting).
    */
    std::optional<bool> parse_telegram_reply(const std::string& text);

    // Parse a getUpdates response body. Non-message updates come back with an empty chat_id.
    bool parse_telegram_updates(const std::string& body,
                                std::vector<TelegramMessage>& out,
                                std::string* err);

    /*
    Minimal Bot API client over HTTPS (api.telegram.org).
    The token is only ever part of the request path; it is never logged.
    */
    class TelegramClient {
    public:
        TelegramClient(std::string bot_token, std::string chat_id);

        bool send_message(const std::string& html, std::string* err);

        // Long poll; offset 0 => server default, -1 => only the latest update.
        bool get_updates(std::int64_t offset, int timeout_sec,
                         std::vector<TelegramMessage>& out, std::string* err);

        /*
        Send an approval request and wait up to timeout_sec for a reply from
        the configured chat that is dated at or after the request. Sends a
        timeout notice when the wait expires.
        */
        InteractionResult request_approval(const std::string& command,
                                           const Verdict& verdict,
                                           int timeout_sec);

    private:
        std::string token_;
        std::string chat_id_;
    };

    class TelegramNotifier final : public ChallengeNotifier {
    public:
        TelegramNotifier(std::string bot_token, std::string chat_id);
        std::string name() const override { return "telegram"; }
        bool deliver(const std::string& code, const std::string& command, std::string* err) override;

    private:
        TelegramClient client_;
    };

} // namespace veto::platform
