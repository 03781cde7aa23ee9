#include "platform/telegram_client.h"
#include "veto_util.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace veto::platform {

static constexpr const char* kApiHost = "api.telegram.org";
static constexpr int kLongPollMaxSec = 10;

std::optional<bool> parse_telegram_reply(const std::string& text) {
    const std::string t = lower_ascii(trim_ws(text));
    if (t == "/allow" || t == "allow" || t == "yes" || t == "y") return true;
    if (t == "/deny"  || t == "deny"  || t == "no"  || t == "n") return false;
    return std::nullopt;
}

bool parse_telegram_updates(const std::string& body,
                            std::vector<TelegramMessage>& out,
                            std::string* err) {
    out.clear();
    try {
        json j = json::parse(body);
        if (!j.value("ok", false)) {
            if (err) *err = "telegram: " + j.value("description", std::string("request failed"));
            return false;
        }
        for (const auto& u : j.value("result", json::array())) {
            TelegramMessage m;
            m.update_id = u.value("update_id", (std::int64_t)0);
            if (!u.contains("message") || !u["message"].is_object()) {
                // Keep the id so the offset still advances past it.
                out.push_back(m);
                continue;
            }
            const json& msg = u["message"];
            m.date = msg.value("date", (std::int64_t)0);
            m.text = msg.value("text", std::string());
            if (msg.contains("chat") && msg["chat"].contains("id")) {
                const json& id = msg["chat"]["id"];
                m.chat_id = id.is_string() ? id.get<std::string>() : std::to_string(id.get<std::int64_t>());
            }
            out.push_back(std::move(m));
        }
    } catch (const std::exception& e) {
        if (err) *err = std::string("telegram: bad response: ") + e.what();
        return false;
    }
    return true;
}

TelegramClient::TelegramClient(std::string bot_token, std::string chat_id)
    : token_(std::move(bot_token)), chat_id_(std::move(chat_id)) {}

bool TelegramClient::send_message(const std::string& html, std::string* err) {
    httplib::SSLClient cli(kApiHost, 443);
    cli.set_connection_timeout(10, 0);
    cli.set_read_timeout(15, 0);

    json body = {
        {"chat_id", chat_id_},
        {"text", html},
        {"parse_mode", "HTML"},
    };
    auto res = cli.Post("/bot" + token_ + "/sendMessage", body.dump(), "application/json");
    if (!res) {
        if (err) *err = "telegram: " + httplib::to_string(res.error());
        return false;
    }
    if (res->status != 200) {
        if (err) *err = "telegram: HTTP " + std::to_string(res->status);
        return false;
    }
    return true;
}

bool TelegramClient::get_updates(std::int64_t offset, int timeout_sec,
                                 std::vector<TelegramMessage>& out, std::string* err) {
    httplib::SSLClient cli(kApiHost, 443);
    cli.set_connection_timeout(10, 0);
    cli.set_read_timeout(timeout_sec + 5, 0);

    std::string path = "/bot" + token_ + "/getUpdates?timeout=" + std::to_string(timeout_sec);
    if (offset != 0) path += "&offset=" + std::to_string(offset);

    auto res = cli.Get(path);
    if (!res) {
        if (err) *err = "telegram: " + httplib::to_string(res.error());
        return false;
    }
    if (res->status != 200) {
        if (err) *err = "telegram: HTTP " + std::to_string(res->status);
        return false;
    }
    return parse_telegram_updates(res->body, out, err);
}

InteractionResult TelegramClient::request_approval(const std::string& command,
                                                   const Verdict& verdict,
                                                   int timeout_sec) {
    InteractionResult res;
    std::string err;

    // Skip whatever is already queued: only replies to this request count.
    std::int64_t offset = 0;
    std::vector<TelegramMessage> msgs;
    if (get_updates(-1, 0, msgs, &err)) {
        for (const auto& m : msgs) offset = std::max(offset, m.update_id + 1);
    } else {
        std::cerr << "[telegram] " << err << std::endl;
    }

    const std::int64_t requested_at = now_epoch();
    std::string text = "<b>veto approval request</b>\n\n"
                       "<b>Risk:</b> " + risk_to_string(verdict.risk);
    if (verdict.category) text += " (" + html_escape(*verdict.category) + ")";
    text += "\n<b>Command:</b>\n<code>" + html_escape(command) + "</code>\n\n"
            "Reply <b>/allow</b> or <b>/deny</b> within " + std::to_string(timeout_sec) + "s.";

    if (!send_message(text, &err)) {
        res.status = Interaction::Unavailable;
        res.detail = err;
        return res;
    }

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::seconds(timeout_sec);

    while (clock::now() < deadline) {
        const auto left = std::chrono::duration_cast<std::chrono::seconds>(deadline - clock::now()).count();
        const int poll = (int)std::max<long long>(1, std::min<long long>(kLongPollMaxSec, left));

        if (!get_updates(offset, poll, msgs, &err)) {
            std::cerr << "[telegram] " << err << std::endl;
            std::this_thread::sleep_for(std::chrono::seconds(1));
            continue;
        }
        for (const auto& m : msgs) {
            offset = std::max(offset, m.update_id + 1);
            if (m.chat_id != chat_id_ || m.date < requested_at) continue;

            auto decision = parse_telegram_reply(m.text);
            if (!decision) continue;

            if (*decision) {
                res.status = Interaction::Approved;
            } else {
                res.status = Interaction::Denied;
                res.detail = "Denied via Telegram";
            }
            return res;
        }
    }

    std::string notice_err;
    if (!send_message("Request timed out; command denied.\n<code>" + html_escape(shorten(command, 200)) + "</code>",
                      &notice_err)) {
        std::cerr << "[telegram] timeout notice: " << notice_err << std::endl;
    }
    res.status = Interaction::TimedOut;
    res.detail = "No Telegram reply within " + std::to_string(timeout_sec) + "s";
    return res;
}

TelegramNotifier::TelegramNotifier(std::string bot_token, std::string chat_id)
    : client_(std::move(bot_token), std::move(chat_id)) {}

bool TelegramNotifier::deliver(const std::string& code, const std::string& command, std::string* err) {
    const std::string text = "<b>veto challenge code</b>\n\n"
                             "<b>Code:</b> <code>" + code + "</code>\n\n"
                             "<b>Command:</b>\n<code>" + html_escape(command) + "</code>\n\n"
                             "<i>Expires in 60 seconds</i>";
    return client_.send_message(text, err);
}

} // namespace veto::platform
