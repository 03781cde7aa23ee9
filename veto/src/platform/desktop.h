#pragma once
#include <string>

#include "authenticator.h"
#include "challenge.h"

namespace veto::platform {

    // osascript (macOS) / notify-send (Linux). false + *err if nothing could show it.
    bool desktop_notify(const std::string& title, const std::string& body, std::string* err);

    // Allow/Deny question: osascript on macOS, zenity with a display on Linux.
    bool dialog_available();
    InteractionResult dialog_ask(const std::string& title, const std::string& message, int timeout_sec);

    /*
    Touch ID via the VetoAuth helper (installed next to veto on macOS).
    The helper prints exactly one of AUTH_SUCCESS / AUTH_FAILED / AUTH_UNAVAILABLE.
    Empty path => not installed / not macOS.
    */
    std::string touchid_helper_path();
    InteractionResult touchid_ask(const std::string& reason);

    // Challenge codes as a desktop notification.
    class DesktopNotifier final : public ChallengeNotifier {
    public:
        std::string name() const override { return "desktop"; }
        bool deliver(const std::string& code, const std::string& command, std::string* err) override;
    };

} // namespace veto::platform
