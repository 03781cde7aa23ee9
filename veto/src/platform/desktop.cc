#include "platform/desktop.h"
#include "platform/run_cmd.h"

#include <cstdlib>
#include <filesystem>

namespace veto::platform {

// AppleScript string literal body.
static std::string applescript_escape(const std::string& s) {
    std::string o;
    for (char c : s) {
        if (c == '\\' || c == '"') o.push_back('\\');
        o.push_back(c);
    }
    return o;
}

bool desktop_notify(const std::string& title, const std::string& body, std::string* err) {
#if defined(__APPLE__)
    const std::string script = "display notification \"" + applescript_escape(body) +
                               "\" with title \"" + applescript_escape(title) + "\" sound name \"Glass\"";
    CmdResult r = run_cmd({"osascript", "-e", script}, nullptr, 10);
    if (!r.ok && err) *err = "osascript: " + (r.err.empty() ? "exit " + std::to_string(r.exit_code) : r.err);
    return r.ok;
#else
    if (!have_executable("notify-send")) {
        if (err) *err = "notify-send not installed";
        return false;
    }
    CmdResult r = run_cmd({"notify-send", "--urgency=critical", "--app-name=veto", title, body}, nullptr, 10);
    if (!r.ok && err) *err = "notify-send: " + (r.err.empty() ? "exit " + std::to_string(r.exit_code) : r.err);
    return r.ok;
#endif
}

bool dialog_available() {
#if defined(__APPLE__)
    return have_executable("osascript");
#else
    const char* x = std::getenv("DISPLAY");
    const char* w = std::getenv("WAYLAND_DISPLAY");
    const bool display = (x && *x) || (w && *w);
    return display && have_executable("zenity");
#endif
}

InteractionResult dialog_ask(const std::string& title, const std::string& message, int timeout_sec) {
    InteractionResult res;
    if (!dialog_available()) {
        res.status = Interaction::Unavailable;
        res.detail = "no dialog facility";
        return res;
    }

#if defined(__APPLE__)
    const std::string script =
        "display dialog \"" + applescript_escape(message) + "\" with title \"" + applescript_escape(title) +
        "\" buttons {\"Deny\", \"Allow\"} default button \"Deny\" cancel button \"Deny\" with icon caution"
        " giving up after " + std::to_string(timeout_sec);
    CmdResult r = run_cmd({"osascript", "-e", script}, nullptr, timeout_sec + 5);
    if (r.timed_out || r.out.find("gave up:true") != std::string::npos) {
        res.status = Interaction::TimedOut;
    } else if (r.ok && r.out.find("button returned:Allow") != std::string::npos) {
        res.status = Interaction::Approved;
    } else if (r.exit_code == 1) {
        // Cancel button (-128 "User canceled").
        res.status = Interaction::Denied;
        res.detail = "Denied in dialog";
    } else {
        res.status = Interaction::Error;
        res.detail = r.err;
    }
#else
    CmdResult r = run_cmd({"zenity", "--question", "--title=" + title, "--text=" + message,
                           "--ok-label=Allow", "--cancel-label=Deny",
                           "--timeout=" + std::to_string(timeout_sec)},
                          nullptr, timeout_sec + 5);
    if (r.timed_out || r.exit_code == 5) {
        res.status = Interaction::TimedOut;
    } else if (r.ok) {
        res.status = Interaction::Approved;
    } else if (r.exit_code == 1) {
        res.status = Interaction::Denied;
        res.detail = "Denied in dialog";
    } else {
        res.status = Interaction::Error;
        res.detail = r.err;
    }
#endif
    return res;
}

std::string touchid_helper_path() {
#if defined(__APPLE__)
    std::error_code ec;
    if (const char* home = std::getenv("HOME")) {
        const std::string p = std::string(home) + "/.local/bin/VetoAuth";
        if (std::filesystem::exists(p, ec)) return p;
    }
    if (std::filesystem::exists("/usr/local/bin/VetoAuth", ec)) return "/usr/local/bin/VetoAuth";
#endif
    return {};
}

InteractionResult touchid_ask(const std::string& reason) {
    InteractionResult res;
    const std::string helper = touchid_helper_path();
    if (helper.empty()) {
        res.status = Interaction::Unavailable;
        res.detail = "Touch ID helper not installed";
        return res;
    }

    CmdResult r = run_cmd({helper, reason}, nullptr, 120);
    if (r.out.find("AUTH_SUCCESS") != std::string::npos) {
        res.status = Interaction::Approved;
    } else if (r.out.find("AUTH_UNAVAILABLE") != std::string::npos) {
        res.status = Interaction::Unavailable;
        res.detail = "Biometric authentication not available";
    } else if (r.timed_out) {
        res.status = Interaction::TimedOut;
    } else {
        res.status = Interaction::Denied;
        res.detail = "Touch ID verification failed or was cancelled";
    }
    return res;
}

bool DesktopNotifier::deliver(const std::string& code, const std::string& /*command*/, std::string* err) {
    return desktop_notify("veto Challenge", "Challenge code: " + code, err);
}

} // namespace veto::platform
