#pragma once
#include <optional>
#include <string>

namespace veto::platform {

    // All prompts go to /dev/tty, never stdout (stdout may be a hook payload).
    bool have_tty();

    // y/yes => true, anything else => false; nullopt if there is no terminal.
    std::optional<bool> tty_confirm(const std::string& prompt);

    std::optional<std::string> tty_read_line(const std::string& prompt);

    // Echo disabled while reading; restored on every path.
    std::optional<std::string> tty_read_secret(const std::string& prompt);

} // namespace veto::platform
