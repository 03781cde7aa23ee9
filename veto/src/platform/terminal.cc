#include "platform/terminal.h"
#include "veto_util.h"

#include <cerrno>

#include <fcntl.h>
#include <termios.h>
#include <unistd.h>

namespace veto::platform {

namespace {

class TtyFd {
public:
    TtyFd() : fd_(::open("/dev/tty", O_RDWR | O_NOCTTY | O_CLOEXEC)) {}
    ~TtyFd() { if (fd_ >= 0) ::close(fd_); }
    TtyFd(const TtyFd&) = delete;
    TtyFd& operator=(const TtyFd&) = delete;

    bool ok() const { return fd_ >= 0; }
    int fd() const { return fd_; }

private:
    int fd_;
};

// Restores the saved termios state on scope exit.
class EchoOff {
public:
    explicit EchoOff(int fd) : fd_(fd) {
        if (::tcgetattr(fd_, &saved_) != 0) return;
        struct termios t = saved_;
        t.c_lflag &= ~(tcflag_t)ECHO;
        t.c_lflag |= ECHONL;
        active_ = ::tcsetattr(fd_, TCSAFLUSH, &t) == 0;
    }
    ~EchoOff() {
        if (active_) ::tcsetattr(fd_, TCSAFLUSH, &saved_);
    }
    EchoOff(const EchoOff&) = delete;
    EchoOff& operator=(const EchoOff&) = delete;

private:
    int fd_;
    struct termios saved_{};
    bool active_ = false;
};

bool write_all(int fd, const std::string& s) {
    size_t off = 0;
    while (off < s.size()) {
        ssize_t n = ::write(fd, s.data() + off, s.size() - off);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        off += (size_t)n;
    }
    return true;
}

std::optional<std::string> read_line(int fd) {
    std::string line;
    char c;
    for (;;) {
        ssize_t n = ::read(fd, &c, 1);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            if (line.empty()) return std::nullopt;
            break;
        }
        if (c == '\n') break;
        if (c != '\r') line.push_back(c);
    }
    return line;
}

} // namespace

bool have_tty() {
    TtyFd t;
    return t.ok();
}

std::optional<std::string> tty_read_line(const std::string& prompt) {
    TtyFd t;
    if (!t.ok() || !write_all(t.fd(), prompt)) return std::nullopt;
    return read_line(t.fd());
}

std::optional<bool> tty_confirm(const std::string& prompt) {
    auto line = tty_read_line(prompt);
    if (!line) return std::nullopt;
    const std::string a = lower_ascii(trim_ws(*line));
    return a == "y" || a == "yes";
}

std::optional<std::string> tty_read_secret(const std::string& prompt) {
    TtyFd t;
    if (!t.ok() || !write_all(t.fd(), prompt)) return std::nullopt;
    EchoOff guard(t.fd());
    return read_line(t.fd());
}

} // namespace veto::platform
