#include "platform/run_cmd.h"
#include "veto_util.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace veto::platform {

static void close_fd(int& fd) {
    if (fd >= 0) ::close(fd);
    fd = -1;
}

CmdResult run_cmd(const std::vector<std::string>& argv,
                  const std::string* stdin_data,
                  int timeout_sec) {
    CmdResult r;
    if (argv.empty()) { r.err = "empty argv"; return r; }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    int in_pipe[2]  = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};

    if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0 || (stdin_data && pipe(in_pipe) != 0)) {
        for (int* p : {in_pipe, out_pipe, err_pipe}) { close_fd(p[0]); close_fd(p[1]); }
        r.err = "pipe() failed";
        return r;
    }

    pid_t pid = fork();
    if (pid < 0) {
        for (int* p : {in_pipe, out_pipe, err_pipe}) { close_fd(p[0]); close_fd(p[1]); }
        r.err = "fork() failed";
        return r;
    }

    if (pid == 0) {
        if (stdin_data) {
            dup2(in_pipe[0], STDIN_FILENO);
        } else {
            int devnull = ::open("/dev/null", O_RDONLY);
            if (devnull >= 0) { dup2(devnull, STDIN_FILENO); ::close(devnull); }
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            if (p[0] >= 0) ::close(p[0]);
            if (p[1] >= 0) ::close(p[1]);
        }
        std::signal(SIGPIPE, SIG_DFL);
        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    if (stdin_data) {
        close_fd(in_pipe[0]);
        // Small payloads (secrets, messages): a single blocking write fits the pipe buffer.
        size_t off = 0;
        while (off < stdin_data->size()) {
            ssize_t n = ::write(in_pipe[1], stdin_data->data() + off, stdin_data->size() - off);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;
            off += (size_t)n;
        }
        close_fd(in_pipe[1]);
    }

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::seconds(timeout_sec);

    std::string out, err;
    char buf[4096];
    bool out_open = true, err_open = true;

    while (out_open || err_open) {
        int wait_ms = -1;
        if (timeout_sec > 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
            if (left <= 0) {
                ::kill(pid, SIGKILL);
                r.timed_out = true;
                break;
            }
            wait_ms = (int)left;
        }

        struct pollfd fds[2];
        int nfds = 0;
        int out_idx = -1, err_idx = -1;
        if (out_open) { fds[nfds] = {out_pipe[0], POLLIN, 0}; out_idx = nfds++; }
        if (err_open) { fds[nfds] = {err_pipe[0], POLLIN, 0}; err_idx = nfds++; }

        int pr = ::poll(fds, (nfds_t)nfds, wait_ms);
        if (pr < 0) {
            if (errno == EINTR) continue;
            ::kill(pid, SIGKILL);
            break;
        }
        if (pr == 0) continue;

        auto drain = [&](int idx, int fd, std::string& dst, bool& open_flag) {
            if (idx < 0 || !(fds[idx].revents & (POLLIN | POLLHUP | POLLERR))) return;
            ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n > 0) dst.append(buf, buf + n);
            else if (n == 0 || errno != EINTR) open_flag = false;
        };
        drain(out_idx, out_pipe[0], out, out_open);
        drain(err_idx, err_pipe[0], err, err_open);
    }

    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    int st = 0;
    while (waitpid(pid, &st, 0) < 0) {
        if (errno != EINTR) break;
    }

    r.out = std::move(out);
    r.err = shorten(err, 400);
    if (WIFEXITED(st)) r.exit_code = WEXITSTATUS(st);
    r.ok = !r.timed_out && WIFEXITED(st) && WEXITSTATUS(st) == 0;
    return r;
}

bool have_executable(const std::string& name) {
    if (name.empty()) return false;

    auto is_exec = [](const std::string& p) {
        struct stat sb{};
        return ::stat(p.c_str(), &sb) == 0 && S_ISREG(sb.st_mode) && ::access(p.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos) return is_exec(name);

    const char* path = std::getenv("PATH");
    if (!path) return false;

    std::stringstream ss(path);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        if (is_exec(dir + "/" + name)) return true;
    }
    return false;
}

} // namespace veto::platform
