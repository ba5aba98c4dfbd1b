#include "opsgate/proc.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

namespace opsgate {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    bool have_token = false;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;

    auto flush = [&]() {
        if (have_token) {
            out.push_back(cur);
            cur.clear();
            have_token = false;
        }
    };

    for (char c : cmd) {
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            have_token = true;
            if (c == '\'') { st = SQ; continue; }
            if (c == '"') { st = DQ; esc = false; continue; }
            cur.push_back(c);
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else { // DQ
            if (esc) {
                cur.push_back(c);
                esc = false;
                continue;
            }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM) return {};
    flush();
    return out;
}

namespace {

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void close_pair(int p[2]) {
    if (p[0] >= 0) close(p[0]);
    if (p[1] >= 0) close(p[1]);
}

// Write a diagnostic from the forked child; only async-signal-safe calls.
void child_fail(const char* what, const char* detail, int code) {
    (void)!write(STDERR_FILENO, what, std::strlen(what));
    if (detail) (void)!write(STDERR_FILENO, detail, std::strlen(detail));
    (void)!write(STDERR_FILENO, "\n", 1);
    _exit(code);
}

struct Capture {
    std::string* buf;
    size_t cap;
    bool* truncated;

    void append(const char* data, size_t n) {
        size_t can = cap > buf->size() ? cap - buf->size() : 0;
        size_t take = std::min(can, n);
        if (take < n) *truncated = true;
        buf->append(data, take);
    }
};

// Read whatever is available; returns false once the pipe hit EOF or errored.
bool drain(int fd, Capture& c) {
    char buf[8192];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) { c.append(buf, (size_t)n); continue; }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

} // namespace

bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const std::string& stdin_data,
                      const ProcLimits& lim,
                      ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int in_pipe[2] = {-1, -1};
    if (pipe(out_pipe) != 0) {
        res->error = std::string("pipe(out) failed: ") + std::strerror(errno);
        return false;
    }
    if (pipe(err_pipe) != 0) {
        res->error = std::string("pipe(err) failed: ") + std::strerror(errno);
        close_pair(out_pipe);
        return false;
    }
    if (pipe(in_pipe) != 0) {
        res->error = std::string("pipe(in) failed: ") + std::strerror(errno);
        close_pair(out_pipe);
        close_pair(err_pipe);
        return false;
    }

    // Build argv before fork: no allocation in the child.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        res->error = std::string("fork failed: ") + std::strerror(errno);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(in_pipe);
        return false;
    }

    if (pid == 0) {
        // child
        (void)dup2(in_pipe[0], STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(err_pipe[1], STDERR_FILENO);

        // isolate process group so timeout can kill the whole subtree
        (void)setpgid(0, 0);

        long maxfd = sysconf(_SC_OPEN_MAX);
        if (maxfd < 256) maxfd = 256;
        for (int fd = 3; fd < maxfd; fd++) {
            (void)close(fd);
        }

        // scrub dangerous loader env vars
        unsetenv("LD_PRELOAD");
        unsetenv("LD_LIBRARY_PATH");

#ifdef __linux__
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif
        signal(SIGPIPE, SIG_DFL);

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            child_fail("cannot chdir to ", cwd.c_str(), 126);
        }

        execvp(cargv[0], cargv.data());
        child_fail("exec failed: ", cargv[0], 127);
    }

    // parent
    (void)setpgid(pid, pid);
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(in_pipe[0]);

    set_nonblocking(out_pipe[0]);
    set_nonblocking(err_pipe[0]);

    int in_fd = in_pipe[1];
    if (stdin_data.empty()) {
        close(in_fd);
        in_fd = -1;
    } else {
        set_nonblocking(in_fd);
    }
    size_t write_off = 0;

    Capture cout_cap{&res->out, lim.stdout_max_bytes, &res->stdout_truncated};
    Capture cerr_cap{&res->err, lim.stderr_max_bytes, &res->stderr_truncated};
    bool out_open = true;
    bool err_open = true;

    auto start = std::chrono::steady_clock::now();
    bool child_exited = false;
    int status = 0;

    // Loop until the child exits and both pipes reach EOF (a grandchild may
    // keep them open; the process-group kill on timeout covers that case).
    while (!(child_exited && !out_open && !err_open)) {
        int elapsed_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        int slice = 100;
        if (lim.timeout_ms > 0) {
            int remaining = lim.timeout_ms - elapsed_ms;
            if (remaining <= 0) {
                res->timed_out = true;
                (void)kill(-pid, SIGKILL);
                (void)kill(pid, SIGKILL);
                if (!child_exited) (void)waitpid(pid, &status, 0);
                child_exited = true;
                break;
            }
            if (remaining < slice) slice = remaining;
        }

        struct pollfd fds[3];
        nfds_t nfds = 0;
        int out_idx = -1, err_idx = -1, in_idx = -1;
        if (out_open) { out_idx = (int)nfds; fds[nfds].fd = out_pipe[0]; fds[nfds].events = POLLIN; fds[nfds].revents = 0; nfds++; }
        if (err_open) { err_idx = (int)nfds; fds[nfds].fd = err_pipe[0]; fds[nfds].events = POLLIN; fds[nfds].revents = 0; nfds++; }
        if (in_fd >= 0) { in_idx = (int)nfds; fds[nfds].fd = in_fd; fds[nfds].events = POLLOUT; fds[nfds].revents = 0; nfds++; }

        if (nfds > 0) {
            int pr = poll(fds, nfds, slice);
            if (pr < 0 && errno != EINTR) {
                res->error = std::string("poll failed: ") + std::strerror(errno);
                (void)kill(-pid, SIGKILL);
                (void)kill(pid, SIGKILL);
                if (!child_exited) (void)waitpid(pid, &status, 0);
                child_exited = true;
                break;
            }
            if (pr > 0) {
                if (out_idx >= 0 && fds[out_idx].revents) out_open = drain(out_pipe[0], cout_cap);
                if (err_idx >= 0 && fds[err_idx].revents) err_open = drain(err_pipe[0], cerr_cap);
                if (in_idx >= 0 && fds[in_idx].revents) {
                    while (write_off < stdin_data.size()) {
                        ssize_t n = write(in_fd, stdin_data.data() + write_off, stdin_data.size() - write_off);
                        if (n > 0) { write_off += (size_t)n; continue; }
                        if (n == -1 && errno == EINTR) continue;
                        if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                        write_off = stdin_data.size(); // reader went away
                        break;
                    }
                    if (write_off >= stdin_data.size()) {
                        close(in_fd);
                        in_fd = -1;
                    }
                }
            }
        } else {
            // both pipes closed, only waiting for the child
            struct timespec ts{0, 5 * 1000 * 1000};
            nanosleep(&ts, nullptr);
        }

        if (!child_exited) {
            pid_t w = waitpid(pid, &status, WNOHANG);
            if (w == pid) child_exited = true;
        }
    }

    if (in_fd >= 0) close(in_fd);
    if (out_open) (void)drain(out_pipe[0], cout_cap);
    if (err_open) (void)drain(err_pipe[0], cerr_cap);
    close(out_pipe[0]);
    close(err_pipe[0]);

    if (res->timed_out) {
        res->exit_code = -1;
    } else if (WIFEXITED(status)) {
        res->exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res->exit_code = 128 + WTERMSIG(status);
    } else {
        res->exit_code = 128;
    }
    return true;
}

Command Command::exec(std::vector<std::string> argv, int timeout_sec, std::string cwd) {
    Command c;
    c.argv = std::move(argv);
    c.timeout_sec = timeout_sec;
    c.cwd = std::move(cwd);
    return c;
}

Command Command::sh(std::string script, int timeout_sec, std::string cwd) {
    Command c;
    c.shell = std::move(script);
    c.timeout_sec = timeout_sec;
    c.cwd = std::move(cwd);
    return c;
}

std::string Command::display() const {
    if (!shell.empty()) return shell;
    std::ostringstream oss;
    for (size_t i = 0; i < argv.size(); i++) {
        if (i) oss << ' ';
        const auto& a = argv[i];
        if (a.empty() || a.find_first_of(" \t\"'") != std::string::npos) oss << '\'' << a << '\'';
        else oss << a;
    }
    return oss.str();
}

ExecutionResult SystemProcessRunner::run(const Command& cmd) {
    ExecutionResult r;

    std::vector<std::string> argv = cmd.shell.empty()
        ? cmd.argv
        : std::vector<std::string>{"/bin/sh", "-c", cmd.shell};

    ProcLimits lim = base_;
    lim.timeout_ms = cmd.timeout_sec > 0 ? cmd.timeout_sec * 1000 : base_.timeout_ms;

    ProcResult pr;
    if (!proc_run_capture(argv, cmd.cwd, cmd.stdin_data, lim, &pr)) {
        r.err = pr.error;
        r.returncode = -1;
        return r;
    }

    r.out = std::move(pr.out);
    r.truncated = pr.stdout_truncated || pr.stderr_truncated;
    if (pr.timed_out) {
        r.timed_out = true;
        r.returncode = -1;
        r.err = "Command timed out after " + std::to_string(lim.timeout_ms / 1000) + "s";
        return r;
    }
    r.err = std::move(pr.err);
    if (!pr.error.empty()) {
        if (!r.err.empty() && r.err.back() != '\n') r.err.push_back('\n');
        r.err += pr.error;
    }
    r.returncode = pr.exit_code;
    r.success = (pr.exit_code == 0 && pr.error.empty());
    return r;
}

} // namespace opsgate
