#include "stagehand/proc.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>

#ifndef _WIN32
  #include <unistd.h>
  #include <fcntl.h>
  #include <sys/types.h>
  #include <sys/wait.h>
  #include <poll.h>
  #ifdef __linux__
    #include <sys/prctl.h>
  #endif
#endif

namespace stagehand {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;
    bool quoted = false;

    auto flush = [&]() {
        if (!cur.empty() || quoted) {
            out.push_back(cur);
            cur.clear();
        }
        quoted = false;
    };

    for (size_t i = 0; i < cmd.size(); i++) {
        char c = cmd[i];
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            if (c == '\'') { st = SQ; quoted = true; continue; }
            if (c == '"') { st = DQ; quoted = true; esc = false; continue; }
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

std::string trim_ws(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) s.pop_back();
    size_t i = 0;
    while (i < s.size() && (s[i] == '\n' || s[i] == '\r' || s[i] == ' ' || s[i] == '\t')) i++;
    if (i) s.erase(0, i);
    return s;
}

namespace {

// Splits the byte stream into lines, capturing up to the configured cap.
class LineSink {
public:
    LineSink(const ProcLimits& lim, const LineFn& on_line, ProcResult* res)
        : lim_(lim), on_line_(on_line), res_(res) {}

    void feed(const char* data, size_t n) {
        size_t can = lim_.capture_max_bytes > res_->output.size()
                         ? (lim_.capture_max_bytes - res_->output.size()) : 0;
        if (n > can) res_->output_truncated = true;
        res_->output.append(data, std::min(n, can));

        for (size_t i = 0; i < n; i++) {
            if (data[i] == '\n') {
                emit();
            } else {
                pending_.push_back(data[i]);
            }
        }
    }

    void finish() {
        if (!pending_.empty()) emit();
    }

private:
    void emit() {
        if (!pending_.empty() && pending_.back() == '\r') pending_.pop_back();
        if (on_line_) on_line_(pending_);
        pending_.clear();
    }

    const ProcLimits& lim_;
    const LineFn& on_line_;
    ProcResult* res_;
    std::string pending_;
};

} // namespace

bool proc_run_streaming(const std::vector<std::string>& argv,
                        const std::string& cwd,
                        const ProcLimits& lim,
                        const LineFn& on_line,
                        ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

#ifdef _WIN32
    res->error = "proc_run_streaming: not supported on Windows";
    return false;
#else
    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    int pipefd[2];
    if (pipe(pipefd) != 0) {
        res->error = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }

    // exec failure is reported through a close-on-exec pipe
    int errpipe[2];
    if (pipe(errpipe) != 0) {
        close(pipefd[0]); close(pipefd[1]);
        res->error = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }
    (void)fcntl(errpipe[1], F_SETFD, FD_CLOEXEC);

    int flags = fcntl(pipefd[0], F_GETFL, 0);
    if (flags >= 0) (void)fcntl(pipefd[0], F_SETFL, flags | O_NONBLOCK);

    pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]); close(pipefd[1]);
        close(errpipe[0]); close(errpipe[1]);
        res->error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        // child
        (void)dup2(pipefd[1], STDOUT_FILENO);
        (void)dup2(pipefd[1], STDERR_FILENO);
        close(pipefd[0]);
        close(pipefd[1]);
        close(errpipe[0]);

        // own process group so a deadline can kill the whole subtree
        (void)setpgid(0, 0);

#ifdef __linux__
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            int e = errno;
            (void)!write(errpipe[1], &e, sizeof(e));
            _exit(127);
        }

        std::vector<char*> cargv;
        cargv.reserve(argv.size() + 1);
        for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
        cargv.push_back(nullptr);

        execvp(cargv[0], cargv.data());
        int e = errno;
        (void)!write(errpipe[1], &e, sizeof(e));
        _exit(127);
    }

    // parent
    (void)setpgid(pid, pid);
    close(pipefd[1]);
    close(errpipe[1]);

    int child_errno = 0;
    ssize_t en = read(errpipe[0], &child_errno, sizeof(child_errno));
    close(errpipe[0]);
    if (en == static_cast<ssize_t>(sizeof(child_errno))) {
        (void)waitpid(pid, nullptr, 0);
        close(pipefd[0]);
        res->error = "cannot execute '" + argv[0] + "': " + std::strerror(child_errno);
        return false;
    }

    LineSink sink(lim, on_line, res);
    auto start = std::chrono::steady_clock::now();
    bool eof = false;
    int status = 0;

    while (!eof) {
        char buf[4096];
        while (true) {
            ssize_t n = read(pipefd[0], buf, sizeof(buf));
            if (n > 0) { sink.feed(buf, static_cast<size_t>(n)); continue; }
            if (n == 0) { eof = true; break; }
            if (errno == EINTR) continue;
            break; // EAGAIN
        }
        if (eof) break;

        auto now = std::chrono::steady_clock::now();
        int elapsed_ms = static_cast<int>(
            std::chrono::duration_cast<std::chrono::milliseconds>(now - start).count());
        if (lim.timeout_ms > 0 && elapsed_ms > lim.timeout_ms) {
            res->timed_out = true;
            (void)kill(-pid, SIGKILL);
            (void)kill(pid, SIGKILL);
            break;
        }

        struct pollfd pfd;
        pfd.fd = pipefd[0];
        pfd.events = POLLIN;
        int slice = 100;
        if (lim.timeout_ms > 0) {
            int remaining = lim.timeout_ms - elapsed_ms;
            if (remaining < slice) slice = std::max(1, remaining);
        }
        (void)poll(&pfd, 1, slice);
    }
    sink.finish();
    close(pipefd[0]);

    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            res->exit_code = 128;
            res->error = std::string("waitpid failed: ") + std::strerror(errno);
            return true;
        }
    }

    if (WIFEXITED(status)) {
        res->exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res->exit_code = 128 + WTERMSIG(status);
    } else {
        res->exit_code = 128;
    }
    return true;
#endif
}

bool PosixProcessRunner::run(const std::vector<std::string>& argv,
                             const std::string& cwd,
                             const LineFn& on_line,
                             ProcResult* res) {
    return proc_run_streaming(argv, cwd, lim_, on_line, res);
}

} // namespace stagehand
