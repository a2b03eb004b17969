#if defined(__linux__)

#include "converge/os/process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace converge::os {

namespace {

/// Owns one file descriptor.
struct Fd {
    int fd{-1};
    Fd() = default;
    explicit Fd(int f) : fd(f) {}
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    ~Fd() { reset(); }
    void reset() { if (fd >= 0) ::close(fd); fd = -1; }
};

bool make_pipe(Fd& r, Fd& w) {
    int p[2];
    if (::pipe2(p, O_CLOEXEC) != 0) return false;
    r.fd = p[0]; w.fd = p[1];
    return true;
}

std::string errno_text(int err) { return std::strerror(err); }

/**
 * @brief Reap the child; translate a signal death into 128+sig.
 */
int wait_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    if (WIFEXITED(status))   return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

converge_detail::expected<ProcessResult, ProcessError>
run_process(std::span<const std::string> argv, std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        return converge_detail::unexpected(ProcessError{ProcessErrc::SpawnFailed, "empty command"});
    }

    Fd out_r, out_w, err_r, err_w, exec_r, exec_w;
    if (!make_pipe(out_r, out_w) || !make_pipe(err_r, err_w) || !make_pipe(exec_r, exec_w)) {
        return converge_detail::unexpected(ProcessError{ProcessErrc::SpawnFailed, "pipe: " + errno_text(errno)});
    }

    // argv must be built before fork: no allocation in the child.
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        return converge_detail::unexpected(ProcessError{ProcessErrc::SpawnFailed, "fork: " + errno_text(errno)});
    }
    if (pid == 0) {
        // Child: stdin from /dev/null, stdout/stderr into the pipes. O_CLOEXEC drops the rest.
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_w.fd, STDOUT_FILENO);
        ::dup2(err_w.fd, STDERR_FILENO);
        // The parent may block SIGINT/SIGTERM for a watcher thread; children start clean.
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        ::execvp(args[0], args.data());
        const int e = errno;
        [[maybe_unused]] auto n = ::write(exec_w.fd, &e, sizeof(e));
        ::_exit(127);
    }

    out_w.reset(); err_w.reset(); exec_w.reset();

    // exec pipe: EOF means execvp succeeded; an int means it failed with that errno.
    int exec_errno = 0;
    ssize_t n;
    do { n = ::read(exec_r.fd, &exec_errno, sizeof(exec_errno)); } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        wait_child(pid);
        const auto code = (exec_errno == ENOENT || exec_errno == EACCES) ? ProcessErrc::NotFound
                                                                         : ProcessErrc::SpawnFailed;
        return converge_detail::unexpected(ProcessError{code, argv[0] + ": " + errno_text(exec_errno)});
    }

    ProcessResult res;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    pollfd fds[2] = {{out_r.fd, POLLIN, 0}, {err_r.fd, POLLIN, 0}};
    std::string* sinks[2] = {&res.out, &res.err};
    int open_streams = 2;
    char buf[4096];

    while (open_streams > 0) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            ::kill(pid, SIGKILL);
            wait_child(pid);
            return converge_detail::unexpected(ProcessError{
                ProcessErrc::Timeout, argv[0] + " did not finish within " +
                std::to_string(timeout.count()) + " ms"});
        }
        const int rc = ::poll(fds, 2, static_cast<int>(left.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            const int e = errno;
            ::kill(pid, SIGKILL);
            wait_child(pid);
            return converge_detail::unexpected(ProcessError{ProcessErrc::IoError, "poll: " + errno_text(e)});
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            const ssize_t got = ::read(fds[i].fd, buf, sizeof(buf));
            if (got > 0) {
                sinks[i]->append(buf, static_cast<std::size_t>(got));
            } else if (got == 0 || errno != EINTR) {
                fds[i].fd = -1; // stream closed (or broken): stop polling it
                --open_streams;
            }
        }
    }

    res.exit_code = wait_child(pid);
    return res;
}

} // namespace converge::os
#endif
