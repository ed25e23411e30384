#include "workspace/process_runner.hpp"

#include <cerrno>
#include <cstdint>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hive::workspace {

using core::errors::ErrorKind;
using core::errors::HiveError;

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void keep_tail(std::string& out, const std::size_t limit) {
    if (limit > 0 && out.size() > limit) {
        out.erase(0, out.size() - limit);
    }
}

void drain_pipe(const int fd, bool& is_open, std::string& out, const std::size_t limit) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            keep_tail(out, limit);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

void close_pipe(int (&fds)[2]) {
    for (int& fd : fds) {
        if (fd >= 0) {
            static_cast<void>(close(fd));
            fd = -1;
        }
    }
}

}  // namespace

core::errors::Result<ProcessOutcome> run_process(const ProcessRequest& request,
                                                 const core::concurrency::CancelToken& cancel) {
    if (request.command.empty()) {
        return HiveError{ErrorKind::Input, "Command cannot be empty.", "empty_command"};
    }
    if (cancel.is_cancelled()) {
        ProcessOutcome outcome;
        outcome.cancelled = true;
        outcome.stderr_text = "Command cancelled before start.";
        return outcome;
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0) {
        return HiveError{ErrorKind::Internal, "Failed to create process pipes.",
                         "pipe_creation_failed"};
    }
    if (pipe(stderr_pipe) != 0) {
        close_pipe(stdout_pipe);
        return HiveError{ErrorKind::Internal, "Failed to create process pipes.",
                         "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return HiveError{ErrorKind::Internal, "Failed to fork process.", "fork_failed"};
    }

    if (pid == 0) {
        // Own process group, so a kill reaches the command's children too.
        static_cast<void>(setpgid(0, 0));
        if (chdir(request.working_directory.c_str()) != 0) {
            _exit(126);
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        execl("/bin/sh", "sh", "-c", request.command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessOutcome outcome;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    bool killed = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        if (!child_exited && !killed) {
            if (cancel.is_cancelled()) {
                outcome.cancelled = true;
            }
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            if (request.timeout.count() > 0 && elapsed > request.timeout) {
                outcome.timed_out = true;
            }
            if (outcome.cancelled || outcome.timed_out) {
                static_cast<void>(kill(-pid, SIGKILL));
                static_cast<void>(kill(pid, SIGKILL));
                killed = true;
            }
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            static_cast<void>(poll(nullptr, 0, 20));
        }

        drain_pipe(stdout_pipe[0], stdout_open, outcome.stdout_text, request.max_output_bytes);
        drain_pipe(stderr_pipe[0], stderr_open, outcome.stderr_text, request.max_output_bytes);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }
    }

    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.exit_code = 128 + WTERMSIG(status);
    }

    outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return outcome;
}

}  // namespace hive::workspace
