#include "Subprocess.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

struct Pipe {
    int fds[2] = {-1, -1};
    ~Pipe() { CloseRead(); CloseWrite(); }
    bool Open() { return pipe2(fds, O_CLOEXEC) == 0; }
    void CloseRead() { if (fds[0] >= 0) { close(fds[0]); fds[0] = -1; } }
    void CloseWrite() { if (fds[1] >= 0) { close(fds[1]); fds[1] = -1; } }
};

// Appends what is readable on fd; returns false on EOF or error.
bool Drain(int fd, std::string& sink, size_t cap, bool& truncated) {
    char buf[8192];
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
        size_t room = sink.size() < cap ? cap - sink.size() : 0;
        size_t take = std::min(room, static_cast<size_t>(n));
        sink.append(buf, take);
        if (take < static_cast<size_t>(n)) truncated = true;
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return true;
    return false;
}

} // anonymous namespace

namespace Cadenza {

ProcessResult RunProcess(const std::vector<std::string>& argv, std::chrono::milliseconds timeout, size_t max_output_bytes) {
    ProcessResult result;
    if (argv.empty()) {
        result.spawn_error = "empty command line";
        return result;
    }

    Pipe out_pipe, err_pipe, exec_pipe;
    if (!out_pipe.Open() || !err_pipe.Open() || !exec_pipe.Open()) {
        result.spawn_error = std::string("pipe: ") + std::strerror(errno);
        return result;
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& a : argv) c_argv.push_back(const_cast<char*>(a.c_str()));
    c_argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.spawn_error = std::string("fork: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        dup2(out_pipe.fds[1], STDOUT_FILENO);
        dup2(err_pipe.fds[1], STDERR_FILENO);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        execvp(c_argv[0], c_argv.data());
        int err = errno;
        ssize_t ignored = write(exec_pipe.fds[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    out_pipe.CloseWrite();
    err_pipe.CloseWrite();
    exec_pipe.CloseWrite();

    int exec_errno = 0;
    if (read(exec_pipe.fds[0], &exec_errno, sizeof(exec_errno)) == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        result.spawn_error = argv[0] + ": " + std::strerror(exec_errno);
        return result;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool out_open = true, err_open = true;
    while (out_open || err_open) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }
        pollfd fds[2];
        nfds_t count = 0;
        if (out_open) fds[count++] = {out_pipe.fds[0], POLLIN, 0};
        if (err_open) fds[count++] = {err_pipe.fds[0], POLLIN, 0};
        int rc = poll(fds, count, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            Logger::Log(LogLevel::Warn, "subprocess", std::string("poll failed: ") + std::strerror(errno));
            result.timed_out = true;
            break;
        }
        for (nfds_t i = 0; i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            if (fds[i].fd == out_pipe.fds[0]) {
                out_open = Drain(fds[i].fd, result.out, max_output_bytes, result.truncated);
            } else {
                err_open = Drain(fds[i].fd, result.err, max_output_bytes, result.truncated);
            }
        }
    }

    int status = 0;
    if (result.timed_out) {
        kill(pid, SIGKILL);
    }
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

}
