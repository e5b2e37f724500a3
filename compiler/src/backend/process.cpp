//! # Subprocess Execution (Unix)
//!
//! fork + execvp. Exec failure in the child is reported through a
//! close-on-exec status pipe, so the parent can tell "could not start"
//! from "started and exited 127".

#include "backend/process.hpp"

#include "log/log.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace kindred::backend {

namespace {

// Appends whatever is currently readable; returns false at end of stream.
auto drain(int fd, std::string& out) -> bool {
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR;
    }
}

auto is_executable_file(const std::filesystem::path& path) -> bool {
    struct stat st {};
    if (stat(path.c_str(), &st) != 0) {
        return false;
    }
    return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

void close_pipe(int fds[2]) {
    close(fds[0]);
    close(fds[1]);
}

} // namespace

auto find_program(const std::string& program) -> std::optional<std::filesystem::path> {
    if (program.empty()) {
        return std::nullopt;
    }
    if (program.find('/') != std::string::npos) {
        if (is_executable_file(program)) {
            return std::filesystem::path(program);
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    std::stringstream dirs(search);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        auto candidate = std::filesystem::path(dir) / program;
        if (is_executable_file(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

auto run_process(const std::string& program, const std::vector<std::string>& args,
                 int timeout_seconds) -> ProcessResult {
    using Clock = std::chrono::steady_clock;
    auto start = Clock::now();

    ProcessResult result;

    int stdout_pipe[2];
    int stderr_pipe[2];
    int status_pipe[2];
    if (pipe(stdout_pipe) != 0) {
        result.stderr_output = "Failed to create pipes: " + std::string(std::strerror(errno));
        return result;
    }
    if (pipe(stderr_pipe) != 0) {
        result.stderr_output = "Failed to create pipes: " + std::string(std::strerror(errno));
        close_pipe(stdout_pipe);
        return result;
    }
    if (pipe(status_pipe) != 0) {
        result.stderr_output = "Failed to create pipes: " + std::string(std::strerror(errno));
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return result;
    }
    fcntl(status_pipe[1], F_SETFD, FD_CLOEXEC);

    // Build argv before forking; the child only calls async-signal-safe functions
    std::vector<char*> c_args;
    c_args.push_back(const_cast<char*>(program.c_str()));
    for (const auto& a : args) {
        c_args.push_back(const_cast<char*>(a.c_str()));
    }
    c_args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.stderr_output = "Failed to fork: " + std::string(std::strerror(errno));
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(status_pipe);
        return result;
    }

    if (pid == 0) {
        // Child process
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        close(status_pipe[0]);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        execvp(program.c_str(), c_args.data());
        int exec_errno = errno;
        ssize_t ignored = write(status_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    close(status_pipe[1]);

    // Blocks until exec succeeds (EOF) or the child reports its errno
    int exec_errno = 0;
    ssize_t status_read;
    do {
        status_read = read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (status_read < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (status_read == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        result.stderr_output = "Failed to execute " + program + ": " + std::strerror(exec_errno);
        return result;
    }

    result.launched = true;

    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    auto deadline = Clock::now() + std::chrono::seconds(timeout_seconds > 0 ? timeout_seconds : 60);

    int status = 0;
    bool finished = false;
    bool stdout_open = true;
    bool stderr_open = true;

    while (Clock::now() < deadline) {
        pollfd fds[2] = {{stdout_open ? stdout_pipe[0] : -1, POLLIN, 0},
                         {stderr_open ? stderr_pipe[0] : -1, POLLIN, 0}};
        poll(fds, 2, 10);
        if (stdout_open) {
            stdout_open = drain(stdout_pipe[0], result.stdout_output);
        }
        if (stderr_open) {
            stderr_open = drain(stderr_pipe[0], result.stderr_output);
        }

        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret > 0) {
            finished = true;
            break;
        }
    }

    if (!finished) {
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        result.timed_out = true;
        result.exit_code = -1;
        KINDRED_LOG_WARN("backend", program << " timed out after " << timeout_seconds << "s");
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = -1;
    }

    // Collect what was written after the last poll. Stays non-blocking: a
    // killed tool may leave grandchildren holding the write ends.
    if (stdout_open) {
        drain(stdout_pipe[0], result.stdout_output);
    }
    if (stderr_open) {
        drain(stderr_pipe[0], result.stderr_output);
    }

    close(stdout_pipe[0]);
    close(stderr_pipe[0]);

    auto end = Clock::now();
    result.duration_us = std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();

    return result;
}

} // namespace kindred::backend
