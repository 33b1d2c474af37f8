#include "process.hpp"
#include "platform.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <chrono>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_pipes();
    if (pid_ > 0 && !reaped_) {
        terminate();
    }
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    *this = std::move(other);
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_pipes();
        pid_ = other.pid_;
        out_fd_ = other.out_fd_;
        err_fd_ = other.err_fd_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.out_fd_ = -1;
        other.err_fd_ = -1;
        other.reaped_ = false;
    }
    return *this;
}

void ProcessHandle::close_pipes() {
    if (out_fd_ >= 0) { close(out_fd_); out_fd_ = -1; }
    if (err_fd_ >= 0) { close(err_fd_); err_fd_ = -1; }
}

int ProcessHandle::reap(int status) {
    reaped_ = true;
    exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return exit_code_;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

bool ProcessHandle::running() {
    if (pid_ <= 0 || reaped_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        reap(status);
        return false;
    }
    return ret == 0;  // 0 means still running
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (reaped_) return exit_code_;
    if (timeout_ms < 0) {
        int status;
        if (waitpid(pid_, &status, 0) != pid_) return -1;
        return reap(status);
    }
    // Poll with timeout
    int elapsed = 0;
    for (;;) {
        int status;
        pid_t ret = waitpid(pid_, &status, WNOHANG);
        if (ret == pid_) {
            return reap(status);
        }
        if (elapsed >= timeout_ms) break;
        sleep_ms(10);
        elapsed += 10;
    }
    return -1;  // timed out
}

void ProcessHandle::terminate() {
    if (pid_ <= 0 || reaped_) return;
    kill(pid_, SIGTERM);
    for (int waited = 0; waited < PROCESS_TERM_GRACE_MS; waited += 100) {
        int status;
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            reap(status);
            return;
        }
        sleep_ms(100);
    }
    kill(pid_, SIGKILL);
    int status;
    if (waitpid(pid_, &status, 0) == pid_) reap(status);
    else reaped_ = true;
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    bool capture) {
    ProcessHandle handle;

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // reports exec() errno back to the parent

    if (capture && (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0)) {
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]})
            if (fd >= 0) close(fd);
        return handle;
    }
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]})
            if (fd >= 0) close(fd);
        return handle;
    }

    pid_t pid = fork();
    if (pid < 0) {
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1],
                       exec_pipe[0], exec_pipe[1]})
            if (fd >= 0) close(fd);
        return handle;
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        } else {
            close(STDIN_FILENO);
        }

        if (capture) {
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);
        }

        // Build argv array
        std::vector<const char*> argv;
        argv.push_back(program.c_str());
        for (const auto& a : args) argv.push_back(a.c_str());
        argv.push_back(nullptr);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);  // exec failed
    }

    // Parent
    close(exec_pipe[1]);
    if (capture) {
        close(out_pipe[1]);
        close(err_pipe[1]);
    }

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (n > 0) {
        // exec failed; collect the child and hand back an invalid handle
        waitpid(pid, nullptr, 0);
        if (capture) {
            close(out_pipe[0]);
            close(err_pipe[0]);
        }
        errno = child_errno;
        return handle;
    }

    handle.pid_ = pid;
    if (capture) {
        handle.out_fd_ = out_pipe[0];
        handle.err_fd_ = err_pipe[0];
    }
    return handle;
}

// ── run_capture ──────────────────────────────────────────────

CommandResult run_capture(const std::vector<std::string>& argv, int timeout_ms) {
    CommandResult result;
    if (argv.empty()) {
        result.status = CommandStatus::SpawnFailed;
        result.stderr_data = "empty command";
        return result;
    }

    std::vector<std::string> args(argv.begin() + 1, argv.end());
    ProcessHandle proc = spawn(argv[0], args, true);
    if (!proc.valid()) {
        result.status = CommandStatus::SpawnFailed;
        result.stderr_data = "failed to start " + argv[0] + ": " + std::strerror(errno);
        return result;
    }

    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);

    struct pollfd fds[2];
    fds[0] = {proc.stdout_fd(), POLLIN, 0};
    fds[1] = {proc.stderr_fd(), POLLIN, 0};
    std::string* sinks[2] = {&result.stdout_data, &result.stderr_data};
    int open_streams = 2;
    char buf[PIPE_READ_BUF_SIZE];

    while (open_streams > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - clock::now()).count();
        if (remaining <= 0) break;

        int ret = poll(fds, 2, static_cast<int>(remaining));
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) break;  // deadline

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                fds[i].fd = -1;  // EOF: poll() ignores negative fds
                --open_streams;
            }
        }
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - clock::now()).count();
    int code = (open_streams == 0 && remaining > 0)
        ? proc.wait(static_cast<int>(remaining))
        : -1;

    if (proc.running()) {
        proc.terminate();
        result.status = CommandStatus::TimedOut;
        result.exit_code = -1;
        result.stderr_data += fmt::format("timed out after {}ms", timeout_ms);
        return result;
    }

    result.exit_code = (code == -1) ? proc.wait(0) : code;
    return result;
}

} // namespace platform
