#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running.
    bool running();

    // Wait for the process to exit. Returns exit code.
    // timeout_ms = -1 means indefinite wait; -1 is also returned on timeout.
    int wait(int timeout_ms = -1);

    // Terminate the process (SIGTERM, then SIGKILL after the grace period).
    void terminate();

    int native_handle() const { return pid_; }

    // Read ends of the child's stdout/stderr pipes (-1 if not captured).
    int stdout_fd() const { return out_fd_; }
    int stderr_fd() const { return err_fd_; }

private:
    void close_pipes();
    int reap(int status);

    int pid_ = -1;
    int out_fd_ = -1;
    int err_fd_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               bool capture);
};

// Spawn a child process with stdin closed.
// capture: if true, stdout and stderr are redirected to pipes readable
// through stdout_fd()/stderr_fd().
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    bool capture = false);

// Run argv[0] with the remaining arguments, collecting stdout/stderr until
// it exits or timeout_ms elapses. A child still running at the deadline is
// terminated and reported as TimedOut.
CommandResult run_capture(const std::vector<std::string>& argv, int timeout_ms);

} // namespace platform
