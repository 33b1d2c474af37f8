#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <core/types.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

struct SessionTarget {
    std::string host;
    std::string user;
    int port = 22;
    int connect_timeout = 5;              // seconds, TCP connect + handshake
    std::vector<std::string> key_paths;   // tried after the ssh-agent, in order
};

// One-shot, non-interactive SSH session: connect, authenticate with public
// keys only, run one command on an exec channel (no PTY), tear down.
// Host keys are accepted without verification; the monitors run on a
// private network where controller identities change on redeploy.
class SessionManager {
public:
    explicit SessionManager(const SessionTarget& target);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Run command remotely. The whole call, connect included, finishes
    // within timeout_secs.
    CommandResult exec(const std::string& command, int timeout_secs);

    void close();

private:
    using Deadline = std::chrono::steady_clock::time_point;

    CommandResult establish(Deadline deadline);
    CommandResult userauth(Deadline deadline);
    CommandResult run_channel(const std::string& command, Deadline deadline);

    // Block until the socket is ready in the direction libssh2 asked for,
    // or the deadline passes. Returns false on deadline.
    bool wait_socket(Deadline deadline);

    SessionTarget target_;
    LIBSSH2_SESSION* session_ = nullptr;
    LIBSSH2_CHANNEL* channel_ = nullptr;
    int sock_ = -1;
};
