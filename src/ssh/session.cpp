#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <filesystem>
#include <mutex>

namespace {

using clock_type = std::chrono::steady_clock;

int remaining_ms(clock_type::time_point deadline) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - clock_type::now()).count();
    return ms > 0 ? static_cast<int>(ms) : 0;
}

CommandResult failure(CommandStatus status, const std::string& msg) {
    CommandResult r;
    r.status = status;
    r.exit_code = -1;
    r.stderr_data = msg;
    return r;
}

std::string hex_fingerprint(const char* hash, size_t len) {
    std::string out;
    for (size_t i = 0; i < len; ++i) {
        if (i) out += ":";
        out += fmt::format("{:02x}", static_cast<unsigned char>(hash[i]));
    }
    return out;
}

// libssh2_init is process-global and must run once before any session.
bool ensure_libssh2() {
    static std::once_flag once;
    static int rc = -1;
    std::call_once(once, [] { rc = libssh2_init(0); });
    return rc == 0;
}

} // namespace

SessionManager::SessionManager(const SessionTarget& target)
    : target_(target) {
}

SessionManager::~SessionManager() {
    close();
}

CommandResult SessionManager::exec(const std::string& command, int timeout_secs) {
    auto deadline = clock_type::now() + std::chrono::seconds(timeout_secs);

    auto est = establish(deadline);
    if (est.status != CommandStatus::Completed) {
        close();
        return est;
    }

    auto result = run_channel(command, deadline);
    close();
    return result;
}

bool SessionManager::wait_socket(Deadline deadline) {
    int ms = remaining_ms(deadline);
    if (ms <= 0) return false;

    short events = 0;
    int dir = libssh2_session_block_directions(session_);
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) events = POLLIN;

    // Cap each wait so deadline checks stay responsive
    platform::poll_socket(sock_, events, ms < 100 ? ms : 100);
    return remaining_ms(deadline) > 0;
}

CommandResult SessionManager::establish(Deadline deadline) {
    if (!ensure_libssh2()) {
        return failure(CommandStatus::ConnectFailed, "Failed to initialize libssh2");
    }

    int connect_ms = target_.connect_timeout * 1000;
    if (connect_ms > remaining_ms(deadline)) connect_ms = remaining_ms(deadline);

    std::string err;
    sock_ = platform::connect_tcp(target_.host, target_.port, connect_ms, err);
    if (sock_ < 0) {
        return failure(CommandStatus::ConnectFailed, err);
    }

    session_ = libssh2_session_init();
    if (!session_) {
        return failure(CommandStatus::ConnectFailed, "Failed to create SSH session");
    }
    libssh2_session_set_blocking(session_, 0);

    // Handshake shares the connect budget
    auto handshake_deadline = clock_type::now() + std::chrono::seconds(target_.connect_timeout);
    if (handshake_deadline > deadline) handshake_deadline = deadline;

    int rc;
    while ((rc = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_socket(handshake_deadline)) {
            return failure(CommandStatus::TimedOut,
                           "SSH handshake with " + target_.host + " timed out");
        }
    }
    if (rc != 0) {
        return failure(CommandStatus::ConnectFailed,
                       fmt::format("SSH handshake with {} failed (rc={})", target_.host, rc));
    }

    // Accept whatever identity the controller presents; record it for debugging.
    const char* hash = libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256);
    if (hash) {
        log_debug(fmt::format("ssh: {} host key SHA256 {}", target_.host,
                              hex_fingerprint(hash, 32)));
    }

    return userauth(deadline);
}

CommandResult SessionManager::userauth(Deadline deadline) {
    const std::string& user = target_.user;

    // 1. ssh-agent identities
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (agent) {
        if (libssh2_agent_connect(agent) == 0 && libssh2_agent_list_identities(agent) == 0) {
            struct libssh2_agent_publickey* identity = nullptr;
            struct libssh2_agent_publickey* prev = nullptr;
            while (libssh2_agent_get_identity(agent, &identity, prev) == 0) {
                int rc;
                while ((rc = libssh2_agent_userauth(agent, user.c_str(), identity))
                       == LIBSSH2_ERROR_EAGAIN) {
                    if (!wait_socket(deadline)) break;
                }
                if (rc == 0) {
                    libssh2_agent_disconnect(agent);
                    libssh2_agent_free(agent);
                    log_debug(fmt::format("ssh: authenticated to {} via agent", target_.host));
                    return CommandResult{0, "", "", CommandStatus::Completed};
                }
                if (remaining_ms(deadline) <= 0) break;
                prev = identity;
            }
            libssh2_agent_disconnect(agent);
        }
        libssh2_agent_free(agent);
    }

    if (remaining_ms(deadline) <= 0) {
        return failure(CommandStatus::TimedOut, "SSH authentication timed out");
    }

    // 2. Private key files
    for (const auto& raw : target_.key_paths) {
        std::string key = expand_home(raw);
        std::error_code ec;
        if (!std::filesystem::exists(key, ec)) continue;

        int rc;
        while ((rc = libssh2_userauth_publickey_fromfile_ex(
                    session_, user.c_str(), static_cast<unsigned int>(user.size()),
                    nullptr, key.c_str(), nullptr)) == LIBSSH2_ERROR_EAGAIN) {
            if (!wait_socket(deadline)) {
                return failure(CommandStatus::TimedOut, "SSH authentication timed out");
            }
        }
        if (rc == 0) {
            log_debug(fmt::format("ssh: authenticated to {} with {}", target_.host, key));
            return CommandResult{0, "", "", CommandStatus::Completed};
        }
    }

    return failure(CommandStatus::AuthFailed,
                   fmt::format("Public key authentication failed for {}@{}", user, target_.host));
}

CommandResult SessionManager::run_channel(const std::string& command, Deadline deadline) {
    while ((channel_ = libssh2_channel_open_session(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            return failure(CommandStatus::ChannelFailed, "Failed to open exec channel");
        }
        if (!wait_socket(deadline)) {
            return failure(CommandStatus::TimedOut, "Timed out opening exec channel");
        }
    }

    int rc;
    while ((rc = libssh2_channel_exec(channel_, command.c_str())) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_socket(deadline)) {
            return failure(CommandStatus::TimedOut, "Timed out starting remote command");
        }
    }
    if (rc != 0) {
        return failure(CommandStatus::ChannelFailed, "Failed to exec command on channel");
    }

    CommandResult result;
    char buf[SSH_READ_BUF_SIZE];
    for (;;) {
        bool progressed = false;

        ssize_t n = libssh2_channel_read(channel_, buf, sizeof(buf));
        if (n > 0) {
            result.stdout_data.append(buf, static_cast<size_t>(n));
            progressed = true;
        } else if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            return failure(CommandStatus::ChannelFailed, "SSH channel read error");
        }

        ssize_t e = libssh2_channel_read_stderr(channel_, buf, sizeof(buf));
        if (e > 0) {
            result.stderr_data.append(buf, static_cast<size_t>(e));
            progressed = true;
        } else if (e < 0 && e != LIBSSH2_ERROR_EAGAIN) {
            return failure(CommandStatus::ChannelFailed, "SSH channel read error");
        }

        if (libssh2_channel_eof(channel_)) break;
        if (!progressed && !wait_socket(deadline)) {
            auto r = failure(CommandStatus::TimedOut, "Remote command timed out");
            r.stdout_data = std::move(result.stdout_data);
            return r;
        }
    }

    while ((rc = libssh2_channel_close(channel_)) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_socket(deadline)) break;
    }
    result.exit_code = (rc == 0) ? libssh2_channel_get_exit_status(channel_) : -1;
    result.status = (rc == 0) ? CommandStatus::Completed : CommandStatus::ChannelFailed;
    return result;
}

void SessionManager::close() {
    // Teardown stays non-blocking so a dead peer cannot stall the tick;
    // the disconnect message is best-effort.
    if (channel_) {
        libssh2_channel_free(channel_);
        channel_ = nullptr;
    }

    if (session_) {
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
    }

    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}
