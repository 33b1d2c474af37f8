#pragma once

#include <string>
#include <poll.h>

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(int sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(int sock, short events, int timeout_ms);

// Close a socket.
void close_socket(int sock);

// Open a non-blocking TCP connection to host:port, waiting at most
// timeout_ms for it to complete. Returns the socket, or -1 with err set.
int connect_tcp(const std::string& host, int port, int timeout_ms, std::string& err);

// True if getaddrinfo() can resolve host.
bool host_resolves(const std::string& host, std::string& err);

} // namespace platform
