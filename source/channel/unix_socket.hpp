#ifndef NLBD_UNIX_SOCKET_HPP
#define NLBD_UNIX_SOCKET_HPP

// Unix-domain socket transport for the command channel.
// One request frame and one response frame per connection.

#include <string>

#include "protocol/error_kind.hpp"

namespace channel {

// Result of binding the daemon endpoint.
struct ListenResult {
    bool success = false;
    int listen_fd = -1;
    int lock_fd = -1;
    nlbd::ErrorKind error_kind = nlbd::ErrorKind::None;
    std::string error_detail;
};

// Result of connecting to a running daemon.
struct ConnectResult {
    bool success = false;
    int fd = -1;
    bool daemon_absent = false; // no socket file or connection refused
    std::string error_detail;
};

// Result of reading one frame.
struct ReadResult {
    bool success = false;
    bool timed_out = false;
    bool peer_closed = false;
    std::string frame;
    std::string error_detail;
};

// Result of waiting for a connection on the listen socket.
struct AcceptResult {
    bool success = false;
    bool timed_out = false; // nothing pending within the wait, not an error
    int fd = -1;
    std::string error_detail;
};

// $XDG_RUNTIME_DIR/nlbd.sock, else /tmp/nlbd-<uid>.sock.
std::string default_socket_path();

// <socket_path>.lock
std::string lock_path_for(const std::string &socket_path);

// Whether the path fits in sockaddr_un.sun_path.
bool socket_path_fits(const std::string &socket_path);

// Bind the endpoint exactly once. Takes an exclusive lock on the lock file
// first; fails with ErrorKind::Lifecycle if the lock is held or a live listener
// answers on the path. A stale socket file is removed.
ListenResult listen_endpoint(const std::string &socket_path);

// Close the listen socket, remove the socket file and release the lock.
void close_endpoint(ListenResult &endpoint, const std::string &socket_path);

// Wait up to timeout_milliseconds for a client.
AcceptResult accept_connection(int listen_fd, int timeout_milliseconds);

// Connect to the daemon endpoint.
ConnectResult connect_endpoint(const std::string &socket_path);

// Read exactly one frame, waiting at most timeout_milliseconds in total.
ReadResult read_frame(int fd, int timeout_milliseconds);

// Write one frame (followed by a newline), retrying partial writes.
bool write_frame(int fd, const std::string &frame, std::string &error_detail);

// close() that ignores invalid descriptors.
void close_fd(int fd);

} // namespace channel

#endif // NLBD_UNIX_SOCKET_HPP
