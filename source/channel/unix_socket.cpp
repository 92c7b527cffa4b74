#include "channel/unix_socket.hpp"
#include "channel/frame_decoder.hpp"
#include "utils/debug_log.hpp"

#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/file.h>
#include <sys/un.h>
#include <poll.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <chrono>

namespace channel {

static std::string errno_text(const std::string &what) {
    return what + ": " + std::strerror(errno);
}

static bool fill_address(const std::string &socket_path, struct sockaddr_un &address) {
    if (!socket_path_fits(socket_path)) {
        return false;
    }
    std::memset(&address, 0, sizeof(address));
    address.sun_family = AF_UNIX;
    std::strncpy(address.sun_path, socket_path.c_str(), sizeof(address.sun_path) - 1);
    return true;
}

std::string default_socket_path() {
    const char *runtime_directory = std::getenv("XDG_RUNTIME_DIR");
    if (runtime_directory != nullptr && runtime_directory[0] != '\0') {
        return std::string(runtime_directory) + "/nlbd.sock";
    }
    return "/tmp/nlbd-" + std::to_string(getuid()) + ".sock";
}

std::string lock_path_for(const std::string &socket_path) {
    return socket_path + ".lock";
}

bool socket_path_fits(const std::string &socket_path) {
    struct sockaddr_un address;
    return !socket_path.empty() && socket_path.size() < sizeof(address.sun_path);
}

// Probe whether something accepts connections on the path.
static bool listener_alive(const std::string &socket_path) {
    struct sockaddr_un address;
    if (!fill_address(socket_path, address)) {
        return false;
    }
    int probe_fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (probe_fd < 0) {
        return false;
    }
    bool alive = (connect(probe_fd, reinterpret_cast<struct sockaddr *>(&address), sizeof(address)) == 0);
    close(probe_fd);
    return alive;
}

ListenResult listen_endpoint(const std::string &socket_path) {
    ListenResult result;
    result.error_kind = nlbd::ErrorKind::Transport;

    struct sockaddr_un address;
    if (!fill_address(socket_path, address)) {
        result.error_detail = "Socket path is empty or too long: " + socket_path;
        return result;
    }

    std::string lock_path = lock_path_for(socket_path);
    int lock_fd = open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (lock_fd < 0) {
        result.error_detail = errno_text("Cannot open lock file " + lock_path);
        return result;
    }
    if (flock(lock_fd, LOCK_EX | LOCK_NB) != 0) {
        int lock_errno = errno;
        close(lock_fd);
        if (lock_errno == EWOULDBLOCK) {
            result.error_kind = nlbd::ErrorKind::Lifecycle;
            result.error_detail = "daemon already running (endpoint " + socket_path + " is locked)";
        } else {
            result.error_detail = "Cannot lock " + lock_path + ": " + std::strerror(lock_errno);
        }
        return result;
    }

    struct stat socket_stat;
    if (lstat(socket_path.c_str(), &socket_stat) == 0) {
        if (listener_alive(socket_path)) {
            close(lock_fd);
            result.error_kind = nlbd::ErrorKind::Lifecycle;
            result.error_detail = "daemon already running (a listener answers on " + socket_path + ")";
            return result;
        }
        if (!S_ISSOCK(socket_stat.st_mode)) {
            close(lock_fd);
            result.error_detail = "Endpoint path exists and is not a socket: " + socket_path;
            return result;
        }
        debug_log::log("Removing stale socket " + socket_path);
        unlink(socket_path.c_str());
    }

    int listen_fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listen_fd < 0) {
        close(lock_fd);
        result.error_detail = errno_text("socket() failed");
        return result;
    }
    if (bind(listen_fd, reinterpret_cast<struct sockaddr *>(&address), sizeof(address)) != 0) {
        result.error_detail = errno_text("bind(" + socket_path + ") failed");
        close(listen_fd);
        close(lock_fd);
        return result;
    }
    if (listen(listen_fd, 16) != 0) {
        result.error_detail = errno_text("listen() failed");
        close(listen_fd);
        unlink(socket_path.c_str());
        close(lock_fd);
        return result;
    }
    chmod(socket_path.c_str(), 0600);

    result.success = true;
    result.error_kind = nlbd::ErrorKind::None;
    result.listen_fd = listen_fd;
    result.lock_fd = lock_fd;
    return result;
}

void close_endpoint(ListenResult &endpoint, const std::string &socket_path) {
    if (endpoint.listen_fd >= 0) {
        close(endpoint.listen_fd);
        endpoint.listen_fd = -1;
        unlink(socket_path.c_str());
    }
    if (endpoint.lock_fd >= 0) {
        unlink(lock_path_for(socket_path).c_str());
        close(endpoint.lock_fd);
        endpoint.lock_fd = -1;
    }
    endpoint.success = false;
}

AcceptResult accept_connection(int listen_fd, int timeout_milliseconds) {
    AcceptResult result;

    struct pollfd poll_descriptor;
    poll_descriptor.fd = listen_fd;
    poll_descriptor.events = POLLIN;
    poll_descriptor.revents = 0;

    int ready = poll(&poll_descriptor, 1, timeout_milliseconds);
    if (ready == 0 || (ready < 0 && errno == EINTR)) {
        result.timed_out = true;
        return result;
    }
    if (ready < 0) {
        result.error_detail = errno_text("poll() on listen socket failed");
        return result;
    }

    int client_fd = accept4(listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
    if (client_fd < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) {
            result.timed_out = true;
            return result;
        }
        result.error_detail = errno_text("accept() failed");
        return result;
    }

    result.success = true;
    result.fd = client_fd;
    return result;
}

ConnectResult connect_endpoint(const std::string &socket_path) {
    ConnectResult result;

    struct sockaddr_un address;
    if (!fill_address(socket_path, address)) {
        result.error_detail = "Socket path is empty or too long: " + socket_path;
        return result;
    }

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        result.error_detail = errno_text("socket() failed");
        return result;
    }
    if (connect(fd, reinterpret_cast<struct sockaddr *>(&address), sizeof(address)) != 0) {
        int connect_errno = errno;
        close(fd);
        result.daemon_absent = (connect_errno == ENOENT || connect_errno == ECONNREFUSED);
        result.error_detail = result.daemon_absent
            ? "daemon not started (no listener on " + socket_path + ")"
            : "connect(" + socket_path + ") failed: " + std::strerror(connect_errno);
        return result;
    }

    result.success = true;
    result.fd = fd;
    return result;
}

ReadResult read_frame(int fd, int timeout_milliseconds) {
    ReadResult result;
    FrameDecoder decoder;
    char buffer[8192];

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            result.timed_out = true;
            result.error_detail = "Timed out waiting for a complete message.";
            return result;
        }

        struct pollfd poll_descriptor;
        poll_descriptor.fd = fd;
        poll_descriptor.events = POLLIN;
        poll_descriptor.revents = 0;
        int ready = poll(&poll_descriptor, 1, static_cast<int>(remaining));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.error_detail = errno_text("poll() failed");
            return result;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t received = read(fd, buffer, sizeof(buffer));
        if (received < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            result.error_detail = errno_text("read() failed");
            return result;
        }
        if (received == 0) {
            result.peer_closed = true;
            result.error_detail = decoder.has_partial_frame()
                ? "Connection closed in the middle of a message."
                : "Connection closed before a message arrived.";
            return result;
        }

        if (!decoder.feed(buffer, static_cast<size_t>(received))) {
            result.error_detail = "Message exceeds the maximum frame size.";
            return result;
        }
        if (decoder.next_frame(result.frame)) {
            result.success = true;
            return result;
        }
    }
}

bool write_frame(int fd, const std::string &frame, std::string &error_detail) {
    std::string payload = frame + "\n";
    size_t offset = 0;
    while (offset < payload.size()) {
        ssize_t written = send(fd, payload.data() + offset, payload.size() - offset, MSG_NOSIGNAL);
        if (written < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            error_detail = errno_text("send() failed");
            return false;
        }
        offset += static_cast<size_t>(written);
    }
    return true;
}

void close_fd(int fd) {
    if (fd >= 0) {
        close(fd);
    }
}

} // namespace channel
