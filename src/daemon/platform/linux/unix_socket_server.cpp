#include "platform/linux/unix_socket_server.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketServer::UnixSocketServer() = default;

UnixSocketServer::~UnixSocketServer() {
    stop();
}

bool UnixSocketServer::start(const std::string& endpoint) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        std::println(stderr, "ipc: socket path too long: {}", endpoint);
        return false;
    }
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    // Remove stale socket
    ::unlink(endpoint.c_str());

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        std::println(stderr, "ipc: socket() failed: {}", std::strerror(errno));
        return false;
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "ipc: bind({}) failed: {}", endpoint, std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }
    socket_path_ = endpoint;

    if (::listen(server_fd_, 8) < 0) {
        std::println(stderr, "ipc: listen() failed: {}", std::strerror(errno));
        stop();
        return false;
    }

    return true;
}

void UnixSocketServer::stop() {
    for (auto& c : clients_) {
        ::close(c.fd);
    }
    clients_.clear();

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            std::println(stderr, "ipc: accept4() failed: {}", std::strerror(errno));
        }
        return -1;
    }
    clients_.push_back({fd, {}});
    return fd;
}

IpcServer::ReadStatus UnixSocketServer::read_command(int client_fd, nlohmann::json& cmd) {
    auto* client = find_client(client_fd);
    if (!client) return ReadStatus::Closed;

    // A previous read may have buffered more than one line.
    auto pos = client->buf.find('\n');
    if (pos == std::string::npos) {
        char buf[4096];
        ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
        if (n == 0) return ReadStatus::Closed;
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return ReadStatus::Incomplete;
            std::println(stderr, "ipc: recv() on client {} failed: {}", client_fd, std::strerror(errno));
            return ReadStatus::Closed;
        }

        size_t scanned = client->buf.size();
        client->buf.append(buf, static_cast<size_t>(n));
        pos = client->buf.find('\n', scanned);
        if (pos == std::string::npos) {
            if (client->buf.size() > max_line_bytes) {
                std::println(stderr, "ipc: client {} exceeded {} bytes without a newline",
                             client_fd, max_line_bytes);
                return ReadStatus::Closed;
            }
            return ReadStatus::Incomplete;
        }
    }

    std::string line = client->buf.substr(0, pos);
    client->buf.erase(0, pos + 1);

    try {
        cmd = nlohmann::json::parse(line);
        return ReadStatus::Command;
    } catch (const nlohmann::json::exception& e) {
        std::println(stderr, "ipc: malformed command from client {}: {}", client_fd, e.what());
        return ReadStatus::Malformed;
    }
}

bool UnixSocketServer::send_response(int client_fd, const nlohmann::json& response) {
    std::string msg = response.dump() + "\n";
    size_t off = 0;

    // Client sockets are non-blocking; large responses (inline samples) need several writes.
    while (off < msg.size()) {
        ssize_t sent = ::send(client_fd, msg.data() + off, msg.size() - off, MSG_NOSIGNAL);
        if (sent > 0) {
            off += static_cast<size_t>(sent);
            continue;
        }
        if (sent < 0 && errno == EINTR) continue;
        if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{.fd = client_fd, .events = POLLOUT, .revents = 0};
            if (::poll(&pfd, 1, send_timeout_ms) > 0) continue;
            std::println(stderr, "ipc: client {} stopped reading", client_fd);
            return false;
        }
        std::println(stderr, "ipc: send() failed: {}", std::strerror(errno));
        return false;
    }
    return true;
}

void UnixSocketServer::close_client(int client_fd) {
    ::close(client_fd);
    std::erase_if(clients_, [client_fd](const ClientBuffer& c) { return c.fd == client_fd; });
}

UnixSocketServer::ClientBuffer* UnixSocketServer::find_client(int fd) {
    auto it = std::ranges::find_if(clients_, [fd](const ClientBuffer& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}
