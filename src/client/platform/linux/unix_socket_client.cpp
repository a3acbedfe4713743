#include "platform/linux/unix_socket_client.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

bool UnixSocketClient::connect(const std::string& endpoint) {
    sockaddr_un addr{};
    if (endpoint.size() >= sizeof(addr.sun_path)) return false;
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    close();
    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return false;

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd_);
        fd_ = -1;
        return false;
    }
    return true;
}

bool UnixSocketClient::send(const nlohmann::json& cmd) {
    if (fd_ < 0) return false;
    std::string msg = cmd.dump() + "\n";
    size_t off = 0;
    while (off < msg.size()) {
        ssize_t sent = ::send(fd_, msg.data() + off, msg.size() - off, MSG_NOSIGNAL);
        if (sent < 0 && errno == EINTR) continue;
        if (sent <= 0) return false;
        off += static_cast<size_t>(sent);
    }
    return true;
}

bool UnixSocketClient::recv(nlohmann::json& response, int timeout_ms) {
    if (fd_ < 0) return false;

    pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
    size_t scanned = 0;
    auto pos = pending_.find('\n');

    // Responses carrying samples span many reads; only scan the new bytes.
    while (pos == std::string::npos) {
        int ret = ::poll(&pfd, 1, timeout_ms);
        if (ret < 0 && errno == EINTR) continue;
        if (ret <= 0) return false;

        char tmp[16384];
        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
        if (n <= 0) return false;

        scanned = pending_.size();
        pending_.append(tmp, static_cast<size_t>(n));
        pos = pending_.find('\n', scanned);
    }

    std::string line = pending_.substr(0, pos);
    pending_.erase(0, pos + 1);

    try {
        response = nlohmann::json::parse(line);
        return true;
    } catch (const nlohmann::json::exception& e) {
        std::println(stderr, "ipc: malformed response: {}", e.what());
        return false;
    }
}

void UnixSocketClient::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    pending_.clear();
}
