#pragma once

#include "platform/ipc_client.hpp"

#include <string>

// Blocking client for the daemon's newline-delimited JSON socket.
class UnixSocketClient : public IpcClient {
public:
    UnixSocketClient() = default;
    ~UnixSocketClient() override { close(); }

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    bool connect(const std::string& endpoint) override;
    bool send(const nlohmann::json& cmd) override;
    bool recv(nlohmann::json& response, int timeout_ms = default_timeout_ms) override;
    void close() override;

private:
    int fd_ = -1;
    // Bytes read past the end of the last response.
    std::string pending_;
};
