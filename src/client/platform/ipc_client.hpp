#pragma once

#include <nlohmann/json.hpp>
#include <string>

class IpcClient {
public:
    // Stopping a long recording with inline samples can take a while.
    static constexpr int default_timeout_ms = 30000;

    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send(const nlohmann::json& cmd) = 0;
    virtual bool recv(nlohmann::json& response, int timeout_ms = default_timeout_ms) = 0;
    virtual void close() = 0;

    bool request(const nlohmann::json& cmd, nlohmann::json& response,
                 int timeout_ms = default_timeout_ms) {
        return send(cmd) && recv(response, timeout_ms);
    }
};
