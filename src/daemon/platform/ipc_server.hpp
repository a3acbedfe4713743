#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <string>

// Server side of the command socket: one JSON request in, one JSON response out.
class IpcServer {
public:
    using Handler = std::function<nlohmann::json(const nlohmann::json&)>;

    enum class ReadStatus {
        Command,    // cmd holds the next request
        Incomplete, // no full line buffered yet; wait for more data
        Malformed,  // a full line arrived but was not JSON
        Closed,     // peer gone, socket error, or line too long
    };

    virtual ~IpcServer() = default;
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    // Returns the client fd, or -1.
    virtual int accept_client() = 0;
    // Consumes at most one buffered line; reads the socket only when none is buffered.
    virtual ReadStatus read_command(int client_fd, nlohmann::json& cmd) = 0;
    virtual bool send_response(int client_fd, const nlohmann::json& response) = 0;
    virtual void close_client(int client_fd) = 0;

    // Answers every complete line available on the client through handler.
    // False means the client should be dropped.
    bool serve(int client_fd, const Handler& handler) {
        while (true) {
            nlohmann::json cmd;
            switch (read_command(client_fd, cmd)) {
                case ReadStatus::Command:
                    if (!send_response(client_fd, handler(cmd))) return false;
                    break;
                case ReadStatus::Malformed:
                    if (!send_response(client_fd, {{"status", "error"}, {"message", "malformed command"}})) {
                        return false;
                    }
                    break;
                case ReadStatus::Incomplete:
                    return true;
                case ReadStatus::Closed:
                    return false;
            }
        }
    }
};
