#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "recorder/recorder_service.hpp"

#include <atomic>
#include <string>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void handle_client(int fd);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Constructed before core_
    RecorderService recorder_;
    UnixSocketServer ipc_server_;

    DaemonCore core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;

    std::atomic<bool> running_{false};
};
