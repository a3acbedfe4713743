#include "platform/linux/linux_event_loop.hpp"

#include "platform/linux/pipewire_backend.hpp"
#include "platform/platform_paths.hpp"
#include "recorder/audio_worker.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      recorder_(
          // WorkerSpawner
          [rate = config_.audio.sample_rate,
           capacity = config_.audio.ring_buffer_samples(),
           verbose = verbose_]() {
              return spawn_audio_worker(
                  [rate, capacity]() { return PipeWireBackend::create(rate, capacity); },
                  verbose);
          },
          verbose_),
      core_(config_, verbose_, recorder_) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
}

bool LinuxEventLoop::init() {
    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // epoll setup
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
            std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
            return false;
        }
        return true;
    };

    if (!add_fd(signal_fd_, EPOLLIN)) return false;
    if (!add_fd(ipc_server_.server_fd(), EPOLLIN)) return false;

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) < 0) {
                    std::println(stderr, "signalfd read failed: {}", std::strerror(errno));
                }
                log("Received signal, shutting down");
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) != 0) {
                        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
                        ipc_server_.close_client(client_fd);
                    }
                }
                continue;
            }

            handle_client(fd);
        }
    }

    // Clean shutdown
    core_.shutdown();
    ipc_server_.stop();
}

void LinuxEventLoop::handle_client(int fd) {
    // Blocks for the worker round trip; requests are serialized anyway.
    bool keep = ipc_server_.serve(fd, [this](const nlohmann::json& cmd) -> nlohmann::json {
        if (!cmd.is_object()) {
            return {{"status", "error"}, {"message", "command must be a JSON object"}};
        }
        try {
            std::string cmd_str = cmd.value("cmd", "");
            log("Command: " + cmd_str);
            return core_.handle_command(cmd_str, cmd);
        } catch (const nlohmann::json::exception& e) {
            return {{"status", "error"}, {"message", std::string("malformed command: ") + e.what()}};
        } catch (const std::exception& e) {
            std::println(stderr, "daemon: command failed: {}", e.what());
            return {{"status", "error"}, {"message", std::string("internal error: ") + e.what()}};
        }
    });

    if (!keep) {
        epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
        ipc_server_.close_client(fd);
    }
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[micgate] {}", msg);
    }
}
