#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <print>
#include <unistd.h>

namespace platform {

void daemonize() {
    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "fork() failed: {}", std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0);

    if (setsid() < 0) {
        std::println(stderr, "setsid() failed: {}", std::strerror(errno));
        _exit(1);
    }

    // Second fork so the daemon can never reacquire a controlling terminal
    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    // Clients send absolute output paths, so the working directory can be released.
    if (chdir("/") < 0) _exit(1);

    if (!freopen("/dev/null", "r", stdin) ||
        !freopen("/dev/null", "w", stdout) ||
        !freopen("/dev/null", "w", stderr)) {
        _exit(1);
    }
}

} // namespace platform
