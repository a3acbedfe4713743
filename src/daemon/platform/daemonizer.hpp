#pragma once

namespace platform {

// Detaches from the controlling terminal; the calling process continues as the daemon.
void daemonize();

} // namespace platform
