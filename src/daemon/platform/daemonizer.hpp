#pragma once

namespace platform {

// Detaches from the controlling terminal (double fork, setsid) and points
// stdio at /dev/null. Exits the calling process on failure.
void daemonize();

} // namespace platform
