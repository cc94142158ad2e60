#pragma once

namespace platform {

// Detaches from the terminal. Returns only in the daemon process.
void daemonize();

} // namespace platform
