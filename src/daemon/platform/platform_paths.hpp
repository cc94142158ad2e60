#pragma once

#include <string>

namespace platform {

// Per-user directories. Empty string when no home directory can be determined.
std::string config_dir();
std::string data_dir();

// Scratch directory for audio artifacts (tmpfs when available).
std::string recordings_dir();

std::string ipc_endpoint();

} // namespace platform
