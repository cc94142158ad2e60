#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <unistd.h>

namespace platform {

namespace {

constexpr const char* kAppDir = "voxpaste";

std::string xdg_or_home(const char* xdg_var, const char* home_suffix) {
    const char* xdg = std::getenv(xdg_var);
    if (xdg && *xdg) return std::string(xdg) + "/" + kAppDir;
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + home_suffix + "/" + kAppDir;
}

} // namespace

std::string config_dir() {
    return xdg_or_home("XDG_CONFIG_HOME", "/.config");
}

std::string data_dir() {
    return xdg_or_home("XDG_DATA_HOME", "/.local/share");
}

std::string recordings_dir() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) return std::string(xdg) + "/" + kAppDir + "/recordings";
    return "/tmp/voxpaste-" + std::to_string(::getuid()) + "/recordings";
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) return std::string(xdg) + "/voxpaste.sock";
    return "/tmp/voxpaste-" + std::to_string(::getuid()) + ".sock";
}

} // namespace platform
