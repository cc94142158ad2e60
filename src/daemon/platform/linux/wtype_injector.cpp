#include "platform/linux/wtype_injector.hpp"
#include "platform/linux/subprocess.hpp"

#include <cstdlib>

bool WtypeInjector::has_permission() {
    const char* display = std::getenv("WAYLAND_DISPLAY");
    if (!display || !*display) return false;
    return platform::find_in_path("wtype");
}

std::vector<std::string> WtypeInjector::command_for(std::span<const KeyStroke> strokes) {
    std::vector<std::string> argv = {"wtype"};
    for (auto& s : strokes) {
        bool down = s.direction == KeyStroke::Direction::Down;
        if (s.modifier) {
            argv.push_back(down ? "-M" : "-m");
        } else {
            argv.push_back(down ? "-P" : "-p");
        }
        argv.push_back(s.key);
    }
    return argv;
}

std::expected<void, std::string> WtypeInjector::post_sequence(std::span<const KeyStroke> strokes) {
    if (strokes.empty()) return std::unexpected(std::string("empty key sequence"));

    auto res = platform::run_process(command_for(strokes));
    if (!res) return std::unexpected(res.error());
    if (res->exit_code != 0) {
        return std::unexpected("wtype exited with code " + std::to_string(res->exit_code));
    }
    return {};
}
