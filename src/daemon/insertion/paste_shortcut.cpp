#include "platform/key_injector.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

std::string normalize(std::string token) {
    auto first = token.find_first_not_of(" \t");
    if (first == std::string::npos) return {};
    auto last = token.find_last_not_of(" \t");
    token = token.substr(first, last - first + 1);
    std::ranges::transform(token, token.begin(), [](unsigned char c) { return std::tolower(c); });
    if (token == "control") return "ctrl";
    if (token == "super" || token == "meta" || token == "cmd") return "logo";
    return token;
}

} // namespace

std::vector<KeyStroke> paste_sequence(const std::string& shortcut) {
    std::vector<std::string> tokens;
    std::istringstream in(shortcut);
    std::string token;
    while (std::getline(in, token, '+')) {
        token = normalize(token);
        if (!token.empty()) tokens.push_back(token);
    }
    if (tokens.empty()) return {};

    auto key = tokens.back();
    tokens.pop_back();

    std::vector<KeyStroke> strokes;
    for (auto& mod : tokens) strokes.push_back({mod, KeyStroke::Direction::Down, true});
    strokes.push_back({key, KeyStroke::Direction::Down, false});
    strokes.push_back({key, KeyStroke::Direction::Up, false});
    for (auto it = tokens.rbegin(); it != tokens.rend(); ++it) {
        strokes.push_back({*it, KeyStroke::Direction::Up, true});
    }
    return strokes;
}
