#pragma once

#include <expected>
#include <span>
#include <string>
#include <vector>

struct KeyStroke {
    enum class Direction { Down, Up };

    std::string key;         // "ctrl", "shift", "v", ...
    Direction direction;
    bool modifier = false;
};

// Synthesizes keyboard input in the focused application.
class KeyInjector {
public:
    virtual ~KeyInjector() = default;

    // False when the session can't simulate input at all.
    virtual bool has_permission() = 0;

    // Posts every stroke as one batch so local input cannot interleave.
    virtual std::expected<void, std::string> post_sequence(std::span<const KeyStroke> strokes) = 0;
};

// "ctrl+shift+v" -> ctrl down, shift down, v down, v up, shift up, ctrl up.
// Empty if the shortcut has no key.
std::vector<KeyStroke> paste_sequence(const std::string& shortcut);
