#pragma once

#include "platform/key_injector.hpp"

// Key injection through wtype (virtual-keyboard-unstable-v1).
class WtypeInjector : public KeyInjector {
public:
    bool has_permission() override;
    std::expected<void, std::string> post_sequence(std::span<const KeyStroke> strokes) override;

    static std::vector<std::string> command_for(std::span<const KeyStroke> strokes);
};
