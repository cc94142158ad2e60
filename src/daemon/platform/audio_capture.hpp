#pragma once

#include <expected>
#include <string>

class AudioCapture {
public:
    virtual ~AudioCapture() = default;
    // Error string describes why the device could not be opened.
    virtual std::expected<void, std::string> start() = 0;
    virtual void stop() = 0;
    virtual bool is_capturing() const = 0;
};
