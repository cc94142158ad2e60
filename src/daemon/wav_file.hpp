#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

// 16-bit PCM mono WAV, the format every transcription backend accepts.
namespace wav {

struct Header {
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
    uint32_t data_bytes = 0;

    double duration_s() const {
        uint32_t frame = channels * (bits_per_sample / 8u);
        if (sample_rate == 0 || frame == 0) return 0.0;
        return static_cast<double>(data_bytes / frame) / sample_rate;
    }
};

std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate);

std::expected<void, std::string> write_file(const std::filesystem::path& path,
                                            std::span<const int16_t> samples,
                                            uint32_t sample_rate);

// Parses the RIFF header and locates the data chunk. Only PCM is accepted.
std::expected<Header, std::string> read_header(const std::filesystem::path& path);

struct Samples {
    uint32_t sample_rate = 0;
    std::vector<int16_t> pcm;
};

// Reads the whole data chunk. Rejects anything but 16-bit mono.
std::expected<Samples, std::string> read_samples(const std::filesystem::path& path);

} // namespace wav
