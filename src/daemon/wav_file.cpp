#include "wav_file.hpp"

#include <cstring>
#include <fstream>

namespace wav {

namespace {

uint16_t le16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t le32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

} // namespace

std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));

    std::vector<uint8_t> out;
    out.reserve(44 + data_size);
    auto put = [&out](const void* data, size_t len) {
        auto p = static_cast<const uint8_t*>(data);
        out.insert(out.end(), p, p + len);
    };
    auto put16 = [&put](uint16_t v) { put(&v, 2); };
    auto put32 = [&put](uint32_t v) { put(&v, 4); };

    put("RIFF", 4);
    put32(36 + data_size);
    put("WAVE", 4);
    put("fmt ", 4);
    put32(16);
    put16(1);               // PCM
    put16(channels);
    put32(sample_rate);
    put32(byte_rate);
    put16(block_align);
    put16(bits_per_sample);
    put("data", 4);
    put32(data_size);
    put(samples.data(), data_size);

    return out;
}

std::expected<void, std::string> write_file(const std::filesystem::path& path,
                                            std::span<const int16_t> samples,
                                            uint32_t sample_rate) {
    auto bytes = encode(samples, sample_rate);
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        return std::unexpected("cannot create " + path.string());
    }
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!f) {
        return std::unexpected("short write to " + path.string());
    }
    return {};
}

namespace {

// Leaves the stream positioned at the first byte of the data chunk.
std::expected<Header, std::string> parse_header(std::ifstream& f) {
    uint8_t riff[12];
    if (!f.read(reinterpret_cast<char*>(riff), sizeof(riff))) {
        return std::unexpected("file too short for a RIFF header");
    }
    if (std::memcmp(riff, "RIFF", 4) != 0 || std::memcmp(riff + 8, "WAVE", 4) != 0) {
        return std::unexpected("not a RIFF/WAVE file");
    }

    Header h;
    bool have_fmt = false;
    uint8_t chunk[8];
    while (f.read(reinterpret_cast<char*>(chunk), sizeof(chunk))) {
        uint32_t size = le32(chunk + 4);
        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (size < 16) return std::unexpected("fmt chunk too small");
            uint8_t fmt[16];
            if (!f.read(reinterpret_cast<char*>(fmt), sizeof(fmt))) {
                return std::unexpected("truncated fmt chunk");
            }
            if (le16(fmt) != 1) return std::unexpected("audio is not PCM");
            h.channels = le16(fmt + 2);
            h.sample_rate = le32(fmt + 4);
            h.bits_per_sample = le16(fmt + 14);
            have_fmt = true;
            f.seekg(size - 16 + (size & 1), std::ios::cur);
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            if (!have_fmt) return std::unexpected("data chunk before fmt chunk");
            h.data_bytes = size;
            return h;
        } else {
            f.seekg(size + (size & 1), std::ios::cur);
        }
    }
    return std::unexpected("no data chunk");
}

} // namespace

std::expected<Header, std::string> read_header(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected("cannot open " + path.string());
    }
    return parse_header(f);
}

std::expected<Samples, std::string> read_samples(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected("cannot open " + path.string());
    }
    auto h = parse_header(f);
    if (!h) return std::unexpected(h.error());
    if (h->channels != 1 || h->bits_per_sample != 16) {
        return std::unexpected("expected 16-bit mono audio");
    }

    std::vector<uint8_t> raw(h->data_bytes);
    f.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(raw.size()));
    // A recorder killed mid-write leaves a data size larger than the file.
    raw.resize(static_cast<size_t>(f.gcount()) & ~size_t{1});

    Samples out;
    out.sample_rate = h->sample_rate;
    out.pcm.reserve(raw.size() / 2);
    for (size_t i = 0; i < raw.size(); i += 2) {
        out.pcm.push_back(static_cast<int16_t>(le16(raw.data() + i)));
    }
    return out;
}

} // namespace wav
