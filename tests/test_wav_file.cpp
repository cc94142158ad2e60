#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "test_support.hpp"
#include "wav_file.hpp"

#include <cstring>
#include <fstream>
#include <vector>

TEST_CASE("WAV file", "[wav]") {
    test::TmpDir dir("wav");

    SECTION("EncodeHeaderLayout") {
        std::vector<int16_t> samples = {0, 1000, -1000, 32767};
        auto bytes = wav::encode(samples, 16000);

        REQUIRE(bytes.size() == 44 + samples.size() * 2);
        REQUIRE(std::memcmp(bytes.data(), "RIFF", 4) == 0);
        REQUIRE(std::memcmp(bytes.data() + 8, "WAVE", 4) == 0);
        REQUIRE(std::memcmp(bytes.data() + 36, "data", 4) == 0);

        int16_t last;
        std::memcpy(&last, bytes.data() + 44 + 6, 2);
        REQUIRE(last == 32767);
    }

    SECTION("WriteThenReadHeader") {
        std::vector<int16_t> samples(8000, 42);
        auto path = dir.path / "half_second.wav";
        REQUIRE(wav::write_file(path, samples, 16000));

        auto h = wav::read_header(path);
        REQUIRE(h);
        REQUIRE(h->channels == 1);
        REQUIRE(h->sample_rate == 16000);
        REQUIRE(h->bits_per_sample == 16);
        REQUIRE(h->data_bytes == 16000);
        REQUIRE_THAT(h->duration_s(), Catch::Matchers::WithinAbs(0.5, 1e-9));
    }

    SECTION("EmptyRecordingHasNoData") {
        auto path = dir.path / "empty.wav";
        REQUIRE(wav::write_file(path, {}, 16000));
        auto h = wav::read_header(path);
        REQUIRE(h);
        REQUIRE(h->data_bytes == 0);
    }

    SECTION("SkipsUnknownChunks") {
        auto bytes = wav::encode(std::vector<int16_t>(10, 1), 16000);
        // Splice a LIST chunk between fmt and data.
        std::vector<uint8_t> list = {'L', 'I', 'S', 'T', 3, 0, 0, 0, 'a', 'b', 'c', 0};
        bytes.insert(bytes.begin() + 36, list.begin(), list.end());

        auto path = dir.path / "list.wav";
        std::ofstream(path, std::ios::binary)
            .write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));

        auto h = wav::read_header(path);
        REQUIRE(h);
        REQUIRE(h->data_bytes == 20);
    }

    SECTION("ReadSamples") {
        std::vector<int16_t> samples = {0, 1, -1, 32767, -32768, 1234};
        auto path = dir.path / "samples.wav";
        REQUIRE(wav::write_file(path, samples, 16000));

        auto read = wav::read_samples(path);
        REQUIRE(read);
        REQUIRE(read->sample_rate == 16000);
        REQUIRE(read->pcm == samples);
    }

    SECTION("ReadSamplesTruncatedData") {
        auto bytes = wav::encode(std::vector<int16_t>(100, 7), 16000);
        bytes.resize(44 + 51);  // half a sample dangling at the end
        auto path = dir.path / "truncated.wav";
        std::ofstream(path, std::ios::binary)
            .write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));

        auto read = wav::read_samples(path);
        REQUIRE(read);
        REQUIRE(read->pcm.size() == 25);
        REQUIRE(read->pcm.back() == 7);
    }

    SECTION("ReadSamplesRejectsStereo") {
        auto bytes = wav::encode(std::vector<int16_t>(4, 0), 16000);
        bytes[22] = 2;  // channel count
        auto path = dir.path / "stereo.wav";
        std::ofstream(path, std::ios::binary)
            .write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));

        REQUIRE(wav::read_header(path));
        auto read = wav::read_samples(path);
        REQUIRE_FALSE(read);
        REQUIRE(read.error() == "expected 16-bit mono audio");
    }

    SECTION("RejectsGarbage") {
        auto path = dir.path / "garbage.wav";
        std::ofstream(path) << "definitely not a wave file";
        REQUIRE_FALSE(wav::read_header(path));
    }

    SECTION("RejectsMissingFile") {
        auto h = wav::read_header(dir.path / "missing.wav");
        REQUIRE_FALSE(h);
    }

    SECTION("WriteIntoMissingDirectoryFails") {
        auto res = wav::write_file(dir.path / "nope" / "x.wav", std::vector<int16_t>(4, 0), 16000);
        REQUIRE_FALSE(res);
    }
}
