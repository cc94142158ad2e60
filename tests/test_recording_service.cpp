#include <catch2/catch_test_macros.hpp>

#include "recording_service.hpp"
#include "test_support.hpp"
#include "wav_file.hpp"

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

TEST_CASE("RecordingService", "[recording]") {
    test::TmpDir dir("recording");
    SampleRing ring(16000);
    LevelMeter meter;
    test::FakeCapture capture;
    RecordingService rec(capture, ring, meter, 16000, dir.path / "recordings");

    SECTION("IdleByDefault") {
        REQUIRE_FALSE(rec.is_recording());
        REQUIRE(rec.recording_duration() == 0.0);
        REQUIRE(rec.audio_level() == 0.0f);
        REQUIRE_FALSE(rec.stop_recording());
    }

    SECTION("StopWritesArtifact") {
        REQUIRE(rec.start_recording());
        REQUIRE(rec.is_recording());
        REQUIRE(capture.is_capturing());

        std::vector<int16_t> samples(4000, 123);
        ring.push(samples);

        auto artifact = rec.stop_recording();
        REQUIRE(artifact);
        REQUIRE_FALSE(capture.is_capturing());
        REQUIRE(fs::exists(artifact->path));
        REQUIRE(artifact->path.extension() == ".wav");
        REQUIRE(artifact->duration_s == 0.25);
        REQUIRE(artifact->sample_rate == 16000);

        auto h = wav::read_header(artifact->path);
        REQUIRE(h);
        REQUIRE(h->data_bytes == 8000);
    }

    SECTION("ArtifactNamesAreUnique") {
        REQUIRE(rec.start_recording());
        auto first = rec.stop_recording();
        REQUIRE(first);
        auto first_path = first->path;

        REQUIRE(rec.start_recording());
        auto second = rec.stop_recording();
        REQUIRE(second);
        REQUIRE(second->path != first_path);
        // Starting again discarded the previous artifact.
        REQUIRE_FALSE(fs::exists(first_path));
    }

    SECTION("DeleteRecording") {
        REQUIRE(rec.start_recording());
        auto artifact = rec.stop_recording();
        REQUIRE(artifact);

        rec.delete_recording();
        REQUIRE_FALSE(fs::exists(artifact->path));
        REQUIRE_FALSE(rec.current_artifact());

        // Safe without an artifact.
        rec.delete_recording();
    }

    SECTION("DeviceUnavailable") {
        capture.fail_with = "no capture device";
        auto res = rec.start_recording();
        REQUIRE_FALSE(res);
        REQUIRE(res.error().find("no capture device") != std::string::npos);
        REQUIRE_FALSE(rec.is_recording());
    }

    SECTION("StaleSamplesAreCleared") {
        std::vector<int16_t> stale(500, 9);
        ring.push(stale);

        REQUIRE(rec.start_recording());
        auto artifact = rec.stop_recording();
        REQUIRE(artifact);
        REQUIRE(artifact->duration_s == 0.0);
    }
}
