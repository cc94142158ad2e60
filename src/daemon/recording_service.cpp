#include "recording_service.hpp"

#include "wav_file.hpp"

#include <format>
#include <print>
#include <unistd.h>

namespace fs = std::filesystem;

RecordingService::RecordingService(AudioCapture& capture, SampleRing& ring, LevelMeter& meter,
                                   uint32_t sample_rate, fs::path recordings_dir)
    : capture_(capture), ring_(ring), meter_(meter),
      sample_rate_(sample_rate), dir_(std::move(recordings_dir)) {}

RecordingService::~RecordingService() {
    if (recording_) capture_.stop();
    delete_recording();
}

std::expected<void, std::string> RecordingService::start_recording() {
    // A leftover capture or artifact from an interrupted session is discarded.
    if (recording_) {
        capture_.stop();
        recording_ = false;
    }
    delete_recording();

    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        return std::unexpected(std::format("Couldn't start recording: {}: {}",
                                           dir_.string(), ec.message()));
    }

    ring_.clear();
    meter_.reset();
    if (auto res = capture_.start(); !res) {
        return std::unexpected("Couldn't start recording: " + res.error());
    }

    record_start_ = std::chrono::steady_clock::now();
    recording_ = true;
    return {};
}

std::optional<AudioArtifact> RecordingService::stop_recording() {
    if (!recording_) return std::nullopt;

    capture_.stop();
    recording_ = false;
    meter_.reset();

    auto samples = ring_.drain();
    if (ring_.dropped() > 0) {
        std::println(stderr, "recording: buffer full, dropped {} samples", ring_.dropped());
    }

    auto path = next_artifact_path();
    if (auto res = wav::write_file(path, samples, sample_rate_); !res) {
        std::println(stderr, "recording: {}", res.error());
        return std::nullopt;
    }

    artifact_ = AudioArtifact{
        .path = path,
        .duration_s = static_cast<double>(samples.size()) / sample_rate_,
        .sample_rate = sample_rate_,
    };
    return artifact_;
}

void RecordingService::delete_recording() {
    if (!artifact_) return;

    std::error_code ec;
    fs::remove(artifact_->path, ec);
    if (ec) {
        std::println(stderr, "recording: failed to delete {}: {}",
                     artifact_->path.string(), ec.message());
    }
    artifact_.reset();
}

double RecordingService::recording_duration() const {
    if (!recording_) return 0.0;
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - record_start_).count();
}

fs::path RecordingService::next_artifact_path() {
    return dir_ / std::format("dictation_{}_{}.wav", ::getpid(), ++sequence_);
}
