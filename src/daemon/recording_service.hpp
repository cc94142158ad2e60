#pragma once

#include "audio_artifact.hpp"
#include "level_meter.hpp"
#include "platform/audio_capture.hpp"
#include "sample_ring.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

class RecordingService {
public:
    RecordingService(AudioCapture& capture, SampleRing& ring, LevelMeter& meter,
                     uint32_t sample_rate, std::filesystem::path recordings_dir);
    ~RecordingService();

    RecordingService(const RecordingService&) = delete;
    RecordingService& operator=(const RecordingService&) = delete;

    // Fails if the capture device cannot be opened.
    std::expected<void, std::string> start_recording();

    // Writes the captured samples to a WAV artifact. nullopt if not recording.
    std::optional<AudioArtifact> stop_recording();

    // Removes the last artifact's file. No-op without one.
    void delete_recording();

    bool is_recording() const { return recording_; }
    float audio_level() const { return recording_ ? meter_.level() : 0.0f; }
    double recording_duration() const;
    const std::optional<AudioArtifact>& current_artifact() const { return artifact_; }

private:
    std::filesystem::path next_artifact_path();

    AudioCapture& capture_;
    SampleRing& ring_;
    LevelMeter& meter_;
    uint32_t sample_rate_;
    std::filesystem::path dir_;

    bool recording_ = false;
    std::chrono::steady_clock::time_point record_start_;
    std::optional<AudioArtifact> artifact_;
    uint64_t sequence_ = 0;
};
