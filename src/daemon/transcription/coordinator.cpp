#include "coordinator.hpp"

#include "config.hpp"
#include "wav_file.hpp"

#include <format>
#include <print>

std::string_view to_string(TranscriptionMode mode) {
    return mode == TranscriptionMode::Remote ? "remote" : "local";
}

TranscriptionCoordinator::TranscriptionCoordinator(ConfigStore& config,
                                                   TranscriptionBackend& local,
                                                   TranscriptionBackend& remote, bool verbose)
    : config_(config), local_(local), remote_(remote), verbose_(verbose) {}

void TranscriptionCoordinator::log(const std::string& msg) {
    if (verbose_) std::println(stderr, "[voxpaste] transcription: {}", msg);
}

TranscriptionBackend& TranscriptionCoordinator::backend_for(TranscriptionMode mode) {
    return mode == TranscriptionMode::Remote ? remote_ : local_;
}

TranscriptionMode TranscriptionCoordinator::current_mode() {
    return config_.snapshot().transcription.parsed_mode();
}

std::optional<std::string> TranscriptionCoordinator::validate_configuration() {
    auto config = config_.snapshot();
    return backend_for(config.transcription.parsed_mode()).validate(config);
}

TranscriptionOutcome TranscriptionCoordinator::transcribe(const AudioArtifact& audio,
                                                          std::stop_token stop) {
    using Kind = TranscriptionError::Kind;

    if (stop.stop_requested()) return std::unexpected(TranscriptionError::cancelled());

    auto header = wav::read_header(audio.path);
    if (!header) {
        return std::unexpected(TranscriptionError{Kind::AudioUnreadable, header.error()});
    }
    if (header->data_bytes == 0) {
        return std::unexpected(TranscriptionError{Kind::AudioUnreadable, "Audio file is empty"});
    }

    // One snapshot per call: edits made mid-transcription apply to the next one.
    auto config = config_.snapshot();
    auto mode = config.transcription.parsed_mode();
    log(std::format("{} backend, {:.1f}s of audio", to_string(mode), header->duration_s()));

    auto result = backend_for(mode).transcribe(audio, config, stop);

    // A result that arrives after cancellation is never delivered.
    if (stop.stop_requested()) {
        log("result discarded after cancellation");
        return std::unexpected(TranscriptionError::cancelled());
    }
    if (!result && result.error().kind != Kind::Cancelled) {
        std::println(stderr, "transcription: {}", result.error().message());
    }
    return result;
}
