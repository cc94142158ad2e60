#pragma once

#include "audio_artifact.hpp"
#include "config.hpp"

#include <expected>
#include <optional>
#include <stop_token>
#include <string>

struct TranscriptResult {
    std::string text;
    double duration_s = 0.0;
    double processing_s = 0.0;
};

struct TranscriptionError {
    enum class Kind {
        NoModelAvailable,
        ModelLoadFailed,
        AudioUnreadable,
        NetworkError,
        BackendRejected,
        NoTextReturned,
        Cancelled,  // never shown; the result is discarded
    };

    Kind kind;
    std::string detail;

    // User-facing text carried by the transcriptionFailed event.
    std::string message() const;

    static TranscriptionError cancelled() { return {Kind::Cancelled, {}}; }
};

using TranscriptionOutcome = std::expected<TranscriptResult, TranscriptionError>;

class TranscriptionBackend {
public:
    virtual ~TranscriptionBackend() = default;

    // Blocking. Implementations observe `stop` while waiting and return
    // Cancelled as soon as they notice it.
    virtual TranscriptionOutcome transcribe(const AudioArtifact& audio, const Config& config,
                                            std::stop_token stop) = 0;

    // Reason the backend cannot run with this configuration, if any.
    virtual std::optional<std::string> validate(const Config& config) const = 0;
};
