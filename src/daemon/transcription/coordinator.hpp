#pragma once

#include "backend.hpp"

#include <optional>
#include <stop_token>
#include <string>

class ConfigStore;

// Picks the local or remote backend from the persisted configuration and runs
// one transcription. Holds no per-session state.
class TranscriptionCoordinator {
public:
    TranscriptionCoordinator(ConfigStore& config, TranscriptionBackend& local,
                             TranscriptionBackend& remote, bool verbose = false);

    TranscriptionOutcome transcribe(const AudioArtifact& audio, std::stop_token stop);

    // Why the active backend can't run, if it can't.
    std::optional<std::string> validate_configuration();

    TranscriptionMode current_mode();

private:
    TranscriptionBackend& backend_for(TranscriptionMode mode);
    void log(const std::string& msg);

    ConfigStore& config_;
    TranscriptionBackend& local_;
    TranscriptionBackend& remote_;
    bool verbose_;
};

std::string_view to_string(TranscriptionMode mode);
