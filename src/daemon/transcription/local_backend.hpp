#pragma once

#include "backend.hpp"
#include "platform/model_runner.hpp"
#include "serial_executor.hpp"

#include <chrono>

// On-device transcription. Every call into the model runner, from any
// session, goes through one serial executor thread.
class LocalBackend : public TranscriptionBackend {
public:
    explicit LocalBackend(ModelRunner& runner, bool verbose = false);

    LocalBackend(const LocalBackend&) = delete;
    LocalBackend& operator=(const LocalBackend&) = delete;

    TranscriptionOutcome transcribe(const AudioArtifact& audio, const Config& config,
                                    std::stop_token stop) override;
    std::optional<std::string> validate(const Config& config) const override;

private:
    TranscriptionOutcome run_on_executor(const AudioArtifact& audio, const Config& config,
                                         std::stop_token stop);
    void log(const std::string& msg);

    ModelRunner& runner_;
    bool verbose_;
    SerialExecutor executor_;

    static constexpr std::chrono::milliseconds kStopPoll{25};
};
