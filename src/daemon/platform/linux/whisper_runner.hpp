#pragma once

#include "platform/model_runner.hpp"

struct whisper_context;

// whisper.cpp linked in-process. The context stays loaded between recordings
// and is replaced only when a different model is requested.
class WhisperRunner : public ModelRunner {
public:
    WhisperRunner(bool use_gpu, bool verbose);
    ~WhisperRunner() override;

    WhisperRunner(const WhisperRunner&) = delete;
    WhisperRunner& operator=(const WhisperRunner&) = delete;

    std::expected<void, std::string> load(const std::filesystem::path& model) override;
    const std::filesystem::path& loaded_model() const override { return model_; }

    // Polls `stop` between decoder steps through whisper's abort callback.
    std::expected<std::string, Failure> run(const std::filesystem::path& wav,
                                            const RunnerParams& params,
                                            std::stop_token stop) override;

private:
    void unload();

    bool use_gpu_;
    whisper_context* ctx_ = nullptr;
    std::filesystem::path model_;
};
